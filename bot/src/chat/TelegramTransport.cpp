#include "chat/TelegramTransport.hpp"

#include "monitor/Logger.hpp"

using json = nlohmann::json;

TelegramTransport::TelegramTransport(HttpClient& http, std::string token, std::string apiBase)
    : http_(http), token_(std::move(token)), apiBase_(std::move(apiBase)) {}

std::string TelegramTransport::methodUrl(const std::string& method) const {
    return apiBase_ + "/bot" + token_ + "/" + method;
}

std::optional<json> TelegramTransport::unwrap(const std::string& method, const HttpResponse& res) {
    if (!res.transportOk) {
        LOGE("TG", method << " failed: " << res.error);
        return std::nullopt;
    }

    try {
        auto j = json::parse(res.body);
        if (!j.value("ok", false)) {
            LOGE("TG", method << " rejected (HTTP " << res.status << "): "
                              << j.value("description", std::string("no description")));
            return std::nullopt;
        }
        if (!j.contains("result")) return json(true);
        return j["result"];
    } catch (const json::exception& e) {
        LOGE("TG", method << " returned malformed JSON (HTTP " << res.status << "): " << e.what());
        return std::nullopt;
    }
}

std::optional<json> TelegramTransport::call(const std::string& method, const json& params) {
    HttpHeaders headers = {{"Content-Type", "application/json"}};
    HttpResponse res = http_.post(methodUrl(method), headers, params.dump());
    return unwrap(method, res);
}

ChatUpdate TelegramTransport::parseUpdate(const json& u) {
    ChatUpdate up;
    up.updateId = u.value("update_id", static_cast<std::int64_t>(0));

    if (!u.contains("message") || !u["message"].is_object()) return up;
    const auto& m = u["message"];

    up.messageId = m.value("message_id", static_cast<std::int64_t>(0));
    if (m.contains("chat") && m["chat"].is_object()) {
        up.chatId = m["chat"].value("id", static_cast<std::int64_t>(0));
    }
    if (m.contains("from") && m["from"].is_object()) {
        up.userId = m["from"].value("id", static_cast<std::int64_t>(0));
        up.userName = m["from"].value("first_name", std::string());
    }
    up.text = m.value("text", std::string());
    up.caption = m.value("caption", std::string());

    if (m.contains("photo") && m["photo"].is_array()) {
        for (const auto& p : m["photo"]) {
            ChatPhoto ph;
            ph.fileId = p.value("file_id", std::string());
            ph.width = p.value("width", 0);
            ph.height = p.value("height", 0);
            ph.fileSize = p.value("file_size", static_cast<std::int64_t>(0));
            up.photos.push_back(ph);
        }
    }
    return up;
}

std::vector<ChatUpdate> TelegramTransport::fetchUpdates(std::int64_t offset) {
    json params = {
        {"offset", offset},
        {"timeout", LONG_POLL_TIMEOUT_S},
        {"allowed_updates", json::array({"message"})}
    };

    std::vector<ChatUpdate> updates;
    auto result = call("getUpdates", params);
    if (!result || !result->is_array()) return updates;

    for (const auto& u : *result) {
        try {
            updates.push_back(parseUpdate(u));
        } catch (const json::exception& e) {
            LOGW("TG", "Skipping unparsable update: " << e.what());
        }
    }
    return updates;
}

std::optional<std::int64_t> TelegramTransport::sendMessage(std::int64_t chatId,
                                                           const std::string& text,
                                                           const SendOptions& opts) {
    json params = {{"chat_id", chatId}, {"text", text}};
    if (opts.html) params["parse_mode"] = "HTML";
    if (opts.forceReply) params["reply_markup"] = {{"force_reply", true}, {"selective", true}};

    auto result = call("sendMessage", params);
    if (!result || !result->is_object()) return std::nullopt;
    return result->value("message_id", static_cast<std::int64_t>(0));
}

bool TelegramTransport::editMessage(std::int64_t chatId, std::int64_t messageId,
                                    const std::string& text) {
    json params = {{"chat_id", chatId}, {"message_id", messageId}, {"text", text}};
    return call("editMessageText", params).has_value();
}

bool TelegramTransport::deleteMessage(std::int64_t chatId, std::int64_t messageId) {
    json params = {{"chat_id", chatId}, {"message_id", messageId}};
    return call("deleteMessage", params).has_value();
}

bool TelegramTransport::sendPhoto(std::int64_t chatId, const std::string& imageBytes,
                                  const std::string& caption, const std::string& format) {
    bool png = format == "png";
    std::vector<FormPart> parts = {
        {"chat_id", std::to_string(chatId), "", ""},
        {"caption", caption, "", ""},
        {"photo", imageBytes, png ? "edited.png" : "edited.jpg", png ? "image/png" : "image/jpeg"},
    };

    HttpResponse res = http_.postMultipart(methodUrl("sendPhoto"), {}, parts);
    return unwrap("sendPhoto", res).has_value();
}

std::optional<std::string> TelegramTransport::downloadFile(const std::string& fileId) {
    auto result = call("getFile", json{{"file_id", fileId}});
    std::string path;
    if (result && result->is_object()) path = result->value("file_path", std::string());
    if (path.empty()) {
        LOGE("TG", "getFile returned no file_path for " << fileId);
        return std::nullopt;
    }

    HttpResponse res = http_.get(apiBase_ + "/file/bot" + token_ + "/" + path, {});
    if (!res.ok()) {
        LOGE("TG", "File download failed for " << fileId << ": " << res.error);
        return std::nullopt;
    }
    return std::move(res.body);
}
