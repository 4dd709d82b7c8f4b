#pragma once
#include <nlohmann/json.hpp>

#include "chat/ChatTransport.hpp"
#include "net/HttpClient.hpp"

// Telegram Bot API qua HttpClient (getUpdates long polling)
class TelegramTransport : public ChatTransport {
public:
    static constexpr int LONG_POLL_TIMEOUT_S = 30;

    TelegramTransport(HttpClient& http, std::string token,
                      std::string apiBase = "https://api.telegram.org");

    std::vector<ChatUpdate> fetchUpdates(std::int64_t offset) override;

    std::optional<std::int64_t> sendMessage(std::int64_t chatId, const std::string& text,
                                            const SendOptions& opts) override;

    bool editMessage(std::int64_t chatId, std::int64_t messageId,
                     const std::string& text) override;

    bool deleteMessage(std::int64_t chatId, std::int64_t messageId) override;

    bool sendPhoto(std::int64_t chatId, const std::string& imageBytes,
                   const std::string& caption, const std::string& format) override;

    std::optional<std::string> downloadFile(const std::string& fileId) override;

    static ChatUpdate parseUpdate(const nlohmann::json& u);

private:
    std::string methodUrl(const std::string& method) const;

    // POST JSON tới 1 method; trả về "result" nếu ok=true
    std::optional<nlohmann::json> call(const std::string& method, const nlohmann::json& params);
    std::optional<nlohmann::json> unwrap(const std::string& method, const HttpResponse& res);

    HttpClient& http_;
    std::string token_;
    std::string apiBase_;
};
