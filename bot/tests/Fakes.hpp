#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chat/ChatTransport.hpp"
#include "net/HttpClient.hpp"

inline HttpResponse httpReply(long status, std::string body) {
    HttpResponse r;
    r.transportOk = true;
    r.status = status;
    r.body = std::move(body);
    if (!r.ok()) r.error = "HTTP " + std::to_string(status);
    return r;
}

inline HttpResponse networkError(const std::string& what = "Couldn't connect to server") {
    HttpResponse r;
    r.error = what;
    return r;
}

// PNG signature + IHDR: đủ để đọc width/height, không có pixel
inline std::string pngHeader(std::uint32_t w, std::uint32_t h) {
    std::string s("\x89PNG\r\n\x1a\n", 8);
    auto be32 = [&s](std::uint32_t v) {
        s.push_back(static_cast<char>((v >> 24) & 0xff));
        s.push_back(static_cast<char>((v >> 16) & 0xff));
        s.push_back(static_cast<char>((v >> 8) & 0xff));
        s.push_back(static_cast<char>(v & 0xff));
    };
    be32(13);
    s += "IHDR";
    be32(w);
    be32(h);
    s.push_back(8);   // bit depth
    s.push_back(2);   // truecolor
    s.push_back(0);
    s.push_back(0);
    s.push_back(0);
    be32(0);          // CRC, stb không kiểm tra khi chỉ đọc header
    return s;
}

struct HttpCall {
    std::string method;
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::vector<FormPart> parts;

    std::optional<std::string> header(const std::string& name) const {
        for (const auto& h : headers) {
            if (h.first == name) return h.second;
        }
        return std::nullopt;
    }
};

class FakeHttpClient : public HttpClient {
public:
    using Handler = std::function<HttpResponse(const HttpCall&)>;

    explicit FakeHttpClient(Handler h = nullptr) : handler(std::move(h)) {}

    HttpResponse get(const std::string& url, const HttpHeaders& headers) override {
        return record({"GET", url, headers, "", {}});
    }

    HttpResponse post(const std::string& url, const HttpHeaders& headers,
                      const std::string& body) override {
        return record({"POST", url, headers, body, {}});
    }

    HttpResponse postMultipart(const std::string& url, const HttpHeaders& headers,
                               const std::vector<FormPart>& parts) override {
        return record({"MULTIPART", url, headers, "", parts});
    }

    std::vector<HttpCall> callsTo(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<HttpCall> out;
        for (const auto& c : calls) {
            if (c.url == url) out.push_back(c);
        }
        return out;
    }

    Handler handler;
    std::vector<HttpCall> calls;

private:
    HttpResponse record(HttpCall c) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            calls.push_back(c);
        }
        return handler ? handler(c) : networkError();
    }

    mutable std::mutex mtx;
};

struct SentMessage {
    std::int64_t chatId;
    std::int64_t messageId;
    std::string text;
    SendOptions opts;
};

class FakeChatTransport : public ChatTransport {
public:
    std::vector<ChatUpdate> fetchUpdates(std::int64_t offset) override {
        std::lock_guard<std::mutex> lock(mtx);
        offsets.push_back(offset);
        if (batches.empty()) {
            if (onDrained) onDrained();
            return {};
        }
        auto b = batches.front();
        batches.pop_front();
        return b;
    }

    std::optional<std::int64_t> sendMessage(std::int64_t chatId, const std::string& text,
                                            const SendOptions& opts) override {
        std::lock_guard<std::mutex> lock(mtx);
        std::int64_t id = ++lastMessageId;
        sent.push_back({chatId, id, text, opts});
        return id;
    }

    bool editMessage(std::int64_t chatId, std::int64_t messageId,
                     const std::string& text) override {
        std::lock_guard<std::mutex> lock(mtx);
        edited.push_back({chatId, messageId, text, {}});
        return true;
    }

    bool deleteMessage(std::int64_t, std::int64_t messageId) override {
        std::lock_guard<std::mutex> lock(mtx);
        deleted.push_back(messageId);
        return true;
    }

    bool sendPhoto(std::int64_t chatId, const std::string& imageBytes,
                   const std::string& caption, const std::string& format) override {
        std::lock_guard<std::mutex> lock(mtx);
        photos.push_back({chatId, 0, imageBytes, {}});
        photoCaptions.push_back(caption);
        photoFormats.push_back(format);
        return true;
    }

    std::optional<std::string> downloadFile(const std::string& fileId) override {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = files.find(fileId);
        if (it == files.end()) return std::nullopt;
        return it->second;
    }

    std::string lastText() const {
        std::lock_guard<std::mutex> lock(mtx);
        return sent.empty() ? "" : sent.back().text;
    }

    std::string lastEdit() const {
        std::lock_guard<std::mutex> lock(mtx);
        return edited.empty() ? "" : edited.back().text;
    }

    std::deque<std::vector<ChatUpdate>> batches;
    std::function<void()> onDrained;
    std::vector<std::int64_t> offsets;

    std::map<std::string, std::string> files;
    std::vector<SentMessage> sent;
    std::vector<SentMessage> edited;
    std::vector<SentMessage> photos;      // text = image bytes
    std::vector<std::string> photoCaptions;
    std::vector<std::string> photoFormats;
    std::vector<std::int64_t> deleted;
    std::int64_t lastMessageId = 100;

private:
    mutable std::mutex mtx;
};
