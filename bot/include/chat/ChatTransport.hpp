#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ChatPhoto {
    std::string fileId;
    int width = 0;
    int height = 0;
    std::int64_t fileSize = 0;
};

struct ChatUpdate {
    std::int64_t updateId = 0;
    std::int64_t chatId = 0;        // 0 = update không phải message (bỏ qua)
    std::int64_t messageId = 0;
    std::int64_t userId = 0;
    std::string userName;

    std::string text;
    std::string caption;
    std::vector<ChatPhoto> photos;  // các size của cùng 1 ảnh, nhỏ -> lớn

    bool hasPhoto() const { return !photos.empty(); }
    bool isCommand() const { return !text.empty() && text[0] == '/'; }

    // "/start@my_bot arg" -> "/start"
    std::string command() const;
};

struct SendOptions {
    bool html = false;
    bool forceReply = false;
};

class ChatTransport {
public:
    virtual ~ChatTransport() = default;

    // Long-poll; offset = update_id lớn nhất đã xử lý + 1
    virtual std::vector<ChatUpdate> fetchUpdates(std::int64_t offset) = 0;

    // Trả về message_id của tin vừa gửi
    virtual std::optional<std::int64_t> sendMessage(std::int64_t chatId, const std::string& text,
                                                    const SendOptions& opts) = 0;

    virtual bool editMessage(std::int64_t chatId, std::int64_t messageId,
                             const std::string& text) = 0;

    virtual bool deleteMessage(std::int64_t chatId, std::int64_t messageId) = 0;

    // format: "jpeg" | "png", quyết định tên file và content type
    virtual bool sendPhoto(std::int64_t chatId, const std::string& imageBytes,
                           const std::string& caption, const std::string& format) = 0;

    virtual std::optional<std::string> downloadFile(const std::string& fileId) = 0;
};
