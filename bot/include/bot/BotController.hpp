#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "ai/EditJobClient.hpp"
#include "chat/ChatTransport.hpp"
#include "chat/ConversationContext.hpp"
#include "utils/Config.hpp"

class ThreadPool;

class BotController {
public:
    static constexpr const char* KEY_PHOTO = "photo";
    static constexpr const char* KEY_ASPECT_RATIO = "aspect_ratio";

    // pool == nullptr: chạy edit ngay trên thread gọi handleUpdate
    BotController(ChatTransport& chat, const EditJobClient& editor, const Config& cfg,
                  ThreadPool* pool = nullptr);

    // Vòng long-poll, block tới khi stop()
    void run();
    void stop();
    bool running() const { return running_.load(); }

    void handleUpdate(const ChatUpdate& up);

    SessionStore& sessions() { return sessions_; }
    std::int64_t offset() const { return offset_; }

private:
    void startCommand(const ChatUpdate& up);
    void helpCommand(const ChatUpdate& up);
    void statusCommand(const ChatUpdate& up);
    void clearCommand(const ChatUpdate& up);

    void handlePhoto(const ChatUpdate& up);
    void handleText(const ChatUpdate& up);

    void processEdit(std::int64_t chatId, const std::string& prompt,
                     std::optional<std::int64_t> statusMsg);
    void runEdit(std::int64_t chatId, const std::string& prompt, const std::string& image,
                 const std::string& aspectRatio, std::optional<std::int64_t> statusMsg);

    std::optional<std::int64_t> reply(std::int64_t chatId, const std::string& text);
    void updateStatus(std::int64_t chatId, std::optional<std::int64_t> statusMsg,
                      const std::string& text);

    ChatTransport& chat_;
    const EditJobClient& editor_;
    const Config& cfg_;
    ThreadPool* pool_;

    SessionStore sessions_;
    std::atomic<bool> running_{false};
    std::int64_t offset_ = 0;
    std::atomic<std::size_t> nextTaskId_{0};
};
