#include "bot/BotController.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include "ai/AspectRatio.hpp"
#include "bot/MessageFormatter.hpp"
#include "image/ImageInfo.hpp"
#include "monitor/Logger.hpp"
#include "threadpool/ThreadPool.hpp"

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

BotController::BotController(ChatTransport& chat, const EditJobClient& editor, const Config& cfg,
                             ThreadPool* pool)
    : chat_(chat), editor_(editor), cfg_(cfg), pool_(pool) {}

void BotController::run() {
    running_ = true;
    LOGX("BOT", "Update loop running...");

    while (running_) {
        auto t0 = std::chrono::steady_clock::now();
        auto updates = chat_.fetchUpdates(offset_);

        for (const auto& up : updates) {
            offset_ = std::max(offset_, up.updateId + 1);
            try {
                handleUpdate(up);
            } catch (const std::exception& e) {
                LOGE("BOT", "Error handling update " << up.updateId << ": " << e.what());
            }
        }

        // getUpdates trả về ngay (lỗi mạng) -> nghỉ 1s, tránh quay vòng
        if (updates.empty() && running_ &&
            std::chrono::steady_clock::now() - t0 < std::chrono::seconds(1)) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    LOGX("BOT", "Update loop stopped at offset " << offset_);
}

void BotController::stop() {
    running_ = false;
}

void BotController::handleUpdate(const ChatUpdate& up) {
    if (up.chatId == 0) {
        LOGD("BOT", "Ignoring non-message update " << up.updateId);
        return;
    }

    if (up.hasPhoto()) {
        handlePhoto(up);
        return;
    }

    if (up.isCommand()) {
        std::string cmd = up.command();
        if (cmd == "/start") startCommand(up);
        else if (cmd == "/help") helpCommand(up);
        else if (cmd == "/status") statusCommand(up);
        else if (cmd == "/clear") clearCommand(up);
        else LOGD("BOT", "Unknown command " << cmd << " from chat " << up.chatId);
        return;
    }

    if (!up.text.empty()) {
        handleText(up);
    }
}

std::optional<std::int64_t> BotController::reply(std::int64_t chatId, const std::string& text) {
    return chat_.sendMessage(chatId, text, SendOptions{});
}

void BotController::updateStatus(std::int64_t chatId, std::optional<std::int64_t> statusMsg,
                                 const std::string& text) {
    if (statusMsg && chat_.editMessage(chatId, *statusMsg, text)) return;
    reply(chatId, text);
}

void BotController::startCommand(const ChatUpdate& up) {
    SendOptions opts;
    opts.html = true;
    opts.forceReply = true;
    chat_.sendMessage(up.chatId,
                      MessageFormatter::welcome(MessageFormatter::mentionHtml(up.userId, up.userName)),
                      opts);
}

void BotController::helpCommand(const ChatUpdate& up) {
    reply(up.chatId, MessageFormatter::help());
}

void BotController::statusCommand(const ChatUpdate& up) {
    reply(up.chatId, MessageFormatter::status(cfg_));
}

void BotController::clearCommand(const ChatUpdate& up) {
    ConversationContext& ctx = sessions_.context(up.chatId);
    if (ctx.contains(KEY_PHOTO)) {
        ctx.clear();
        reply(up.chatId, "✅ Image cleared! Send a new image to start editing.");
    } else {
        reply(up.chatId, "No image to clear. Send an image first!");
    }
}

void BotController::handlePhoto(const ChatUpdate& up) {
    auto statusMsg = reply(up.chatId, "📥 Processing your image...");

    // size cuối cùng = độ phân giải cao nhất
    const ChatPhoto& photo = up.photos.back();
    auto bytes = chat_.downloadFile(photo.fileId);
    if (!bytes) {
        LOGE("BOT", "Error handling photo: download failed for chat " << up.chatId);
        updateStatus(up.chatId, statusMsg, "❌ Error processing image. Please try again.");
        return;
    }

    if (!validateImageSize(*bytes, cfg_.max_image_size_mb)) {
        updateStatus(up.chatId, statusMsg,
                     "❌ Image too large. Maximum size is " +
                         std::to_string(cfg_.max_image_size_mb) + "MB.");
        return;
    }

    std::string ratio = AspectRatioClassifier::classifyImage(*bytes, cfg_.default_aspect_ratio);

    ConversationContext& ctx = sessions_.context(up.chatId);
    ctx.set(KEY_PHOTO, std::move(*bytes));
    ctx.set(KEY_ASPECT_RATIO, ratio);

    std::string caption = trim(up.caption);
    if (!caption.empty()) {
        updateStatus(up.chatId, statusMsg,
                     "✅ Image received with caption!\n"
                     "📐 Aspect ratio: " + ratio + "\n"
                     "📝 Prompt: \"" + caption + "\"\n\n"
                     "🎨 Starting edit...");
        processEdit(up.chatId, caption, statusMsg);
    } else {
        updateStatus(up.chatId, statusMsg,
                     "✅ Image received!\n"
                     "📐 Detected aspect ratio: " + ratio + "\n\n"
                     "💬 Now send me your editing instructions!");
    }
}

void BotController::handleText(const ChatUpdate& up) {
    ConversationContext& ctx = sessions_.context(up.chatId);
    if (!ctx.contains(KEY_PHOTO)) {
        reply(up.chatId, "📷 Please send a photo first!\nUse /start to see how to use the bot.");
        return;
    }

    std::string prompt = trim(up.text);
    if (prompt.empty()) return;

    auto statusMsg = reply(up.chatId, "🎨 Processing your edit request...");
    processEdit(up.chatId, prompt, statusMsg);
}

void BotController::processEdit(std::int64_t chatId, const std::string& prompt,
                                std::optional<std::int64_t> statusMsg) {
    ConversationContext& ctx = sessions_.context(chatId);
    auto image = ctx.get(KEY_PHOTO);
    if (!image) {
        updateStatus(chatId, statusMsg, "❌ An error occurred. Please try again.");
        return;
    }
    std::string ratio = ctx.getOr(KEY_ASPECT_RATIO, cfg_.default_aspect_ratio);

    updateStatus(chatId, statusMsg,
                 "🎨 Editing your image...\n"
                 "📝 Prompt: " + prompt + "\n"
                 "📐 Aspect ratio: " + ratio + "\n\n"
                 "⏳ This may take 10-30 seconds...");

    if (!pool_) {
        runEdit(chatId, prompt, *image, ratio, statusMsg);
        return;
    }

    // Copy ảnh vào task: /clear hoặc ảnh mới không ảnh hưởng job đang chạy
    std::size_t id = nextTaskId_++;
    std::size_t queued = pool_->submit(Task(id, chatId, "edit",
        [this, chatId, prompt, img = std::move(*image), ratio, statusMsg]() {
            runEdit(chatId, prompt, img, ratio, statusMsg);
        }));
    LOGD("BOT", "Edit task #" << id << " queued for chat " << chatId << " (in flight: " << queued << ")");
}

void BotController::runEdit(std::int64_t chatId, const std::string& prompt,
                            const std::string& image, const std::string& aspectRatio,
                            std::optional<std::int64_t> statusMsg) {
    auto t0 = std::chrono::steady_clock::now();
    EditOutcome out = editor_.edit(image, prompt, aspectRatio);
    double sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    if (!out.ok()) {
        LOGX("BOT", "Edit failed for chat " << chatId << ": " << toString(out.error)
                    << " (" << out.reason << ") after " << out.polls << " polls, " << sec << "s");
        updateStatus(chatId, statusMsg,
                     "❌ Failed to edit image. Please try again with a different prompt.");
        return;
    }

    LOGX("BOT", "Edit done for chat " << chatId << " after " << out.polls << " polls, " << sec << "s");

    if (!chat_.sendPhoto(chatId, out.image, "✨ Edited Image\n📝 Prompt: " + prompt,
                         cfg_.output_format)) {
        updateStatus(chatId, statusMsg, "❌ An error occurred. Please try again.");
        return;
    }

    if (statusMsg) chat_.deleteMessage(chatId, *statusMsg);
    reply(chatId,
          "🔄 You can send another editing instruction for this image, "
          "or send a new image to start over!");
}
