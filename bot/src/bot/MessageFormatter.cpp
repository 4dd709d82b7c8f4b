#include "bot/MessageFormatter.hpp"

#include <sstream>

#include "utils/Config.hpp"

std::string MessageFormatter::escapeHtml(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default:  out += c;
        }
    }
    return out;
}

std::string MessageFormatter::mentionHtml(std::int64_t userId, const std::string& name) {
    return "<a href=\"tg://user?id=" + std::to_string(userId) + "\">" + escapeHtml(name) + "</a>";
}

std::string MessageFormatter::welcome(const std::string& mentionHtml) {
    return "🎨 <b>AI Image Editor Bot</b>\n\n"
           "Hi " + mentionHtml + "!\n\n"
           "<b>Two ways to use:</b>\n\n"
           "<b>Quick:</b> send a photo with your edit instruction as the caption.\n\n"
           "<b>Step by step:</b>\n"
           "1. Send me an image\n"
           "2. Send a text description of how you want to edit it\n\n"
           "<b>Examples:</b>\n"
           "• \"Change the car color to red\"\n"
           "• \"Add sunglasses to the person\"\n"
           "• \"Make the sky sunset colored\"\n"
           "• \"Add text 'SALE' to the image\"\n\n"
           "The bot keeps your image's original aspect ratio!";
}

std::string MessageFormatter::help() {
    return "🔧 Bot Commands & Usage\n\n"
           "Commands:\n"
           "• /start - Start the bot\n"
           "• /help - Show this help message\n"
           "• /clear - Clear current image from memory\n"
           "• /status - Show bot status\n\n"
           "How to edit images:\n"
           "• Send a photo with the editing instruction as caption, or\n"
           "• Send a photo, then send the instruction as text\n\n"
           "Tips:\n"
           "• Be specific in your descriptions\n"
           "• The bot keeps original aspect ratios\n"
           "• Processing may take 10-30 seconds\n"
           "• You can send a new image anytime\n"
           "• Several instructions can be applied to the same image";
}

std::string MessageFormatter::status(const Config& cfg) {
    std::ostringstream oss;
    oss << "🤖 Bot Status\n\n"
        << "✅ Bot is running\n"
        << "🔧 Environment: " << cfg.environment << "\n"
        << "📊 Max image size: " << cfg.max_image_size_mb << "MB\n"
        << "⏱️ API timeout: " << cfg.bfl_timeout << "s\n"
        << "🎯 Default aspect ratio: " << cfg.default_aspect_ratio;
    return oss.str();
}
