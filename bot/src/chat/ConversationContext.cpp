#include "chat/ConversationContext.hpp"

void ConversationContext::set(const std::string& key, std::string value) {
    std::lock_guard<std::mutex> lock(mtx_);
    values_[key] = std::move(value);
}

std::optional<std::string> ConversationContext::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

std::string ConversationContext::getOr(const std::string& key, const std::string& fallback) const {
    auto v = get(key);
    return v ? *v : fallback;
}

bool ConversationContext::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return values_.count(key) > 0;
}

bool ConversationContext::empty() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return values_.empty();
}

void ConversationContext::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    values_.clear();
}

ConversationContext& SessionStore::context(std::int64_t chatId) {
    std::lock_guard<std::mutex> lock(mtx_);
    return sessions_[chatId];
}

std::size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return sessions_.size();
}
