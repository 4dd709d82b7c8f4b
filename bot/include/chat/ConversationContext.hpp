#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Key-value của 1 cuộc hội thoại (ảnh đang chờ + aspect ratio giữa 2 lượt chat)
class ConversationContext {
public:
    void set(const std::string& key, std::string value);
    std::optional<std::string> get(const std::string& key) const;
    std::string getOr(const std::string& key, const std::string& fallback) const;

    bool contains(const std::string& key) const;
    bool empty() const;
    void clear();

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::string> values_;
};

// 1 context cho mỗi chat id; reference trả về ổn định suốt đời store
class SessionStore {
public:
    ConversationContext& context(std::int64_t chatId);
    std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::map<std::int64_t, ConversationContext> sessions_;
};
