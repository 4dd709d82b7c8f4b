#pragma once
#include <cstdint>
#include <string>

class Config;

class MessageFormatter {
public:
    static std::string escapeHtml(const std::string& s);
    static std::string mentionHtml(std::int64_t userId, const std::string& name);

    static std::string welcome(const std::string& mentionHtml);
    static std::string help();
    static std::string status(const Config& cfg);
};
