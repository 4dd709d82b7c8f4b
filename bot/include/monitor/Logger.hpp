#pragma once
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

enum class LogLevel { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3 };

class Logger {
public:
    static void setLevel(LogLevel level);
    static void setLevel(const std::string& name);
    static LogLevel level();

    static bool enabled(LogLevel level);

    // Ghi 1 dòng hoàn chỉnh: [<ms>ms][TID ...][TAG] message
    static void write(LogLevel level, const std::string& tag, const std::string& msg);

    static LogLevel parseLevel(const std::string& name);

private:
    static std::mutex mtx;
};

#define LOGX_AT(lvl, tag, msg)                              \
    do {                                                    \
        if (Logger::enabled(lvl)) {                         \
            std::ostringstream logx_oss_;                   \
            logx_oss_ << msg;                               \
            Logger::write(lvl, tag, logx_oss_.str());       \
        }                                                   \
    } while (0)

#define LOGX(tag, msg)   LOGX_AT(LogLevel::INFO, tag, msg)
#define LOGD(tag, msg)   LOGX_AT(LogLevel::DEBUG, tag, msg)
#define LOGW(tag, msg)   LOGX_AT(LogLevel::WARN, tag, msg)
#define LOGE(tag, msg)   LOGX_AT(LogLevel::ERROR, tag, msg)
