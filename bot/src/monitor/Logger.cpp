#include "monitor/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>

std::mutex Logger::mtx;

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};

static inline long long nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

void Logger::setLevel(LogLevel level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

void Logger::setLevel(const std::string& name) {
    setLevel(parseLevel(name));
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool Logger::enabled(LogLevel level) {
    return static_cast<int>(level) <= g_level.load(std::memory_order_relaxed);
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (n == "ERROR" || n == "CRITICAL") return LogLevel::ERROR;
    if (n == "WARN" || n == "WARNING")   return LogLevel::WARN;
    if (n == "DEBUG")                    return LogLevel::DEBUG;
    return LogLevel::INFO;
}

void Logger::write(LogLevel level, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mtx);

    // lỗi và cảnh báo ra stderr, còn lại stdout
    std::ostream& out = (level <= LogLevel::WARN) ? std::cerr : std::cout;
    out << "[" << nowMs() << "ms]"
        << "[TID " << std::this_thread::get_id() << "]"
        << "[" << tag << "]";
    if (level != LogLevel::INFO) out << "[" << levelName(level) << "]";
    out << " " << msg << std::endl;
}
