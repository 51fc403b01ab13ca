#pragma once

#include "relay/common/noncopyable.h"

#include <mutex>
#include <sstream>
#include <string>

namespace relay {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger : noncopyable {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }

    // Colors are only emitted when stdout is a terminal unless forced.
    void SetColor(bool on) { color_ = on; }

    // Unknown names map to INFO.
    static LogLevel ParseLevel(const std::string& levelStr);
    static const char* LevelName(LogLevel level);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;

    LogLevel level_ = LogLevel::INFO;
    bool color_ = false;
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "origin " << addr;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::ostringstream ss_;
};

} // namespace common
} // namespace relay

#define RELAY_LOG(lvl) \
    if (relay::common::LogLevel::lvl >= relay::common::Logger::Instance().GetLevel()) \
    relay::common::LogStream(relay::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG RELAY_LOG(DEBUG)
#define LOG_INFO  RELAY_LOG(INFO)
#define LOG_WARN  RELAY_LOG(WARN)
#define LOG_ERROR RELAY_LOG(ERROR)
#define LOG_FATAL RELAY_LOG(FATAL)
