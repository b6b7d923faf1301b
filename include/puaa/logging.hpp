#pragma once

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace puaa {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

// Four-letter tag used in log lines
inline const char* log_level_tag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "EROR";
        case LogLevel::FATAL: return "FATL";
    }
    return "UNKN";
}

/**
 * Label prepended to every line logged by the current thread while the
 * object lives. The build driver tags each compile with its output file so
 * lines from parallel targets can be told apart. Nests; the innermost wins.
 */
class ScopedLogContext {
public:
    explicit ScopedLogContext(std::string label) : previous_(std::move(current())) {
        current() = std::move(label);
    }

    ~ScopedLogContext() { current() = std::move(previous_); }

    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

    static std::string& current() {
        thread_local std::string label;
        return label;
    }

private:
    std::string previous_;
};

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    bool enabled(LogLevel level) const { return level >= this->level(); }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        // Format outside the lock; only the write is serialized
        std::ostringstream msg;
        msg << prefix(level, file, line, func);
        (msg << ... << args);
        const std::string text = msg.str();

        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;
        *output_ << text << std::endl;

        if (level == LogLevel::FATAL) {
            *output_ << std::flush;
            std::abort();
        }
    }

private:
    Logger() : level_(LogLevel::INFO), output_(&std::cerr) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // "[2024-01-01 12:00:00.000] INFO parser.cpp:42 parse_text() - [context] "
    static std::string prefix(LogLevel level, const char* file, int line, const char* func) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        const char* filename = std::strrchr(file, '/');
        if (!filename) filename = std::strrchr(file, '\\');
        filename = filename ? filename + 1 : file;

        std::ostringstream ss;
        ss << '[' << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count() << "] "
           << log_level_tag(level) << ' ' << filename << ':' << line << ' ' << func << "() - ";

        const std::string& context = ScopedLogContext::current();
        if (!context.empty()) {
            ss << '[' << context << "] ";
        }
        return ss.str();
    }

    LogLevel level_;
    std::ostream* output_;
    mutable std::mutex mutex_;
};

// Arguments are only evaluated when the level is enabled
#define PUAA_LOG(level, ...)                                                              \
    do {                                                                                  \
        if (puaa::Logger::getInstance().enabled(level)) {                                 \
            puaa::Logger::getInstance().log(level, __FILE__, __LINE__, __func__, __VA_ARGS__); \
        }                                                                                 \
    } while (0)

#define LOG_DEBUG(...) PUAA_LOG(puaa::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  PUAA_LOG(puaa::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WARN(...)  PUAA_LOG(puaa::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERROR(...) PUAA_LOG(puaa::LogLevel::ERROR, __VA_ARGS__)
#define LOG_FATAL(...) PUAA_LOG(puaa::LogLevel::FATAL, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

// Parses "debug", "info", "warn", "error", "fatal". Returns false for anything else.
inline bool parse_log_level(const std::string& name, LogLevel& level) {
    if (name == "debug") level = LogLevel::DEBUG;
    else if (name == "info") level = LogLevel::INFO;
    else if (name == "warn") level = LogLevel::WARN;
    else if (name == "error") level = LogLevel::ERROR;
    else if (name == "fatal") level = LogLevel::FATAL;
    else return false;
    return true;
}

} // namespace puaa
