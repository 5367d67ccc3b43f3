#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace stvox {

// Small process-wide logger with spdlog-style "{}" placeholders
class SimpleLogger {
public:
    enum class Level {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical,
        Off
    };

    SimpleLogger();
    ~SimpleLogger();

    void setLevel(Level level) { currentLevel_ = level; }
    Level level() const { return currentLevel_; }
    bool addFile(const std::filesystem::path& path);

    template<typename... Args>
    void trace(const std::string& fmt, Args&&... args) {
        log(Level::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& fmt, Args&&... args) {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& fmt, Args&&... args) {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& fmt, Args&&... args) {
        log(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& fmt, Args&&... args) {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(const std::string& fmt, Args&&... args) {
        log(Level::Critical, fmt, std::forward<Args>(args)...);
    }

    // Exposed for tests: substitutes each "{}" in order, extra args are dropped
    template<typename... Args>
    static std::string format(const std::string& fmt, Args&&... args) {
        return formatMessage(fmt, std::forward<Args>(args)...);
    }

private:
    template<typename... Args>
    void log(Level level, const std::string& fmt, Args&&... args) {
        if (level < currentLevel_ || level == Level::Off) return;

        std::string line = levelPrefix(level) + formatMessage(fmt, std::forward<Args>(args)...);

        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << line << std::endl;
        for (auto& file : files_) {
            if (file.is_open()) {
                file << line << '\n';
                file.flush();
            }
        }
    }

    template<typename T>
    static std::string toString(T&& val) {
        std::ostringstream oss;
        oss << std::forward<T>(val);
        return oss.str();
    }

    template<typename T, typename... Args>
    static std::string formatMessage(const std::string& fmt, T&& first, Args&&... rest) {
        std::string result = fmt;
        size_t pos = result.find("{}");
        if (pos == std::string::npos) {
            return result;
        }
        std::string head = result.substr(0, pos) + toString(std::forward<T>(first));
        return head + formatMessage(result.substr(pos + 2), std::forward<Args>(rest)...);
    }

    static std::string formatMessage(const std::string& fmt) {
        return fmt;
    }

    static std::string levelPrefix(Level level);

    Level currentLevel_ = Level::Info;
    std::mutex mutex_;
    std::vector<std::ofstream> files_;
};

std::optional<SimpleLogger::Level> ParseLogLevel(const std::string& s);
bool AddLogFile(const std::filesystem::path& path);
void SetLogLevel(const std::string& s);
std::shared_ptr<SimpleLogger> Logger();

// Logs "<label> took <ms> ms" at debug level when it goes out of scope
class ScopedTimer
{
public:
    explicit ScopedTimer(std::string label)
        : label_(std::move(label)), start_(std::chrono::steady_clock::now())
    {
    }
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double milliseconds() const
    {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace stvox
