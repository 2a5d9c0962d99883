#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace cs {

enum class LogLevel { Debug, Info, Warn, Error, Off };

// Small "{}"-formatting logger shared by the whole library
class MinimalLogger {
public:
    MinimalLogger();
    ~MinimalLogger();

    template<typename... Args>
    void debug(const std::string& fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    void set_level(LogLevel level) { level_ = level; }
    [[nodiscard]] LogLevel level() const { return level_; }
    void add_file(const std::filesystem::path& path);

private:
    template<typename... Args>
    void log(LogLevel level, const std::string& fmt, Args&&... args) {
        if (level < level_ || level_ == LogLevel::Off) return;
        write(level, format_message(fmt, std::forward<Args>(args)...));
    }

    void write(LogLevel level, const std::string& msg);

    template<typename T>
    static std::string to_string_helper(const T& value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    static std::string to_string_helper(const std::string& value) { return value; }
    static std::string to_string_helper(const char* value) { return std::string(value); }

    static std::string format_message(const std::string& fmt) { return fmt; }

    template<typename T, typename... Args>
    static std::string format_message(const std::string& fmt, T&& first, Args&&... rest) {
        size_t pos = fmt.find("{}");
        if (pos == std::string::npos) {
            return fmt;
        }
        std::string result = fmt.substr(0, pos) + to_string_helper(first);
        result += format_message(fmt.substr(pos + 2), std::forward<Args>(rest)...);
        return result;
    }

    LogLevel level_ = LogLevel::Info;
    std::mutex mutex_;
    std::vector<std::shared_ptr<std::ofstream>> files_;
};

void AddLogFile(const std::filesystem::path& path);
void SetLogLevel(const std::string& s);
auto Logger() -> std::shared_ptr<MinimalLogger>;

}  // namespace cs
