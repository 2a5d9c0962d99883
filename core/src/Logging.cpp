#include "cs/core/util/Logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace {

std::string timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

const char* level_string(cs::LogLevel level)
{
    switch (level) {
        case cs::LogLevel::Debug: return "DEBUG";
        case cs::LogLevel::Info:  return "INFO ";
        case cs::LogLevel::Warn:  return "WARN ";
        case cs::LogLevel::Error: return "ERROR";
        default:                  return "?????";
    }
}

}  // namespace

namespace cs {

MinimalLogger::MinimalLogger() = default;

MinimalLogger::~MinimalLogger() = default;

void MinimalLogger::write(LogLevel level, const std::string& msg)
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream oss;
    oss << "[" << timestamp() << "] [" << level_string(level) << "] " << msg;
    const std::string formatted = oss.str();

    std::cout << formatted << std::endl;

    for (auto& file : files_) {
        if (file && file->is_open()) {
            (*file) << formatted << std::endl;
        }
    }
}

void MinimalLogger::add_file(const std::filesystem::path& path)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto file = std::make_shared<std::ofstream>(path, std::ios::app);
    if (file->is_open()) {
        files_.push_back(file);
    }
}

auto Logger() -> std::shared_ptr<MinimalLogger>
{
    static auto logger = std::make_shared<MinimalLogger>();
    return logger;
}

void AddLogFile(const std::filesystem::path& path)
{
    Logger()->add_file(path);
}

void SetLogLevel(const std::string& s)
{
    LogLevel level = LogLevel::Info;

    if (s == "debug" || s == "DEBUG") {
        level = LogLevel::Debug;
    } else if (s == "info" || s == "INFO") {
        level = LogLevel::Info;
    } else if (s == "warn" || s == "WARN" || s == "warning" || s == "WARNING") {
        level = LogLevel::Warn;
    } else if (s == "error" || s == "ERROR") {
        level = LogLevel::Error;
    } else if (s == "off" || s == "OFF") {
        level = LogLevel::Off;
    }

    Logger()->set_level(level);
}

}  // namespace cs
