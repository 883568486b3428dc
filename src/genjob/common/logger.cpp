#include "genjob/common/logger.hpp"
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace genjob
{

namespace
{

std::mutex g_log_mutex;
LogLevel g_level{LogLevel::Warn};
bool g_level_initialized{false};
std::unordered_map<std::thread::id, std::string> g_thread_names;

// Requires g_log_mutex.
LogLevel current_level_locked() noexcept
{
    if (!g_level_initialized)
    {
        const char* env_val = std::getenv("GENJOB_LOG_LEVEL");
        g_level = env_val
            ? Logger::parse_level(env_val, LogLevel::Warn)
            : LogLevel::Warn;
        g_level_initialized = true;
    }
    return g_level;
}

} // namespace

void Logger::set_level(LogLevel level) noexcept
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return current_level_locked();
}

bool Logger::enabled(LogLevel level) noexcept
{
    return static_cast<std::uint8_t>(level) <=
           static_cast<std::uint8_t>(Logger::level());
}

void Logger::log(LogLevel level, const std::string& message) noexcept
{
    try
    {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (static_cast<std::uint8_t>(level) >
            static_cast<std::uint8_t>(current_level_locked()))
        {
            return;
        }

        std::ostringstream ss;
        ss << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
           << " [" << level_name(level) << "]";

        auto it = g_thread_names.find(std::this_thread::get_id());
        if (it != g_thread_names.end())
        {
            ss << " [" << it->second << "]";
        }
        else
        {
            ss << " [T" << std::this_thread::get_id() << "]";
        }
        ss << " " << message;

        std::cerr << ss.str() << std::endl;
    }
    catch (...)
    {
        // Logging failures are dropped; callers must not see them.
    }
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) noexcept
{
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name)
    {
        lowered.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }

    if (lowered == "error") return LogLevel::Error;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "trace") return LogLevel::Trace;
    return fallback;
}

const char* Logger::level_name(LogLevel level) noexcept
{
    switch (level)
    {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "UNKN ";
}

void set_thread_name(const std::string& name)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

void clear_thread_name() noexcept
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names.erase(std::this_thread::get_id());
}

} // namespace genjob
