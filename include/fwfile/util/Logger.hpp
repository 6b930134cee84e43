#pragma once
/// @file Logger.hpp
/// @brief Minimal synchronous logger formatted with {fmt}
///
/// Usage:
/// @code
/// FW_LOG_INFO("wrote {} records to {}", n, path);
/// FwFile::Logger::instance().setLevel(FwFile::Logger::Level::Debug);
/// @endcode

#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace FwFile {

/// @brief Process-wide logger writing "[time] [LEVEL] message" lines
/// @note Single-threaded tool; no internal queue or locking.
class Logger {
  public:
    enum class Level { Trace = 0, Debug, Info, Warn, Error, Off };

    static Logger& instance();

    void setLevel(Level level) noexcept { level_ = level; }
    Level level() const noexcept { return level_; }

    /// @brief Redirects output (default stderr). Caller keeps ownership of stream.
    void setStream(std::FILE* stream) noexcept { stream_ = stream ? stream : stderr; }

    bool enabled(Level level) const noexcept {
        return level_ != Level::Off && level != Level::Off &&
               static_cast<int>(level) >= static_cast<int>(level_);
    }

    template <typename... Args>
    void log(Level level, fmt::format_string<Args...> format, Args&&... args) {
        if (!enabled(level))
            return;
        write(level, fmt::format(format, std::forward<Args>(args)...));
    }

    /// @brief Parses "trace|debug|info|warn|error|off" (case sensitive)
    static bool parseLevel(std::string_view text, Level& out) noexcept;

    static const char* levelName(Level level) noexcept;

  private:
    Logger() = default;

    void write(Level level, std::string_view message);

    Level level_ = Level::Warn;
    std::FILE* stream_ = stderr;
};

} // namespace FwFile

#define FW_LOG_TRACE(...) ::FwFile::Logger::instance().log(::FwFile::Logger::Level::Trace, __VA_ARGS__)
#define FW_LOG_DEBUG(...) ::FwFile::Logger::instance().log(::FwFile::Logger::Level::Debug, __VA_ARGS__)
#define FW_LOG_INFO(...) ::FwFile::Logger::instance().log(::FwFile::Logger::Level::Info, __VA_ARGS__)
#define FW_LOG_WARN(...) ::FwFile::Logger::instance().log(::FwFile::Logger::Level::Warn, __VA_ARGS__)
#define FW_LOG_ERROR(...) ::FwFile::Logger::instance().log(::FwFile::Logger::Level::Error, __VA_ARGS__)
