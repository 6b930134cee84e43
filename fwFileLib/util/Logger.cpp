#include "fwfile/util/Logger.hpp"

#include <ctime>

#include <fmt/chrono.h>

namespace FwFile {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

bool Logger::parseLevel(std::string_view text, Level& out) noexcept {
    static constexpr std::pair<std::string_view, Level> kLevels[] = {
        {"trace", Level::Trace}, {"debug", Level::Debug}, {"info", Level::Info},
        {"warn", Level::Warn},   {"error", Level::Error}, {"off", Level::Off},
    };
    for (const auto& entry : kLevels) {
        if (entry.first == text) {
            out = entry.second;
            return true;
        }
    }
    return false;
}

const char* Logger::levelName(Level level) noexcept {
    switch (level) {
    case Level::Trace:
        return "TRACE";
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        break;
    }
    return "OFF";
}

void Logger::write(Level level, std::string_view message) {
    std::time_t now = std::time(nullptr);
    fmt::print(stream_, "[{:%Y-%m-%d %H:%M:%S}] [{:<5}] {}\n", fmt::localtime(now),
               levelName(level), message);
    std::fflush(stream_);
}

} // namespace FwFile
