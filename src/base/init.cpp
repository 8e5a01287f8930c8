#include "base/init.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <cctype>

namespace meshrtc {
namespace {

logging::Level ToLoggerLevel(LoggingLevel level) {
    switch (level) {
    case LoggingLevel::NONE:
        return logging::Level::NONE;
    case LoggingLevel::ERROR:
        return logging::Level::ERROR;
    case LoggingLevel::WARNING:
        return logging::Level::WARNING;
    case LoggingLevel::INFO:
        return logging::Level::INFO;
    case LoggingLevel::DEBUG:
        return logging::Level::DEBUG;
    case LoggingLevel::VERBOSE:
        return logging::Level::VERBOSE;
    }
    return logging::Level::NONE;
}

} // namespace

LoggingLevel ParseLoggingLevel(const std::string& name, LoggingLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "none") return LoggingLevel::NONE;
    if (lower == "error") return LoggingLevel::ERROR;
    if (lower == "warning") return LoggingLevel::WARNING;
    if (lower == "info") return LoggingLevel::INFO;
    if (lower == "debug") return LoggingLevel::DEBUG;
    if (lower == "verbose") return LoggingLevel::VERBOSE;
    return fallback;
}

void Init(LoggingLevel level) {
    logging::InitLogger(ToLoggerLevel(level));
}
    
} // namespace meshrtc
