#ifndef _BASE_INIT_H_
#define _BASE_INIT_H_

#include "base/defines.hpp"

#include <string>

namespace meshrtc {

// Log level
enum class LoggingLevel {
    NONE,
    ERROR,
    WARNING,
    INFO,
    DEBUG,
    VERBOSE
};

// Parses "none", "error", "warning", "info", "debug" or "verbose".
// Returns `fallback` for anything else.
MESHRTC_EXPORT LoggingLevel ParseLoggingLevel(const std::string& name, LoggingLevel fallback);

MESHRTC_EXPORT void Init(LoggingLevel level = LoggingLevel::NONE);
    
} // namespace meshrtc

#endif
