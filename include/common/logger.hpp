#ifndef _COMMON_LOGGER_H_
#define _COMMON_LOGGER_H_

#include "base/defines.hpp"

#include <plog/Log.h>

#include <functional>
#include <string>

namespace meshrtc {
namespace logging {

enum class Level { // Don't change, it MUST match plog severity
    NONE = 0,
    FATAL = 1,
    ERROR = 2,
    WARNING = 3,
    INFO = 4,
    DEBUG = 5,
    VERBOSE = 6
};

// Returns true if the message was consumed, otherwise it goes to the console.
using LoggingCallback = std::function<bool(Level level, std::string message)>;

MESHRTC_EXPORT void InitLogger(Level level, LoggingCallback callback = nullptr);
MESHRTC_EXPORT void InitLogger(plog::Severity severity, plog::IAppender *appender = nullptr);

} // namespace logging
} // namespace meshrtc

#endif
