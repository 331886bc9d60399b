#pragma once

#include <atomic>
#include <cstdarg>
#include <string>

#include <clouddrive/log_level.h>
#include <clouddrive/common/logger_forward.h>

namespace clouddrive
{
namespace common
{

// Routes a subsystem's messages to the process-wide logger.
//
// Each message is tagged with the subsystem's name and the calling
// thread. A message is emitted only when neither the subsystem's own
// level nor the global level masks it.
class Logger
{
    std::atomic<LogLevel> mLevel;

    std::string mName;

public:
    explicit Logger(std::string name, LogLevel level = logMax);

    Logger(const Logger& other) = delete;

    Logger& operator=(const Logger& rhs) = delete;

    void emit(LogLevel level,
              const char* filename,
              unsigned int line,
              const std::string& message) const;

    void emitf(LogLevel level,
               const char* filename,
               unsigned int line,
               const char* format,
               ...) const;

    LogLevel level() const;

    void level(LogLevel level);

    bool masked(LogLevel level) const;

    const std::string& name() const;
}; // Logger

// Used by the call machinery, the dispatcher and the executors.
Logger& callLogger();

} // common
} // clouddrive
