#pragma once

#include <clouddrive/common/logger.h>
#include <clouddrive/logging.h>

// Emit a message through a subsystem logger.
//
// The arguments are only evaluated when the message isn't masked.
#define LogEmit(logger, level, message) do \
{ \
    auto& logEmitLogger = (logger); \
    if (!logEmitLogger.masked(level)) \
        logEmitLogger.emit((level), \
                           ::clouddrive::log_file_leafname(__FILE__), \
                           __LINE__, \
                           (message)); \
} \
while (0)

#define LogEmitF(logger, level, ...) do \
{ \
    auto& logEmitLogger = (logger); \
    if (!logEmitLogger.masked(level)) \
        logEmitLogger.emitf((level), \
                            ::clouddrive::log_file_leafname(__FILE__), \
                            __LINE__, \
                            __VA_ARGS__); \
} \
while (0)

#define LogDebug1(logger, message) \
  LogEmit((logger), ::clouddrive::logDebug, (message))

#define LogDebugF(logger, ...) \
  LogEmitF((logger), ::clouddrive::logDebug, __VA_ARGS__)

#define LogInfo1(logger, message) \
  LogEmit((logger), ::clouddrive::logInfo, (message))

#define LogInfoF(logger, ...) \
  LogEmitF((logger), ::clouddrive::logInfo, __VA_ARGS__)

#define LogWarning1(logger, message) \
  LogEmit((logger), ::clouddrive::logWarning, (message))

#define LogWarningF(logger, ...) \
  LogEmitF((logger), ::clouddrive::logWarning, __VA_ARGS__)

#define LogError1(logger, message) \
  LogEmit((logger), ::clouddrive::logError, (message))

#define LogErrorF(logger, ...) \
  LogEmitF((logger), ::clouddrive::logError, __VA_ARGS__)
