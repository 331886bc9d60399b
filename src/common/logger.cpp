#include <sstream>
#include <thread>
#include <utility>

#include <clouddrive/common/logger.h>
#include <clouddrive/common/utility.h>
#include <clouddrive/logging.h>

namespace clouddrive
{
namespace common
{

Logger::Logger(std::string name, LogLevel level)
  : mLevel(level)
  , mName(std::move(name))
{
}

void Logger::emit(LogLevel level,
                  const char* filename,
                  unsigned int line,
                  const std::string& message) const
{
    if (masked(level))
        return;

    std::ostringstream ostream;

    ostream << mName
            << " ["
            << std::this_thread::get_id()
            << "]: "
            << message;

    SimpleLogger::postLog(level,
                          ostream.str().c_str(),
                          filename,
                          static_cast<int>(line));
}

void Logger::emitf(LogLevel level,
                   const char* filename,
                   unsigned int line,
                   const char* format,
                   ...) const
{
    if (masked(level))
        return;

    std::va_list arguments;

    va_start(arguments, format);

    auto message = vformat(format, arguments);

    va_end(arguments);

    emit(level, filename, line, message);
}

LogLevel Logger::level() const
{
    return mLevel;
}

void Logger::level(LogLevel level)
{
    mLevel = level;
}

bool Logger::masked(LogLevel level) const
{
    return level > mLevel || level > SimpleLogger::getLogLevel();
}

const std::string& Logger::name() const
{
    return mName;
}

Logger& callLogger()
{
    static Logger logger("Calls");

    return logger;
}

} // common
} // clouddrive
