#include <clouddrive/logging.h>

#include <ctime>
#include <iostream>

namespace clouddrive
{

ExternalLogger g_externalLogger;

std::atomic<Logger*> SimpleLogger::logger{&g_externalLogger};

// by default, display logs with level equal or less than logInfo
std::atomic<LogLevel> SimpleLogger::logCurrentLevel{logInfo};

std::string SimpleLogger::getTime()
{
    char ts[50];
    time_t t = std::time(NULL);
    std::tm tm{};

    gmtime_r(&t, &tm);

    if (std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm))
        return ts;

    return {};
}

SimpleLogger::SimpleLogger(const LogLevel ll, const char* filename, const int line)
  : level(ll)
{
    if (!logger)
        return;

    t = getTime();

    std::ostringstream oss;

    oss << filename;

    if (line >= 0)
        oss << ":" << line;

    fname = oss.str();
}

SimpleLogger::~SimpleLogger()
{
    if (auto* output = logger.load())
        output->log(t.c_str(), level, fname.c_str(), ostr.str().c_str());
}

std::ostream& operator<<(std::ostream& ostr, const std::error_code& value)
{
    return ostr << value.category().name() << ": " << value.message();
}

std::ostream& operator<<(std::ostream& ostr, const std::system_error& se)
{
    return ostr << se.code().category().name() << ": " << se.what();
}

ExternalLogger::ExternalLogger()
  : logToConsole(false)
{
}

void ExternalLogger::addLogger(void* id, LogCallback callback)
{
    std::lock_guard<std::recursive_mutex> g(mutex);

    loggers[id] = std::move(callback);
}

void ExternalLogger::removeLogger(void* id)
{
    std::lock_guard<std::recursive_mutex> g(mutex);

    loggers.erase(id);
}

void ExternalLogger::setLogToConsole(bool enable)
{
    logToConsole = enable;
}

void ExternalLogger::log(const char* time,
                         int loglevel,
                         const char* source,
                         const char* message)
{
    if (!time)
        time = "";

    if (!source)
        source = "";

    if (!message)
        message = "";

    std::lock_guard<std::recursive_mutex> g(mutex);

    // Logging from inside a logging callback would recurse forever.
    if (alreadyLogging)
        return;

    alreadyLogging = true;

    for (auto& entry : loggers)
        entry.second(time, loglevel, source, message);

    if (logToConsole)
    {
        std::clog << "[" << time << "]["
                  << SimpleLogger::toStr(static_cast<LogLevel>(loglevel))
                  << "] "
                  << message
                  << " ["
                  << source
                  << "]"
                  << std::endl;
    }

    alreadyLogging = false;
}

} // clouddrive
