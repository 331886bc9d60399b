/* Usage example:

    // Emit debug messages and everything more severe.
    SimpleLogger::setLogLevel(logDebug);

    // Print messages on the console.
    g_externalLogger.setLogToConsole(true);

    // Forward messages to the application.
    g_externalLogger.addLogger(this, [](const char* time,
                                        int level,
                                        const char* source,
                                        const char* message) {
        ...
    });

    LOG_debug << "Executing call " << id;
    LOG_err << "Transfer failed: " << error;
*/
#pragma once

#include <atomic>
#include <cassert>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>
#include <type_traits>

#include <clouddrive/log_level.h>

namespace clouddrive
{

// Output Log Interface
class Logger
{
public:
    virtual ~Logger() = default;

    virtual void log(const char* time,
                     int loglevel,
                     const char* source,
                     const char* message) = 0;
}; // Logger

class SimpleLogger
{
    LogLevel level;

    std::ostringstream ostr;
    std::string t;
    std::string fname;

    static std::string getTime();

    // Where are messages sent?
    static std::atomic<Logger*> logger;

    // What is the most verbose level we'll emit?
    static std::atomic<LogLevel> logCurrentLevel;

public:
    SimpleLogger(const LogLevel ll, const char* filename, const int line);

    ~SimpleLogger();

    SimpleLogger(const SimpleLogger&) = delete;

    SimpleLogger& operator=(const SimpleLogger&) = delete;

    static const char* toStr(LogLevel ll)
    {
        switch (ll)
        {
            case logVerbose: return "verbose";
            case logDebug: return "debug";
            case logInfo: return "info";
            case logWarning: return "warn";
            case logError: return "err";
            case logFatal: return "FATAL";
        }

        assert(false);

        return "";
    }

    template<typename T>
    SimpleLogger& operator<<(T* obj)
    {
        if (obj)
            ostr << obj;
        else
            ostr << "(NULL)";

        return *this;
    }

    template<typename T, typename = typename std::enable_if<std::is_scalar<T>::value>::type>
    SimpleLogger& operator<<(const T obj)
    {
        static_assert(!std::is_same<T, std::nullptr_t>::value, "T cannot be nullptr_t");

        ostr << obj;

        return *this;
    }

    template<typename T, typename = typename std::enable_if<!std::is_scalar<T>::value>::type>
    SimpleLogger& operator<<(const T& obj)
    {
        ostr << obj;

        return *this;
    }

    template<typename T>
    SimpleLogger& operator<<(const std::unique_ptr<T>& ptr)
    {
        return *this << ptr.get();
    }

    template<typename T>
    SimpleLogger& operator<<(const std::shared_ptr<T>& ptr)
    {
        return *this << ptr.get();
    }

    // set output class
    static void setOutputClass(Logger* logger_class)
    {
        logger = logger_class;
    }

    static void setLogLevel(LogLevel ll)
    {
        logCurrentLevel = ll;
    }

    static LogLevel getLogLevel()
    {
        return logCurrentLevel;
    }

    static void postLog(LogLevel logLevel, const char* message, const char* filename, int line)
    {
        if (logCurrentLevel < logLevel)
            return;

        SimpleLogger logger(logLevel, filename ? filename : "", line);

        if (message)
            logger << message;
    }
}; // SimpleLogger

// source file leaf name
template<std::size_t N>
inline const char* log_file_leafname(const char (&fullpath)[N])
{
    for (auto i = N - 1; --i; )
    {
        if (fullpath[i] == '/' || fullpath[i] == '\\')
            return &fullpath[i+1];
    }

    return fullpath;
}

std::ostream& operator<<(std::ostream&, const std::system_error&);
std::ostream& operator<<(std::ostream&, const std::error_code&);

// Helper used in LOG_* macros below to make the right operand of ?: void to match the left one
struct LoggerVoidify
{
    void operator&(SimpleLogger&) {}
}; // LoggerVoidify

#define LOG_verbose \
    ::clouddrive::SimpleLogger::getLogLevel() < ::clouddrive::logVerbose ? (void)0 : \
        ::clouddrive::LoggerVoidify() & ::clouddrive::SimpleLogger(::clouddrive::logVerbose, ::clouddrive::log_file_leafname(__FILE__), __LINE__)

#define LOG_debug \
    ::clouddrive::SimpleLogger::getLogLevel() < ::clouddrive::logDebug ? (void)0 : \
        ::clouddrive::LoggerVoidify() & ::clouddrive::SimpleLogger(::clouddrive::logDebug, ::clouddrive::log_file_leafname(__FILE__), __LINE__)

#define LOG_info \
    ::clouddrive::SimpleLogger::getLogLevel() < ::clouddrive::logInfo ? (void)0 : \
        ::clouddrive::LoggerVoidify() & ::clouddrive::SimpleLogger(::clouddrive::logInfo, ::clouddrive::log_file_leafname(__FILE__), __LINE__)

#define LOG_warn \
    ::clouddrive::SimpleLogger::getLogLevel() < ::clouddrive::logWarning ? (void)0 : \
        ::clouddrive::LoggerVoidify() & ::clouddrive::SimpleLogger(::clouddrive::logWarning, ::clouddrive::log_file_leafname(__FILE__), __LINE__)

#define LOG_err \
    ::clouddrive::SimpleLogger::getLogLevel() < ::clouddrive::logError ? (void)0 : \
        ::clouddrive::LoggerVoidify() & ::clouddrive::SimpleLogger(::clouddrive::logError, ::clouddrive::log_file_leafname(__FILE__), __LINE__)

#define LOG_fatal \
    ::clouddrive::SimpleLogger(::clouddrive::logFatal, ::clouddrive::log_file_leafname(__FILE__), __LINE__)

// Fans messages out to any number of application supplied callbacks.
class ExternalLogger
  : public Logger
{
public:
    using LogCallback = std::function<void(const char* time,
                                           int loglevel,
                                           const char* source,
                                           const char* message)>;

    ExternalLogger();

    void addLogger(void* id, LogCallback callback);

    void removeLogger(void* id);

    void setLogToConsole(bool enable);

    void log(const char* time,
             int loglevel,
             const char* source,
             const char* message) override;

private:
    std::recursive_mutex mutex;
    std::map<void*, LogCallback> loggers;
    std::atomic<bool> logToConsole;
    bool alreadyLogging = false;
}; // ExternalLogger

extern ExternalLogger g_externalLogger;

} // clouddrive
