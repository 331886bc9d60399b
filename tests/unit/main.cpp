#include <cstdlib>

#include <gtest/gtest.h>

#include <clouddrive/logging.h>

int main(int argc, char* argv[])
{
    using namespace clouddrive;

    // Keep the output quiet unless we've been asked otherwise.
    auto level = logWarning;

    if (auto* name = std::getenv("CLOUDDRIVE_LOG_LEVEL"))
        level = toLogLevel(name);

    SimpleLogger::setLogLevel(level);

    g_externalLogger.setLogToConsole(true);

    testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
