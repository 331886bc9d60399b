// Small command line client.
//
// Credentials and the API host are taken from the environment:
//
//   CLOUDDRIVE_ACCESS_TOKEN  OAuth access token (required)
//   CLOUDDRIVE_API_HOST      Defaults to api.pcloud.com
//   CLOUDDRIVE_LOG_LEVEL     fatal, error, warning, info, debug or verbose
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <clouddrive/clouddrive.h>

using namespace clouddrive;

namespace
{

using Arguments = std::vector<std::string>;
using Command = std::function<int(ApiService&, const Arguments&)>;

handle toHandle(const std::string& value)
{
    std::size_t used = 0;

    auto result = std::stoull(value, &used);

    if (used != value.size())
        throw std::invalid_argument("Invalid identifier: " + value);

    return static_cast<handle>(result);
}

int report(const Error& error)
{
    std::cerr << "Error: " << error << std::endl;

    return EXIT_FAILURE;
}

ProgressListenerPtr progress(const char* what)
{
    return makeProgressListener([what](m_off_t transferred, m_off_t total) {
        std::cerr << "\r" << what << ": " << transferred;

        if (total != UNKNOWN_LENGTH)
            std::cerr << " / " << total;

        if (transferred == total)
            std::cerr << std::endl;
    });
}

void print(const RemoteEntry& entry)
{
    std::cout << (entry.isFolder() ? "d " : "- ")
              << entry.id() << "\t";

    if (!entry.isFolder())
        std::cout << static_cast<const RemoteFile&>(entry).mSize;

    std::cout << "\t" << entry.mName << "\n";
}

int catFile(ApiService& service, const Arguments& arguments)
{
    RemoteFile file;

    file.mFileID = toHandle(arguments.at(0));

    auto result = service.downloadContent(file).execute();

    if (!result)
        return report(result.error());

    std::cout << *result << std::flush;

    return EXIT_SUCCESS;
}

int copyEntry(ApiService& service, const Arguments& arguments)
{
    auto result = service.copy(arguments.at(0), toHandle(arguments.at(1))).execute();

    if (!result)
        return report(result.error());

    print(**result);

    return EXIT_SUCCESS;
}

int deleteEntry(ApiService& service, const Arguments& arguments)
{
    auto id = parseEntryID(arguments.at(0));

    if (!id)
        throw std::invalid_argument("Invalid entry identifier: " + arguments[0]);

    // Folders are removed along with their content.
    auto result = id->mFolder
                    ? service.deleteFolder(id->mID, true).execute()
                    : service.deleteFile(id->mID).execute();

    if (!result)
        return report(result.error());

    return EXIT_SUCCESS;
}

int download(ApiService& service, const Arguments& arguments)
{
    RemoteFile file;

    file.mFileID = toHandle(arguments.at(0));

    auto sink = DataSink::toFile(arguments.at(1));
    auto result = service.download(file, sink, progress("Downloaded")).execute();

    if (!result)
        return report(result.error());

    std::cout << *result << " byte(s) written to " << arguments[1] << std::endl;

    return EXIT_SUCCESS;
}

int fileLink(ApiService& service, const Arguments& arguments)
{
    auto result = service.createFileLink(toHandle(arguments.at(0))).execute();

    if (!result)
        return report(result.error());

    for (auto& url : result->mURLs)
        std::cout << url << "\n";

    return EXIT_SUCCESS;
}

int listFolder(ApiService& service, const Arguments& arguments)
{
    auto id = arguments.empty() ? ROOT_FOLDER_ID : toHandle(arguments[0]);
    auto result = service.listFolder(id).execute();

    if (!result)
        return report(result.error());

    for (auto& child : result->mChildren)
        print(*child);

    return EXIT_SUCCESS;
}

int makeFolder(ApiService& service, const Arguments& arguments)
{
    auto result = service.createFolder(toHandle(arguments.at(0)), arguments.at(1)).execute();

    if (!result)
        return report(result.error());

    print(*result);

    return EXIT_SUCCESS;
}

int moveEntry(ApiService& service, const Arguments& arguments)
{
    auto result = service.move(arguments.at(0), toHandle(arguments.at(1))).execute();

    if (!result)
        return report(result.error());

    print(**result);

    return EXIT_SUCCESS;
}

int renameEntry(ApiService& service, const Arguments& arguments)
{
    auto result = service.rename(arguments.at(0), arguments.at(1)).execute();

    if (!result)
        return report(result.error());

    print(**result);

    return EXIT_SUCCESS;
}

int upload(ApiService& service, const Arguments& arguments)
{
    auto& path = arguments.at(1);
    auto name = arguments.size() > 2 ? arguments[2] : path.substr(path.find_last_of('/') + 1);

    auto result = service.createFile(toHandle(arguments.at(0)),
                                     name,
                                     DataSource::fromFile(path),
                                     std::nullopt,
                                     progress("Uploaded")).execute();

    if (!result)
        return report(result.error());

    print(*result);

    return EXIT_SUCCESS;
}

int userInfo(ApiService& service, const Arguments&)
{
    auto result = service.getUserInfo().execute();

    if (!result)
        return report(result.error());

    std::cout << "User:     " << result->mUserID << "\n"
              << "Email:    " << result->mEmail
              << (result->mEmailVerified ? "" : " (unverified)") << "\n"
              << "Premium:  " << (result->mPremium ? "yes" : "no") << "\n"
              << "Quota:    " << result->mUsedQuota << " / " << result->mTotalQuota
              << std::endl;

    return EXIT_SUCCESS;
}

struct CommandInfo
{
    Command mFunction;
    std::size_t mMinArguments;
    const char* mUsage;
}; // CommandInfo

const std::map<std::string, CommandInfo>& commands()
{
    static const std::map<std::string, CommandInfo> commands = {
        {"cat",    {catFile,     1, "cat <file>"}},
        {"cp",     {copyEntry,   2, "cp <entry> <folder>"}},
        {"get",    {download,    2, "get <file> <local path>"}},
        {"info",   {userInfo,    0, "info"}},
        {"link",   {fileLink,    1, "link <file>"}},
        {"ls",     {listFolder,  0, "ls [folder]"}},
        {"mkdir",  {makeFolder,  2, "mkdir <parent> <name>"}},
        {"mv",     {moveEntry,   2, "mv <entry> <folder>"}},
        {"put",    {upload,      2, "put <folder> <local path> [name]"}},
        {"rename", {renameEntry, 2, "rename <entry> <name>"}},
        {"rm",     {deleteEntry, 1, "rm <entry>"}},
    }; // commands

    return commands;
}

int usage(const char* program)
{
    std::cerr << "Usage: " << program << " <command> [arguments]\n\n"
              << "Folders and files are named by number, entries by "
              << "\"d<number>\" or \"f<number>\".\n\n"
              << "Commands:\n";

    for (auto& command : commands())
        std::cerr << "  " << command.second.mUsage << "\n";

    return EXIT_FAILURE;
}

} // anonymous

int main(int argc, char** argv)
{
    if (auto* level = std::getenv("CLOUDDRIVE_LOG_LEVEL"))
        SimpleLogger::setLogLevel(toLogLevel(level));
    else
        SimpleLogger::setLogLevel(logWarning);

    g_externalLogger.setLogToConsole(true);

    if (argc < 2)
        return usage(argv[0]);

    auto command = commands().find(argv[1]);

    if (command == commands().end())
        return usage(argv[0]);

    Arguments arguments(argv + 2, argv + argc);

    if (arguments.size() < command->second.mMinArguments)
        return usage(argv[0]);

    auto* token = std::getenv("CLOUDDRIVE_ACCESS_TOKEN");

    if (!token || !*token)
    {
        std::cerr << "CLOUDDRIVE_ACCESS_TOKEN must be set" << std::endl;
        return EXIT_FAILURE;
    }

    auto builder = ApiService::builder();

    builder.authenticator(Authenticators::bearer(token))
           .cache(std::make_shared<ResponseCache>(1 << 20));

    if (auto* host = std::getenv("CLOUDDRIVE_API_HOST"))
        builder.apiHost(host);

    auto service = builder.create();

    auto result = EXIT_FAILURE;

    try
    {
        result = command->second.mFunction(*service, arguments);
    }
    catch (std::exception& exception)
    {
        std::cerr << "Error: " << exception.what() << std::endl;
    }

    service->shutdown();

    return result;
}
