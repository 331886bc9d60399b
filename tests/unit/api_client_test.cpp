#include <chrono>
#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <clouddrive/api_client.h>
#include <clouddrive/data_sink.h>
#include <clouddrive/data_source.h>
#include <clouddrive/transfer.h>

#include "fake_remote.h"

namespace clouddrive
{

using namespace std::chrono_literals;

using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

using test::MockTransport;
using test::queryArgument;
using test::reply;

// Hands out a new token whenever the remote rejects the current one.
class RefreshingAuthenticator
  : public Authenticator
{
public:
    void authenticate(HttpRequest& request) override
    {
        request.header("Authorization", "Bearer " + mToken);
    }

    bool refresh() override
    {
        ++mRefreshes;

        mToken = "fresh";

        return true;
    }

    int mRefreshes = 0;

    std::string mToken = "stale";
}; // RefreshingAuthenticator

class ApiClientTest
  : public ::testing::Test
{
protected:
    ApiClient& client(ResponseCachePtr cache = nullptr)
    {
        mClient = std::make_unique<ApiClient>(mOptions, std::move(cache), mTransport);

        return *mClient;
    }

    CancellerPtr mCanceller = std::make_shared<Canceller>();

    std::unique_ptr<ApiClient> mClient;

    ApiServiceOptions mOptions;

    std::shared_ptr<MockTransport> mTransport = std::make_shared<MockTransport>();
}; // ApiClientTest

TEST_F(ApiClientTest, shapes_requests)
{
    mOptions.mApiHost = "eapi.example";
    mOptions.mAuthenticator = Authenticators::bearer("token");
    mOptions.mConnectTimeout = 1000ms;
    mOptions.mReadTimeout = 2000ms;
    mOptions.mWriteTimeout = 3000ms;

    EXPECT_CALL(*mTransport, execute(_, _)).WillOnce(Invoke([](HttpRequest& request, const Canceller&) {
        EXPECT_EQ(request.mMethod, HTTP_METHOD_GET);
        EXPECT_EQ(request.mURL.rfind("https://eapi.example/createfolder?", 0), 0u);
        EXPECT_EQ(queryArgument(request.mURL, "timeformat"), "timestamp");
        EXPECT_EQ(queryArgument(request.mURL, "folderid"), "0");
        EXPECT_EQ(queryArgument(request.mURL, "name"), "My Docs");
        EXPECT_EQ(request.mConnectTimeout, 1000ms);
        EXPECT_EQ(request.mReadTimeout, 2000ms);
        EXPECT_EQ(request.mWriteTimeout, 3000ms);

        auto* authorization = findHeader(request.mHeaders, "Authorization");

        EXPECT_NE(authorization, nullptr);

        if (authorization)
            EXPECT_EQ(*authorization, "Bearer token");

        return ErrorOr<HttpResponse>(reply(R"({"result": 0})"));
    }));

    ApiRequest request("createfolder");

    request.arg("folderid", ROOT_FOLDER_ID).arg("name", "My Docs");

    auto result = client().call(request, *mCanceller);

    ASSERT_TRUE(result);
    EXPECT_EQ(*result, R"({"result": 0})");
}

TEST_F(ApiClientTest, http_failure)
{
    EXPECT_CALL(*mTransport, execute(_, _)).WillOnce(Return(ErrorOr<HttpResponse>(reply("", 503))));

    auto result = client().call(ApiRequest("userinfo"), *mCanceller);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ERROR_KIND_API);
    EXPECT_EQ(result.error().code(), 503);
}

TEST_F(ApiClientTest, api_failure)
{
    EXPECT_CALL(*mTransport, execute(_, _))
      .WillOnce(Return(ErrorOr<HttpResponse>(reply(R"({"result": 2005, "error": "Directory does not exist."})"))));

    auto result = client().call(ApiRequest("listfolder"), *mCanceller);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), apiError(2005, "Directory does not exist."));
}

TEST_F(ApiClientTest, malformed_reply)
{
    EXPECT_CALL(*mTransport, execute(_, _)).WillOnce(Return(ErrorOr<HttpResponse>(reply("<html>"))));

    auto result = client().call(ApiRequest("listfolder"), *mCanceller);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ERROR_KIND_TRANSPORT);
    EXPECT_EQ(result.error().code(), LOCAL_EPROTOCOL);
}

TEST_F(ApiClientTest, transport_failure)
{
    EXPECT_CALL(*mTransport, execute(_, _))
      .WillOnce(Return(ErrorOr<HttpResponse>(unexpected(transportError(LOCAL_ECONNECT, "refused")))));

    auto result = client().call(ApiRequest("listfolder"), *mCanceller);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), LOCAL_ECONNECT);
}

TEST_F(ApiClientTest, refreshes_credentials_once)
{
    auto authenticator = std::make_shared<RefreshingAuthenticator>();

    mOptions.mAuthenticator = authenticator;

    EXPECT_CALL(*mTransport, execute(_, _))
      .WillOnce(Invoke([](HttpRequest& request, const Canceller&) {
          EXPECT_EQ(*findHeader(request.mHeaders, "Authorization"), "Bearer stale");
          return ErrorOr<HttpResponse>(reply(R"({"result": 2094, "error": "Invalid token."})"));
      }))
      .WillOnce(Invoke([](HttpRequest& request, const Canceller&) {
          EXPECT_EQ(*findHeader(request.mHeaders, "Authorization"), "Bearer fresh");
          return ErrorOr<HttpResponse>(reply(R"({"result": 0})"));
      }));

    EXPECT_TRUE(client().call(ApiRequest("userinfo"), *mCanceller));
    EXPECT_EQ(authenticator->mRefreshes, 1);
}

TEST_F(ApiClientTest, refreshes_at_most_once)
{
    auto authenticator = std::make_shared<RefreshingAuthenticator>();

    mOptions.mAuthenticator = authenticator;

    EXPECT_CALL(*mTransport, execute(_, _))
      .Times(2)
      .WillRepeatedly(Return(ErrorOr<HttpResponse>(reply(R"({"result": 1000, "error": "Log in required."})"))));

    auto result = client().call(ApiRequest("userinfo"), *mCanceller);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), API_ELOGINREQUIRED);
    EXPECT_EQ(authenticator->mRefreshes, 1);
}

TEST_F(ApiClientTest, streamed_requests_are_not_replayed)
{
    auto authenticator = std::make_shared<RefreshingAuthenticator>();

    mOptions.mAuthenticator = authenticator;

    EXPECT_CALL(*mTransport, execute(_, _))
      .WillOnce(Return(ErrorOr<HttpResponse>(reply(R"({"result": 1000, "error": "Log in required."})"))));

    auto source = DataSource::fromBytes("abc");
    auto reader = source->open();

    ASSERT_TRUE(reader);

    ProgressOptions options;

    options.mExecutor = inlineExecutor();
    options.mThreshold = 1;

    UploadBody body(std::move(reader).value(), 3, options, *mCanceller);

    ApiRequest request("uploadfile");

    request.body(HTTP_METHOD_PUT, body);

    auto result = client().call(request, *mCanceller);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), API_ELOGINREQUIRED);
    EXPECT_EQ(authenticator->mRefreshes, 0);
}

TEST_F(ApiClientTest, caches_responses)
{
    auto cache = std::make_shared<ResponseCache>(4096);

    auto response = reply(R"({"result": 0, "email": "user@example.com"})");

    response.mHeaders.emplace_back("Cache-Control", "max-age=60");

    EXPECT_CALL(*mTransport, execute(_, _)).WillOnce(Return(ErrorOr<HttpResponse>(response)));

    auto& c = client(cache);

    EXPECT_TRUE(c.call(ApiRequest("userinfo"), *mCanceller));
    EXPECT_TRUE(c.call(ApiRequest("userinfo"), *mCanceller));
    EXPECT_EQ(cache->hits(), 1u);
}

TEST_F(ApiClientTest, cache_keys_include_credentials)
{
    auto cache = std::make_shared<ResponseCache>(4096);

    auto response = reply(R"({"result": 0})");

    response.mHeaders.emplace_back("Cache-Control", "max-age=60");

    EXPECT_CALL(*mTransport, execute(_, _))
      .Times(2)
      .WillRepeatedly(Return(ErrorOr<HttpResponse>(response)));

    mOptions.mAuthenticator = Authenticators::bearer("alice");

    EXPECT_TRUE(client(cache).call(ApiRequest("userinfo"), *mCanceller));

    mOptions.mAuthenticator = Authenticators::bearer("bob");

    EXPECT_TRUE(client(cache).call(ApiRequest("userinfo"), *mCanceller));
}

TEST_F(ApiClientTest, fetch_skips_authentication)
{
    mOptions.mAuthenticator = Authenticators::bearer("token");

    EXPECT_CALL(*mTransport, execute(_, _)).WillOnce(Invoke([](HttpRequest& request, const Canceller&) {
        EXPECT_EQ(request.mURL, "https://content.example/1/a.txt");
        EXPECT_EQ(findHeader(request.mHeaders, "Authorization"), nullptr);
        EXPECT_NE(request.mConsumer, nullptr);
        return ErrorOr<HttpResponse>(reply(""));
    }));

    auto sink = std::make_shared<BufferSink>();

    ProgressOptions options;

    options.mExecutor = inlineExecutor();
    options.mThreshold = 1;

    DownloadConsumer consumer(sink, options, *mCanceller);

    EXPECT_TRUE(client().fetch("https://content.example/1/a.txt", consumer, *mCanceller));
}

TEST(ApiClientDecoding, folder_listing)
{
    auto reply = R"({
        "result": 0,
        "metadata": {
            "isfolder": true, "folderid": 0, "name": "/", "created": 10, "modified": 20,
            "contents": [
                {"isfolder": true, "folderid": 5, "parentfolderid": 0, "name": "Docs", "contents": []},
                {"isfolder": false, "fileid": 7, "parentfolderid": 0, "name": "a.txt",
                 "size": 3, "contenttype": "text/plain", "hash": 17868426305633419520,
                 "icon": "document", "thumb": false}
            ]
        }
    })";

    auto folder = ApiClient::decodeFolder(reply);

    ASSERT_TRUE(folder);
    EXPECT_EQ(folder->mFolderID, ROOT_FOLDER_ID);
    EXPECT_EQ(folder->mCreated, 10);
    EXPECT_EQ(folder->mModified, 20);
    ASSERT_EQ(folder->mChildren.size(), 2u);

    auto& docs = *folder->mChildren[0];

    EXPECT_TRUE(docs.isFolder());
    EXPECT_EQ(docs.mName, "Docs");
    EXPECT_EQ(docs.id(), "d5");

    ASSERT_FALSE(folder->mChildren[1]->isFolder());

    auto& file = static_cast<const RemoteFile&>(*folder->mChildren[1]);

    EXPECT_EQ(file.mFileID, 7u);
    EXPECT_EQ(file.mSize, 3);
    EXPECT_EQ(file.mContentType, "text/plain");
    EXPECT_EQ(file.mHash, "17868426305633419520");
}

TEST(ApiClientDecoding, upload_metadata)
{
    auto file = ApiClient::decodeFile(R"({"result": 0, "fileids": [9], "metadata": [{"isfolder": false, "fileid": 9, "name": "b.bin", "size": 4}]})");

    ASSERT_TRUE(file);
    EXPECT_EQ(file->mFileID, 9u);
    EXPECT_EQ(file->mName, "b.bin");
}

TEST(ApiClientDecoding, wrong_entry_type)
{
    auto file = ApiClient::decodeFile(R"({"result": 0, "metadata": {"isfolder": true, "folderid": 1}})");

    ASSERT_FALSE(file);
    EXPECT_EQ(file.error().code(), LOCAL_EPROTOCOL);

    EXPECT_FALSE(ApiClient::decodeFolder(R"({"result": 0})"));
}

TEST(ApiClientDecoding, file_link)
{
    auto link = ApiClient::decodeFileLink(R"({"result": 0, "path": "/abc/a.txt", "hosts": ["c1.example", "c2.example"], "expires": 1234})");

    ASSERT_TRUE(link);
    EXPECT_EQ(link->mExpires, 1234);
    ASSERT_EQ(link->mURLs.size(), 2u);
    EXPECT_EQ(link->bestUrl(), "https://c1.example/abc/a.txt");
    EXPECT_EQ(link->mURLs[1], "https://c2.example/abc/a.txt");

    EXPECT_FALSE(ApiClient::decodeFileLink(R"({"result": 0, "path": "/abc", "hosts": []})"));
}

TEST(ApiClientDecoding, user_info)
{
    auto info = ApiClient::decodeUserInfo(R"({"result": 0, "email": "user@example.com", "emailverified": true, "premium": false, "quota": 10737418240, "usedquota": 512, "userid": 42})");

    ASSERT_TRUE(info);
    EXPECT_EQ(info->mEmail, "user@example.com");
    EXPECT_TRUE(info->mEmailVerified);
    EXPECT_FALSE(info->mPremium);
    EXPECT_EQ(info->mTotalQuota, 10737418240u);
    EXPECT_EQ(info->mUsedQuota, 512u);
    EXPECT_EQ(info->mUserID, 42u);
}

TEST(ApiClientDecoding, result)
{
    auto result = ApiClient::decodeResult(R"({"result": 2006, "error": "Folder is not empty."})");

    ASSERT_TRUE(result);
    EXPECT_EQ(result->first, 2006);
    EXPECT_EQ(result->second, "Folder is not empty.");

    EXPECT_FALSE(ApiClient::decodeResult(R"({"error": "no result"})"));
    EXPECT_FALSE(ApiClient::decodeResult("[]"));
}

} // clouddrive
