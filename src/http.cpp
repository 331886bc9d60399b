#include <cassert>
#include <cctype>
#include <stdexcept>

#include <clouddrive/http.h>

namespace clouddrive
{

class AccessTokenAuthenticator
  : public Authenticator
{
    const std::string mToken;

public:
    explicit AccessTokenAuthenticator(std::string token)
      : Authenticator()
      , mToken(std::move(token))
    {
    }

    void authenticate(HttpRequest& request) override
    {
        request.query("access_token", mToken);
    }
}; // AccessTokenAuthenticator

class BearerAuthenticator
  : public Authenticator
{
    const std::string mValue;

public:
    explicit BearerAuthenticator(const std::string& token)
      : Authenticator()
      , mValue("Bearer " + token)
    {
    }

    void authenticate(HttpRequest& request) override
    {
        request.header("Authorization", mValue);
    }
}; // BearerAuthenticator

static bool equal(const std::string& lhs, const std::string& rhs)
{
    if (lhs.size() != rhs.size())
        return false;

    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        auto l = std::tolower(static_cast<unsigned char>(lhs[i]));
        auto r = std::tolower(static_cast<unsigned char>(rhs[i]));

        if (l != r)
            return false;
    }

    return true;
}

const char* toString(HttpMethod method)
{
    static const char* names[] = {
#define DEFINE_NAME(name) #name,
        DEFINE_HTTP_METHODS(DEFINE_NAME)
#undef DEFINE_NAME
    }; // names

    if (method < sizeof(names) / sizeof(names[0]))
        return names[method];

    assert(false && "Unhandled HTTP method enumerant");

    return "N/A";
}

const std::string* findHeader(const HttpHeaders& headers, const std::string& name)
{
    for (auto& header : headers)
    {
        if (equal(header.first, name))
            return &header.second;
    }

    return nullptr;
}

std::string urlEncode(const std::string& value)
{
    static const char digits[] = "0123456789ABCDEF";

    std::string result;

    result.reserve(value.size() * 3);

    for (auto c : value)
    {
        auto u = static_cast<unsigned char>(c);

        // Unreserved characters are passed through as is.
        if (std::isalnum(u) || c == '-' || c == '.' || c == '_' || c == '~')
        {
            result.push_back(c);
            continue;
        }

        result.push_back('%');
        result.push_back(digits[u >> 4]);
        result.push_back(digits[u & 0xf]);
    }

    return result;
}

void HttpRequest::header(std::string name, std::string value)
{
    mHeaders.emplace_back(std::move(name), std::move(value));
}

void HttpRequest::query(const std::string& name, const std::string& value)
{
    mURL.push_back(mURL.find('?') == std::string::npos ? '?' : '&');
    mURL.append(urlEncode(name));
    mURL.push_back('=');
    mURL.append(urlEncode(value));
}

const std::string* HttpResponse::header(const std::string& name) const
{
    return findHeader(mHeaders, name);
}

bool HttpResponse::successful() const
{
    return mStatus >= 200 && mStatus < 300;
}

bool Authenticator::refresh()
{
    return false;
}

AuthenticatorPtr Authenticators::bearer(std::string token)
{
    if (token.empty())
        throw std::invalid_argument("Bearer token can't be empty");

    return std::make_shared<BearerAuthenticator>(token);
}

AuthenticatorPtr Authenticators::accessToken(std::string token)
{
    if (token.empty())
        throw std::invalid_argument("Access token can't be empty");

    return std::make_shared<AccessTokenAuthenticator>(std::move(token));
}

} // clouddrive
