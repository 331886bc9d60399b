#include <cassert>
#include <ostream>
#include <sstream>

#include <clouddrive/types.h>

namespace clouddrive
{

const char* toDescription(ErrorKind kind)
{
    static const char* descriptions[] = {
#define DEFINE_DESCRIPTION(name, description) description,
        DEFINE_ERROR_KINDS(DEFINE_DESCRIPTION)
#undef DEFINE_DESCRIPTION
    }; // descriptions

    if (kind < sizeof(descriptions) / sizeof(descriptions[0]))
        return descriptions[kind];

    assert(false && "Unhandled error kind enumerant");

    return "N/A";
}

const char* toString(ErrorKind kind)
{
    static const char* names[] = {
#define DEFINE_NAME(name, description) #name,
        DEFINE_ERROR_KINDS(DEFINE_NAME)
#undef DEFINE_NAME
    }; // names

    if (kind < sizeof(names) / sizeof(names[0]))
        return names[kind];

    assert(false && "Unhandled error kind enumerant");

    return "N/A";
}

bool isAuthenticationFailure(int code)
{
    return code == API_ELOGINREQUIRED
           || code == API_ELOGINFAILED
           || code == API_EINVALIDTOKEN;
}

Error::Error()
  : mKind(ERROR_KIND_NONE)
  , mCode(API_OK)
  , mMessage()
{
}

Error::Error(ErrorKind kind, int code, std::string message)
  : mKind(kind)
  , mCode(code)
  , mMessage(std::move(message))
{
}

bool Error::operator==(const Error& rhs) const
{
    return mKind == rhs.mKind && mCode == rhs.mCode;
}

bool Error::operator!=(const Error& rhs) const
{
    return !(*this == rhs);
}

bool Error::ok() const
{
    return mKind == ERROR_KIND_NONE;
}

ErrorKind Error::kind() const
{
    return mKind;
}

int Error::code() const
{
    return mCode;
}

const std::string& Error::message() const
{
    return mMessage;
}

std::string Error::toString() const
{
    std::ostringstream ostream;

    ostream << *this;

    return ostream.str();
}

std::ostream& operator<<(std::ostream& ostream, const Error& error)
{
    ostream << toString(error.kind()) << " (" << error.code() << ")";

    if (!error.message().empty())
        ostream << ": " << error.message();

    return ostream;
}

Error apiError(int code, std::string message)
{
    return Error(ERROR_KIND_API, code, std::move(message));
}

Error cancelledError()
{
    return Error(ERROR_KIND_CANCELLED, LOCAL_ECANCELLED, "Call cancelled");
}

Error integrityError(std::string message)
{
    return Error(ERROR_KIND_INTEGRITY, LOCAL_ELENGTH, std::move(message));
}

Error stateError(int code, std::string message)
{
    return Error(ERROR_KIND_STATE, code, std::move(message));
}

Error transportError(int code, std::string message)
{
    return Error(ERROR_KIND_TRANSPORT, code, std::move(message));
}

} // clouddrive
