#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

namespace clouddrive
{

// Signed so that -1 can represent an unknown length.
using m_off_t = std::int64_t;

// Seconds since the epoch.
using m_time_t = std::int64_t;

// Identifies files and folders on the remote.
using handle = std::uint64_t;

// The root folder is always zero.
constexpr handle ROOT_FOLDER_ID = 0;

// Signals that a stream's length isn't known in advance.
constexpr m_off_t UNKNOWN_LENGTH = -1;

#define DEFINE_ERROR_KINDS(expander) \
    expander(NONE, "No error") \
    expander(ARGUMENT, "An invalid argument was specified") \
    expander(API, "The remote endpoint rejected the operation") \
    expander(TRANSPORT, "The exchange failed due to a connectivity or I/O problem") \
    expander(INTEGRITY, "The transferred length did not match the declared length") \
    expander(STATE, "The call was not in a state that permits the operation") \
    expander(CANCELLED, "The call has been cancelled")

enum ErrorKind : unsigned int
{
#define DEFINE_ENUMERANT(name, description) ERROR_KIND_##name,
    DEFINE_ERROR_KINDS(DEFINE_ENUMERANT)
#undef DEFINE_ENUMERANT
}; // ErrorKind

const char* toDescription(ErrorKind kind);

const char* toString(ErrorKind kind);

// Locally generated error codes.
//
// Errors reported by the remote carry the remote's own (positive) result
// code instead.
enum ErrorCodes : int
{
    API_OK = 0,                 ///< Everything OK.
    LOCAL_EINTERNAL = -1,       ///< Internal error.
    LOCAL_EARGS = -2,           ///< Bad arguments.
    LOCAL_ECONNECT = -3,        ///< Couldn't connect to (or resolve) the remote.
    LOCAL_ETIMEOUT = -4,        ///< An exchange timed out.
    LOCAL_EREAD = -5,           ///< Data could not be read from a source.
    LOCAL_EWRITE = -6,          ///< Data could not be written to a sink.
    LOCAL_ELENGTH = -7,         ///< Declared and actual lengths differ.
    LOCAL_EEXECUTED = -8,       ///< The call has already been executed.
    LOCAL_ECANCELLED = -9,      ///< The call has been cancelled.
    LOCAL_ESHUTDOWN = -10,      ///< The service has been shut down.
    LOCAL_EPROTOCOL = -11,      ///< The remote sent something we can't understand.
    LOCAL_ESSL = -12,           ///< TLS negotiation or verification failed.
    LOCAL_ENETWORK = -13,       ///< Any other network failure.
}; // ErrorCodes

// Remote result codes that mean our credentials weren't accepted.
constexpr int API_ELOGINREQUIRED = 1000;
constexpr int API_ELOGINFAILED = 2000;
constexpr int API_EINVALIDTOKEN = 2094;

bool isAuthenticationFailure(int code);

class Error
{
    // What kind of error is this?
    ErrorKind mKind;

    // Machine readable code.
    int mCode;

    // Human readable description.
    std::string mMessage;

public:
    Error();

    Error(ErrorKind kind, int code, std::string message = std::string());

    bool operator==(const Error& rhs) const;

    bool operator!=(const Error& rhs) const;

    // True if this instance doesn't describe an error.
    bool ok() const;

    ErrorKind kind() const;

    int code() const;

    const std::string& message() const;

    // Human readable rendition suitable for logging.
    std::string toString() const;
}; // Error

std::ostream& operator<<(std::ostream& ostream, const Error& error);

// Convenience constructors.
Error apiError(int code, std::string message);

Error cancelledError();

Error integrityError(std::string message);

Error stateError(int code, std::string message);

Error transportError(int code, std::string message);

} // clouddrive
