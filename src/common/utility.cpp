#include <cstdio>
#include <stdexcept>

#include <clouddrive/common/utility.h>

namespace clouddrive
{
namespace common
{

std::string format(const char* format, ...)
{
    std::va_list arguments;

    va_start(arguments, format);

    auto result = vformat(format, arguments);

    va_end(arguments);

    return result;
}

std::string vformat(const char* format, std::va_list arguments)
{
    if (!format)
        throw std::invalid_argument("format can't be null");

    // Most log lines and error messages fit here.
    char scratch[256];

    std::va_list attempt;

    va_copy(attempt, arguments);

    auto length = std::vsnprintf(scratch, sizeof(scratch), format, attempt);

    va_end(attempt);

    if (length < 0)
        throw std::invalid_argument(std::string("Malformed format: ") + format);

    auto size = static_cast<std::size_t>(length);

    if (size < sizeof(scratch))
        return std::string(scratch, size);

    // Too long for the scratch buffer so format directly into the result.
    std::string result(size, '\0');

    va_copy(attempt, arguments);

    std::vsnprintf(&result[0], size + 1, format, attempt);

    va_end(attempt);

    return result;
}

} // common
} // clouddrive
