#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <clouddrive/json.h>

namespace clouddrive
{

// Encode a code point as UTF-8.
static void append(std::string& value, unsigned long codePoint)
{
    if (codePoint < 0x80)
        return value.push_back(static_cast<char>(codePoint));

    if (codePoint < 0x800)
    {
        value.push_back(static_cast<char>(0xc0 | (codePoint >> 6)));
        value.push_back(static_cast<char>(0x80 | (codePoint & 0x3f)));
        return;
    }

    if (codePoint < 0x10000)
    {
        value.push_back(static_cast<char>(0xe0 | (codePoint >> 12)));
        value.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3f)));
        value.push_back(static_cast<char>(0x80 | (codePoint & 0x3f)));
        return;
    }

    value.push_back(static_cast<char>(0xf0 | (codePoint >> 18)));
    value.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3f)));
    value.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3f)));
    value.push_back(static_cast<char>(0x80 | (codePoint & 0x3f)));
}

// Parse four hexadecimal digits.
static bool hex4(const char* position, unsigned long& value)
{
    value = 0;

    for (auto i = 0; i < 4; ++i)
    {
        auto c = position[i];

        value <<= 4;

        if (c >= '0' && c <= '9')
            value |= static_cast<unsigned long>(c - '0');
        else if (c >= 'a' && c <= 'f')
            value |= static_cast<unsigned long>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F')
            value |= static_cast<unsigned long>(c - 'A' + 10);
        else
            return false;
    }

    return true;
}

// Locate the end of the string starting at position.
static const char* stringEnd(const char* position)
{
    for (++position; *position; ++position)
    {
        if (*position == '"')
            return position + 1;

        if (*position == '\\' && !*++position)
            break;
    }

    return nullptr;
}

void JSON::skip()
{
    while (*mPosition && std::strchr(" \t\r\n,:", *mPosition))
        ++mPosition;
}

JSON::JSON()
  : mPosition("")
{
}

JSON::JSON(const std::string& data)
  : mPosition(data.c_str())
{
}

JSON::JSON(const char* data)
  : mPosition(data ? data : "")
{
}

bool JSON::eof()
{
    skip();

    return !*mPosition;
}

bool JSON::enterarray()
{
    skip();

    if (*mPosition != '[')
        return false;

    ++mPosition;

    return true;
}

bool JSON::enterobject()
{
    skip();

    if (*mPosition != '{')
        return false;

    ++mPosition;

    return true;
}

bool JSON::getbool(bool& value)
{
    skip();

    if (!std::strncmp(mPosition, "true", 4))
    {
        mPosition += 4;
        value = true;
        return true;
    }

    if (!std::strncmp(mPosition, "false", 5))
    {
        mPosition += 5;
        value = false;
        return true;
    }

    std::int64_t number;

    if (!getint(number))
        return false;

    value = number != 0;

    return true;
}

bool JSON::getint(std::int64_t& value)
{
    skip();

    if (*mPosition != '-' && (*mPosition < '0' || *mPosition > '9'))
        return false;

    char* end = nullptr;

    errno = 0;

    auto result = std::strtoll(mPosition, &end, 10);

    if (errno || end == mPosition)
        return false;

    // Silently drop any fraction or exponent.
    mPosition = end;

    if (*mPosition == '.' || *mPosition == 'e' || *mPosition == 'E')
    {
        std::strtod(mPosition, &end);
        mPosition = end;
    }

    value = static_cast<std::int64_t>(result);

    return true;
}

std::string JSON::getname()
{
    skip();

    auto position = mPosition;

    std::string name;

    if (!storestring(name))
        return std::string();

    while (*mPosition == ' ' || *mPosition == '\t' || *mPosition == '\r' || *mPosition == '\n')
        ++mPosition;

    // Not a name after all.
    if (*mPosition != ':')
    {
        mPosition = position;
        return std::string();
    }

    ++mPosition;

    return name;
}

bool JSON::isnull()
{
    skip();

    if (std::strncmp(mPosition, "null", 4))
        return false;

    mPosition += 4;

    return true;
}

bool JSON::leavearray()
{
    skip();

    if (*mPosition != ']')
        return false;

    ++mPosition;

    return true;
}

bool JSON::leaveobject()
{
    skip();

    if (*mPosition != '}')
        return false;

    ++mPosition;

    return true;
}

bool JSON::storestring(std::string& value)
{
    skip();

    if (*mPosition != '"')
        return false;

    std::string result;

    for (auto position = mPosition + 1; *position; ++position)
    {
        auto c = *position;

        if (c == '"')
        {
            mPosition = position + 1;
            value = std::move(result);
            return true;
        }

        if (c != '\\')
        {
            result.push_back(c);
            continue;
        }

        switch (*++position)
        {
        case 'b':
            result.push_back('\b');
            break;
        case 'f':
            result.push_back('\f');
            break;
        case 'n':
            result.push_back('\n');
            break;
        case 'r':
            result.push_back('\r');
            break;
        case 't':
            result.push_back('\t');
            break;
        case 'u':
        {
            unsigned long codePoint;

            if (!hex4(position + 1, codePoint))
                return false;

            position += 4;

            // Combine surrogate pairs.
            if (codePoint >= 0xd800 && codePoint < 0xdc00
                && position[1] == '\\' && position[2] == 'u')
            {
                unsigned long low;

                if (hex4(position + 3, low) && low >= 0xdc00 && low < 0xe000)
                {
                    codePoint = 0x10000 + ((codePoint - 0xd800) << 10) + (low - 0xdc00);
                    position += 6;
                }
            }

            append(result, codePoint);
            break;
        }
        case '\0':
            return false;
        default:
            result.push_back(*position);
            break;
        }
    }

    return false;
}

bool JSON::storeobject(std::string* value)
{
    skip();

    auto start = mPosition;
    auto position = mPosition;
    auto depth = 0;

    do
    {
        switch (*position)
        {
        case '\0':
            return false;
        case '"':
            position = stringEnd(position);

            if (!position)
                return false;

            continue;
        case '[':
        case '{':
            ++depth;
            break;
        case ']':
        case '}':
            // Can't skip past the end of our container.
            if (!depth--)
                return false;
            break;
        default:
            // Scalars end at the next separator.
            if (!depth)
            {
                while (*position && !std::strchr(",:]} \t\r\n", *position))
                    ++position;

                continue;
            }

            break;
        }

        ++position;
    }
    while (depth);

    mPosition = position;

    if (value)
        value->assign(start, position);

    return true;
}

} // clouddrive
