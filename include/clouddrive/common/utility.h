#pragma once

#include <cstdarg>
#include <string>

namespace clouddrive
{
namespace common
{

// printf-style formatting.
std::string format(const char* format, ...);

std::string vformat(const char* format, std::va_list arguments);

} // common
} // clouddrive
