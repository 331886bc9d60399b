#pragma once

namespace clouddrive
{
namespace common
{

class Logger;

} // common
} // clouddrive
