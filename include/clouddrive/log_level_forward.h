#pragma once

namespace clouddrive
{

enum LogLevel : int;

} // clouddrive
