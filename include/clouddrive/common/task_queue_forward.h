#pragma once

#include <memory>

namespace clouddrive
{
namespace common
{

class Task;
class TaskContext;
class TaskQueue;

using TaskContextPtr = std::shared_ptr<TaskContext>;

} // common
} // clouddrive
