#pragma once

#include <clouddrive/common/expected_forward.h>
#include <clouddrive/common/unexpected_forward.h>

namespace clouddrive
{

class Error;

namespace common
{

template<typename T>
using ErrorOr = Expected<Error, T>;

} // common

using common::ErrorOr;

} // clouddrive
