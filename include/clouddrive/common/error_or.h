#pragma once

#include <clouddrive/common/error_or_forward.h>
#include <clouddrive/common/expected.h>
#include <clouddrive/types.h>

namespace clouddrive
{

using common::unexpected;

} // clouddrive
