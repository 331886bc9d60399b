#pragma once

#include <clouddrive/common/unexpected_forward.h>

#include <type_traits>
#include <utility>

namespace clouddrive
{
namespace common
{

// Marks a failure so that it can be returned where an Expected is.
template<typename E>
class Unexpected
{
    E mError;

public:
    explicit Unexpected(E error)
      : mError(std::move(error))
    {
    }

    const E& value() const&
    {
        return mError;
    }

    E&& value() &&
    {
        return std::move(mError);
    }
}; // Unexpected<E>

// return unexpected(Error(API_EACCESS, ...));
template<typename E>
Unexpected<std::decay_t<E>> unexpected(E&& error)
{
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

} // common
} // clouddrive
