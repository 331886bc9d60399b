#pragma once

#include <clouddrive/common/expected_forward.h>
#include <clouddrive/common/unexpected.h>

#include <type_traits>
#include <utility>
#include <variant>

namespace clouddrive
{
namespace common
{
namespace detail
{

// Can an Expected holding T be built directly from a U?
template<typename T, typename U>
constexpr bool BuildsResultV =
    !IsExpectedV<std::decay_t<U>>
    && !IsUnexpectedV<std::decay_t<U>>
    && std::is_constructible_v<T, U>;

} // detail

// The outcome of an operation: either a result of type T or a failure
// of type E.
//
// Failures are produced by returning unexpected(failure):
//
//   ErrorOr<RemoteFolder> decodeFolder(const JSON& reply)
//   {
//       if (!reply.has("metadata"))
//           return unexpected(Error(...));
//
//       ...
//   }
//
// Accessing the wrong alternative throws std::bad_variant_access.
template<typename E, typename T>
class Expected
{
    template<typename F, typename U>
    friend class Expected;

    static constexpr std::size_t FAILURE = 0;
    static constexpr std::size_t RESULT  = 1;

    std::variant<E, T> mOutcome;

    template<typename Outcome>
    static std::variant<E, T> adopt(Outcome&& outcome)
    {
        if (outcome.index() == RESULT)
            return std::variant<E, T>(std::in_place_index<RESULT>,
                                      std::get<RESULT>(std::forward<Outcome>(outcome)));

        return std::variant<E, T>(std::in_place_index<FAILURE>,
                                  std::get<FAILURE>(std::forward<Outcome>(outcome)));
    }

public:
    // Default constructed outcomes hold a default failure.
    Expected() = default;

    Expected(const Expected& other) = default;

    Expected(Expected&& other) = default;

    // Widen an outcome whose result converts to ours.
    template<typename U,
             typename = std::enable_if_t<std::is_constructible_v<T, U&&>>>
    Expected(Expected<E, U>&& other)
      : mOutcome(adopt(std::move(other.mOutcome)))
    {
    }

    template<typename U,
             typename = std::enable_if_t<std::is_constructible_v<T, const U&>>>
    Expected(const Expected<E, U>& other)
      : mOutcome(adopt(other.mOutcome))
    {
    }

    template<typename F>
    Expected(Unexpected<F>&& failure)
      : mOutcome(std::in_place_index<FAILURE>, std::move(failure).value())
    {
    }

    template<typename F>
    Expected(const Unexpected<F>& failure)
      : mOutcome(std::in_place_index<FAILURE>, failure.value())
    {
    }

    template<typename U,
             typename = std::enable_if_t<detail::BuildsResultV<T, U>>>
    Expected(U&& result)
      : mOutcome(std::in_place_index<RESULT>, std::forward<U>(result))
    {
    }

    Expected& operator=(const Expected& rhs) = default;

    Expected& operator=(Expected&& rhs) = default;

    template<typename U>
    auto operator=(U&& result)
      -> std::enable_if_t<detail::BuildsResultV<T, U>, Expected&>
    {
        mOutcome.template emplace<RESULT>(std::forward<U>(result));
        return *this;
    }

    // True if we hold a result.
    explicit operator bool() const
    {
        return mOutcome.index() == RESULT;
    }

    bool operator!() const
    {
        return mOutcome.index() == FAILURE;
    }

    T* operator->()
    {
        return &value();
    }

    const T* operator->() const
    {
        return &value();
    }

    T& operator*() &
    {
        return value();
    }

    T&& operator*() &&
    {
        return std::move(*this).value();
    }

    const T& operator*() const&
    {
        return value();
    }

    E& error() &
    {
        return std::get<FAILURE>(mOutcome);
    }

    E&& error() &&
    {
        return std::get<FAILURE>(std::move(mOutcome));
    }

    const E& error() const&
    {
        return std::get<FAILURE>(mOutcome);
    }

    T& value() &
    {
        return std::get<RESULT>(mOutcome);
    }

    T&& value() &&
    {
        return std::get<RESULT>(std::move(mOutcome));
    }

    const T& value() const&
    {
        return std::get<RESULT>(mOutcome);
    }
}; // Expected<E, T>

} // common
} // clouddrive
