#pragma once

namespace clouddrive
{
namespace common
{

template<typename E, typename T>
class Expected;

// True when T names some Expected<E, U>.
template<typename T>
constexpr bool IsExpectedV = false;

template<typename E, typename T>
constexpr bool IsExpectedV<Expected<E, T>> = true;

} // common
} // clouddrive
