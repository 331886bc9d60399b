#pragma once

namespace clouddrive
{
namespace common
{

template<typename E>
class Unexpected;

// True when T names some Unexpected<E>.
template<typename T>
constexpr bool IsUnexpectedV = false;

template<typename E>
constexpr bool IsUnexpectedV<Unexpected<E>> = true;

} // common
} // clouddrive
