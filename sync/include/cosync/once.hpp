/**
 * @file once.hpp
 * @brief Pieces shared by PerProcess, PerThread and PerTask
 */

#ifndef COSYNC_ONCE_HPP
#define COSYNC_ONCE_HPP

#include "cosync/function.hpp"

#include <cstdint>
#include <type_traits>

namespace cosync
{

/**
 * @brief Lifecycle of one memoized slot. Moves forward only.
 *
 * Uninit -> Running -> Done | Failed
 */
enum class OnceState : std::uint8_t
{
   Uninit,
   Running,
   Done,
   Failed
};

/**
 * @brief Default initializer type: any callable returning T
 */
template<typename T>
using OnceInitializer = Function<T(), 32, HeapPolicy::CanUseHeap>;

namespace detail
{
   template<typename T>
   inline constexpr bool valid_once_value = !std::is_void_v<T> && !std::is_reference_v<T>;
}

} // namespace cosync

#endif // COSYNC_ONCE_HPP
