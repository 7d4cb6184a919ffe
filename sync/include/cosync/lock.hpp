/**
 * @file lock.hpp
 * @brief Scoped acquisition helpers for any BasicLockable
 *
 * Anything with lock()/unlock() (and try_lock() for try_with_lock) works
 * here, including the runtime's Spinlock and WaitQueue.
 */

#ifndef COSYNC_LOCK_HPP
#define COSYNC_LOCK_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace cosync
{

/**
 * @brief RAII guard: locks on construction, unlocks on destruction
 */
template<typename L>
class LockGuard
{
public:
   explicit LockGuard(L& lock) : lock(lock)
   {
      lock.lock();
   }

   /**
    * @brief Take over a lock the caller already holds
    */
   LockGuard(L& lock, std::adopt_lock_t) : lock(lock) {}

   ~LockGuard()
   {
      lock.unlock();
   }

   LockGuard(LockGuard const&)            = delete;
   LockGuard& operator=(LockGuard const&) = delete;
   LockGuard(LockGuard&&)                 = delete;
   LockGuard& operator=(LockGuard&&)      = delete;

private:
   L& lock;
};

/**
 * @brief Run body while holding lock, releasing it on every exit path
 * @return Whatever body returns
 */
template<typename L, typename Body>
decltype(auto) with_lock(L& lock, Body&& body)
{
   LockGuard<L> guard(lock);
   return std::invoke(std::forward<Body>(body));
}

/**
 * @brief Run body only if lock can be taken without blocking
 * @return For a void body, whether it ran. Otherwise its result, or
 *         std::nullopt if the lock was busy.
 */
template<typename L, typename Body>
auto try_with_lock(L& lock, Body&& body)
{
   using R = std::remove_cvref_t<std::invoke_result_t<Body&&>>;

   if constexpr (std::is_void_v<R>) {
      if (!lock.try_lock()) return false;
      LockGuard<L> guard(lock, std::adopt_lock);
      std::invoke(std::forward<Body>(body));
      return true;
   } else {
      if (!lock.try_lock()) return std::optional<R>{};
      LockGuard<L> guard(lock, std::adopt_lock);
      return std::optional<R>{std::invoke(std::forward<Body>(body))};
   }
}

} // namespace cosync

#endif // COSYNC_LOCK_HPP
