/**
 * @file condition.hpp
 * @brief Condition variable bundled with the ReentrantLock that guards it
 */

#ifndef COSYNC_CONDITION_HPP
#define COSYNC_CONDITION_HPP

#include "cosync/reentrant_lock.hpp"
#include "cosync/runtime.hpp"

#include <cstddef>

namespace cosync
{

/**
 * @brief A ReentrantLock plus a list of units waiting for a state change
 *
 * Usage:
 *   LockGuard guard(cond);
 *   while (!predicate()) {
 *       cond.wait();
 *   }
 *
 * wait() releases the lock completely, whatever depth the caller holds it
 * at, and restores that depth before returning.
 */
class Condition
{
public:
   Condition() = default;

   Condition(Condition const&)            = delete;
   Condition& operator=(Condition const&) = delete;

   void lock() noexcept { mutex.lock(); }
   [[nodiscard]] bool try_lock() noexcept { return mutex.try_lock(); }
   void unlock() { mutex.unlock(); }
   [[nodiscard]] bool is_locked() const noexcept { return mutex.is_locked(); }
   [[nodiscard]] bool is_held_by_current() const noexcept { return mutex.is_held_by_current(); }

   /**
    * @brief Park until notified. Caller must hold the lock.
    */
   void wait();

   /**
    * @brief Wake the longest waiting unit. Caller must hold the lock.
    * @return true if a unit was woken
    */
   bool notify_one() noexcept;

   /**
    * @brief Wake every waiting unit. Caller must hold the lock.
    * @return Number of units woken
    */
   std::size_t notify_all() noexcept;

   [[nodiscard]] ReentrantLock& underlying_lock() noexcept { return mutex; }

private:
   void assert_havelock() const noexcept;

   ReentrantLock mutex;
   WaitList waiters;
};

} // namespace cosync

#endif // COSYNC_CONDITION_HPP
