/**
 * @file reentrant_lock.hpp
 * @brief Recursive mutual exclusion for units
 */

#ifndef COSYNC_REENTRANT_LOCK_HPP
#define COSYNC_REENTRANT_LOCK_HPP

#include "cosync/runtime.hpp"

#include <atomic>
#include <cstdint>

namespace cosync
{

/**
 * @brief A lock the holding unit may take again without blocking itself
 *
 * Each lock() (or successful try_lock()) must be matched by an unlock(). The
 * lock is free for other units once the depth drops back to 0.
 *
 * State is a tri-state word plus the owner's identity and depth:
 * - Unlocked:  free.
 * - Locked:    held, nobody parked since it was last taken.
 * - Contended: held, and a unit is (or was) parked on it, so the releasing
 *              side must wake one.
 *
 * The uncontended path is a single CAS. Only the slow path touches the wait
 * queue. While a unit holds the lock, finalizers on it are deferred until the
 * outermost unlock().
 *
 * Satisfies BasicLockable and Lockable, so std::unique_lock and
 * std::scoped_lock work with it.
 */
class ReentrantLock
{
public:
   ReentrantLock() = default;
   ~ReentrantLock() = default;

   ReentrantLock(ReentrantLock const&)            = delete;
   ReentrantLock& operator=(ReentrantLock const&) = delete;
   ReentrantLock(ReentrantLock&&)                 = delete;
   ReentrantLock& operator=(ReentrantLock&&)      = delete;

   /**
    * @brief Acquire the lock if it is free or already held by the caller
    *
    * Never parks the caller.
    * @return true if the caller now holds the lock
    */
   [[nodiscard]] bool try_lock() noexcept;

   /**
    * @brief Acquire the lock, parking until it is available
    */
   void lock() noexcept;

   /**
    * @brief Release one level of the lock
    * @throws InvalidOperation "unlock count must match lock count" if the
    *         lock is not held at all (count mismatch), or "unlock from wrong
    *         thread" if another unit holds it (wrong owner). The lock is left
    *         untouched in both cases.
    */
   void unlock();

   /**
    * @brief Whether any unit holds the lock
    *
    * Note: a racy snapshot, not a synchronization point.
    */
   [[nodiscard]] bool is_locked() const noexcept;

   [[nodiscard]] bool is_held_by_current() const noexcept;

   /**
    * @brief Fully release a lock held by the caller, whatever its depth
    * @return The depth to hand back to relock_all()
    * @throws InvalidOperation with the same count-mismatch and wrong-owner
    *         messages as unlock()
    */
   std::uint32_t unlock_all();

   /**
    * @brief Reacquire after unlock_all() and restore the saved depth
    */
   void relock_all(std::uint32_t depth) noexcept;

private:
   enum class LockWord : std::uint8_t { Unlocked, Locked, Contended };

   bool try_acquire(UnitId self, LockWord word) noexcept;

   std::atomic<UnitId> locked_by{nullptr};
   std::atomic<std::uint32_t> reentrancy_count{0};
   std::atomic<LockWord> havelock{LockWord::Unlocked};
   WaitQueue cond_wait;
};

} // namespace cosync

#endif // COSYNC_REENTRANT_LOCK_HPP
