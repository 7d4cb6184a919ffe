#include "cosync/reentrant_lock.hpp"
#include "cosync/errors.hpp"
#include "DEBUG_PRINT.hpp"

namespace cosync
{

bool ReentrantLock::try_acquire(UnitId self, LockWord word) noexcept
{
   finalizers::disable();
   auto expected = LockWord::Unlocked;
   if (havelock.compare_exchange_strong(expected, word, std::memory_order_acquire, std::memory_order_relaxed)) {
      reentrancy_count.store(1, std::memory_order_relaxed);
      locked_by.store(self, std::memory_order_release);
      return true;
   }
   finalizers::enable();
   return false;
}

bool ReentrantLock::try_lock() noexcept
{
   UnitId const self = this_unit::id();
   // Only the owner can have stored its own identity
   if (locked_by.load(std::memory_order_relaxed) == self) {
      reentrancy_count.store(reentrancy_count.load(std::memory_order_relaxed) + 1, std::memory_order_relaxed);
      return true;
   }
   return try_acquire(self, LockWord::Locked);
}

void ReentrantLock::lock() noexcept
{
   if (try_lock()) return;

   UnitId const self = this_unit::id();
   LOG_SYNC("ReentrantLock(%p) contended, taking slow path", ptr_suffix(this));

   cond_wait.lock();
   while (true) {
      auto prior = LockWord::Locked;
      if (havelock.compare_exchange_strong(prior, LockWord::Contended) || prior == LockWord::Contended) {
         // Held by someone else, who will wake us on release
         cond_wait.wait();
         continue;
      }
      // prior == Unlocked: race for it. Units still queued behind us must be
      // woken by our own unlock(), so take it as Contended in that case.
      if (try_acquire(self, cond_wait.has_waiters() ? LockWord::Contended : LockWord::Locked)) {
         break;
      }
   }
   cond_wait.unlock();
}

void ReentrantLock::unlock()
{
   std::uint32_t const n = reentrancy_count.load(std::memory_order_relaxed);
   if (n == 0) {
      throw InvalidOperation("unlock count must match lock count");
   }
   if (locked_by.load(std::memory_order_relaxed) != this_unit::id()) {
      throw InvalidOperation("unlock from wrong thread");
   }

   if (n > 1) {
      reentrancy_count.store(n - 1, std::memory_order_relaxed);
      return;
   }

   locked_by.store(nullptr, std::memory_order_relaxed);
   reentrancy_count.store(0, std::memory_order_relaxed);
   if (havelock.exchange(LockWord::Unlocked, std::memory_order_release) == LockWord::Contended) {
      cond_wait.lock();
      cond_wait.notify_one();
      cond_wait.unlock();
   }
   finalizers::enable();
}

bool ReentrantLock::is_locked() const noexcept
{
   return havelock.load(std::memory_order_relaxed) != LockWord::Unlocked;
}

bool ReentrantLock::is_held_by_current() const noexcept
{
   return locked_by.load(std::memory_order_relaxed) == this_unit::id();
}

std::uint32_t ReentrantLock::unlock_all()
{
   std::uint32_t const n = reentrancy_count.load(std::memory_order_relaxed);
   if (n == 0) {
      throw InvalidOperation("unlock count must match lock count");
   }
   if (locked_by.load(std::memory_order_relaxed) != this_unit::id()) {
      throw InvalidOperation("unlock from wrong thread");
   }
   reentrancy_count.store(1, std::memory_order_relaxed);
   unlock();
   return n;
}

void ReentrantLock::relock_all(std::uint32_t depth) noexcept
{
   lock();
   std::uint32_t const old = reentrancy_count.exchange(depth, std::memory_order_relaxed);
   if (old != 1) {
      concurrency_violation("relock_all: lock was reacquired at a depth other than 1");
   }
}

} // namespace cosync
