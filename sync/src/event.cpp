#include "cosync/event.hpp"
#include "cosync/lock.hpp"
#include "DEBUG_PRINT.hpp"

namespace cosync
{

// Autoreset events take the signal, plain events only look at it
bool Event::consume_signal() noexcept
{
   if (is_autoreset) {
      return set.exchange(false, std::memory_order_acq_rel);
   }
   return set.load(std::memory_order_seq_cst);
}

void Event::wait()
{
   if (consume_signal()) return;

   LockGuard guard(notify_cond);
   // A notify() may have landed before we took the lock
   if (consume_signal()) return;

   // A wakeup is the signal itself: an autoreset notify that wakes us does
   // not latch the flag, so there is nothing left to re-check.
   notify_cond.wait();
}

void Event::notify()
{
   LockGuard guard(notify_cond);
   if (is_autoreset) {
      if (!notify_cond.notify_one()) {
         set.store(true, std::memory_order_release);
      }
   } else if (!set.load(std::memory_order_relaxed)) {
      set.store(true, std::memory_order_release);
      std::size_t const woken = notify_cond.notify_all();
      LOG_SYNC("Event(%p) set, woke %zu waiters", ptr_suffix(this), woken);
      (void)woken;
   }
}

void Event::reset() noexcept
{
   set.store(false, std::memory_order_seq_cst);
}

} // namespace cosync
