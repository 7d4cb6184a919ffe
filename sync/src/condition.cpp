#include "cosync/condition.hpp"
#include "cosync/errors.hpp"
#include "DEBUG_PRINT.hpp"

namespace cosync
{

void Condition::assert_havelock() const noexcept
{
   if (!mutex.is_held_by_current()) {
      concurrency_violation("Condition used without holding its lock");
   }
}

void Condition::wait()
{
   assert_havelock();

   WaitList::Node node;
   waiters.add(node);

   std::uint32_t const depth = mutex.unlock_all();
   WaitList::block(node);
   mutex.relock_all(depth);
}

bool Condition::notify_one() noexcept
{
   assert_havelock();
   return waiters.signal_one();
}

std::size_t Condition::notify_all() noexcept
{
   assert_havelock();
   std::size_t const woken = waiters.signal_all();
   if (woken) LOG_SYNC("Condition(%p) woke %zu waiters", ptr_suffix(this), woken);
   return woken;
}

} // namespace cosync
