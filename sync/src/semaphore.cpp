#include "cosync/semaphore.hpp"
#include "cosync/errors.hpp"
#include "cosync/lock.hpp"
#include "DEBUG_PRINT.hpp"

namespace cosync
{

static std::size_t checked_capacity(std::size_t capacity)
{
   if (capacity == 0) {
      throw InvalidArgument("Semaphore size must be > 0");
   }
   return capacity;
}

Semaphore::Semaphore(std::size_t capacity) : sem_size(checked_capacity(capacity)) {}

void Semaphore::acquire()
{
   LockGuard guard(cond_wait);
   while (curr_cnt.load(std::memory_order_relaxed) >= sem_size) {
      LOG_SYNC("Semaphore(%p) full, waiting", ptr_suffix(this));
      cond_wait.wait();
   }
   curr_cnt.fetch_add(1, std::memory_order_relaxed);
}

bool Semaphore::try_acquire()
{
   LockGuard guard(cond_wait);
   if (curr_cnt.load(std::memory_order_relaxed) >= sem_size) {
      return false;
   }
   curr_cnt.fetch_add(1, std::memory_order_relaxed);
   return true;
}

void Semaphore::release()
{
   LockGuard guard(cond_wait);
   std::size_t const n = curr_cnt.load(std::memory_order_relaxed);
   if (n == 0) {
      throw InvalidOperation("release count must match acquire count");
   }
   curr_cnt.store(n - 1, std::memory_order_relaxed);
   cond_wait.notify_one();
}

} // namespace cosync
