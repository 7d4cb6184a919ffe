/**
 * @file semaphore.hpp
 * @brief Counting semaphore for units
 */

#ifndef COSYNC_SEMAPHORE_HPP
#define COSYNC_SEMAPHORE_HPP

#include "cosync/condition.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <utility>

namespace cosync
{

/**
 * @brief Lets at most capacity() units hold a slot at the same time
 *
 * Unlike a lock, a slot is not owned: any unit may release a slot another
 * unit acquired.
 */
class Semaphore
{
public:
   /**
    * @throws InvalidArgument if capacity is 0
    */
   explicit Semaphore(std::size_t capacity);

   Semaphore(Semaphore const&)            = delete;
   Semaphore& operator=(Semaphore const&) = delete;

   /**
    * @brief Take a slot, parking while all of them are in use
    */
   void acquire();

   /**
    * @brief Take a slot only if one is free right now
    */
   [[nodiscard]] bool try_acquire();

   /**
    * @brief Hand a slot back and wake one parked acquirer
    * @throws InvalidOperation if no slot is currently taken
    */
   void release();

   /**
    * @brief Run body while holding a slot, released on every exit path
    */
   template<typename Body>
   decltype(auto) acquire_scoped(Body&& body)
   {
      acquire();
      SlotGuard guard(*this);
      return std::invoke(std::forward<Body>(body));
   }

   [[nodiscard]] std::size_t capacity() const noexcept { return sem_size; }

   // Racy peek at the slots in use
   [[nodiscard]] std::size_t count() const noexcept { return curr_cnt.load(std::memory_order_relaxed); }

private:
   struct SlotGuard
   {
      Semaphore& semaphore;
      explicit SlotGuard(Semaphore& semaphore) : semaphore(semaphore) {}
      ~SlotGuard() { semaphore.release(); }
   };

   std::size_t const sem_size;
   std::atomic<std::size_t> curr_cnt{0};
   Condition cond_wait;
};

} // namespace cosync

#endif // COSYNC_SEMAPHORE_HPP
