/**
 * @file event.hpp
 * @brief Level- or edge-triggered signal between units
 */

#ifndef COSYNC_EVENT_HPP
#define COSYNC_EVENT_HPP

#include "cosync/condition.hpp"

#include <atomic>

namespace cosync
{

/**
 * @brief Units wait() until another unit notify()s
 *
 * A plain event latches: once notified, every current and future wait()
 * returns at once until reset().
 *
 * An autoreset event hands out one wakeup per notify(): it releases one
 * parked waiter, or if nobody is parked, lets exactly the next wait() through.
 */
class Event
{
public:
   explicit Event(bool autoreset = false) : is_autoreset(autoreset) {}

   Event(Event const&)            = delete;
   Event& operator=(Event const&) = delete;

   void wait();
   void notify();

   /**
    * @brief Clear the signal. Does not take the lock.
    */
   void reset() noexcept;

   [[nodiscard]] bool is_set() const noexcept { return set.load(std::memory_order_relaxed); }
   [[nodiscard]] bool autoreset() const noexcept { return is_autoreset; }

private:
   [[nodiscard]] bool consume_signal() noexcept;

   Condition notify_cond;
   bool const is_autoreset;
   std::atomic<bool> set{false};
};

} // namespace cosync

#endif // COSYNC_EVENT_HPP
