/**
 * @file lockable.hpp
 * @brief A value that can only be reached through its lock
 */

#ifndef COSYNC_LOCKABLE_HPP
#define COSYNC_LOCKABLE_HPP

#include "cosync/errors.hpp"
#include "cosync/lock.hpp"
#include "cosync/reentrant_lock.hpp"

#include <functional>
#include <optional>
#include <utility>

namespace cosync
{

/**
 * @brief Pairs a value with the lock that protects it
 *
 * Example:
 *   Lockable<std::vector<int>> items;
 *   {
 *       auto guard = items.lock();
 *       guard->push_back(42);
 *   }   // unlocked here
 *
 *   items.with([](auto& v) { v.clear(); });
 */
template<typename V, typename L = ReentrantLock>
class Lockable
{
public:
   /**
    * @brief Holds the lock and gives access to the value. Unlocks when destroyed.
    */
   class Guard
   {
   public:
      Guard(Guard&& other) noexcept : owner(std::exchange(other.owner, nullptr)) {}
      Guard& operator=(Guard&&) = delete;
      Guard(Guard const&)            = delete;
      Guard& operator=(Guard const&) = delete;

      ~Guard()
      {
         if (owner) owner->mtx.unlock();
      }

      V& operator*() const noexcept { return owner->value; }
      V* operator->() const noexcept { return &owner->value; }

      /**
       * @brief Release early; the guard is empty afterwards
       */
      void unlock()
      {
         std::exchange(owner, nullptr)->mtx.unlock();
      }

   private:
      friend class Lockable;
      explicit Guard(Lockable& owner) noexcept : owner(&owner) {}

      Lockable* owner;
   };

   Lockable() = default;

   template<typename... Args>
   explicit Lockable(std::in_place_t, Args&&... args) : value(std::forward<Args>(args)...) {}

   explicit Lockable(V initial) : value(std::move(initial)) {}

   Lockable(Lockable const&)            = delete;
   Lockable& operator=(Lockable const&) = delete;

   [[nodiscard]] Guard lock()
   {
      mtx.lock();
      return Guard(*this);
   }

   /**
    * @return A guard, or std::nullopt if the lock is held elsewhere
    */
   [[nodiscard]] std::optional<Guard> try_lock()
   {
      if (!mtx.try_lock()) return std::nullopt;
      return Guard(*this);
   }

   /**
    * @brief Direct access for code that already holds the lock
    *
    * Calling this without holding the lock is a fatal error.
    */
   [[nodiscard]] V& get() noexcept
   {
      if constexpr (requires (L const& l) { l.is_held_by_current(); }) {
         if (!mtx.is_held_by_current()) concurrency_violation("Lockable value accessed without holding its lock");
      } else {
         if (!mtx.is_locked()) concurrency_violation("Lockable value accessed without holding its lock");
      }
      return value;
   }

   /**
    * @brief Run fn(value) under the lock and return its result
    */
   template<typename Fn>
   decltype(auto) with(Fn&& fn)
   {
      return with_lock(mtx, [&]() -> decltype(auto) { return std::invoke(std::forward<Fn>(fn), value); });
   }

   [[nodiscard]] L& underlying_lock() noexcept { return mtx; }

private:
   V value{};
   L mtx;
};

} // namespace cosync

#endif // COSYNC_LOCKABLE_HPP
