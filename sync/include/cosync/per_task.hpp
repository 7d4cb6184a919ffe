/**
 * @file per_task.hpp
 * @brief Lazily computed value, once per unit
 */

#ifndef COSYNC_PER_TASK_HPP
#define COSYNC_PER_TASK_HPP

#include "cosync/errors.hpp"
#include "cosync/once.hpp"
#include "cosync/runtime.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace cosync
{

/**
 * @brief Calls initializer the first time each unit invokes it
 *
 * Results live in the calling unit's local storage under a key unique to this
 * object, and are destroyed with the unit. No other unit can see them, so nothing here
 * synchronizes.
 */
template<typename T, typename F = OnceInitializer<T>>
class PerTask
{
   static_assert(detail::valid_once_value<T>, "PerTask needs an object type");

   struct Slot
   {
      std::optional<T> value;
      std::exception_ptr failure;
      bool running{false};
   };

public:
   explicit PerTask(F initializer) : initializer(std::move(initializer)) {}

   PerTask(PerTask const&)            = delete;
   PerTask& operator=(PerTask const&) = delete;

   T& operator()()
   {
      Slot& slot = slot_in(this_unit::local_storage());
      if (slot.value) return *slot.value;

      if (slot.failure) {
         throw PermanentInitializationFailure(slot.failure);
      }
      if (slot.running) {
         throw InvalidOperation("PerTask initializer called itself recursively");
      }

      slot.running = true;
      try {
         slot.value.emplace(std::invoke(initializer));
      } catch (...) {
         slot.running = false;
         slot.failure = std::current_exception();
         throw;
      }
      slot.running = false;
      return *slot.value;
   }

   /**
    * @brief Whether the calling unit already has a value
    */
   [[nodiscard]] bool has_value() const
   {
      auto& storage = this_unit::local_storage();
      return storage.contains(key) && slot_in(storage).value.has_value();
   }

private:
   Slot& slot_in(UnitLocalStorage& storage) const
   {
      return storage.get_or_insert<Slot>(key, [] { return Slot{}; });
   }

   F initializer;
   UnitLocalStorage::Key const key{UnitLocalStorage::new_key()};
};

template<typename F>
PerTask(F) -> PerTask<std::invoke_result_t<F&>, F>;

} // namespace cosync

#endif // COSYNC_PER_TASK_HPP
