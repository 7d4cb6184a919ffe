/**
 * @file per_process.hpp
 * @brief Lazily computed value, once per process
 */

#ifndef COSYNC_PER_PROCESS_HPP
#define COSYNC_PER_PROCESS_HPP

#include "cosync/errors.hpp"
#include "cosync/lock.hpp"
#include "cosync/once.hpp"
#include "cosync/reentrant_lock.hpp"
#include "DEBUG_PRINT.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace cosync
{

/**
 * @brief Calls initializer the first time it is invoked and caches the result
 *
 * Every later call, from any unit on any worker, returns the same object
 * without taking a lock. Concurrent first callers block until the one running
 * the initializer finishes.
 *
 * If the initializer throws, the failure is permanent: that caller sees the
 * original exception, every later caller a PermanentInitializationFailure
 * carrying it. The initializer never runs again.
 *
 * Example:
 *   PerProcess config([] { return load_config(); });
 *   Config& c = config();
 */
template<typename T, typename F = OnceInitializer<T>>
class PerProcess
{
   static_assert(detail::valid_once_value<T>, "PerProcess needs an object type");

public:
   explicit PerProcess(F initializer) : initializer(std::move(initializer)) {}

   PerProcess(PerProcess const&)            = delete;
   PerProcess& operator=(PerProcess const&) = delete;

   T& operator()()
   {
      if (state.load(std::memory_order_acquire) == OnceState::Done) {
         return *value;
      }
      return initialize();
   }

   [[nodiscard]] bool is_initialized() const noexcept
   {
      return state.load(std::memory_order_acquire) == OnceState::Done;
   }

private:
   [[gnu::noinline]] T& initialize()
   {
      // failure is written before Failed is published and never again
      if (state.load(std::memory_order_acquire) == OnceState::Failed) {
         throw PermanentInitializationFailure(failure);
      }

      LockGuard guard(lock);
      switch (state.load(std::memory_order_relaxed)) {
         case OnceState::Done:
            return *value;
         case OnceState::Failed:
            throw PermanentInitializationFailure(failure);
         case OnceState::Running:
            // Only the lock holder can see Running: the initializer called us
            throw InvalidOperation("PerProcess initializer called itself recursively");
         case OnceState::Uninit:
            break;
      }

      LOG_ONCE("PerProcess(%p) running initializer", ptr_suffix(this));
      state.store(OnceState::Running, std::memory_order_relaxed);
      try {
         value.emplace(std::invoke(initializer));
      } catch (...) {
         failure = std::current_exception();
         state.store(OnceState::Failed, std::memory_order_release);
         throw;
      }
      state.store(OnceState::Done, std::memory_order_release);
      return *value;
   }

   F initializer;
   std::atomic<OnceState> state{OnceState::Uninit};
   ReentrantLock lock;
   std::optional<T> value;
   std::exception_ptr failure;
};

template<typename F>
PerProcess(F) -> PerProcess<std::invoke_result_t<F&>, F>;

} // namespace cosync

#endif // COSYNC_PER_PROCESS_HPP
