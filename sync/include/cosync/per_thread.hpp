/**
 * @file per_thread.hpp
 * @brief Lazily computed value, once per worker thread
 */

#ifndef COSYNC_PER_THREAD_HPP
#define COSYNC_PER_THREAD_HPP

#include "cosync/condition.hpp"
#include "cosync/errors.hpp"
#include "cosync/once.hpp"
#include "cosync/runtime.hpp"
#include "DEBUG_PRINT.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cosync
{

namespace detail
{
   /**
    * @brief Fixed-length array of atomics, one published snapshot of a PerThread
    */
   template<typename E>
   class AtomicArray
   {
   public:
      explicit AtomicArray(std::size_t length) : length(length), slots(new std::atomic<E>[length]) {}

      [[nodiscard]] std::size_t size() const noexcept { return length; }
      std::atomic<E>&       operator[](std::size_t i)       noexcept { return slots[i]; }
      std::atomic<E> const& operator[](std::size_t i) const noexcept { return slots[i]; }

   private:
      std::size_t length;
      std::unique_ptr<std::atomic<E>[]> slots;
   };

   /**
    * @brief The one lock (and wait list) every PerThread grows and initializes under
    */
   Condition& per_thread_lock() noexcept;
}  // namespace detail

/**
 * @brief Calls initializer once per worker thread id and caches each result
 *
 * operator()() returns the value belonging to the calling OS thread (see
 * this_thread::id()). A unit that parks or yields may come back on another
 * worker, so fetch the value again afterwards rather than assuming it is
 * still the right one.
 *
 * Reading a value that is already computed takes no lock. Computing one runs
 * the initializer without holding any lock, so a slow initializer only holds
 * up callers for that same thread id.
 *
 * Values live on the heap and never move: a reference handed out stays valid
 * until the PerThread is destroyed, even when the slot arrays grow.
 */
template<typename T, typename F = OnceInitializer<T>>
class PerThread
{
   static_assert(detail::valid_once_value<T>, "PerThread needs an object type");

   using States = detail::AtomicArray<OnceState>;
   using Values = detail::AtomicArray<T*>;

public:
   explicit PerThread(F initializer) : initializer(std::move(initializer)) {}

   ~PerThread()
   {
      // Every value is reachable from the newest snapshot
      if (Values* xs = values.load(std::memory_order_acquire)) {
         for (std::size_t i = 0; i < xs->size(); ++i) {
            delete (*xs)[i].load(std::memory_order_relaxed);
         }
      }
   }

   PerThread(PerThread const&)            = delete;
   PerThread& operator=(PerThread const&) = delete;

   T& operator()()
   {
      return (*this)[this_thread::id()];
   }

   /**
    * @brief Value for an explicit thread id
    * @throws InvalidArgument if no thread has been handed that id yet
    */
   T& operator[](std::uint32_t tid)
   {
      States const* ss = states.load(std::memory_order_acquire);
      // Values is published before States, so it is never the shorter one
      Values const* xs = values.load(std::memory_order_relaxed);
      if (ss && tid < ss->size() && (*ss)[tid].load(std::memory_order_acquire) == OnceState::Done) {
         return *(*xs)[tid].load(std::memory_order_relaxed);
      }
      return initialize(tid);
   }

   /**
    * @brief Length of the current snapshot (thread ids it can hold)
    */
   [[nodiscard]] std::size_t capacity() const noexcept
   {
      States const* ss = states.load(std::memory_order_acquire);
      return ss ? ss->size() : 0;
   }

private:
   [[gnu::noinline]] T& initialize(std::uint32_t tid)
   {
      if (tid >= this_thread::max_id()) {
         throw InvalidArgument("thread id outside of allocated range");
      }

      Condition& shared = detail::per_thread_lock();
      std::unique_lock<Condition> guard(shared);

      grow_to_fit(tid);

      while (true) {
         switch ((*states.load(std::memory_order_relaxed))[tid].load(std::memory_order_relaxed)) {
            case OnceState::Done:
               return *(*values.load(std::memory_order_relaxed))[tid].load(std::memory_order_relaxed);
            case OnceState::Failed:
               throw PermanentInitializationFailure(failures.at(tid));
            case OnceState::Running:
               // One wait list serves every slot of every PerThread; re-check ours
               shared.wait();
               continue;
            case OnceState::Uninit:
               break;
         }
         break;
      }

      // Claim the slot, then run the initializer without the lock
      (*states.load(std::memory_order_relaxed))[tid].store(OnceState::Running, std::memory_order_relaxed);
      guard.unlock();
      LOG_ONCE("PerThread(%p) initializing thread id %u", ptr_suffix(this), tid);

      T* result = nullptr;
      try {
         result = new T(std::invoke(initializer));
      } catch (...) {
         guard.lock();
         failures.emplace(tid, std::current_exception());
         (*states.load(std::memory_order_relaxed))[tid].store(OnceState::Failed, std::memory_order_release);
         shared.notify_all();
         throw;
      }

      guard.lock();
      // Growth may have published new snapshots while the lock was dropped
      (*values.load(std::memory_order_relaxed))[tid].store(result, std::memory_order_release);
      (*states.load(std::memory_order_relaxed))[tid].store(OnceState::Done, std::memory_order_release);
      shared.notify_all();
      return *result;
   }

   // Caller holds detail::per_thread_lock()
   void grow_to_fit(std::uint32_t tid)
   {
      States* old_ss = states.load(std::memory_order_relaxed);
      Values* old_xs = values.load(std::memory_order_relaxed);
      std::size_t const old_len = old_ss ? old_ss->size() : 0;
      if (tid < old_len) return;

      if (old_ss && old_xs->size() < old_len) {
         concurrency_violation("PerThread value snapshot shorter than its state snapshot");
      }

      std::size_t const new_len = std::max<std::size_t>(old_len + this_thread::max_id(), std::size_t{tid} + 1);
      if (new_len <= old_len) {
         concurrency_violation("PerThread growth must enlarge the snapshot");
      }

      auto new_ss = std::make_unique<States>(new_len);
      auto new_xs = std::make_unique<Values>(new_len);
      for (std::size_t i = 0; i < old_len; ++i) {
         (*new_xs)[i].store((*old_xs)[i].load(std::memory_order_relaxed), std::memory_order_relaxed);
         (*new_ss)[i].store((*old_ss)[i].load(std::memory_order_relaxed), std::memory_order_relaxed);
      }
      for (std::size_t i = old_len; i < new_len; ++i) {
         (*new_xs)[i].store(nullptr, std::memory_order_relaxed);
         (*new_ss)[i].store(OnceState::Uninit, std::memory_order_relaxed);
      }

      LOG_ONCE("PerThread(%p) grew %zu -> %zu", ptr_suffix(this), old_len, new_len);
      values.store(new_xs.get(), std::memory_order_release);
      states.store(new_ss.get(), std::memory_order_release);

      // Superseded snapshots may still be read by lock-free callers
      value_snapshots.push_back(std::move(new_xs));
      state_snapshots.push_back(std::move(new_ss));
   }

   F initializer;
   std::atomic<States*> states{nullptr};
   std::atomic<Values*> values{nullptr};

   // Guarded by detail::per_thread_lock()
   std::vector<std::unique_ptr<States>> state_snapshots;
   std::vector<std::unique_ptr<Values>> value_snapshots;
   std::unordered_map<std::uint32_t, std::exception_ptr> failures;
};

template<typename F>
PerThread(F) -> PerThread<std::invoke_result_t<F&>, F>;

} // namespace cosync

#endif // COSYNC_PER_THREAD_HPP
