/**
 * @file runtime.hpp
 * @brief cosync host runtime API
 *
 * The runtime multiplexes cooperatively scheduled units (fibers) onto a pool
 * of worker threads. It provides the collaborators the synchronization
 * primitives are built on: identity of the running unit, parking, a
 * spinlock-protected wait queue, finalizer deferral and unit-local storage.
 *
 * A bare OS thread that never entered a unit (e.g. main()) is treated as a
 * unit of its own: it has an identity, can park (by blocking the OS thread)
 * and has its own local storage.
 */

#ifndef COSYNC_RUNTIME_HPP
#define COSYNC_RUNTIME_HPP

#include "cosync/function.hpp"
#include "cosync/port_traits.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <utility>

namespace cosync
{

namespace config
{
   /**
    * @brief Worker threads started by a default-constructed Runtime
    */
   static constexpr std::uint32_t DEFAULT_WORKERS = 4;

   static constexpr std::size_t DEFAULT_STACK_BYTES = 64 * 1024;
   static constexpr std::size_t MIN_STACK_BYTES     = 16 * 1024;
   static_assert(MIN_STACK_BYTES <= DEFAULT_STACK_BYTES, "Default stack below the minimum.");

   /**
    * @brief How long an idle worker sleeps before polling the ready queue again
    */
   static constexpr long IDLE_SLEEP_NS = 20'000;
   static_assert(0 < IDLE_SLEEP_NS && IDLE_SLEEP_NS < 1'000'000'000, "Idle sleep must be below one second.");

   /**
    * @brief Spinlock spins before handing the CPU back to the OS
    */
   static constexpr std::uint32_t SPIN_LIMIT = 128;

   static constexpr std::size_t CACHE_LINE = COSYNC_PORT_CACHE_LINE;
}  // namespace config

/* ============================================================================
 * Spinlock
 * ========================================================================= */

/**
 * @brief Test-and-test-and-set spinlock for very short critical sections
 *
 * A unit must never switch out while holding one. WaitQueue::wait() is the
 * only place that parks with a Spinlock involved, and it releases it first.
 */
class Spinlock
{
public:
   constexpr Spinlock() = default;
   ~Spinlock() = default;

   Spinlock(Spinlock const&)            = delete;
   Spinlock& operator=(Spinlock const&) = delete;
   Spinlock(Spinlock&&)                 = delete;
   Spinlock& operator=(Spinlock&&)      = delete;

   /**
    * @brief Acquire the spinlock (busy-wait)
    */
   void lock() noexcept;

   void unlock() noexcept
   {
      flag.clear(std::memory_order_release);
   }

   /**
    * @brief Try to acquire the spinlock without blocking
    * @return true if acquired, false if already locked
    */
   [[nodiscard]] bool try_lock() noexcept
   {
      return !flag.test(std::memory_order_relaxed) && !flag.test_and_set(std::memory_order_acquire);
   }

   /**
    * @brief Check if the spinlock is currently locked
    *
    * Note: This is racy and should only be used for debugging/assertions.
    */
   [[nodiscard]] bool is_locked() const noexcept
   {
      return flag.test(std::memory_order_relaxed);
   }

private:
   std::atomic_flag flag;
};

/**
 * @brief RAII guard for spinlocks
 */
class SpinlockGuard
{
public:
   explicit SpinlockGuard(Spinlock& lock) : lock(lock)
   {
      lock.lock();
   }

   ~SpinlockGuard()
   {
      lock.unlock();
   }

   SpinlockGuard(SpinlockGuard const&)            = delete;
   SpinlockGuard& operator=(SpinlockGuard const&) = delete;

private:
   Spinlock& lock;
};

/* ============================================================================
 * Execution contexts and parking
 * ========================================================================= */

/**
 * @brief A unit, or a bare OS thread acting as one. Defined by the runtime.
 */
struct ExecutionContext;

/**
 * @brief Opaque identity of an execution context, compared by address
 */
using UnitId = ExecutionContext const*;

/**
 * @brief Make a parked context runnable again
 *
 * If the context is not parked yet, the wakeup is remembered and its next
 * park() returns at once. Safe to call from any unit or OS thread.
 */
void unpark(ExecutionContext* context) noexcept;

/* ============================================================================
 * WaitList
 * ========================================================================= */

/**
 * @brief Intrusive FIFO of parked execution contexts
 *
 * Synchronization primitives embed a WaitList and guard it with a lock of
 * their choosing: WaitQueue uses a Spinlock, Condition a ReentrantLock.
 * Nodes live on the waiter's stack.
 *
 * A waiter returns from block() only once its own node was signalled, so
 * there are no spurious wakeups. The signalling side must hold the guarding
 * lock. It is done with the node (and the waiter's context) by the time the
 * waiter can return.
 */
class WaitList
{
public:
   struct Node
   {
      // Waiting -> Signalling (unpark in flight) -> Done (signaller is finished with the node)
      enum class Signal : std::uint8_t { Waiting, Signalling, Done };

      Node* next{nullptr};
      Node* prev{nullptr};
      ExecutionContext* context{nullptr};
      std::atomic<Signal> signal{Signal::Waiting};

      [[nodiscard]] bool signalled() const noexcept { return signal.load(std::memory_order_acquire) == Signal::Done; }
   };

   constexpr WaitList() = default;
   ~WaitList() = default;

   WaitList(WaitList const&)            = delete;
   WaitList& operator=(WaitList const&) = delete;

   [[nodiscard]] bool empty() const noexcept { return head == nullptr; }

   // This walks the linked list so isn't 'free'
   [[nodiscard]] std::size_t size() const noexcept;

   /**
    * @brief Register the calling context as a waiter at the back of the list
    */
   void add(Node& node) noexcept;

   /**
    * @brief Wake the longest waiting context
    * @return true if a waiter was woken, false if the list was empty
    */
   bool signal_one() noexcept;

   /**
    * @brief Wake every waiting context
    * @return Number of waiters woken
    */
   std::size_t signal_all() noexcept;

   /**
    * @brief Park the calling context until node has been signalled
    *
    * Call after releasing the lock that guards the list.
    */
   static void block(Node const& node) noexcept;

private:
   Node* pop_front() noexcept;

   Node* head{nullptr};
   Node* tail{nullptr};
};

/* ============================================================================
 * WaitQueue
 * ========================================================================= */

/**
 * @brief Spinlock-protected wait queue with lock/wait/notify semantics
 *
 * Usage:
 *   queue.lock();
 *   while (!condition) {
 *       queue.wait();   // releases the lock while parked
 *   }
 *   queue.unlock();
 */
class WaitQueue
{
public:
   constexpr WaitQueue() = default;

   WaitQueue(WaitQueue const&)            = delete;
   WaitQueue& operator=(WaitQueue const&) = delete;

   void lock() noexcept { spinlock.lock(); }
   void unlock() noexcept { spinlock.unlock(); }
   [[nodiscard]] bool try_lock() noexcept { return spinlock.try_lock(); }
   [[nodiscard]] bool is_locked() const noexcept { return spinlock.is_locked(); }

   /**
    * @brief Park until notified
    *
    * Caller must hold the queue lock. It is released while parked and held
    * again when wait() returns.
    */
   void wait() noexcept;

   /**
    * @brief Wake one waiter. Caller must hold the queue lock.
    * @return true if a waiter was woken
    */
   bool notify_one() noexcept;

   /**
    * @brief Wake all waiters. Caller must hold the queue lock.
    * @return Number of waiters woken
    */
   std::size_t notify_all() noexcept;

   /**
    * @brief Check for parked waiters. Caller must hold the queue lock.
    */
   [[nodiscard]] bool has_waiters() const noexcept { return !waiters.empty(); }

private:
   Spinlock spinlock;
   WaitList waiters;
};

/* ============================================================================
 * Unit-local storage
 * ========================================================================= */

/**
 * @brief Private key/value map owned by one execution context
 *
 * Only the owning context ever touches it, so it needs no locking. Entries
 * are destroyed with the context.
 *
 * Keys come from new_key() and are never handed out twice, so an owner
 * created where a destroyed one used to live cannot pick up its entries.
 */
class UnitLocalStorage
{
public:
   using Key = std::uint64_t;

   UnitLocalStorage() = default;

   /**
    * @brief A process-wide unique key
    */
   [[nodiscard]] static Key new_key() noexcept;

   UnitLocalStorage(UnitLocalStorage const&)            = delete;
   UnitLocalStorage& operator=(UnitLocalStorage const&) = delete;

   /**
    * @brief Find the value stored under key, or create it from make()
    *
    * The caller is responsible for always using the same V with a given key.
    * If make() throws, nothing is stored.
    */
   template<typename V, typename Make>
   V& get_or_insert(Key key, Make&& make)
   {
      if (auto it = entries.find(key); it != entries.end()) {
         return static_cast<Entry<V>&>(*it->second).value;
      }
      // make() may insert other keys, so only emplace once it has returned
      auto entry = std::make_unique<Entry<V>>(make);
      V& value = entry->value;
      entries.emplace(key, std::move(entry));
      return value;
   }

   [[nodiscard]] bool contains(Key key) const { return entries.find(key) != entries.end(); }
   [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }

private:
   struct EntryBase
   {
      virtual ~EntryBase() = default;
   };

   template<typename V>
   struct Entry final : EntryBase
   {
      template<typename Make>
      explicit Entry(Make& make) : value(make()) {}
      V value;
   };

   std::unordered_map<Key, std::unique_ptr<EntryBase>> entries;
};

/* ============================================================================
 * Runtime and Units
 * ========================================================================= */

struct RuntimeState;
struct UnitControlBlock;

/**
 * @brief A pool of worker threads running units from one shared ready queue
 *
 * Destroying the runtime stops and joins the workers. Every Unit spawned on
 * it must have finished by then.
 */
class Runtime
{
public:
   explicit Runtime(std::uint32_t workers = config::DEFAULT_WORKERS);
   ~Runtime();

   Runtime(Runtime const&)            = delete;
   Runtime& operator=(Runtime const&) = delete;

   [[nodiscard]] std::uint32_t worker_count() const noexcept;

   /**
    * @brief Units spawned on this runtime whose entry has not returned yet
    */
   [[nodiscard]] std::uint32_t live_units() const noexcept;

private:
   friend class Unit;
   std::unique_ptr<RuntimeState> state;
};

/**
 * @brief Handle to a cooperatively scheduled unit of execution
 *
 * The unit starts running as soon as it is constructed. Destroying the
 * handle joins the unit.
 */
class Unit
{
public:
   using Id = std::uint32_t;
   using EntryFn = Function<void(), 48, HeapPolicy::CanUseHeap>;

   Unit(Runtime& runtime, EntryFn&& entry, std::size_t stack_bytes = config::DEFAULT_STACK_BYTES);
   ~Unit();

   Unit(Unit const&)            = delete;
   Unit& operator=(Unit const&) = delete;

   [[nodiscard]] Id get_id() const noexcept;

   /**
    * @brief Identity the unit reports through this_unit::id()
    */
   [[nodiscard]] UnitId unit_id() const noexcept;

   [[nodiscard]] bool joinable() const noexcept { return !joined; }

   /**
    * @brief Wait for the unit's entry to return
    *
    * May be called from another unit or from a bare OS thread, but not from
    * the unit itself.
    */
   void join();

private:
   UnitControlBlock* ucb{nullptr};
   std::unique_ptr<std::byte[]> stack;
   bool joined{false};
};

namespace this_unit
{
   /**
    * @brief Identity of the calling unit (or bare OS thread)
    */
   [[nodiscard]] UnitId id() noexcept;

   /**
    * @brief The calling execution context, never null
    */
   [[nodiscard]] ExecutionContext* context() noexcept;

   /**
    * @brief true when called from a unit running on a Runtime worker
    */
   [[nodiscard]] bool in_unit() noexcept;

   /**
    * @brief Give other units a chance to run
    *
    * From a bare OS thread this yields the OS thread.
    */
   void yield() noexcept;

   /**
    * @brief Cooperatively wait for at least the given duration
    */
   void sleep_for(std::chrono::nanoseconds duration) noexcept;

   /**
    * @brief Park until unpark() is called for this context
    *
    * May return early; callers re-check their own wakeup condition.
    */
   void park() noexcept;

   /**
    * @brief Storage private to the calling unit
    */
   [[nodiscard]] UnitLocalStorage& local_storage() noexcept;
}  // namespace this_unit

namespace this_thread
{
   /**
    * @brief Dense, 0-based id of the calling OS thread
    *
    * Ids are handed out on first use and never reused. A unit may be resumed
    * on a different worker after it parks or yields, so the id can change
    * across those points.
    */
   [[nodiscard]] std::uint32_t id() noexcept;

   /**
    * @brief Number of thread ids handed out so far (every id is below this)
    */
   [[nodiscard]] std::uint32_t max_id() noexcept;
}  // namespace this_thread

/* ============================================================================
 * Finalizer deferral
 * ========================================================================= */

namespace finalizers
{
   using Callback = Function<void(), 32, HeapPolicy::CanUseHeap>;

   /**
    * @brief Inhibit finalizers on the calling context (nestable)
    */
   void disable() noexcept;

   /**
    * @brief Undo one disable(); at depth 0 run everything deferred meanwhile
    */
   void enable() noexcept;

   [[nodiscard]] bool enabled() noexcept;

   [[nodiscard]] std::uint32_t inhibit_depth() noexcept;

   /**
    * @brief Run callback now if finalizers are enabled, else once they are
    */
   void defer(Callback&& callback);
}  // namespace finalizers

} // namespace cosync

#endif // COSYNC_RUNTIME_HPP
