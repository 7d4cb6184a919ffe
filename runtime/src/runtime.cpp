/**
 * @file runtime.cpp
 * @brief Worker pool, unit lifecycle, parking and finalizer deferral
 *
 * Units are fibers on heap stacks. Their control block is carved from the top
 * of the stack buffer. Workers pull units from one FIFO ready queue and resume
 * them until they yield, park or finish.
 *
 * Parking a unit is a small state machine so that an unpark() racing with the
 * unit switching out is never lost:
 *
 *   Idle --park()--> Parking --worker, after switch-out--> Parked
 *     ^                 |                                     |
 *     |             unpark()                              unpark()
 *     |                 v                                     v
 *     +--park()---- Notified                         Idle + ready queue
 *
 * Bare OS threads park on a futex-backed permit word instead.
 */

#include "cosync/runtime.hpp"
#include "cosync/port.h"
#include "DEBUG_PRINT.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdio>
#include <exception>
#include <new>
#include <span>
#include <thread>
#include <vector>

namespace cosync
{

static constexpr std::uintptr_t align_down(std::uintptr_t v, std::size_t a) { return v & ~(static_cast<std::uintptr_t>(a) - 1); }

enum class ParkState : std::uint8_t { Idle, Notified, Parking, Parked };

struct ExecutionContext
{
   enum class Kind : std::uint8_t { Unit, Thread };
   Kind const kind;

   // Kind::Unit
   std::atomic<ParkState> park_state{ParkState::Idle};
   // Kind::Thread
   std::atomic<std::uint32_t> permit{0};

   // Only ever touched by the context itself
   std::uint32_t finalizers_inhibited{0};
   std::vector<finalizers::Callback> deferred_finalizers;
   UnitLocalStorage local_storage;

   explicit ExecutionContext(Kind kind) : kind(kind) {}
};

static void unit_launcher(void* arg);

struct UnitControlBlock : ExecutionContext
{
   // Intrusive 'linked-list' links for the ReadyQueue
   UnitControlBlock* next{nullptr};
   UnitControlBlock* prev{nullptr};

   Unit::Id id;
   RuntimeState& runtime;
   std::span<std::byte> stack;
   Unit::EntryFn entry;

   // Set by the unit before switching out to be requeued rather than parked
   bool yield_requested{false};

   // Guarded by joiners' lock
   bool finished{false};
   WaitQueue joiners;

   // Opaque, in-place port context storage
   alignas(COSYNC_PORT_CONTEXT_ALIGN) std::array<std::byte, COSYNC_PORT_CONTEXT_SIZE> context_storage{};
   [[nodiscard]] auto*       context()       noexcept { return reinterpret_cast<cosync_port_context_t*      >(context_storage.data()); }
   [[nodiscard]] auto const* context() const noexcept { return reinterpret_cast<cosync_port_context_t const*>(context_storage.data()); }

   UnitControlBlock(Unit::Id id, RuntimeState& runtime, std::span<std::byte> stack, Unit::EntryFn&& entry) :
      ExecutionContext(Kind::Unit), id(id), runtime(runtime), stack(stack), entry(std::move(entry))
   {
      cosync_port_context_init(context(), stack.data(), stack.size(), unit_launcher, this);
   }

   ~UnitControlBlock()
   {
      cosync_port_context_destroy(context());
   }
};

/**
 * Carves a unit's stack buffer into:
 * +----------------------+ <-- buffer's end (high address)
 * +   UnitControlBlock   + (Fixed size)
 * +----------------------+
 * +     Unit's stack     +
 * +----------------------+ <-- buffer's base (low address)
 */
struct StackLayout
{
   void* ucb;
   std::span<std::byte> user_stack;

   explicit StackLayout(std::span<std::byte> const buffer)
   {
      auto const base = reinterpret_cast<std::uintptr_t>(buffer.data());
      auto const end  = base + buffer.size();

      // UCB at very top, aligned down
      auto const ucb_start = align_down(end - sizeof(UnitControlBlock),
                                        std::max(alignof(UnitControlBlock), std::size_t{COSYNC_STACK_ALIGN}));
      ucb = reinterpret_cast<void*>(ucb_start);

      auto const stack_len = static_cast<std::size_t>(ucb_start - base);
      assert(stack_len >= config::MIN_STACK_BYTES / 2 && "Buffer too small after carving UCB");

      user_stack = buffer.subspan(0, stack_len);
   }
};

class ReadyQueue
{
   UnitControlBlock* head{nullptr};
   UnitControlBlock* tail{nullptr};

public:
   [[nodiscard]] bool empty() const noexcept { return !head; }

   void push_back(UnitControlBlock& ucb) noexcept
   {
      assert(ucb.next == nullptr && ucb.prev == nullptr && "UCB already linked");
      ucb.next = nullptr;
      ucb.prev = tail;
      if (tail) tail->next = &ucb; else head = &ucb;
      tail = &ucb;
   }

   UnitControlBlock* pop_front() noexcept
   {
      if (empty()) return nullptr;
      auto* ucb = head;
      head = ucb->next;
      if (head) head->prev = nullptr; else tail = nullptr;
      ucb->next = ucb->prev = nullptr;
      return ucb;
   }
};

/* ============================================================================
 * RuntimeState
 * ========================================================================= */

struct RuntimeState
{
   alignas(config::CACHE_LINE) Spinlock ready_lock;
   ReadyQueue ready;

   alignas(config::CACHE_LINE) std::atomic<bool> stopping{false};
   std::atomic<std::uint32_t> live_units{0};
   std::vector<std::thread> workers;

   void make_ready(UnitControlBlock& ucb) noexcept
   {
      SpinlockGuard guard(ready_lock);
      ready.push_back(ucb);
   }

   UnitControlBlock* next_ready() noexcept
   {
      SpinlockGuard guard(ready_lock);
      return ready.pop_front();
   }

   void worker_loop()
   {
      // Registers the worker's dense thread id for logging
      std::uint32_t const thread_id = this_thread::id();
      LOG_SCHED("Worker online (thread id %u)", thread_id);
      (void)thread_id;

      while (true) {
         if (auto* ucb = next_ready()) {
            run(*ucb);
            continue;
         }
         if (stopping.load(std::memory_order_acquire)) break;
         cosync_port_idle(config::IDLE_SLEEP_NS);
      }
      LOG_SCHED("Worker offline");
   }

   void run(UnitControlBlock& ucb) noexcept
   {
      cosync_port_set_tls_pointer(&ucb);
      cosync_port_switch(nullptr, ucb.context());
      cosync_port_set_tls_pointer(nullptr);

      if (cosync_port_context_finished(ucb.context())) {
         retire(ucb);
         return;
      }

      if (ucb.yield_requested) {
         ucb.yield_requested = false;
         make_ready(ucb);
         return;
      }

      // The unit switched out to park
      auto expected = ParkState::Parking;
      if (ucb.park_state.compare_exchange_strong(expected, ParkState::Parked, std::memory_order_acq_rel)) {
         return;
      }

      // An unpark() arrived while the unit was switching out
      LOG_SCHED("Unit %u woken while parking (%s), requeued", ucb.id, PARK_STATE_TO_STR(expected));
      assert(expected == ParkState::Notified);
      ucb.park_state.store(ParkState::Idle, std::memory_order_relaxed);
      make_ready(ucb);
   }

   void retire(UnitControlBlock& ucb) noexcept
   {
      LOG_UNIT("Unit %u finished", ucb.id);
      live_units.fetch_sub(1, std::memory_order_acq_rel);

      // Last touch of the UCB: a joiner may free it as soon as this unlocks
      ucb.joiners.lock();
      ucb.finished = true;
      ucb.joiners.notify_all();
      ucb.joiners.unlock();
   }
};

static void unit_launcher(void* arg)
{
   auto* ucb = static_cast<UnitControlBlock*>(arg);

   // The port must have switched onto the carved stack, below the UCB
   [[maybe_unused]] auto* sp = static_cast<std::byte*>(cosync_port_get_stack_pointer());
   assert(sp > ucb->stack.data() && sp <= ucb->stack.data() + ucb->stack.size() && "Unit not running on its own stack");

   LOG_UNIT("Unit %u started", ucb->id);
   try {
      ucb->entry();
   } catch (std::exception const& e) {
      std::fprintf(stderr, "cosync: unit %u terminated by uncaught exception: %s\n", ucb->id, e.what());
      std::terminate();
   } catch (...) {
      std::fprintf(stderr, "cosync: unit %u terminated by uncaught exception: unknown exception\n", ucb->id);
      std::terminate();
   }
   ucb->entry.reset();
}

/* ============================================================================
 * Execution context lookup
 * ========================================================================= */

// Never inlined into unit code: the thread-local address must not be cached
// across a point where the caller could migrate to another worker.
[[gnu::noinline]] static ExecutionContext& thread_root_context() noexcept
{
   static thread_local ExecutionContext root{ExecutionContext::Kind::Thread};
   return root;
}

static UnitControlBlock* current_unit() noexcept
{
   return static_cast<UnitControlBlock*>(cosync_port_get_tls_pointer());
}

static void park_thread(ExecutionContext& context) noexcept
{
   // An exchange (not a plain store) so a permit granted meanwhile is never lost
   while (context.permit.exchange(0, std::memory_order_acquire) == 0) {
      context.permit.wait(0, std::memory_order_relaxed);
   }
}

static void park_unit(UnitControlBlock& ucb) noexcept
{
   // Consume a pending wakeup
   auto expected = ParkState::Notified;
   if (ucb.park_state.compare_exchange_strong(expected, ParkState::Idle, std::memory_order_acquire)) {
      return;
   }

   expected = ParkState::Idle;
   if (!ucb.park_state.compare_exchange_strong(expected, ParkState::Parking, std::memory_order_acq_rel)) {
      // Notified slipped in between the two CASes
      ucb.park_state.exchange(ParkState::Idle, std::memory_order_acquire);
      return;
   }

   cosync_port_yield();
}

void unpark(ExecutionContext* context) noexcept
{
   assert(context != nullptr);

   if (context->kind == ExecutionContext::Kind::Thread) {
      context->permit.store(1, std::memory_order_release);
      context->permit.notify_one();
      return;
   }

   auto& ucb = static_cast<UnitControlBlock&>(*context);
   auto state = ucb.park_state.load(std::memory_order_acquire);
   while (true) {
      switch (state) {
         case ParkState::Notified:
            return;
         case ParkState::Idle:
         case ParkState::Parking:
            if (ucb.park_state.compare_exchange_weak(state, ParkState::Notified, std::memory_order_acq_rel)) {
               return;
            }
            break;
         case ParkState::Parked:
            if (ucb.park_state.compare_exchange_weak(state, ParkState::Idle, std::memory_order_acq_rel)) {
               ucb.runtime.make_ready(ucb);
               return;
            }
            break;
      }
   }
}

/* ============================================================================
 * Runtime
 * ========================================================================= */

Runtime::Runtime(std::uint32_t workers) : state(std::make_unique<RuntimeState>())
{
   workers = std::max<std::uint32_t>(workers, 1);
   state->workers.reserve(workers);
   for (std::uint32_t i = 0; i < workers; ++i) {
      state->workers.emplace_back([s = state.get()] { s->worker_loop(); });
   }
   LOG_SCHED("Runtime started with %u workers", workers);
}

Runtime::~Runtime()
{
   state->stopping.store(true, std::memory_order_release);
   for (auto& worker : state->workers) {
      worker.join();
   }
   assert(state->live_units.load() == 0 && "Runtime destroyed with live units");
}

std::uint32_t Runtime::worker_count() const noexcept
{
   return static_cast<std::uint32_t>(state->workers.size());
}

std::uint32_t Runtime::live_units() const noexcept
{
   return state->live_units.load(std::memory_order_acquire);
}

/* ============================================================================
 * Unit
 * ========================================================================= */

static std::atomic<Unit::Id> next_unit_id{1};

Unit::Unit(Runtime& runtime, EntryFn&& entry, std::size_t stack_bytes)
{
   stack_bytes = std::max(stack_bytes, config::MIN_STACK_BYTES);
   stack.reset(new std::byte[stack_bytes]);

   StackLayout layout({stack.get(), stack_bytes});
   Id const id = next_unit_id.fetch_add(1, std::memory_order_relaxed);
   ucb = ::new (layout.ucb) UnitControlBlock(id, *runtime.state, layout.user_stack, std::move(entry));

   runtime.state->live_units.fetch_add(1, std::memory_order_acq_rel);
   LOG_UNIT("Unit %u spawned (%zu byte stack)", id, layout.user_stack.size());
   runtime.state->make_ready(*ucb);
}

Unit::~Unit()
{
   if (!ucb) return;
   if (!joined) join();
   ucb->~UnitControlBlock();
   ucb = nullptr;
}

Unit::Id Unit::get_id() const noexcept
{
   return ucb->id;
}

UnitId Unit::unit_id() const noexcept
{
   return ucb;
}

void Unit::join()
{
   assert(!joined && "Unit already joined");
   assert(this_unit::context() != ucb && "A unit cannot join itself");

   ucb->joiners.lock();
   while (!ucb->finished) {
      ucb->joiners.wait();
   }
   ucb->joiners.unlock();
   joined = true;
}

/* ============================================================================
 * this_unit / this_thread
 * ========================================================================= */

namespace this_unit
{
   ExecutionContext* context() noexcept
   {
      if (auto* ucb = current_unit()) return ucb;
      return &thread_root_context();
   }

   UnitId id() noexcept
   {
      return context();
   }

   bool in_unit() noexcept
   {
      return current_unit() != nullptr;
   }

   void yield() noexcept
   {
      auto* ucb = current_unit();
      if (!ucb) {
         std::this_thread::yield();
         return;
      }
      ucb->yield_requested = true;
      cosync_port_yield();
   }

   void sleep_for(std::chrono::nanoseconds duration) noexcept
   {
      if (!in_unit()) {
         std::this_thread::sleep_for(duration);
         return;
      }
      auto const deadline = std::chrono::steady_clock::now() + duration;
      while (std::chrono::steady_clock::now() < deadline) {
         yield();
      }
   }

   void park() noexcept
   {
      if (auto* ucb = current_unit()) {
         park_unit(*ucb);
      } else {
         park_thread(thread_root_context());
      }
   }

   UnitLocalStorage& local_storage() noexcept
   {
      return context()->local_storage;
   }
}  // namespace this_unit

static std::atomic<UnitLocalStorage::Key> next_storage_key{1};

UnitLocalStorage::Key UnitLocalStorage::new_key() noexcept
{
   return next_storage_key.fetch_add(1, std::memory_order_relaxed);
}

static std::atomic<std::uint32_t> next_thread_id{0};

namespace this_thread
{
   std::uint32_t id() noexcept
   {
      // Kept in the port's thread-local slot, which also labels debug output
      std::uint32_t id = cosync_port_get_worker_id();
      if (id == COSYNC_PORT_NO_WORKER) {
         id = next_thread_id.fetch_add(1, std::memory_order_relaxed);
         cosync_port_set_worker_id(id);
      }
      return id;
   }

   std::uint32_t max_id() noexcept
   {
      return next_thread_id.load(std::memory_order_acquire);
   }
}  // namespace this_thread

/* ============================================================================
 * Finalizers
 * ========================================================================= */

namespace finalizers
{
   static void run(Callback& callback) noexcept
   {
      try {
         callback();
      } catch (std::exception const& e) {
         std::fprintf(stderr, "error in running finalizer: %s\n", e.what());
      } catch (...) {
         std::fputs("error in running finalizer: unknown exception\n", stderr);
      }
   }

   static void run_deferred(ExecutionContext& context) noexcept
   {
      // Callbacks may defer more work (or disable again) while running
      while (context.finalizers_inhibited == 0 && !context.deferred_finalizers.empty()) {
         auto pending = std::move(context.deferred_finalizers);
         context.deferred_finalizers.clear();
         for (auto& callback : pending) {
            run(callback);
         }
      }
   }

   void disable() noexcept
   {
      ++this_unit::context()->finalizers_inhibited;
   }

   void enable() noexcept
   {
      auto& context = *this_unit::context();
      if (context.finalizers_inhibited == 0) {
         std::fputs("WARNING: finalizers already enabled on this unit.\n", stderr);
         return;
      }
      if (--context.finalizers_inhibited == 0) {
         run_deferred(context);
      }
   }

   bool enabled() noexcept
   {
      return this_unit::context()->finalizers_inhibited == 0;
   }

   std::uint32_t inhibit_depth() noexcept
   {
      return this_unit::context()->finalizers_inhibited;
   }

   void defer(Callback&& callback)
   {
      auto& context = *this_unit::context();
      if (context.finalizers_inhibited == 0) {
         run(callback);
         return;
      }
      context.deferred_finalizers.push_back(std::move(callback));
   }
}  // namespace finalizers

} // namespace cosync
