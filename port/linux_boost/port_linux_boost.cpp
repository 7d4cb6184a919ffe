/**
 * @file port_linux_boost.cpp
 * @brief Linux port using Boost.Context
 *
 * Units are Boost.Context fibers running on caller-provided stacks. Each
 * worker is a plain pthread whose own stack acts as the scheduler context:
 * cosync_port_switch() resumes a unit fiber and returns when the unit yields.
 *
 * A unit that yields on one worker may be resumed by another, so the
 * scheduler fiber handle stored in the context is refreshed on every resume.
 */

#include "cosync/port.h"
#include "cosync/port_traits.h"

#include <boost/context/fiber.hpp>
#include <boost/context/preallocated.hpp>
#include <boost/context/stack_context.hpp>

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <new>
#include <time.h>

/* ============================================================================
 * Port Context Structure
 * ========================================================================= */

struct cosync_port_context
{
   boost::context::fiber unit;   // Unit fiber (owned by the worker while the unit is switched out)
   boost::context::fiber sched;  // Worker fiber (owned by the unit while it runs)
   void*                 stack_top;
   size_t                stack_size;
   cosync_port_entry_t   entry;
   void*                 arg;
};

// Verify that port_traits.h constants are correct
static_assert(sizeof(cosync_port_context) == COSYNC_PORT_CONTEXT_SIZE,
              "COSYNC_PORT_CONTEXT_SIZE mismatch - adjust in port_traits.h");
static_assert(alignof(cosync_port_context) == COSYNC_PORT_CONTEXT_ALIGN,
              "COSYNC_PORT_CONTEXT_ALIGN mismatch - adjust in port_traits.h");
static_assert((COSYNC_STACK_ALIGN & (COSYNC_STACK_ALIGN - 1)) == 0,
              "COSYNC_STACK_ALIGN must be a power of two");

/* ============================================================================
 * Thread-Local State
 * ========================================================================= */

// Unit currently running on this OS thread (used by cosync_port_yield)
static thread_local cosync_port_context* tls_current_context = nullptr;

// TLS pointer (simulates a hardware thread pointer register)
static thread_local void* tls_thread_pointer = nullptr;

static thread_local uint32_t tls_worker_id = COSYNC_PORT_NO_WORKER;

/* ============================================================================
 * Worker Identification
 * ========================================================================= */

extern "C" uint32_t cosync_port_get_worker_id(void)
{
   return tls_worker_id;
}

extern "C" void cosync_port_set_worker_id(uint32_t worker_id)
{
   tls_worker_id = worker_id;
}

/* ============================================================================
 * Context Switching
 * ========================================================================= */

// No-op stack allocator for preallocated memory
struct preallocated_stack_noop
{
   using traits_type = boost::context::stack_traits;
   boost::context::stack_context allocate(size_t) { std::abort(); }
   void deallocate(boost::context::stack_context&) noexcept {}
};

extern "C" void cosync_port_context_init(cosync_port_context_t* context,
                                         void* stack_base,
                                         size_t stack_size,
                                         cosync_port_entry_t entry,
                                         void* arg)
{
   // Construct cosync_port_context_t in place
   ::new (context) cosync_port_context
   {
      .unit       = {},
      .sched      = {},
      .stack_top  = static_cast<uint8_t*>(stack_base) + stack_size,
      .stack_size = stack_size,
      .entry      = entry,
      .arg        = arg,
   };

   // Build a fiber bound to the caller-provided stack
   boost::context::stack_context boost_stack_context =
   {
      .size = context->stack_size,
      .sp   = context->stack_top,
   };

   boost::context::preallocated boost_prealloc(
      boost_stack_context.sp,
      boost_stack_context.size,
      boost_stack_context
   );

   preallocated_stack_noop stack_allocator;

   context->unit = boost::context::fiber(
      std::allocator_arg,
      boost_prealloc,
      stack_allocator,
      [context](boost::context::fiber&& sched_in) mutable -> boost::context::fiber
      {
         // Store the worker continuation so cosync_port_yield() can jump back
         context->sched = std::move(sched_in);

         // No thread-locals in here: the unit may finish on another worker than
         // it started on, and cosync_port_switch() maintains tls_current_context.
         context->entry(context->arg); // Enter user code

         return std::move(context->sched);
      }
   );
}

extern "C" void cosync_port_context_destroy(cosync_port_context_t* context)
{
   // Bug: destroying a live unit
   if (context->unit) {
      std::abort();
   }

   context->sched = boost::context::fiber{};
   context->~cosync_port_context();
}

extern "C" void cosync_port_switch(cosync_port_context_t* /*from*/, cosync_port_context_t* to)
{
   assert(to->unit && "No context to switch to");

   tls_current_context = to;
   to->unit = std::move(to->unit).resume();
   tls_current_context = nullptr;
}

extern "C" void cosync_port_yield(void)
{
   // No current context - nothing to yield from
   if (!tls_current_context) return;

   auto* current = tls_current_context;
   tls_current_context = nullptr;

   assert(current->sched && "No worker context to switch to");
   // The returned fiber belongs to whichever worker resumes us next
   current->sched = std::move(current->sched).resume();
}

extern "C" bool cosync_port_context_finished(cosync_port_context_t const* context)
{
   return !context->unit;
}

/* ============================================================================
 * Thread-Local Storage
 * ========================================================================= */

extern "C" void cosync_port_set_tls_pointer(void* tls_base)
{
   tls_thread_pointer = tls_base;
}

extern "C" void* cosync_port_get_tls_pointer(void)
{
   return tls_thread_pointer;
}

/* ============================================================================
 * CPU Hints / Idle Hook
 * ========================================================================= */

extern "C" void cosync_port_cpu_relax(void)
{
   // CPU yield hint for busy-wait loops
#if defined(__x86_64__) || defined(__i386__)
   __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
   __asm__ __volatile__("yield");
#endif
}

extern "C" void cosync_port_idle(long nanoseconds)
{
   struct timespec req = {.tv_sec = 0, .tv_nsec = nanoseconds};
   nanosleep(&req, nullptr);
}

/* ============================================================================
 * Debug / Diagnostics
 * ========================================================================= */

extern "C" void* cosync_port_get_stack_pointer(void)
{
   void* sp;
#if defined(__x86_64__)
   __asm__ __volatile__("mov %%rsp, %0" : "=r"(sp));
#elif defined(__i386__)
   __asm__ __volatile__("mov %%esp, %0" : "=r"(sp));
#elif defined(__aarch64__)
   __asm__ __volatile__("mov %0, sp" : "=r"(sp));
#elif defined(__arm__)
   __asm__ __volatile__("mov %0, sp" : "=r"(sp));
#else
   int dummy;
   sp = &dummy;
#endif
   return sp;
}
