/**
 * @file wait_queue.cpp
 * @brief Spinlock, WaitList and WaitQueue
 */

#include "cosync/runtime.hpp"
#include "cosync/port.h"
#include "DEBUG_PRINT.hpp"

#include <cassert>
#include <thread>

namespace cosync
{

/* ============================================================================
 * Spinlock
 * ========================================================================= */

void Spinlock::lock() noexcept
{
   std::uint32_t spins = 0;
   while (flag.test_and_set(std::memory_order_acquire)) {
      while (flag.test(std::memory_order_relaxed)) {
         if (++spins < config::SPIN_LIMIT) {
            cosync_port_cpu_relax();
         } else {
            // The holder may have been descheduled by the OS
            spins = 0;
            std::this_thread::yield();
         }
      }
   }
}

/* ============================================================================
 * WaitList
 * ========================================================================= */

std::size_t WaitList::size() const noexcept
{
   std::size_t n = 0;
   for (auto* node = head; node; node = node->next) ++n;
   return n;
}

void WaitList::add(Node& node) noexcept
{
   assert(node.next == nullptr && node.prev == nullptr && "Node already linked");

   node.context = this_unit::context();
   node.signal.store(Node::Signal::Waiting, std::memory_order_relaxed);

   node.prev = tail;
   node.next = nullptr;
   if (tail) tail->next = &node; else head = &node;
   tail = &node;
}

WaitList::Node* WaitList::pop_front() noexcept
{
   if (empty()) return nullptr;
   auto* node = head;
   head = node->next;
   if (head) head->prev = nullptr; else tail = nullptr;
   node->next = node->prev = nullptr;
   return node;
}

bool WaitList::signal_one() noexcept
{
   auto* node = pop_front();
   if (!node) return false;

   // The waiter does not return before Done, so the node and its context
   // stay alive until the unpark below is complete
   node->signal.store(Node::Signal::Signalling, std::memory_order_release);
   unpark(node->context);
   node->signal.store(Node::Signal::Done, std::memory_order_release);
   return true;
}

std::size_t WaitList::signal_all() noexcept
{
   std::size_t woken = 0;
   while (signal_one()) ++woken;
   return woken;
}

void WaitList::block(Node const& node) noexcept
{
   while (true) {
      switch (node.signal.load(std::memory_order_acquire)) {
         case Node::Signal::Done:
            return;
         case Node::Signal::Waiting:
            this_unit::park();
            break;
         case Node::Signal::Signalling:
            // Woken early by a stale permit; the signaller is mid-unpark
            cosync_port_cpu_relax();
            break;
      }
   }
}

/* ============================================================================
 * WaitQueue
 * ========================================================================= */

void WaitQueue::wait() noexcept
{
   assert(spinlock.is_locked() && "WaitQueue::wait() requires the queue lock");

   WaitList::Node node;
   waiters.add(node);

   spinlock.unlock();
   WaitList::block(node);
   spinlock.lock();
}

bool WaitQueue::notify_one() noexcept
{
   assert(spinlock.is_locked() && "WaitQueue::notify_one() requires the queue lock");
   return waiters.signal_one();
}

std::size_t WaitQueue::notify_all() noexcept
{
   assert(spinlock.is_locked() && "WaitQueue::notify_all() requires the queue lock");
   std::size_t const woken = waiters.signal_all();
   if (woken) LOG_SYNC("WaitQueue(%p) woke %zu waiters", ptr_suffix(this), woken);
   return woken;
}

} // namespace cosync
