/**
 * @file function.hpp
 * @brief Type-erased callable with configurable storage
 */

#ifndef COSYNC_FUNCTION_HPP
#define COSYNC_FUNCTION_HPP

#include <array>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace cosync
{

/**
 * @brief Heap allocation policy for Function
 */
enum class HeapPolicy
{
   NoHeap,      // Compile error if callable doesn't fit inline storage
   CanUseHeap,  // Use inline storage if possible, heap otherwise
   MustUseHeap  // Always allocate on heap
};

/**
 * @brief Type-erased callable with deterministic storage semantics
 *
 * Similar to std::function but move-only, and with explicit control over when
 * the heap is used. Unit entry points and deferred finalizer callbacks are
 * stored in one of these.
 *
 * @tparam Signature Function signature (e.g., void(), int(float))
 * @tparam InlineSize Size of inline storage buffer in bytes
 * @tparam Policy Heap allocation policy
 *
 * Example:
 *   Function<void(), 32, HeapPolicy::NoHeap> callback;
 *   callback = []() { do_work(); };  // Compiles if lambda fits in 32 bytes
 */
template<typename Signature, std::size_t InlineSize = 32, HeapPolicy Policy = HeapPolicy::NoHeap>
class Function;

template<typename Ret, typename... Args, std::size_t InlineSize, HeapPolicy Policy>
class Function<Ret(Args...), InlineSize, Policy>
{
   static constexpr bool AllowHeap = (Policy != HeapPolicy::NoHeap);
   static constexpr bool ForceHeap = (Policy == HeapPolicy::MustUseHeap);

   struct Ops
   {
      Ret  (*invoke)(Function const&, Args&&...);
      void (*relocate)(Function& dst, Function& src) noexcept;
      void (*destroy)(Function&) noexcept;
   };

   Ops const* ops{nullptr};

   // Storage for either inline object or heap pointer
   union Storage
   {
      alignas(std::max_align_t) std::array<std::byte, InlineSize> inline_storage;
      void* heap_ptr;
   };
   // Invoking through a const Function still hands out a mutable callable
   mutable Storage storage{};

public:
   constexpr Function() = default;
   constexpr Function(std::nullptr_t) noexcept {}

   template<typename F, typename = std::enable_if_t<!std::is_same_v<std::decay_t<F>, Function>>>
   Function(F&& f)
   {
      emplace(std::forward<F>(f));
   }

   ~Function()
   {
      reset();
   }

   Function(Function&& other) noexcept
   {
      take(other);
   }

   Function& operator=(Function&& other) noexcept
   {
      if (this != &other) {
         reset();
         take(other);
      }
      return *this;
   }

   Function(Function const&)            = delete;
   Function& operator=(Function const&) = delete;

   /**
    * @brief Replace current callable with a new one
    */
   template<typename F>
   void emplace(F&& f)
   {
      using Decayed = std::decay_t<F>;

      static_assert(std::is_invocable_r_v<Ret, Decayed&, Args...>,
                    "Callable signature does not match Function signature");

      constexpr bool FitsInline = sizeof(Decayed) <= InlineSize && alignof(Decayed) <= alignof(std::max_align_t);
      constexpr bool UseHeap    = ForceHeap || !FitsInline;

      static_assert(FitsInline || AllowHeap,
                    "Callable too large for inline storage. "
                    "Increase InlineSize or allow heap allocation.");

      reset();

      if constexpr (UseHeap) {
         storage.heap_ptr = new Decayed(std::forward<F>(f));
      } else {
         ::new (static_cast<void*>(storage.inline_storage.data())) Decayed(std::forward<F>(f));
      }
      ops = &OpsFor<Decayed, UseHeap>::table;
   }

   /**
    * @brief Invoke the stored callable
    *
    * Const because it does not change which callable is stored; the callable
    * itself may still mutate its captures.
    */
   Ret operator()(Args... args) const
   {
      return ops->invoke(*this, std::forward<Args>(args)...);
   }

   explicit operator bool() const noexcept
   {
      return ops != nullptr;
   }

   void reset() noexcept
   {
      if (ops) {
         ops->destroy(*this);
         ops = nullptr;
      }
   }

private:
   template<typename F, bool Heap>
   struct OpsFor
   {
      static F* target(Function const& self) noexcept
      {
         if constexpr (Heap) {
            return static_cast<F*>(self.storage.heap_ptr);
         } else {
            return std::launder(reinterpret_cast<F*>(self.storage.inline_storage.data()));
         }
      }

      static Ret invoke(Function const& self, Args&&... args)
      {
         return (*target(self))(std::forward<Args>(args)...);
      }

      static void relocate(Function& dst, Function& src) noexcept
      {
         if constexpr (Heap) {
            dst.storage.heap_ptr = std::exchange(src.storage.heap_ptr, nullptr);
         } else {
            F* from = target(src);
            ::new (static_cast<void*>(dst.storage.inline_storage.data())) F(std::move(*from));
            from->~F();
         }
      }

      static void destroy(Function& self) noexcept
      {
         if constexpr (Heap) {
            delete target(self);
            self.storage.heap_ptr = nullptr;
         } else {
            target(self)->~F();
         }
      }

      static constexpr Ops table{&invoke, &relocate, &destroy};
   };

   void take(Function& other) noexcept
   {
      if (!other.ops) return;
      other.ops->relocate(*this, other);
      ops = std::exchange(other.ops, nullptr);
   }
};

} // namespace cosync

#endif // COSYNC_FUNCTION_HPP
