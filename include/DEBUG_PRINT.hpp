// Just for debugging ;)
#ifndef DEBUG_PRINT_HPP
#define DEBUG_PRINT_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>

#ifndef DEBUG_PRINT_ENABLE
#  define DEBUG_PRINT_ENABLE 0
#endif

extern "C" uint32_t cosync_port_get_worker_id(void);

namespace cosync::debug
{
   enum class Channel
   {
      Scheduler,
      Unit,
      Sync,
      Once,
      Test
   };

#if DEBUG_PRINT_ENABLE
   // Simple ANSI colour table
   inline const char* color(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Scheduler: return "\x1b[36m"; // cyan
         case Channel::Unit:      return "\x1b[34m"; // blue
         case Channel::Sync:      return "\x1b[33m"; // yellow
         case Channel::Once:      return "\x1b[31m"; // red
         case Channel::Test:      return "\x1b[32m"; // green
      }
      return "\x1b[0m";
   }

   inline const char* label(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Scheduler: return "SCHED ";
         case Channel::Unit:      return "UNIT  ";
         case Channel::Sync:      return "SYNC  ";
         case Channel::Once:      return "ONCE  ";
         case Channel::Test:      return "TEST  ";
      }
      return "????";
   }

   inline constexpr const char* reset() noexcept { return "\x1b[0m"; }

   template <typename... Args>
   inline void print(Channel ch, const char* fmt, Args... args)
   {
      // Format the whole line, colour reset and newline included, so one
      // fputs writes it and workers do not interleave mid-line
      char line[512];
      constexpr std::size_t tail = sizeof("\x1b[0m\n");   // reset + newline + NUL
      constexpr std::size_t body = sizeof(line) - tail + 1;
      int n = std::snprintf(line, body, "%s[worker=%02d][%s] ",
                            color(ch),
                            static_cast<int>(cosync_port_get_worker_id()),
                            label(ch));
      if (n < 0) return;
      auto used = static_cast<std::size_t>(n) < body ? static_cast<std::size_t>(n) : body - 1;
      if constexpr (sizeof...(args) == 0) n = std::snprintf(line + used, body - used, "%s", fmt);
      else n = std::snprintf(line + used, body - used, fmt, args...);
      if (n > 0) used += static_cast<std::size_t>(n) < body - used ? static_cast<std::size_t>(n) : body - used - 1;
      std::snprintf(line + used, sizeof(line) - used, "%s\n", reset());
      std::fputs(line, stdout);
   }

   inline constexpr const char* park_state_to_str(uint8_t state) {
      switch (state) {
         case 0: return "Idle";
         case 1: return "Notified";
         case 2: return "Parking";
         case 3: return "Parked";
         default: return "???";
      }
   }
#endif

}

// Convenience macros
#if DEBUG_PRINT_ENABLE
#  define LOG_SCHED(fmt, ...)       cosync::debug::print(cosync::debug::Channel::Scheduler, fmt, ##__VA_ARGS__)
#  define LOG_UNIT(fmt, ...)        cosync::debug::print(cosync::debug::Channel::Unit,      fmt, ##__VA_ARGS__)
#  define LOG_SYNC(fmt, ...)        cosync::debug::print(cosync::debug::Channel::Sync,      fmt, ##__VA_ARGS__)
#  define LOG_ONCE(fmt, ...)        cosync::debug::print(cosync::debug::Channel::Once,      fmt, ##__VA_ARGS__)
#  define LOG_TEST(fmt, ...)        cosync::debug::print(cosync::debug::Channel::Test,      fmt, ##__VA_ARGS__)
#  define PARK_STATE_TO_STR(state)  cosync::debug::park_state_to_str(static_cast<uint8_t>(state))
   inline void* ptr_suffix(void const* ptr) { return (void*)((uintptr_t)ptr % 10000); }
#else
#  define LOG_SCHED(...)  ((void)0)
#  define LOG_UNIT(...)   ((void)0)
#  define LOG_SYNC(...)   ((void)0)
#  define LOG_ONCE(...)   ((void)0)
#  define LOG_TEST(...)   ((void)0)
#  define PARK_STATE_TO_STR(state)  ""

#endif

#endif
