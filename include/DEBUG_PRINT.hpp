// Just for debugging ;)
// Define DEBUG_PRINT_ENABLE before including to turn a translation unit's logging on.
#ifndef DEBUG_PRINT_HPP
#define DEBUG_PRINT_HPP

#include <cinttypes>
#include <cstdint>
#include <cstdio>

#ifndef DEBUG_PRINT_ENABLE
#  define DEBUG_PRINT_ENABLE 0
#endif

extern "C" uint64_t kairos_port_time_now(void);

namespace kairos::debug
{
   enum class Channel
   {
      Scheduler,
      Port,
      Task,
      Futex,
      Async,
      Test
   };

#if DEBUG_PRINT_ENABLE
   inline const char* color(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Scheduler: return "\x1b[36m"; // cyan
         case Channel::Port:      return "\x1b[35m"; // magenta
         case Channel::Task:      return "\x1b[34m"; // blue
         case Channel::Futex:     return "\x1b[33m"; // yellow
         case Channel::Async:     return "\x1b[91m"; // bright red
         case Channel::Test:      return "\x1b[32m"; // green
      }
      return "\x1b[0m";
   }

   inline const char* label(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Scheduler: return "SCHED ";
         case Channel::Port:      return "PORT  ";
         case Channel::Task:      return "TASK  ";
         case Channel::Futex:     return "FUTEX ";
         case Channel::Async:     return "ASYNC ";
         case Channel::Test:      return "TEST  ";
      }
      return "????";
   }

   inline constexpr const char* reset() noexcept { return "\x1b[0m"; }

   template <typename... Args>
   inline void print(Channel ch, const char* fmt, Args... args)
   {
      std::printf("%s[tick=%06" PRIu64 "][%s] ", color(ch), kairos_port_time_now(), label(ch));
      if constexpr (sizeof...(args) == 0) std::printf("%s", fmt);
      else std::printf(fmt, args...);
      std::printf("%s\n", reset());
   }
#endif

}

#if DEBUG_PRINT_ENABLE
#  define LOG_SCHED(fmt, ...)  kairos::debug::print(kairos::debug::Channel::Scheduler, fmt, ##__VA_ARGS__)
#  define LOG_PORT(fmt, ...)   kairos::debug::print(kairos::debug::Channel::Port,      fmt, ##__VA_ARGS__)
#  define LOG_TASK(fmt, ...)   kairos::debug::print(kairos::debug::Channel::Task,      fmt, ##__VA_ARGS__)
#  define LOG_FUTEX(fmt, ...)  kairos::debug::print(kairos::debug::Channel::Futex,     fmt, ##__VA_ARGS__)
#  define LOG_ASYNC(fmt, ...)  kairos::debug::print(kairos::debug::Channel::Async,     fmt, ##__VA_ARGS__)
#  define LOG_TEST(fmt, ...)   kairos::debug::print(kairos::debug::Channel::Test,      fmt, ##__VA_ARGS__)
#else
#  define LOG_SCHED(...)  ((void)0)
#  define LOG_PORT(...)   ((void)0)
#  define LOG_TASK(...)   ((void)0)
#  define LOG_FUTEX(...)  ((void)0)
#  define LOG_ASYNC(...)  ((void)0)
#  define LOG_TEST(...)   ((void)0)
#endif

#endif
