// Just for debugging ;)
#ifndef DEBUG_PRINT_HPP
#define DEBUG_PRINT_HPP

#include <cstdint>
#include <cstdio>

extern "C" uint64_t kasync_port_time_now(void);
extern "C" uint32_t kasync_port_get_core_id(void);

namespace kasync::debug
{
   enum class Channel
   {
      Executor,
      Timer,
      Reactor,
      Sync,
      Port,
      Test
   };

#if DEBUG_PRINT_ENABLE
   // Simple ANSI colour table
   inline const char* color(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Executor: return "\x1b[36m"; // cyan
         case Channel::Timer:    return "\x1b[34m"; // blue
         case Channel::Reactor:  return "\x1b[35m"; // magenta
         case Channel::Sync:     return "\x1b[33m"; // yellow
         case Channel::Port:     return "\x1b[90m"; // grey
         case Channel::Test:     return "\x1b[32m"; // green
      }
      return "\x1b[0m";
   }

   inline const char* label(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Executor: return "EXEC  ";
         case Channel::Timer:    return "TIMER ";
         case Channel::Reactor:  return "IO    ";
         case Channel::Sync:     return "SYNC  ";
         case Channel::Port:     return "PORT  ";
         case Channel::Test:     return "TEST  ";
      }
      return "????";
   }

   inline constexpr const char* reset() noexcept { return "\x1b[0m"; }

   template <typename... Args>
   inline void print(Channel ch, const char* fmt, Args... args)
   {
      // prefix with time + core + channel label
      std::printf("%s[t=%08llu][core%u][%s] ",
                  color(ch),
                  static_cast<unsigned long long>(kasync_port_time_now()),
                  kasync_port_get_core_id(),
                  label(ch));
      if constexpr (sizeof...(args) == 0) std::printf("%s", fmt);
      else std::printf(fmt, args...);
      std::printf("%s\n", reset());
   }
#endif

}

// Convenience macros
#if DEBUG_PRINT_ENABLE
#  define LOG_EXEC(fmt, ...)     kasync::debug::print(kasync::debug::Channel::Executor, fmt, ##__VA_ARGS__)
#  define LOG_TIMER(fmt, ...)    kasync::debug::print(kasync::debug::Channel::Timer,    fmt, ##__VA_ARGS__)
#  define LOG_REACTOR(fmt, ...)  kasync::debug::print(kasync::debug::Channel::Reactor,  fmt, ##__VA_ARGS__)
#  define LOG_SYNC(fmt, ...)     kasync::debug::print(kasync::debug::Channel::Sync,     fmt, ##__VA_ARGS__)
#  define LOG_PORT(fmt, ...)     kasync::debug::print(kasync::debug::Channel::Port,     fmt, ##__VA_ARGS__)
#  define LOG_TEST(fmt, ...)     kasync::debug::print(kasync::debug::Channel::Test,     fmt, ##__VA_ARGS__)
#  define TRUE_FALSE(what) ((what) ? "TRUE" : "FALSE")
#else
#  define LOG_EXEC(...)    ((void)0)
#  define LOG_TIMER(...)   ((void)0)
#  define LOG_REACTOR(...) ((void)0)
#  define LOG_SYNC(...)    ((void)0)
#  define LOG_PORT(...)    ((void)0)
#  define LOG_TEST(...)    ((void)0)
#  define TRUE_FALSE(what)
#endif

#endif
