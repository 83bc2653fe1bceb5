#ifndef CORE_LOGGING_HPP
#define CORE_LOGGING_HPP

#include <string>
#include <string_view>
#include <type_traits>

enum class LogPriority
{
   DEFAULT = 1,
   VERBOSE,
   DEBUG,
   INFO,
   WARN,
   ERROR,
   FATAL
};

class ILogger
{
public:
   virtual ~ILogger() = default;

   virtual void Write(LogPriority prio, std::string msg) = 0;

   // Arguments are joined with single spaces
   template <LogPriority prio, typename TFirst, typename... TArgs>
   void Write(TFirst && first, TArgs &&... args)
   {
      std::string msg = ToString(std::forward<TFirst>(first));
      ((msg += ' ', msg += ToString(std::forward<TArgs>(args))), ...);
      Write(prio, std::move(msg));
   }

private:
   static std::string ToString(const std::string & s) { return s; }
   static std::string ToString(const char * s) { return std::string(s); }
   static std::string ToString(std::string_view s) { return std::string(s); }
   static std::string ToString(char c) { return std::string(1, c); }
   static std::string ToString(bool b) { return b ? "true" : "false"; }
   template <typename T, typename = std::enable_if_t<
       std::is_arithmetic_v<std::decay_t<T>> && !std::is_same_v<std::decay_t<T>, bool>>>
   static std::string ToString(T s)
   {
      return std::to_string(s);
   }
};

#endif // CORE_LOGGING_HPP
