#include <cstdio>
#include <ctime>
#include <iterator>
#include <mutex>
#include "utils/logger.hpp"

namespace {

char PriorityLetter(LogPriority prio)
{
   switch (prio) {
      case LogPriority::VERBOSE: return 'V';
      case LogPriority::DEBUG: return 'D';
      case LogPriority::INFO: return 'I';
      case LogPriority::WARN: return 'W';
      case LogPriority::ERROR: return 'E';
      case LogPriority::FATAL: return 'F';
      default: return '?';
   }
}

class Logger : public ILogger
{
public:
   Logger(std::string tag, LogPriority threshold)
      : m_tag(std::move(tag))
      , m_threshold(threshold)
   {}
   void Write(LogPriority prio, std::string msg) override
   {
      if (prio < m_threshold)
         return;

      char timeBuf[64] = {};
      const std::time_t t = std::time(nullptr);
      std::tm utc{};
      gmtime_r(&t, &utc);
      std::strftime(std::data(timeBuf), std::size(timeBuf), "%D %T", &utc);

      std::lock_guard lg(m_mutex);
      fprintf(stderr, "%s %c/%s: %s\n", timeBuf, PriorityLetter(prio), m_tag.c_str(), msg.c_str());
   }

private:
   const std::string m_tag;
   const LogPriority m_threshold;
   std::mutex m_mutex;
};

} // namespace

std::unique_ptr<ILogger> CreateLogger(std::string tag, LogPriority threshold)
{
   return std::make_unique<Logger>(std::move(tag), threshold);
}
