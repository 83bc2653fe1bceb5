#ifndef CORE_CHAT_HPP
#define CORE_CHAT_HPP

#include <string>

namespace core {

struct Event
{
   std::string channel;
   std::string user;
   std::string text;
};

// Chat platform capabilities consumed by the commands
class IChatService
{
public:
   virtual ~IChatService() = default;
   virtual std::string ResolveName(const std::string & userId) = 0;
   virtual void PostMessage(const Event & event, std::string text) = 0;
};

} // namespace core

#endif // CORE_CHAT_HPP
