#include <mutex>
#include "console/chatservice.hpp"

namespace {

class ChatService : public core::IChatService
{
public:
   ChatService(std::ostream & out, std::unordered_map<std::string, std::string> userNames)
      : m_out(out)
      , m_userNames(std::move(userNames))
   {}

private:
   std::string ResolveName(const std::string & userId) override
   {
      auto it = m_userNames.find(userId);
      return it == std::cend(m_userNames) ? userId : it->second;
   }
   void PostMessage(const core::Event & event, std::string text) override
   {
      std::lock_guard lg(m_mutex);
      m_out << '[' << event.channel << "] " << text << std::endl;
   }

   std::ostream & m_out;
   const std::unordered_map<std::string, std::string> m_userNames;
   std::mutex m_mutex;
};

} // namespace

namespace console {

std::unique_ptr<core::IChatService> CreateChatService(
   std::ostream & out, std::unordered_map<std::string, std::string> userNames)
{
   return std::make_unique<ChatService>(out, std::move(userNames));
}

} // namespace console
