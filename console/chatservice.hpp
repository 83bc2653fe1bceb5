#ifndef CONSOLE_CHATSERVICE_HPP
#define CONSOLE_CHATSERVICE_HPP

#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>
#include "core/chat.hpp"

namespace console {

// Posts replies to out; users without a configured name are shown by id
std::unique_ptr<core::IChatService> CreateChatService(
   std::ostream & out, std::unordered_map<std::string, std::string> userNames);

} // namespace console

#endif // CONSOLE_CHATSERVICE_HPP
