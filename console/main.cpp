#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "console/chatservice.hpp"
#include "core/config.hpp"
#include "core/controller.hpp"
#include "dice/engine.hpp"
#include "quest/store.hpp"
#include "utils/logger.hpp"
#include "utils/strings.hpp"
#include "utils/worker.hpp"

namespace {

constexpr std::string_view CHANNEL = "console";
constexpr std::string_view DEFAULT_USER = "user";

// "<user>: <message>", or just "<message>" for the default user
core::Event ParseLine(const std::string & line)
{
   std::string_view text = str::Trim(line);
   std::string_view user = DEFAULT_USER;
   const size_t colon = text.find(':');
   if (colon != std::string_view::npos && colon > 0 && text.front() != '!') {
      user = str::Trim(text.substr(0, colon));
      text = str::Trim(text.substr(colon + 1));
   }
   return core::Event{std::string(CHANNEL), std::string(user), std::string(text)};
}

} // namespace

int main(int argc, char * argv[])
{
   core::Config config;
   try {
      config = core::ParseConfig(std::vector<std::string>(argv + 1, argv + argc));
   }
   catch (const std::invalid_argument & e) {
      std::cerr << e.what() << std::endl;
      return 2;
   }

   auto logger = CreateLogger("DUNGEONBOT", config.verbose ? LogPriority::DEBUG : LogPriority::INFO);
   auto chat = console::CreateChatService(std::cout, config.userNames);
   auto engine = config.seed ? dice::CreateUniformEngine(*config.seed) : dice::CreateUniformEngine();
   auto ctrl = core::CreateController(config, std::move(engine), quest::CreateMemoryStore(), *chat, *logger);

   Worker worker("MAIN_WORKER", ctrl.get(), *logger);
   std::string line;
   while (std::getline(std::cin, line)) {
      worker.ScheduleTask([event = ParseLine(line)](void * data) {
         static_cast<core::IController *>(data)->OnMessage(event);
      });
   }
   return 0;
}
