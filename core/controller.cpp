#include <sstream>
#include <unordered_map>
#include <utility>

#include "core/commands.hpp"
#include "core/config.hpp"
#include "core/controller.hpp"
#include "core/logging.hpp"
#include "dice/engine.hpp"
#include "quest/store.hpp"
#include "utils/strings.hpp"

namespace {

using CommandHandlerMap = std::unordered_map<std::string_view, command::Handler>;

template <typename... Commands>
CommandHandlerMap CreateCommandHandlers(command::List<Commands...>)
{
   return CommandHandlerMap{{Commands::NAME, &Commands::Handle}...};
}

class Controller : public core::IController
{
public:
   Controller(const core::Config & config,
              std::unique_ptr<dice::IEngine> engine,
              std::unique_ptr<quest::IStore> quests,
              core::IChatService & chat,
              ILogger & logger)
      : m_config(config)
      , m_generator(std::move(engine))
      , m_quests(std::move(quests))
      , m_ctx{logger, *m_generator, *m_quests, chat, m_config}
      , m_commandHandlers(CreateCommandHandlers(command::Dictionary{}))
   {}

private:
   void OnMessage(const core::Event & event) override
   {
      std::string_view text = str::Trim(event.text);
      if (text.empty() || text.front() != core::COMMAND_PREFIX)
         return;
      text.remove_prefix(1);

      const auto [word, args] = str::SplitWord(text);
      const std::string name = str::ToLower(word);
      auto it = m_commandHandlers.find(name);
      if (it == std::cend(m_commandHandlers)) {
         m_ctx.logger.Write<LogPriority::DEBUG>("Command handler not found, name=", name);
         return;
      }

      std::ostringstream ss;
      ss << "<<<<< " << it->first << " [" << args << "] from " << event.user;
      m_ctx.logger.Write(LogPriority::INFO, ss.str());

      (*it->second)(m_ctx, event, args);
   }

   const core::Config m_config;
   std::unique_ptr<dice::IEngine> m_generator;
   std::unique_ptr<quest::IStore> m_quests;
   const core::Context m_ctx;

   CommandHandlerMap m_commandHandlers;
};

} // namespace

namespace core {

std::unique_ptr<IController> CreateController(const Config & config,
                                              std::unique_ptr<dice::IEngine> engine,
                                              std::unique_ptr<quest::IStore> quests,
                                              IChatService & chat,
                                              ILogger & logger)
{
   return std::make_unique<Controller>(config, std::move(engine), std::move(quests), chat, logger);
}

} // namespace core
