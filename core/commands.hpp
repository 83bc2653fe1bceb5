#ifndef CORE_COMMANDS_HPP
#define CORE_COMMANDS_HPP

#include <string_view>
#include "core/chat.hpp"

class ILogger;

namespace dice {
class IEngine;
}
namespace quest {
class IStore;
}

namespace core {
struct Config;

constexpr char COMMAND_PREFIX = '!';
constexpr std::string_view ROLL_SEPARATOR = "and";

struct Context
{
   ILogger & logger;
   dice::IEngine & engine;
   quest::IStore & quests;
   IChatService & chat;
   const Config & config;
};

} // namespace core

namespace command {

using Handler = void (*)(const core::Context &, const core::Event &, std::string_view);

struct Help final
{
   static constexpr std::string_view NAME = "help";
   static const std::string_view HELP;
   static void Handle(const core::Context & ctx, const core::Event & event, std::string_view args);
};

struct Quest final
{
   static constexpr std::string_view NAME = "quest";
   static const std::string_view HELP;
   static void Handle(const core::Context & ctx, const core::Event & event, std::string_view args);
};

struct Roll final
{
   static constexpr std::string_view NAME = "roll";
   static const std::string_view HELP;
   static void Handle(const core::Context & ctx, const core::Event & event, std::string_view args);
};

template <typename... T> struct List {};

using Dictionary = List<Help, Quest, Roll>;

} // namespace command

#endif // CORE_COMMANDS_HPP
