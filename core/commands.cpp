#include <charconv>
#include <optional>
#include <sstream>
#include <unordered_map>
#include "core/commands.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "dice/combiner.hpp"
#include "dice/formatter.hpp"
#include "quest/store.hpp"
#include "utils/strings.hpp"

namespace {

template <typename... Cs>
std::optional<std::string_view> FindHelp(command::List<Cs...>, std::string_view topic)
{
   std::optional<std::string_view> result;
   (void)((topic == Cs::NAME ? (result = Cs::HELP, true) : false) || ...);
   return result;
}

std::optional<uint32_t> ParseId(std::string_view text)
{
   if (!text.empty() && text.front() == '#')
      text.remove_prefix(1);
   uint32_t id = 0;
   const auto [last, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
   if (text.empty() || ec != std::errc() || last != text.data() + text.size())
      return std::nullopt;
   return id;
}

std::string NotFound(uint32_t id)
{
   return "No quest with id " + std::to_string(id) + ".";
}

std::string ListQuests(std::string_view heading, const std::vector<quest::Quest> & quests)
{
   if (quests.empty())
      return "No quests found.";
   std::ostringstream ss;
   ss << "*Quests (" << heading << "):*";
   for (const auto & q : quests)
      ss << "\n\t" << quest::Summarize(q);
   return ss.str();
}

// Reply text, or nullopt when the usage was malformed
using QuestAction =
   std::optional<std::string> (*)(const core::Context &, std::string_view /*args*/);

std::optional<std::string> QuestAdd(const core::Context & ctx, std::string_view args)
{
   if (args.empty())
      return std::nullopt;
   const auto q = ctx.quests.New(std::string(args), {}, {}, {});
   ctx.logger.Write<LogPriority::INFO>("Quest added, id =", q.id);
   return "Quest added: " + quest::Summarize(q);
}

std::optional<std::string> QuestList(const core::Context & ctx, std::string_view args)
{
   const std::string kind = args.empty() ? "active" : str::ToLower(args);
   const size_t howMany = ctx.config.questListSize;
   if (kind == "active")
      return ListQuests(kind, ctx.quests.ListActive(howMany));
   if (kind == "inactive" || kind == "completed")
      return ListQuests("completed", ctx.quests.ListInactive());
   if (kind == "newest")
      return ListQuests(kind, ctx.quests.ListNewest(howMany));
   if (kind == "updated")
      return ListQuests(kind, ctx.quests.ListLastUpdated(howMany));
   if (kind == "all")
      return ListQuests(kind, ctx.quests.ListAll());
   return std::nullopt;
}

std::optional<std::string> QuestShow(const core::Context & ctx, std::string_view args)
{
   const auto id = ParseId(args);
   if (!id)
      return std::nullopt;
   const auto q = ctx.quests.GetById(*id);
   return q ? quest::Describe(*q) : NotFound(*id);
}

std::optional<std::string> QuestComplete(const core::Context & ctx, std::string_view args)
{
   const auto id = ParseId(args);
   if (!id)
      return std::nullopt;
   const auto q = ctx.quests.Complete(*id);
   return q ? "Quest completed: " + quest::Summarize(*q) : NotFound(*id);
}

std::optional<std::string> QuestDetail(const core::Context & ctx, std::string_view args)
{
   const auto [idText, detail] = str::SplitWord(args);
   const auto id = ParseId(idText);
   if (!id || detail.empty())
      return std::nullopt;
   const auto q = ctx.quests.AddDetail(*id, detail);
   return q ? "Quest updated: " + quest::Summarize(*q) : NotFound(*id);
}

template <std::string quest::Changes::*Field>
std::optional<std::string> QuestModify(const core::Context & ctx, std::string_view args)
{
   const auto [idText, value] = str::SplitWord(args);
   const auto id = ParseId(idText);
   if (!id || value.empty())
      return std::nullopt;
   quest::Changes changes;
   changes.*Field = std::string(value);
   const auto q = ctx.quests.Modify(*id, changes);
   return q ? "Quest updated: " + quest::Summarize(*q) : NotFound(*id);
}

const std::unordered_map<std::string_view, QuestAction> & QuestActions()
{
   static const std::unordered_map<std::string_view, QuestAction> s_actions{
      {"add", &QuestAdd},
      {"list", &QuestList},
      {"show", &QuestShow},
      {"complete", &QuestComplete},
      {"detail", &QuestDetail},
      {"rename", &QuestModify<&quest::Changes::title>},
      {"giver", &QuestModify<&quest::Changes::giver>},
      {"location", &QuestModify<&quest::Changes::location>},
   };
   return s_actions;
}

} // namespace

namespace command {

const std::string_view Help::HELP = R"(```
available help topics:
    help
    quest
    roll

Try `!help [topic]` for information on a specific topic.
```)";

const std::string_view Quest::HELP = R"(```
command:
    !quest

description:
    Keeps track of the party's quests.

usage:
    !quest add [TITLE]
    !quest list [active|completed|newest|updated|all]
    !quest show [ID]
    !quest detail [ID] [TEXT]
    !quest rename [ID] [TITLE]
    !quest giver [ID] [NAME]
    !quest location [ID] [PLACE]
    !quest complete [ID]

examples:
    !quest add Rescue the miller
    !quest detail 1 The miller was last seen near the old mill
    !quest complete 1
```)";

const std::string_view Roll::HELP = R"(```
command:
    !roll

description:
    Rolls dice for you.

usage:
    !roll [HOW MANY]d[SIDES][+/-MODIFIER]
    !roll [HOW MANY]d[SIDES][+/-MODIFIER] and [HOW MANY]d[SIDES][+/-MODIFIER] and ...

examples:
    !roll 2d6
    !roll 1d20+4
    !roll 1d6 and 1d4+2 and 2d8-1
```)";

void Help::Handle(const core::Context & ctx, const core::Event & event, std::string_view args)
{
   const auto [topic, _] = str::SplitWord(args);
   const auto help = FindHelp(Dictionary{}, str::ToLower(topic));
   ctx.chat.PostMessage(event, std::string(help.value_or(HELP)));
}

void Quest::Handle(const core::Context & ctx, const core::Event & event, std::string_view args)
{
   const auto [action, rest] = str::SplitWord(args);
   const auto & actions = QuestActions();
   auto it = actions.find(str::ToLower(action));
   if (it == actions.cend()) {
      ctx.chat.PostMessage(event, std::string(HELP));
      return;
   }
   std::optional<std::string> reply = (*it->second)(ctx, rest);
   ctx.chat.PostMessage(event, reply ? std::move(*reply) : std::string(HELP));
}

void Roll::Handle(const core::Context & ctx, const core::Event & event, std::string_view args)
{
   dice::CompoundResult result;
   try {
      result = dice::Combine(args, ctx.engine, ctx.config.limits, core::ROLL_SEPARATOR);
   }
   catch (const dice::NotationError & e) {
      ctx.logger.Write<LogPriority::WARN>("Rejected roll:", e.what());
      ctx.chat.PostMessage(event, std::string(HELP));
      return;
   }
   const std::string name = ctx.chat.ResolveName(event.user);
   ctx.chat.PostMessage(event, dice::FormatRoll(name, result));
}

} // namespace command
