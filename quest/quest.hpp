#ifndef QUEST_QUEST_HPP
#define QUEST_QUEST_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace quest {

using Clock = std::chrono::system_clock;

struct Quest
{
   uint32_t id;
   std::string title;
   std::string description;
   std::string giver;
   std::string location;
   bool active;
   Clock::time_point created;
   Clock::time_point lastUpdated;
   std::optional<Clock::time_point> completed;
};

// Fields left empty are not modified
struct Changes
{
   std::string title;
   std::string description;
   std::string giver;
   std::string location;
};

std::string TitleCase(std::string_view text);

// One-line summary for chat, e.g. "#3 Rescue The Miller (active)"
std::string Summarize(const Quest & quest);

std::string Describe(const Quest & quest);

} // namespace quest

#endif // QUEST_QUEST_HPP
