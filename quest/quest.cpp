#include <cctype>
#include <sstream>
#include "quest/quest.hpp"

namespace quest {

std::string TitleCase(std::string_view text)
{
   std::string result(text);
   bool wordStart = true;
   for (auto & c : result) {
      const auto uc = static_cast<unsigned char>(c);
      if (std::isalpha(uc)) {
         c = static_cast<char>(wordStart ? std::toupper(uc) : std::tolower(uc));
         wordStart = false;
      } else {
         wordStart = true;
      }
   }
   return result;
}

std::string Summarize(const Quest & quest)
{
   std::ostringstream ss;
   ss << '#' << quest.id << ' ' << TitleCase(quest.title) << (quest.active ? " (active)" : " (completed)");
   return ss.str();
}

std::string Describe(const Quest & quest)
{
   std::ostringstream ss;
   ss << '*' << Summarize(quest) << '*';
   if (!quest.giver.empty())
      ss << "\n\tgiven by: " << quest.giver;
   if (!quest.location.empty())
      ss << "\n\tlocation: " << quest.location;
   if (!quest.description.empty()) {
      std::string_view description = quest.description;
      size_t pos;
      while ((pos = description.find("||")) != std::string_view::npos) {
         ss << "\n\t- " << description.substr(0, pos);
         description.remove_prefix(pos + 2);
      }
      ss << "\n\t- " << description;
   }
   return ss.str();
}

} // namespace quest
