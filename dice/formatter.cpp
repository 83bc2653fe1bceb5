#include <sstream>
#include "dice/formatter.hpp"

namespace {

constexpr std::string_view CLAUSE_JOINER = "\n\t and ";

std::string Requester(std::string_view name)
{
   std::ostringstream ss;
   ss << '*' << name << "* ";
   return ss.str();
}

} // namespace

namespace dice {

std::string FormatFragment(std::string_view clause, const RollOutcome & outcome)
{
   std::ostringstream ss;
   ss << "*rolls a " << outcome.modifiedTotal << "* "
      << "_(" << clause << " = " << outcome.rawSum << ' '
      << static_cast<char>(outcome.expression.op) << ' ' << outcome.expression.modifier << ")_ "
      << "_(min: " << outcome.minPossible << ", max: " << outcome.maxPossible << ")_";
   return ss.str();
}

std::string FormatRoll(std::string_view name, const CompoundResult & result)
{
   if (result.size() == 1)
      return Requester(name) + result.front().text;

   std::string joined;
   for (const auto & clause : result) {
      if (!joined.empty())
         joined += CLAUSE_JOINER;
      joined += clause.text;
   }
   return Requester(name) + joined;
}

} // namespace dice
