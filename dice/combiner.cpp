#include <cctype>
#include "dice/combiner.hpp"
#include "dice/formatter.hpp"
#include "utils/strings.hpp"

namespace dice {

// Splits on the raw text, so each clause is tokenized on its own and its
// errors name only that clause.
CompoundRequest SplitClauses(std::string_view argument, std::string_view separator)
{
   CompoundRequest clauses(1);
   size_t pos = 0;
   while (pos < argument.size()) {
      if (str::StartsWithNoCase(argument.substr(pos), separator)) {
         clauses.emplace_back();
         pos += separator.size();
         continue;
      }
      const char c = argument[pos++];
      if (!std::isspace(static_cast<unsigned char>(c)))
         clauses.back() += c;
   }
   return clauses;
}

CompoundResult Combine(std::string_view argument,
                       IEngine & engine,
                       const Limits & limits,
                       std::string_view separator)
{
   const CompoundRequest clauses = SplitClauses(argument, separator);

   std::vector<RollExpression> expressions;
   expressions.reserve(clauses.size());
   for (const auto & clause : clauses)
      expressions.push_back(Parse(clause, limits));

   CompoundResult result;
   result.reserve(clauses.size());
   for (size_t i = 0; i < clauses.size(); ++i) {
      RollOutcome outcome = Evaluate(expressions[i], engine);
      std::string text = FormatFragment(clauses[i], outcome);
      result.push_back(ClauseResult{clauses[i], std::move(outcome), std::move(text)});
   }
   return result;
}

} // namespace dice
