#ifndef DICE_COMBINER_HPP
#define DICE_COMBINER_HPP

#include <string>
#include <string_view>
#include <vector>
#include "dice/notation.hpp"
#include "dice/roll.hpp"

namespace dice {
class IEngine;

using CompoundRequest = std::vector<std::string>;

struct ClauseResult
{
   std::string clause;
   RollOutcome outcome;
   std::string text;
};

using CompoundResult = std::vector<ClauseResult>;

// Clause texts have their whitespace removed. Never empty: a blank argument
// yields a single empty clause.
CompoundRequest SplitClauses(std::string_view argument, std::string_view separator = "and");

// Every clause is parsed before any of them is evaluated, so a malformed
// clause leaves the engine untouched.
CompoundResult Combine(std::string_view argument,
                       IEngine & engine,
                       const Limits & limits = {},
                       std::string_view separator = "and");

} // namespace dice

#endif // DICE_COMBINER_HPP
