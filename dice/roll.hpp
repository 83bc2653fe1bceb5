#ifndef DICE_ROLL_HPP
#define DICE_ROLL_HPP

#include <cstdint>
#include "dice/notation.hpp"

namespace dice {
class IEngine;

struct RollOutcome
{
   RollExpression expression;
   int64_t rawSum;
   int64_t modifiedTotal;
   int64_t minPossible;
   int64_t maxPossible;
};

// Draws exactly expression.count values from the engine
RollOutcome Evaluate(const RollExpression & expression, IEngine & engine);

} // namespace dice

#endif // DICE_ROLL_HPP
