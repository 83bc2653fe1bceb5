#include <numeric>
#include "dice/roll.hpp"
#include "dice/engine.hpp"

namespace dice {

RollOutcome Evaluate(const RollExpression & expression, IEngine & engine)
{
   Cast cast(expression.count, expression.sides);
   engine.GenerateResult(cast);

   const int64_t rawSum = std::accumulate(cast.values.cbegin(), cast.values.cend(), int64_t{0});
   const int64_t modifier = expression.SignedModifier();
   const int64_t count = expression.count;

   return RollOutcome{
      .expression = expression,
      .rawSum = rawSum,
      .modifiedTotal = rawSum + modifier,
      .minPossible = count + modifier,
      .maxPossible = count * expression.sides + modifier,
   };
}

} // namespace dice
