#ifndef DICE_FORMATTER_HPP
#define DICE_FORMATTER_HPP

#include <string>
#include <string_view>
#include "dice/combiner.hpp"

namespace dice {

// *rolls a 9* _(2d6+3 = 6 + 3)_ _(min: 5, max: 15)_
std::string FormatFragment(std::string_view clause, const RollOutcome & outcome);

std::string FormatRoll(std::string_view name, const CompoundResult & result);

} // namespace dice

#endif // DICE_FORMATTER_HPP
