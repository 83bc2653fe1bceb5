#ifndef CORE_CONFIG_HPP
#define CORE_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "dice/notation.hpp"

namespace core {

struct Config
{
   dice::Limits limits;
   std::optional<uint32_t> seed;
   size_t questListSize = 5U;
   std::unordered_map<std::string, std::string> userNames;
   bool verbose = false;
};

// Accepts --max-dice=N, --max-sides=N, --max-modifier=N, --seed=N,
// --list-size=N, --user=ID=NAME (repeatable) and --verbose.
// Limits above dice::LIMITS_CEILING are rejected.
// Throws std::invalid_argument on anything else.
Config ParseConfig(const std::vector<std::string> & args);

} // namespace core

#endif // CORE_CONFIG_HPP
