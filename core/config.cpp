#include <charconv>
#include <limits>
#include <stdexcept>
#include <string_view>
#include "core/config.hpp"

namespace {

uint32_t ParseNumber(std::string_view option,
                     std::string_view value,
                     uint32_t max = std::numeric_limits<uint32_t>::max())
{
   uint32_t result = 0;
   const auto [last, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
   if (value.empty() || ec != std::errc() || last != value.data() + value.size())
      throw std::invalid_argument("Invalid value for " + std::string(option) + ": '" +
                                  std::string(value) + "'");
   if (result > max)
      throw std::invalid_argument(std::string(option) + " must not exceed " +
                                  std::to_string(max));
   return result;
}

uint32_t ParsePositive(std::string_view option,
                       std::string_view value,
                       uint32_t max = std::numeric_limits<uint32_t>::max())
{
   const uint32_t result = ParseNumber(option, value, max);
   if (result == 0)
      throw std::invalid_argument(std::string(option) + " must be positive");
   return result;
}

} // namespace

namespace core {

Config ParseConfig(const std::vector<std::string> & args)
{
   Config config;
   for (const std::string & arg : args) {
      const std::string_view argView = arg;
      const size_t eq = argView.find('=');
      const std::string_view option = argView.substr(0, eq);
      const std::string_view value =
         eq == std::string_view::npos ? std::string_view{} : argView.substr(eq + 1);

      if (option == "--verbose" && eq == std::string_view::npos) {
         config.verbose = true;
      } else if (option == "--max-dice") {
         config.limits.maxCount = ParsePositive(option, value, dice::LIMITS_CEILING.maxCount);
      } else if (option == "--max-sides") {
         config.limits.maxSides = ParsePositive(option, value, dice::LIMITS_CEILING.maxSides);
      } else if (option == "--max-modifier") {
         config.limits.maxModifier = ParseNumber(option, value, dice::LIMITS_CEILING.maxModifier);
      } else if (option == "--seed") {
         config.seed = ParseNumber(option, value);
      } else if (option == "--list-size") {
         config.questListSize = ParsePositive(option, value);
      } else if (option == "--user") {
         const size_t sep = value.find('=');
         if (sep == 0 || sep == std::string_view::npos || sep + 1 == value.size())
            throw std::invalid_argument("Expected --user=ID=NAME, got '" + arg + "'");
         config.userNames[std::string(value.substr(0, sep))] = std::string(value.substr(sep + 1));
      } else {
         throw std::invalid_argument("Unknown option: '" + arg + "'");
      }
   }
   return config;
}

} // namespace core
