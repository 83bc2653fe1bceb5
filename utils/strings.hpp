#ifndef UTILS_STRINGS_HPP
#define UTILS_STRINGS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>

namespace str {

inline std::string_view Trim(std::string_view s)
{
   static constexpr std::string_view whitespace = " \t\r\n";
   const size_t first = s.find_first_not_of(whitespace);
   if (first == std::string_view::npos)
      return {};
   const size_t last = s.find_last_not_of(whitespace);
   return s.substr(first, last - first + 1);
}

// {"first", "rest of the line"}, both trimmed
inline std::pair<std::string_view, std::string_view> SplitWord(std::string_view s)
{
   s = Trim(s);
   const size_t end = s.find_first_of(" \t");
   if (end == std::string_view::npos)
      return {s, {}};
   return {s.substr(0, end), Trim(s.substr(end))};
}

// False for an empty prefix
inline bool StartsWithNoCase(std::string_view text, std::string_view prefix)
{
   if (prefix.empty() || text.size() < prefix.size())
      return false;
   return std::equal(prefix.cbegin(), prefix.cend(), text.cbegin(), [](unsigned char a, unsigned char b) {
      return std::tolower(a) == std::tolower(b);
   });
}

inline std::string ToLower(std::string_view s)
{
   std::string result(s);
   std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
   });
   return result;
}

} // namespace str

#endif // UTILS_STRINGS_HPP
