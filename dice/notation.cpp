#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include "dice/notation.hpp"
#include "utils/strings.hpp"

using namespace dice;

namespace {

bool IsDigit(char c)
{
   return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string JoinText(std::span<const Lexeme> lexemes)
{
   std::string text;
   for (const auto & lexeme : lexemes)
      text += lexeme.text;
   return text;
}

class Parser
{
public:
   Parser(std::span<const Lexeme> lexemes, const Limits & limits)
      : m_lexemes(lexemes)
      , m_limits(limits)
      , m_pos(0)
   {}

   RollExpression ParseRoll()
   {
      if (m_lexemes.empty())
         Fail(ParseFailure::EMPTY_CLAUSE);

      const uint64_t count = ParseCount();
      const uint64_t sides = ParseSides();
      const auto [op, modifier] = ParseModifier();
      ExpectEnd();

      if (count == 0)
         Fail(ParseFailure::NON_POSITIVE_COUNT);
      if (sides == 0)
         Fail(ParseFailure::NON_POSITIVE_SIDES);
      CheckLimit("count", count, std::min(m_limits.maxCount, LIMITS_CEILING.maxCount));
      CheckLimit("sides", sides, std::min(m_limits.maxSides, LIMITS_CEILING.maxSides));
      CheckLimit("modifier", modifier, std::min(m_limits.maxModifier, LIMITS_CEILING.maxModifier));

      return RollExpression{static_cast<uint32_t>(count),
                            static_cast<uint32_t>(sides),
                            static_cast<uint32_t>(modifier),
                            op};
   }

private:
   // <count>
   uint64_t ParseCount()
   {
      if (const auto * number = Peek<token::Number>()) {
         ++m_pos;
         return number->value;
      }
      if (At<token::D>())
         Fail(ParseFailure::MISSING_COUNT);
      Fail(ParseFailure::UNEXPECTED_TOKEN);
   }

   // d<sides>
   uint64_t ParseSides()
   {
      if (!At<token::D>()) {
         if (AtEnd() || AtSign())
            Fail(ParseFailure::MISSING_SEPARATOR);
         Fail(ParseFailure::UNEXPECTED_TOKEN);
      }
      ++m_pos;
      if (const auto * number = Peek<token::Number>()) {
         ++m_pos;
         return number->value;
      }
      if (At<token::D>())
         Fail(ParseFailure::MULTIPLE_SEPARATORS);
      Fail(ParseFailure::MISSING_SIDES);
   }

   // [(+|-)<modifier>]
   std::pair<Operator, uint64_t> ParseModifier()
   {
      if (AtEnd())
         return {Operator::PLUS, 0U};
      if (At<token::D>())
         Fail(ParseFailure::MULTIPLE_SEPARATORS);
      if (!AtSign())
         Fail(ParseFailure::UNEXPECTED_TOKEN);

      const Operator op = At<token::Plus>() ? Operator::PLUS : Operator::MINUS;
      ++m_pos;
      if (const auto * number = Peek<token::Number>()) {
         ++m_pos;
         return {op, number->value};
      }
      if (AtSign())
         Fail(ParseFailure::AMBIGUOUS_SIGN);
      Fail(ParseFailure::MISSING_MODIFIER);
   }

   void ExpectEnd()
   {
      if (AtEnd())
         return;
      if (AtSign())
         Fail(ParseFailure::AMBIGUOUS_SIGN);
      if (At<token::D>())
         Fail(ParseFailure::MULTIPLE_SEPARATORS);
      Fail(ParseFailure::UNEXPECTED_TOKEN);
   }

   void CheckLimit(std::string_view field, uint64_t value, uint32_t limit) const
   {
      if (value > limit)
         throw OutOfRangeError(field, limit, JoinText(m_lexemes));
   }

   template <typename T>
   const T * Peek() const
   {
      return AtEnd() ? nullptr : std::get_if<T>(&m_lexemes[m_pos].token);
   }
   template <typename T>
   bool At() const
   {
      return Peek<T>() != nullptr;
   }
   bool AtSign() const { return At<token::Plus>() || At<token::Minus>(); }
   bool AtEnd() const { return m_pos >= m_lexemes.size(); }

   [[noreturn]] void Fail(ParseFailure reason) const
   {
      throw ParseError(reason, JoinText(m_lexemes));
   }

   std::span<const Lexeme> m_lexemes;
   const Limits & m_limits;
   size_t m_pos;
};

} // namespace

namespace dice {

std::string_view ToString(ParseFailure failure) noexcept
{
   switch (failure) {
      case ParseFailure::EMPTY_CLAUSE: return "empty roll";
      case ParseFailure::MISSING_COUNT: return "missing number of dice";
      case ParseFailure::MISSING_SEPARATOR: return "missing 'd' separator";
      case ParseFailure::MULTIPLE_SEPARATORS: return "more than one 'd' separator";
      case ParseFailure::MISSING_SIDES: return "missing number of sides";
      case ParseFailure::MISSING_MODIFIER: return "missing modifier after sign";
      case ParseFailure::AMBIGUOUS_SIGN: return "more than one modifier sign";
      case ParseFailure::UNEXPECTED_TOKEN: return "unexpected token";
      case ParseFailure::INVALID_CHARACTER: return "invalid character";
      case ParseFailure::NON_POSITIVE_COUNT: return "number of dice must be positive";
      case ParseFailure::NON_POSITIVE_SIDES: return "number of sides must be positive";
   }
   return "unknown failure";
}

ParseError::ParseError(ParseFailure reason, std::string clause)
   : NotationError("Invalid roll '" + clause + "': " + std::string(ToString(reason)),
                   clause)
   , m_reason(reason)
{}

OutOfRangeError::OutOfRangeError(std::string_view field, uint64_t limit, std::string clause)
   : NotationError("Invalid roll '" + clause + "': " + std::string(field) + " exceeds " +
                      std::to_string(limit),
                   clause)
   , m_field(field)
   , m_limit(limit)
{}

std::vector<Lexeme> Tokenize(std::string_view input, std::string_view separator)
{
   std::vector<Lexeme> result;
   size_t pos = 0;
   while (pos < input.size()) {
      const std::string_view rest = input.substr(pos);
      const char c = rest.front();

      if (std::isspace(static_cast<unsigned char>(c))) {
         ++pos;
         continue;
      }
      if (str::StartsWithNoCase(rest, separator)) {
         result.push_back({token::And{}, rest.substr(0, separator.size())});
         pos += separator.size();
         continue;
      }
      if (IsDigit(c)) {
         size_t length = 1;
         while (length < rest.size() && IsDigit(rest[length]))
            ++length;
         const std::string_view digits = rest.substr(0, length);
         uint64_t value = 0;
         const auto [_, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
         if (ec == std::errc::result_out_of_range)
            throw OutOfRangeError("number", std::numeric_limits<uint64_t>::max(), std::string(input));
         result.push_back({token::Number{value}, digits});
         pos += length;
         continue;
      }
      switch (c) {
         case 'd':
         case 'D':
            result.push_back({token::D{}, rest.substr(0, 1)});
            break;
         case '+':
            result.push_back({token::Plus{}, rest.substr(0, 1)});
            break;
         case '-':
            result.push_back({token::Minus{}, rest.substr(0, 1)});
            break;
         default:
            throw ParseError(ParseFailure::INVALID_CHARACTER, std::string(input));
      }
      ++pos;
   }
   return result;
}

RollExpression ParseClause(std::span<const Lexeme> lexemes, const Limits & limits)
{
   return Parser(lexemes, limits).ParseRoll();
}

RollExpression Parse(std::string_view clause, const Limits & limits)
{
   const auto lexemes = Tokenize(clause);
   return ParseClause(lexemes, limits);
}

} // namespace dice
