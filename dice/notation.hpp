#ifndef DICE_NOTATION_HPP
#define DICE_NOTATION_HPP

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dice {

struct Limits
{
   uint32_t maxCount = 1000U;
   uint32_t maxSides = 1'000'000U;
   uint32_t maxModifier = 1'000'000U;
};

// No configured limit may exceed these: count * sides + modifier stays well
// inside int64_t and one roll holds at most 100'000 values.
inline constexpr Limits LIMITS_CEILING{.maxCount = 100'000U,
                                       .maxSides = 1'000'000'000U,
                                       .maxModifier = 1'000'000'000U};

enum class Operator : char
{
   PLUS = '+',
   MINUS = '-',
};

struct RollExpression
{
   uint32_t count;
   uint32_t sides;
   uint32_t modifier;
   Operator op;

   int64_t SignedModifier() const noexcept
   {
      return op == Operator::PLUS ? static_cast<int64_t>(modifier)
                                  : -static_cast<int64_t>(modifier);
   }
   bool operator==(const RollExpression &) const = default;
};


namespace token {
struct Number
{
   uint64_t value;
};
struct D {};
struct Plus {};
struct Minus {};
struct And {};
} // namespace token

using Token = std::variant<token::Number, token::D, token::Plus, token::Minus, token::And>;

struct Lexeme
{
   Token token;
   std::string_view text;
};


enum class ParseFailure
{
   EMPTY_CLAUSE,
   MISSING_COUNT,
   MISSING_SEPARATOR,
   MULTIPLE_SEPARATORS,
   MISSING_SIDES,
   MISSING_MODIFIER,
   AMBIGUOUS_SIGN,
   UNEXPECTED_TOKEN,
   INVALID_CHARACTER,
   NON_POSITIVE_COUNT,
   NON_POSITIVE_SIDES,
};

std::string_view ToString(ParseFailure failure) noexcept;

class NotationError : public std::invalid_argument
{
public:
   NotationError(const std::string & message, std::string clause)
      : std::invalid_argument(message)
      , m_clause(std::move(clause))
   {}
   const std::string & Clause() const noexcept { return m_clause; }

private:
   std::string m_clause;
};

class ParseError : public NotationError
{
public:
   ParseError(ParseFailure reason, std::string clause);
   ParseFailure Reason() const noexcept { return m_reason; }

private:
   ParseFailure m_reason;
};

class OutOfRangeError : public NotationError
{
public:
   OutOfRangeError(std::string_view field, uint64_t limit, std::string clause);
   std::string_view Field() const noexcept { return m_field; }
   uint64_t Limit() const noexcept { return m_limit; }

private:
   std::string m_field;
   uint64_t m_limit;
};


// Whitespace is skipped; the separator keyword is matched case-insensitively
std::vector<Lexeme> Tokenize(std::string_view input, std::string_view separator = "and");

// Limits above LIMITS_CEILING are capped to it
RollExpression ParseClause(std::span<const Lexeme> lexemes, const Limits & limits = {});

RollExpression Parse(std::string_view clause, const Limits & limits = {});

} // namespace dice

#endif // DICE_NOTATION_HPP
