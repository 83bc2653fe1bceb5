#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "dice/engine.hpp"
#include "dice/notation.hpp"
#include "dice/roll.hpp"

namespace {

class SequenceGenerator : public dice::IEngine
{
public:
   explicit SequenceGenerator(std::vector<uint32_t> sequence)
      : m_sequence(std::move(sequence))
   {}
   size_t draws = 0;

private:
   void GenerateResult(dice::Cast & cast) override
   {
      for (auto & value : cast.values)
         value = m_sequence[draws++ % m_sequence.size()];
   }
   std::vector<uint32_t> m_sequence;
};

TEST(DiceTest, generate_result)
{
   dice::Cast cast(100, 6);
   for (uint32_t val : cast.values) {
      ASSERT_EQ(val, 0U);
   }
   auto engine = dice::CreateUniformEngine();
   engine->GenerateResult(cast);
   for (uint32_t val : cast.values) {
      ASSERT_GE(val, 1U);
      ASSERT_LE(val, 6U);
   }
}

TEST(DiceTest, seeded_engines_repeat_the_same_sequence)
{
   auto engine1 = dice::CreateUniformEngine(42U);
   auto engine2 = dice::CreateUniformEngine(42U);
   dice::Cast cast1(50, 20);
   dice::Cast cast2(50, 20);
   engine1->GenerateResult(cast1);
   engine2->GenerateResult(cast2);
   EXPECT_EQ(cast1.values, cast2.values);
}

TEST(DiceTest, evaluate_sums_draws_and_applies_modifier)
{
   SequenceGenerator generator({2, 5, 6});

   auto outcome = dice::Evaluate(dice::Parse("3d6+3"), generator);
   EXPECT_EQ(3U, generator.draws);
   EXPECT_EQ(13, outcome.rawSum);
   EXPECT_EQ(16, outcome.modifiedTotal);
   EXPECT_EQ(6, outcome.minPossible);
   EXPECT_EQ(21, outcome.maxPossible);
   EXPECT_EQ(dice::Parse("3d6+3"), outcome.expression);
}

TEST(DiceTest, evaluate_with_negative_modifier)
{
   SequenceGenerator generator({1, 1});

   auto outcome = dice::Evaluate(dice::Parse("2d8-1"), generator);
   EXPECT_EQ(2, outcome.rawSum);
   EXPECT_EQ(1, outcome.modifiedTotal);
   EXPECT_EQ(1, outcome.minPossible);
   EXPECT_EQ(15, outcome.maxPossible);
}

TEST(DiceTest, single_sided_die_is_deterministic)
{
   auto engine = dice::CreateUniformEngine();
   for (int i = 0; i < 100; ++i) {
      auto outcome = dice::Evaluate(dice::Parse("1d1"), *engine);
      ASSERT_EQ(1, outcome.modifiedTotal);
      ASSERT_EQ(1, outcome.minPossible);
      ASSERT_EQ(1, outcome.maxPossible);
   }
}

TEST(DiceTest, totals_stay_within_bounds)
{
   struct Case
   {
      std::string_view clause;
      int64_t min;
      int64_t max;
   };
   const Case cases[] = {
      {"3d6", 3, 18},
      {"1d20+4", 5, 24},
      {"2d8-1", 1, 15},
      {"1d4+2", 3, 6},
      {"10d1-20", -10, -10},
   };
   auto engine = dice::CreateUniformEngine();
   for (const auto & c : cases) {
      for (int i = 0; i < 1000; ++i) {
         auto outcome = dice::Evaluate(dice::Parse(c.clause), *engine);
         ASSERT_EQ(c.min, outcome.minPossible) << c.clause;
         ASSERT_EQ(c.max, outcome.maxPossible) << c.clause;
         ASSERT_GE(outcome.modifiedTotal, outcome.minPossible) << c.clause;
         ASSERT_LE(outcome.modifiedTotal, outcome.maxPossible) << c.clause;
      }
   }
}

TEST(DiceTest, bounds_do_not_overflow_at_limits)
{
   const dice::Limits limits;
   SequenceGenerator generator({limits.maxSides});
   auto outcome = dice::Evaluate(dice::Parse("1000d1000000+1000000", limits), generator);
   EXPECT_EQ(1'000'000'000LL + 1'000'000LL, outcome.maxPossible);
   EXPECT_EQ(outcome.maxPossible, outcome.modifiedTotal);
}

TEST(DiceTest, engine_is_safe_to_share_between_threads)
{
   auto engine = dice::CreateUniformEngine();
   std::vector<std::thread> threads;
   std::atomic_bool inBounds = true;
   for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&] {
         for (int i = 0; i < 500; ++i) {
            auto outcome = dice::Evaluate(dice::Parse("4d6+1"), *engine);
            if (outcome.modifiedTotal < 5 || outcome.modifiedTotal > 25)
               inBounds = false;
         }
      });
   }
   for (auto & t : threads)
      t.join();
   EXPECT_TRUE(inBounds.load());
}

} // namespace
