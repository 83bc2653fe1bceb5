#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <vector>

#include "tests/fakelogger.hpp"
#include "core/commands.hpp"
#include "core/config.hpp"
#include "core/controller.hpp"
#include "dice/engine.hpp"
#include "quest/store.hpp"

namespace {

class MockChat : public core::IChatService
{
public:
   struct Post
   {
      std::string channel;
      std::string text;
   };

   std::optional<Post> PopNextPost()
   {
      if (m_posts.empty())
         return std::nullopt;
      auto p = std::move(m_posts.front());
      m_posts.pop();
      return p;
   }
   bool NoPosts() const { return m_posts.empty(); }

   std::vector<std::string> resolved;

private:
   std::string ResolveName(const std::string & userId) override
   {
      resolved.push_back(userId);
      return userId == "U1" ? "Alice" : userId;
   }
   void PostMessage(const core::Event & event, std::string text) override
   {
      m_posts.push({event.channel, std::move(text)});
   }

   std::queue<Post> m_posts;
};

class StubGenerator : public dice::IEngine
{
public:
   uint32_t value = 3;
   size_t draws = 0;

private:
   void GenerateResult(dice::Cast & cast) override
   {
      for (auto & e : cast.values) {
         e = std::min(value, cast.sides);
         ++draws;
      }
   }
};

class ControllerFixture : public ::testing::Test
{
protected:
   ControllerFixture()
   {
      generator = new StubGenerator;
      ctrl = core::CreateController(config,
                                    std::unique_ptr<dice::IEngine>(generator),
                                    quest::CreateMemoryStore(),
                                    chat,
                                    logger);
   }
   void Say(std::string text, std::string user = "U1")
   {
      ctrl->OnMessage(core::Event{"#table", std::move(user), std::move(text)});
   }
   std::string NextPost()
   {
      auto p = chat.PopNextPost();
      if (!p) {
         ADD_FAILURE() << "no post";
         return {};
      }
      EXPECT_EQ("#table", p->channel);
      return p->text;
   }

   core::Config config;
   MockChat chat;
   FakeLogger logger;
   StubGenerator * generator;
   std::unique_ptr<core::IController> ctrl;
};

TEST_F(ControllerFixture, single_roll_is_posted_with_requester_name)
{
   Say("!roll 2d6+3");
   EXPECT_EQ("*Alice* *rolls a 9* _(2d6+3 = 6 + 3)_ _(min: 5, max: 15)_", NextPost());
   EXPECT_TRUE(chat.NoPosts());
   EXPECT_EQ(2U, generator->draws);
   EXPECT_EQ("<<<<< roll [2d6+3] from U1", logger.GetLastLine());
}

TEST_F(ControllerFixture, compound_roll_resolves_name_once)
{
   Say("!roll 1d6 and 1d4+2 and 2d8-1");
   EXPECT_EQ("*Alice* *rolls a 3* _(1d6 = 3 + 0)_ _(min: 1, max: 6)_"
             "\n\t and *rolls a 5* _(1d4+2 = 3 + 2)_ _(min: 3, max: 6)_"
             "\n\t and *rolls a 5* _(2d8-1 = 6 - 1)_ _(min: 1, max: 15)_",
             NextPost());
   EXPECT_TRUE(chat.NoPosts());
   EXPECT_EQ((std::vector<std::string>{"U1"}), chat.resolved);
}

TEST_F(ControllerFixture, command_name_is_case_insensitive)
{
   Say("  !ROLL 1d1 ", "U2");
   EXPECT_EQ("*U2* *rolls a 1* _(1d1 = 1 + 0)_ _(min: 1, max: 1)_", NextPost());
}

TEST_F(ControllerFixture, malformed_roll_posts_usage_without_rolling)
{
   Say("!roll 1d6 and d6");
   EXPECT_EQ(std::string(command::Roll::HELP), NextPost());
   EXPECT_TRUE(chat.NoPosts());
   EXPECT_EQ(0U, generator->draws);
   EXPECT_TRUE(chat.resolved.empty());
   EXPECT_FALSE(logger.NoWarningsOrErrors());

   logger.Clear();
   Say("!roll 1d6+2-1");
   EXPECT_EQ(std::string(command::Roll::HELP), NextPost());
   Say("!roll");
   EXPECT_EQ(std::string(command::Roll::HELP), NextPost());
   Say("!roll 100000d6");
   EXPECT_EQ(std::string(command::Roll::HELP), NextPost());
   EXPECT_EQ(0U, generator->draws);
}

TEST_F(ControllerFixture, non_commands_and_unknown_commands_are_ignored)
{
   Say("hello there");
   Say("roll 1d6");
   EXPECT_TRUE(logger.Empty());
   Say("!dance");
   Say("!");
   EXPECT_TRUE(chat.NoPosts());
   EXPECT_TRUE(logger.NoWarningsOrErrors());
}

TEST_F(ControllerFixture, help_posts_topic_or_general_help)
{
   Say("!help");
   EXPECT_EQ(std::string(command::Help::HELP), NextPost());
   Say("!help roll");
   EXPECT_EQ(std::string(command::Roll::HELP), NextPost());
   Say("!help QUEST");
   EXPECT_EQ(std::string(command::Quest::HELP), NextPost());
   Say("!help nonsense");
   EXPECT_EQ(std::string(command::Help::HELP), NextPost());
   EXPECT_TRUE(chat.NoPosts());
}

TEST_F(ControllerFixture, quest_lifecycle)
{
   Say("!quest add rescue the miller");
   EXPECT_EQ("Quest added: #1 Rescue The Miller (active)", NextPost());
   Say("!quest add slay the dragon");
   EXPECT_EQ("Quest added: #2 Slay The Dragon (active)", NextPost());

   Say("!quest detail 1 last seen near the mill");
   EXPECT_EQ("Quest updated: #1 Rescue The Miller (active)", NextPost());
   Say("!quest giver #1 Old Tom");
   EXPECT_EQ("Quest updated: #1 Rescue The Miller (active)", NextPost());
   Say("!quest location 1 Riverside");
   EXPECT_EQ("Quest updated: #1 Rescue The Miller (active)", NextPost());
   Say("!quest rename 1 find the miller");
   EXPECT_EQ("Quest updated: #1 Find The Miller (active)", NextPost());

   Say("!quest show 1");
   EXPECT_EQ("*#1 Find The Miller (active)*"
             "\n\tgiven by: Old Tom"
             "\n\tlocation: Riverside"
             "\n\t- last seen near the mill",
             NextPost());

   Say("!quest complete 1");
   EXPECT_EQ("Quest completed: #1 Find The Miller (completed)", NextPost());

   Say("!quest list");
   EXPECT_EQ("*Quests (active):*\n\t#2 Slay The Dragon (active)", NextPost());
   Say("!quest list completed");
   EXPECT_EQ("*Quests (completed):*\n\t#1 Find The Miller (completed)", NextPost());
   EXPECT_TRUE(chat.NoPosts());
}

TEST_F(ControllerFixture, quest_errors)
{
   Say("!quest list");
   EXPECT_EQ("No quests found.", NextPost());
   Say("!quest show 9");
   EXPECT_EQ("No quest with id 9.", NextPost());
   Say("!quest complete 9");
   EXPECT_EQ("No quest with id 9.", NextPost());

   Say("!quest");
   EXPECT_EQ(std::string(command::Quest::HELP), NextPost());
   Say("!quest fly away");
   EXPECT_EQ(std::string(command::Quest::HELP), NextPost());
   Say("!quest add");
   EXPECT_EQ(std::string(command::Quest::HELP), NextPost());
   Say("!quest show one");
   EXPECT_EQ(std::string(command::Quest::HELP), NextPost());
   Say("!quest detail 1");
   EXPECT_EQ(std::string(command::Quest::HELP), NextPost());
   Say("!quest list sideways");
   EXPECT_EQ(std::string(command::Quest::HELP), NextPost());
   EXPECT_TRUE(chat.NoPosts());
}

class ThrowingGenerator : public dice::IEngine
{
   void GenerateResult(dice::Cast &) override
   {
      throw std::runtime_error("entropy source unavailable");
   }
};

TEST(ControllerTest, engine_failure_propagates_without_posting)
{
   core::Config config;
   MockChat chat;
   FakeLogger logger;
   auto ctrl = core::CreateController(config,
                                      std::make_unique<ThrowingGenerator>(),
                                      quest::CreateMemoryStore(),
                                      chat,
                                      logger);

   EXPECT_THROW(ctrl->OnMessage(core::Event{"#table", "U1", "!roll 1d6"}), std::runtime_error);
   EXPECT_TRUE(chat.NoPosts());
   EXPECT_TRUE(chat.resolved.empty());
   EXPECT_TRUE(logger.NoWarningsOrErrors());
}

class LimitedFixture : public ControllerFixture
{
protected:
   LimitedFixture()
   {
      config.limits.maxCount = 2U;
      config.questListSize = 1U;
      generator = new StubGenerator;
      ctrl = core::CreateController(config,
                                    std::unique_ptr<dice::IEngine>(generator),
                                    quest::CreateMemoryStore(),
                                    chat,
                                    logger);
   }
};

TEST_F(LimitedFixture, controller_uses_configured_limits)
{
   Say("!roll 2d6");
   EXPECT_EQ("*Alice* *rolls a 6* _(2d6 = 6 + 0)_ _(min: 2, max: 12)_", NextPost());
   Say("!roll 3d6");
   EXPECT_EQ(std::string(command::Roll::HELP), NextPost());

   Say("!quest add one");
   NextPost();
   Say("!quest add two");
   NextPost();
   Say("!quest list");
   EXPECT_EQ("*Quests (active):*\n\t#1 One (active)", NextPost());
}

} // namespace
