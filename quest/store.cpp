#include <algorithm>
#include <iterator>
#include <mutex>
#include "quest/store.hpp"

using namespace quest;

namespace {

template <typename Pred, typename Less>
std::vector<Quest> Select(const std::vector<Quest> & quests, Pred pred, Less less, size_t howMany)
{
   std::vector<Quest> result;
   std::copy_if(quests.cbegin(), quests.cend(), std::back_inserter(result), pred);
   std::stable_sort(result.begin(), result.end(), less);
   if (result.size() > howMany)
      result.resize(howMany);
   return result;
}

auto All()
{
   return [](const Quest &) { return true; };
}

auto CreatedDesc()
{
   return [](const Quest & lhs, const Quest & rhs) {
      return lhs.created != rhs.created ? lhs.created > rhs.created : lhs.id > rhs.id;
   };
}

class MemoryStore : public IStore
{
public:
   explicit MemoryStore(std::function<Clock::time_point()> clock)
      : m_clock(std::move(clock))
      , m_nextId(1U)
   {}

   Quest New(std::string title,
             std::string description,
             std::string giver,
             std::string location) override
   {
      std::lock_guard lg(m_mutex);
      const auto now = m_clock();
      return m_quests.emplace_back(Quest{
         .id = m_nextId++,
         .title = std::move(title),
         .description = std::move(description),
         .giver = std::move(giver),
         .location = std::move(location),
         .active = true,
         .created = now,
         .lastUpdated = now,
         .completed = std::nullopt,
      });
   }
   std::optional<Quest> Modify(uint32_t id, const Changes & changes) override
   {
      std::lock_guard lg(m_mutex);
      Quest * quest = Find(id);
      if (!quest)
         return std::nullopt;
      if (!changes.title.empty())
         quest->title = changes.title;
      if (!changes.description.empty())
         quest->description = changes.description;
      if (!changes.giver.empty())
         quest->giver = changes.giver;
      if (!changes.location.empty())
         quest->location = changes.location;
      quest->lastUpdated = m_clock();
      return *quest;
   }
   std::optional<Quest> AddDetail(uint32_t id, std::string_view detail) override
   {
      std::lock_guard lg(m_mutex);
      Quest * quest = Find(id);
      if (!quest)
         return std::nullopt;
      if (!detail.empty()) {
         if (!quest->description.empty())
            quest->description += "||";
         quest->description += detail;
         quest->lastUpdated = m_clock();
      }
      return *quest;
   }
   std::optional<Quest> Complete(uint32_t id) override
   {
      std::lock_guard lg(m_mutex);
      Quest * quest = Find(id);
      if (!quest)
         return std::nullopt;
      const auto now = m_clock();
      quest->active = false;
      quest->lastUpdated = now;
      quest->completed = now;
      return *quest;
   }
   std::optional<Quest> GetById(uint32_t id) const override
   {
      std::lock_guard lg(m_mutex);
      auto it = std::find_if(m_quests.cbegin(), m_quests.cend(), [id](const Quest & q) {
         return q.id == id;
      });
      if (it == m_quests.cend())
         return std::nullopt;
      return *it;
   }
   std::optional<Quest> GetByTitle(std::string_view title) const override
   {
      std::lock_guard lg(m_mutex);
      auto it = std::find_if(m_quests.cbegin(), m_quests.cend(), [title](const Quest & q) {
         return q.title == title;
      });
      if (it == m_quests.cend())
         return std::nullopt;
      return *it;
   }
   std::vector<Quest> ListNewest(size_t howMany) const override
   {
      std::lock_guard lg(m_mutex);
      return Select(m_quests, All(), CreatedDesc(), howMany);
   }
   std::vector<Quest> ListLastUpdated(size_t howMany) const override
   {
      std::lock_guard lg(m_mutex);
      return Select(m_quests, All(), [](const Quest & lhs, const Quest & rhs) {
         return lhs.lastUpdated != rhs.lastUpdated ? lhs.lastUpdated > rhs.lastUpdated
                                                   : lhs.id > rhs.id;
      }, howMany);
   }
   std::vector<Quest> ListActive(size_t howMany) const override
   {
      std::lock_guard lg(m_mutex);
      return Select(m_quests, [](const Quest & q) { return q.active; }, [](const Quest & lhs, const Quest & rhs) {
         return lhs.id < rhs.id;
      }, howMany);
   }
   std::vector<Quest> ListInactive() const override
   {
      std::lock_guard lg(m_mutex);
      return Select(m_quests, [](const Quest & q) { return !q.active; }, [](const Quest & lhs, const Quest & rhs) {
         return lhs.completed < rhs.completed;
      }, m_quests.size());
   }
   std::vector<Quest> ListAll() const override
   {
      std::lock_guard lg(m_mutex);
      return Select(m_quests, All(), CreatedDesc(), m_quests.size());
   }

private:
   Quest * Find(uint32_t id)
   {
      auto it = std::find_if(m_quests.begin(), m_quests.end(), [id](const Quest & q) {
         return q.id == id;
      });
      return it == m_quests.end() ? nullptr : &*it;
   }

   const std::function<Clock::time_point()> m_clock;
   mutable std::mutex m_mutex;
   std::vector<Quest> m_quests;
   uint32_t m_nextId;
};

} // namespace

namespace quest {

std::unique_ptr<IStore> CreateMemoryStore(std::function<Clock::time_point()> clock)
{
   return std::make_unique<MemoryStore>(std::move(clock));
}

} // namespace quest
