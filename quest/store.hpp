#ifndef QUEST_STORE_HPP
#define QUEST_STORE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "quest/quest.hpp"

namespace quest {

class IStore
{
public:
   virtual ~IStore() = default;

   virtual Quest New(std::string title,
                     std::string description,
                     std::string giver,
                     std::string location) = 0;
   virtual std::optional<Quest> Modify(uint32_t id, const Changes & changes) = 0;
   // Appends to the description with a "||" separator
   virtual std::optional<Quest> AddDetail(uint32_t id, std::string_view detail) = 0;
   virtual std::optional<Quest> Complete(uint32_t id) = 0;

   virtual std::optional<Quest> GetById(uint32_t id) const = 0;
   virtual std::optional<Quest> GetByTitle(std::string_view title) const = 0;

   virtual std::vector<Quest> ListNewest(size_t howMany) const = 0;
   virtual std::vector<Quest> ListLastUpdated(size_t howMany) const = 0;
   virtual std::vector<Quest> ListActive(size_t howMany) const = 0;
   virtual std::vector<Quest> ListInactive() const = 0;
   virtual std::vector<Quest> ListAll() const = 0;
};

std::unique_ptr<IStore> CreateMemoryStore(std::function<Clock::time_point()> clock = [] { return Clock::now(); });

} // namespace quest

#endif // QUEST_STORE_HPP
