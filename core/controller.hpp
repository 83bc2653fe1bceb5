#ifndef CORE_CONTROLLER_HPP
#define CORE_CONTROLLER_HPP

#include <memory>
#include "core/chat.hpp"

class ILogger;

namespace dice {
class IEngine;
} // namespace dice

namespace quest {
class IStore;
} // namespace quest

namespace core {
struct Config;

class IController
{
public:
   virtual ~IController() = default;
   virtual void OnMessage(const Event & event) = 0;
};

// chat and logger must outlive the controller
std::unique_ptr<IController> CreateController(const Config & config,
                                              std::unique_ptr<dice::IEngine> engine,
                                              std::unique_ptr<quest::IStore> quests,
                                              IChatService & chat,
                                              ILogger & logger);

} // namespace core

#endif // CORE_CONTROLLER_HPP
