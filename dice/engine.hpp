#ifndef DICE_ENGINE_HPP
#define DICE_ENGINE_HPP

#include <memory>
#include "dice/cast.hpp"

namespace dice {

class IEngine
{
public:
   virtual ~IEngine() = default;

   // Fills every value with an independent draw in [1, cast.sides]
   virtual void GenerateResult(dice::Cast & cast) = 0;
};

std::unique_ptr<IEngine> CreateUniformEngine();

std::unique_ptr<IEngine> CreateUniformEngine(uint32_t seed);

} // namespace dice

#endif // DICE_ENGINE_HPP
