#ifndef DICE_CAST_HPP
#define DICE_CAST_HPP

#include <cstdint>
#include <vector>

namespace dice {

struct Cast
{
   Cast(uint32_t count, uint32_t sides)
      : sides(sides)
      , values(count, 0U)
   {}
   uint32_t sides;
   std::vector<uint32_t> values;
};

} // namespace dice

#endif // DICE_CAST_HPP
