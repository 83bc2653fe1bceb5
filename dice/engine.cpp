#include <mutex>
#include <random>
#include "dice/engine.hpp"

using namespace dice;

namespace {

class UniformEngine : public IEngine
{
public:
   UniformEngine()
      : m_generator(std::random_device{}())
   {}
   explicit UniformEngine(uint32_t seed)
      : m_generator(seed)
   {}
   void GenerateResult(Cast & cast) override
   {
      std::uniform_int_distribution<uint32_t> dist(1U, cast.sides);
      std::lock_guard lg(m_mutex);
      for (auto & value : cast.values) {
         value = dist(m_generator);
      }
   }

private:
   std::mutex m_mutex;
   std::mt19937 m_generator;
};

} // namespace

namespace dice {

std::unique_ptr<IEngine> CreateUniformEngine()
{
   return std::make_unique<UniformEngine>();
}

std::unique_ptr<IEngine> CreateUniformEngine(uint32_t seed)
{
   return std::make_unique<UniformEngine>(seed);
}

} // namespace dice
