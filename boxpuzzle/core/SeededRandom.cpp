#include "boxpuzzle/core/SeededRandom.hpp"

#include <cmath>
#include <memory>
#include <random>

namespace boxpuzzle::core
{
namespace
{
constexpr std::uint32_t kStateIncrement = 0x6D2B79F5U;
constexpr double kTwoPow32 = 4294967296.0;
} // namespace

SeededRandom::SeededRandom(std::uint32_t seed)
    : m_state(seed == 0U ? 1U : seed)
{
}

double SeededRandom::Next()
{
    m_state += kStateIncrement;
    std::uint32_t t = (m_state ^ (m_state >> 15U)) * (m_state | 1U);
    t ^= t + (t ^ (t >> 7U)) * (t | 61U);
    return static_cast<double>(t ^ (t >> 14U)) / kTwoPow32;
}

int SeededRandom::NextIntInclusive(int min, int max)
{
    const double span = static_cast<double>(max) - static_cast<double>(min) + 1.0;
    return min + static_cast<int>(std::floor(Next() * span));
}

double SeededRandom::NextTriangular01()
{
    const double a = Next();
    const double b = Next();
    return (a + b) * 0.5;
}

RandomFn CreateRng(std::uint32_t seed)
{
    auto state = std::make_shared<SeededRandom>(seed);
    return [state]() { return state->Next(); };
}

RandomFn CreateRng()
{
    return CreateRng(RandomSeed());
}

std::uint32_t RandomSeed()
{
    return std::random_device{}();
}
} // namespace boxpuzzle::core
