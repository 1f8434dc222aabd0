#pragma once

#include <cstdint>
#include <functional>

namespace boxpuzzle::core
{
// Deterministic 32-bit generator. Same seed -> same sequence on every platform.
class SeededRandom
{
public:
    explicit SeededRandom(std::uint32_t seed);

    // Uniform value in [0, 1).
    double Next();

    // Uniform integer in [min, max]. Always consumes exactly one draw.
    int NextIntInclusive(int min, int max);

    // Triangular value in [0, 1] peaking at 0.5 (mean of two draws).
    double NextTriangular01();

    [[nodiscard]] std::uint32_t GetState() const { return m_state; }

private:
    std::uint32_t m_state = 1;
};

using RandomFn = std::function<double()>;

// Returns a generator function bound to its own SeededRandom instance.
[[nodiscard]] RandomFn CreateRng(std::uint32_t seed);

// Non-deterministic variant, seeded from std::random_device.
[[nodiscard]] RandomFn CreateRng();

[[nodiscard]] std::uint32_t RandomSeed();
} // namespace boxpuzzle::core
