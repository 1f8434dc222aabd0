#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "boxpuzzle/core/SeededRandom.hpp"
#include "boxpuzzle/generation/ContainerSplitter.hpp"
#include "boxpuzzle/geometry/Box.hpp"

namespace boxpuzzle::generation
{
// Requested box count per debuff. Entries are processed in insertion order, which
// fixes how the shared generator is consumed.
using DebuffDistribution = std::vector<std::pair<geometry::Debuff, int>>;

// Per-box probability per debuff, flipped in insertion order.
using DebuffChances = std::vector<std::pair<geometry::Debuff, float>>;

// Fisher-Yates shuffle of [0, count).
[[nodiscard]] std::vector<std::size_t> ShuffleIndices(std::size_t count, core::SeededRandom& rng);

// Tags min(count, boxes.size()) distinct boxes with each debuff. Entries with count <= 0
// are skipped without consuming the generator.
void DistributeDebuffs(std::vector<geometry::Box>& boxes, const DebuffDistribution& distribution, core::SeededRandom& rng);

// Same quota rule for a material label.
void DistributeMaterial(
    std::vector<geometry::Box>& boxes,
    geometry::Material material,
    int count,
    core::SeededRandom& rng
);

void ApplyDebuffChances(geometry::Box& box, const DebuffChances& chances, core::SeededRandom& rng);

// Number of boxes carrying the debuff.
[[nodiscard]] std::size_t CountDebuff(const std::vector<geometry::Box>& boxes, geometry::Debuff debuff);

// Splits the container and runs the debuff pass on the same generator.
[[nodiscard]] bool GenerateBoxesWithDistribution(
    std::uint32_t seed,
    int cuts,
    const ContainerDimensions& container,
    const DebuffDistribution& distribution,
    std::vector<geometry::Box>* outBoxes,
    std::string* outError = nullptr
);
} // namespace boxpuzzle::generation
