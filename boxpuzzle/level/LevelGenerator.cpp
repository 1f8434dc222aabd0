#include "boxpuzzle/level/LevelGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <glm/gtc/constants.hpp>

#include "boxpuzzle/core/SeededRandom.hpp"

namespace boxpuzzle::level
{
const std::vector<Difficulty>& DefaultDifficulties()
{
    static const std::vector<Difficulty> kDifficulties{
        Difficulty{"easy", "Easy", 3, 4, 0.85F},
        Difficulty{"medium", "Medium", 5, 6, 0.9F},
        Difficulty{"hard", "Hard", 7, 8, 0.93F},
    };
    return kDifficulties;
}

std::optional<Difficulty> FindDifficulty(const std::string& id)
{
    const std::vector<Difficulty>& difficulties = DefaultDifficulties();
    const auto it = std::find_if(difficulties.begin(), difficulties.end(), [&id](const Difficulty& difficulty) {
        return difficulty.id == id;
    });
    if (it == difficulties.end())
    {
        return std::nullopt;
    }
    return *it;
}

std::optional<RotationRing> ComputeRotationRing(const std::vector<geometry::Box>& boxes)
{
    const std::optional<geometry::BoxBounds> bounds = geometry::ComputeBounds(boxes);
    if (!bounds.has_value())
    {
        return std::nullopt;
    }

    const glm::vec3 extent = bounds->Extent();
    const float halfWidth = std::max(extent.x, LevelConstants::MIN_FOOTPRINT_EXTENT) * 0.5F;
    const float halfDepth = std::max(extent.z, LevelConstants::MIN_FOOTPRINT_EXTENT) * 0.5F;
    const float halfDiagonal = std::sqrt(halfWidth * halfWidth + halfDepth * halfDepth);

    RotationRing ring;
    ring.innerRadius = std::max(halfDiagonal + LevelConstants::RING_INNER_MARGIN, LevelConstants::MIN_RING_RADIUS);
    ring.outerRadius = ring.innerRadius + LevelConstants::RING_WIDTH;
    ring.floorY = bounds->min.y - LevelConstants::RING_VERTICAL_MARGIN;
    return ring;
}

int LevelGenerator::PickBoxCount(double sample, const Difficulty& difficulty)
{
    const int range = std::max(0, difficulty.maxBoxes - difficulty.minBoxes);
    return difficulty.minBoxes + static_cast<int>(std::floor(sample * static_cast<double>(range + 1)));
}

Level LevelGenerator::Generate(std::uint32_t seed, const Difficulty& difficulty) const
{
    core::SeededRandom rng(seed);

    Level level;
    level.seed = seed;
    level.difficultyId = difficulty.id;

    const int boxCount = PickBoxCount(rng.Next(), difficulty);
    level.figure = generation::GenerateFigure(seed, boxCount);
    // fmod keeps float rounding from producing exactly 2*pi.
    level.targetAngle = std::fmod(static_cast<float>(rng.Next() * glm::two_pi<double>()), glm::two_pi<float>());
    level.ring = ComputeRotationRing(level.figure.boxes);

    std::cout << "[Level] Seed=" << seed
              << " difficulty=" << difficulty.id
              << " boxes=" << level.figure.boxes.size()
              << " angle=" << level.targetAngle << "\n";
    return level;
}
} // namespace boxpuzzle::level
