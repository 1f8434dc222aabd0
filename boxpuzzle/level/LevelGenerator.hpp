#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "boxpuzzle/generation/FigureAssembler.hpp"
#include "boxpuzzle/geometry/Box.hpp"

namespace boxpuzzle::level
{
// ============================================================================
// Tuning
// ============================================================================

namespace LevelConstants
{
    constexpr float RING_INNER_MARGIN = 0.6F;     // gap between footprint and ring
    constexpr float RING_WIDTH = 0.8F;
    constexpr float RING_VERTICAL_MARGIN = 0.2F;  // ring sits below the lowest box
    constexpr float MIN_RING_RADIUS = 1.2F;
    constexpr float MIN_FOOTPRINT_EXTENT = 1.0e-6F;
}

// ============================================================================
// Level Definitions
// ============================================================================

struct Difficulty
{
    std::string id;
    std::string title;
    int minBoxes = 3;
    int maxBoxes = 4;
    float matchThreshold = 0.85F;   // silhouette IoU needed to win
};

// Annulus under the figure used by the rotate gesture.
struct RotationRing
{
    float innerRadius = 0.0F;
    float outerRadius = 0.0F;
    float floorY = 0.0F;
};

struct Level
{
    std::uint32_t seed = 0;
    std::string difficultyId;
    generation::Figure figure;
    float targetAngle = 0.0F;            // radians, camera yaw of the target silhouette
    std::optional<RotationRing> ring;    // absent for an empty figure
};

// easy / medium / hard presets.
[[nodiscard]] const std::vector<Difficulty>& DefaultDifficulties();
[[nodiscard]] std::optional<Difficulty> FindDifficulty(const std::string& id);

[[nodiscard]] std::optional<RotationRing> ComputeRotationRing(const std::vector<geometry::Box>& boxes);

class LevelGenerator
{
public:
    /**
     * Builds one puzzle level.
     *
     * The level seed drives two draws of its own generator: the box count inside the
     * difficulty range and the target camera angle. The figure itself is generated from
     * the same seed with a separate generator.
     *
     * @param seed Level seed
     * @param difficulty Box-count range and match threshold
     * @return Generated level
     */
    [[nodiscard]] Level Generate(std::uint32_t seed, const Difficulty& difficulty) const;

    [[nodiscard]] static int PickBoxCount(double sample, const Difficulty& difficulty);
};
} // namespace boxpuzzle::level
