#pragma once

#include <cstdint>
#include <vector>

#include "boxpuzzle/core/SeededRandom.hpp"
#include "boxpuzzle/generation/TagDistribution.hpp"
#include "boxpuzzle/geometry/Box.hpp"

namespace boxpuzzle::generation
{
struct FigureOptions
{
    std::uint32_t seed = 0;
    int boxCount = 5;
    float glassChance = 0.5F;       // per-box chance of the glass material
    DebuffChances debuffChances;    // optional per-box coin flips, in order
};

struct Figure
{
    std::uint32_t seed = 0;
    std::vector<geometry::Box> boxes;
};

// Grows one connected cluster by attaching random boxes to faces of already placed ones.
class FigureAssembler
{
public:
    struct Settings
    {
        int minDimension = 1;
        int maxDimension = 3;
        int maxPlacementAttempts = 64;
        float overlapEpsilon = geometry::kOverlapEpsilon;
    };

    FigureAssembler() = default;
    explicit FigureAssembler(const Settings& settings);

    // Places up to boxCount boxes and recenters the cluster. Fewer boxes come back
    // when every attempt for the next box collides.
    [[nodiscard]] std::vector<geometry::Box> Assemble(int boxCount, core::SeededRandom& rng) const;

    // Random integer extents, centered at the origin.
    [[nodiscard]] geometry::Box CreateRandomBox(core::SeededRandom& rng) const;

    // Puts candidate flush against anchor's face along axis/direction. On the other two axes
    // a smaller candidate is jittered inside the anchor's extent and a larger one is shifted so
    // one of its edges lines up with the anchor.
    [[nodiscard]] static geometry::Box PlaceAdjacentBox(
        const geometry::Box& anchor,
        const geometry::Box& candidate,
        geometry::Axis axis,
        int direction,
        core::SeededRandom& rng
    );

private:
    Settings m_settings;
};

[[nodiscard]] Figure GenerateFigure(std::uint32_t seed, int boxCount);
[[nodiscard]] Figure GenerateFigure(const FigureOptions& options);
} // namespace boxpuzzle::generation
