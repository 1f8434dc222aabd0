#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "boxpuzzle/core/SeededRandom.hpp"
#include "boxpuzzle/geometry/Box.hpp"

namespace boxpuzzle::generation
{
struct ContainerDimensions
{
    float width = 1.0F;
    float height = 1.0F;
    float depth = 1.0F;
};

// BSP tiler: repeatedly cuts the largest splittable segment along its longest axis,
// with the cut biased toward the middle. Output boxes tile the container exactly.
class ContainerSplitter
{
public:
    struct Settings
    {
        double minSplitRatio = 0.3;   // smaller part keeps at least this share
        glm::vec3 origin{0.0F};       // container center
    };

    ContainerSplitter() = default;
    explicit ContainerSplitter(const Settings& settings);

    // Largest accepted cut count: floor(volume) - 1, never below 0.
    [[nodiscard]] static std::int64_t MaxCuts(const ContainerDimensions& container);

    /**
     * Cuts the container `cuts` times, or fewer when no segment can be split further.
     *
     * @param container Dimensions of the volume to tile
     * @param cuts Requested number of binary cuts
     * @param rng Generator shared with any follow-up pass
     * @param outBoxes Receives cuts + 1 boxes (fewer on early stop)
     * @param outError Receives the reason on invalid arguments
     * @return false on invalid arguments; outBoxes is left untouched
     */
    [[nodiscard]] bool Split(
        const ContainerDimensions& container,
        int cuts,
        core::SeededRandom& rng,
        std::vector<geometry::Box>* outBoxes,
        std::string* outError = nullptr
    ) const;

    // Index of the largest-volume segment with an extent > 1, or -1.
    [[nodiscard]] static int PickLargestSplittableIndex(const std::vector<geometry::Box>& segments);

    // Longest axis among extents > 1; ties resolved by one draw.
    [[nodiscard]] static geometry::Axis ChooseLongestAxis(core::SeededRandom& rng, const geometry::Box& segment);

    // Integer cut in [1, size - 1], triangular around the middle of [ratio, 1 - ratio].
    [[nodiscard]] static float ChooseBalancedCut(core::SeededRandom& rng, float size, double minRatio);

private:
    Settings m_settings;
};

// Seeded entry point. Without a seed the generator is seeded from std::random_device.
[[nodiscard]] bool GenerateTiledBoxes(
    const ContainerDimensions& container,
    int cuts,
    std::optional<std::uint32_t> seed,
    std::vector<geometry::Box>* outBoxes,
    std::string* outError = nullptr
);
} // namespace boxpuzzle::generation
