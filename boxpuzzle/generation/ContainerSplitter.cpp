#include "boxpuzzle/generation/ContainerSplitter.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>

namespace boxpuzzle::generation
{
namespace
{
using geometry::Axis;
using geometry::Box;

constexpr std::array<Axis, 3> kAxes{Axis::X, Axis::Y, Axis::Z};

// Volumes at or above this no longer fit std::int64_t after flooring.
constexpr double kSaturatingVolume = 9.2e18;

void SetError(std::string* outError, const std::string& message)
{
    std::cerr << "[Splitter] " << message << "\n";
    if (outError != nullptr)
    {
        *outError = message;
    }
}
} // namespace

ContainerSplitter::ContainerSplitter(const Settings& settings)
    : m_settings(settings)
{
}

std::int64_t ContainerSplitter::MaxCuts(const ContainerDimensions& container)
{
    const double volume = static_cast<double>(container.width) * container.height * container.depth;
    if (std::isnan(volume))
    {
        return 0;
    }
    if (volume >= kSaturatingVolume)
    {
        return std::numeric_limits<std::int64_t>::max();
    }
    return std::max<std::int64_t>(0, static_cast<std::int64_t>(std::floor(volume)) - 1);
}

bool ContainerSplitter::Split(
    const ContainerDimensions& container,
    int cuts,
    core::SeededRandom& rng,
    std::vector<Box>* outBoxes,
    std::string* outError) const
{
    if (outBoxes == nullptr)
    {
        SetError(outError, "No output collection given");
        return false;
    }
    if (!(container.width > 0.0F) || !(container.height > 0.0F) || !(container.depth > 0.0F))
    {
        SetError(outError, "Container dimensions must be positive");
        return false;
    }
    if (!std::isfinite(container.width) || !std::isfinite(container.height) || !std::isfinite(container.depth))
    {
        SetError(outError, "Container dimensions must be finite");
        return false;
    }
    if (cuts < 0)
    {
        SetError(outError, "Cut count must not be negative");
        return false;
    }

    const std::int64_t maxCuts = MaxCuts(container);
    if (cuts > maxCuts)
    {
        std::ostringstream message;
        message << "Too many cuts: " << cuts << " requested, maximum is " << maxCuts;
        SetError(outError, message.str());
        return false;
    }

    std::vector<Box> segments;
    segments.reserve(static_cast<std::size_t>(cuts) + 1);

    Box root;
    root.center = m_settings.origin;
    root.size = glm::vec3(container.width, container.height, container.depth);
    segments.push_back(root);

    for (int cut = 0; cut < cuts; ++cut)
    {
        const int index = PickLargestSplittableIndex(segments);
        if (index < 0)
        {
            break;
        }

        const Box target = segments[static_cast<std::size_t>(index)];
        const Axis axis = ChooseLongestAxis(rng, target);
        const float size = target.size[geometry::AxisIndex(axis)];
        const float offset = ChooseBalancedCut(rng, size, m_settings.minSplitRatio);

        const auto [first, second] = geometry::SplitBox(target, axis, offset);
        segments[static_cast<std::size_t>(index)] = first;
        segments.insert(segments.begin() + index + 1, second);
    }

    *outBoxes = std::move(segments);
    return true;
}

int ContainerSplitter::PickLargestSplittableIndex(const std::vector<Box>& segments)
{
    int best = -1;
    float bestVolume = -1.0F;
    for (std::size_t i = 0; i < segments.size(); ++i)
    {
        const Box& segment = segments[i];
        if (segment.size.x <= 1.0F && segment.size.y <= 1.0F && segment.size.z <= 1.0F)
        {
            continue;
        }

        const float volume = segment.Volume();
        if (volume > bestVolume)
        {
            bestVolume = volume;
            best = static_cast<int>(i);
        }
    }
    return best;
}

Axis ContainerSplitter::ChooseLongestAxis(core::SeededRandom& rng, const Box& segment)
{
    float maxSize = 0.0F;
    for (const Axis axis : kAxes)
    {
        const float size = segment.size[geometry::AxisIndex(axis)];
        if (size > 1.0F)
        {
            maxSize = std::max(maxSize, size);
        }
    }

    std::vector<Axis> candidates;
    if (maxSize > 1.0F)
    {
        for (const Axis axis : kAxes)
        {
            if (segment.size[geometry::AxisIndex(axis)] == maxSize)
            {
                candidates.push_back(axis);
            }
        }
    }

    if (candidates.empty())
    {
        for (const Axis axis : kAxes)
        {
            if (segment.size[geometry::AxisIndex(axis)] > 1.0F)
            {
                return axis;
            }
        }
        return Axis::X;
    }

    const int pick = rng.NextIntInclusive(0, static_cast<int>(candidates.size()) - 1);
    return candidates[static_cast<std::size_t>(pick)];
}

float ContainerSplitter::ChooseBalancedCut(core::SeededRandom& rng, float size, double minRatio)
{
    if (size <= 2.0F)
    {
        return 1.0F;
    }

    const double extent = size;
    const double low = std::max(1.0, std::ceil(extent * minRatio));
    const double high = std::min(extent - 1.0, std::floor(extent * (1.0 - minRatio)));
    if (low > high)
    {
        return 1.0F;
    }

    const double t = rng.NextTriangular01();
    const double cut = std::round(low + t * (high - low));
    return static_cast<float>(std::clamp(cut, 1.0, extent - 1.0));
}

bool GenerateTiledBoxes(
    const ContainerDimensions& container,
    int cuts,
    std::optional<std::uint32_t> seed,
    std::vector<Box>* outBoxes,
    std::string* outError)
{
    const std::uint32_t actualSeed = seed.has_value() ? *seed : core::RandomSeed();
    core::SeededRandom rng(actualSeed);

    const ContainerSplitter splitter{};
    if (!splitter.Split(container, cuts, rng, outBoxes, outError))
    {
        return false;
    }

    std::cout << "[Splitter] Seed=" << actualSeed
              << " container=" << container.width << "x" << container.height << "x" << container.depth
              << " cuts=" << cuts
              << " boxes=" << outBoxes->size() << "\n";
    if (outBoxes->size() < static_cast<std::size_t>(cuts) + 1)
    {
        std::cout << "[Splitter] Stopped early: no segment left to split\n";
    }
    return true;
}
} // namespace boxpuzzle::generation
