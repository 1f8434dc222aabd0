#include "boxpuzzle/generation/FigureAssembler.hpp"

#include <algorithm>
#include <iostream>

namespace boxpuzzle::generation
{
namespace
{
using geometry::Axis;
using geometry::Box;

constexpr int kMaxReservedBoxes = 1024;

geometry::Axis AxisFromSample(double sample)
{
    if (sample < 1.0 / 3.0)
    {
        return Axis::X;
    }
    if (sample < 2.0 / 3.0)
    {
        return Axis::Y;
    }
    return Axis::Z;
}

float OrthogonalOffset(float anchorSize, float candidateSize, core::SeededRandom& rng)
{
    const float range = std::max(anchorSize - candidateSize, 0.0F);

    float offset = 0.0F;
    if (range != 0.0F)
    {
        offset += static_cast<float>(rng.Next() - 0.5) * range;
    }
    if (anchorSize < candidateSize)
    {
        const float sign = rng.Next() > 0.5 ? 1.0F : -1.0F;
        offset += (candidateSize - anchorSize) * 0.5F * sign;
    }
    return offset;
}
} // namespace

FigureAssembler::FigureAssembler(const Settings& settings)
    : m_settings(settings)
{
}

Box FigureAssembler::CreateRandomBox(core::SeededRandom& rng) const
{
    Box box;
    box.size.x = static_cast<float>(rng.NextIntInclusive(m_settings.minDimension, m_settings.maxDimension));
    box.size.y = static_cast<float>(rng.NextIntInclusive(m_settings.minDimension, m_settings.maxDimension));
    box.size.z = static_cast<float>(rng.NextIntInclusive(m_settings.minDimension, m_settings.maxDimension));
    return box;
}

Box FigureAssembler::PlaceAdjacentBox(
    const Box& anchor,
    const Box& candidate,
    Axis axis,
    int direction,
    core::SeededRandom& rng)
{
    Box result = candidate;
    const int attach = geometry::AxisIndex(axis);
    const float sign = direction < 0 ? -1.0F : 1.0F;

    result.center[attach] =
        anchor.center[attach] + sign * (anchor.size[attach] * 0.5F + candidate.size[attach] * 0.5F);

    for (int i = 0; i < 3; ++i)
    {
        if (i == attach)
        {
            continue;
        }
        result.center[i] = anchor.center[i] + OrthogonalOffset(anchor.size[i], candidate.size[i], rng);
    }
    return result;
}

std::vector<Box> FigureAssembler::Assemble(int boxCount, core::SeededRandom& rng) const
{
    std::vector<Box> boxes;
    if (boxCount <= 0)
    {
        return boxes;
    }

    boxes.reserve(static_cast<std::size_t>(std::min(boxCount, kMaxReservedBoxes)));
    boxes.push_back(CreateRandomBox(rng));

    while (static_cast<int>(boxes.size()) < boxCount)
    {
        bool placed = false;
        for (int attempt = 0; attempt < m_settings.maxPlacementAttempts; ++attempt)
        {
            const int anchorIndex = rng.NextIntInclusive(0, static_cast<int>(boxes.size()) - 1);
            const Box anchor = boxes[static_cast<std::size_t>(anchorIndex)];
            const Box candidate = CreateRandomBox(rng);
            const Axis axis = AxisFromSample(rng.Next());
            const int direction = rng.Next() < 0.5 ? -1 : 1;
            const Box placedCandidate = PlaceAdjacentBox(anchor, candidate, axis, direction, rng);

            const bool collides = std::any_of(boxes.begin(), boxes.end(), [&](const Box& existing) {
                return geometry::BoxesOverlap(existing, placedCandidate, m_settings.overlapEpsilon);
            });
            if (collides)
            {
                continue;
            }

            boxes.push_back(placedCandidate);
            placed = true;
            break;
        }

        if (!placed)
        {
            std::cout << "[Assembler] Placement failed after " << m_settings.maxPlacementAttempts
                      << " attempts, stopping at " << boxes.size() << " boxes\n";
            break;
        }
    }

    geometry::RecenterBoxes(boxes);
    return boxes;
}

Figure GenerateFigure(std::uint32_t seed, int boxCount)
{
    FigureOptions options;
    options.seed = seed;
    options.boxCount = boxCount;
    return GenerateFigure(options);
}

Figure GenerateFigure(const FigureOptions& options)
{
    core::SeededRandom rng(options.seed);
    const FigureAssembler assembler{};

    Figure figure;
    figure.seed = options.seed;
    figure.boxes = assembler.Assemble(options.boxCount, rng);

    for (std::size_t i = 0; i < figure.boxes.size(); ++i)
    {
        Box& box = figure.boxes[i];
        box.id = static_cast<int>(i);
        box.location = geometry::BoxLocation::Container;
        box.material = rng.Next() < options.glassChance ? geometry::Material::Glass : geometry::Material::Standard;
        ApplyDebuffChances(box, options.debuffChances, rng);
    }

    std::cout << "[Assembler] Seed=" << options.seed
              << " requested=" << options.boxCount
              << " boxes=" << figure.boxes.size() << "\n";
    return figure;
}
} // namespace boxpuzzle::generation
