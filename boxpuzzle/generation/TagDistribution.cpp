#include "boxpuzzle/generation/TagDistribution.hpp"

#include <algorithm>
#include <iostream>
#include <numeric>

namespace boxpuzzle::generation
{
namespace
{
template <typename Tagger>
void TagShuffledQuota(std::size_t boxCount, int requested, core::SeededRandom& rng, Tagger&& tag)
{
    if (requested <= 0)
    {
        return;
    }

    const std::size_t quota = std::min(static_cast<std::size_t>(requested), boxCount);
    const std::vector<std::size_t> shuffled = ShuffleIndices(boxCount, rng);
    for (std::size_t i = 0; i < quota; ++i)
    {
        tag(shuffled[i]);
    }
}
} // namespace

std::vector<std::size_t> ShuffleIndices(std::size_t count, core::SeededRandom& rng)
{
    std::vector<std::size_t> indices(count);
    std::iota(indices.begin(), indices.end(), std::size_t{0});
    if (count < 2)
    {
        return indices;
    }

    for (std::size_t i = count - 1; i > 0; --i)
    {
        const int j = rng.NextIntInclusive(0, static_cast<int>(i));
        std::swap(indices[i], indices[static_cast<std::size_t>(j)]);
    }
    return indices;
}

void DistributeDebuffs(std::vector<geometry::Box>& boxes, const DebuffDistribution& distribution, core::SeededRandom& rng)
{
    for (const auto& [debuff, amount] : distribution)
    {
        TagShuffledQuota(boxes.size(), amount, rng, [&](std::size_t index) {
            boxes[index].AddDebuff(debuff);
        });
    }
}

void DistributeMaterial(
    std::vector<geometry::Box>& boxes,
    geometry::Material material,
    int count,
    core::SeededRandom& rng)
{
    TagShuffledQuota(boxes.size(), count, rng, [&](std::size_t index) {
        boxes[index].material = material;
    });
}

void ApplyDebuffChances(geometry::Box& box, const DebuffChances& chances, core::SeededRandom& rng)
{
    for (const auto& [debuff, chance] : chances)
    {
        if (rng.Next() < chance)
        {
            box.AddDebuff(debuff);
        }
    }
}

std::size_t CountDebuff(const std::vector<geometry::Box>& boxes, geometry::Debuff debuff)
{
    return static_cast<std::size_t>(std::count_if(boxes.begin(), boxes.end(), [debuff](const geometry::Box& box) {
        return box.HasDebuff(debuff);
    }));
}

bool GenerateBoxesWithDistribution(
    std::uint32_t seed,
    int cuts,
    const ContainerDimensions& container,
    const DebuffDistribution& distribution,
    std::vector<geometry::Box>* outBoxes,
    std::string* outError)
{
    if (outBoxes == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = "No output collection given";
        }
        return false;
    }

    core::SeededRandom rng(seed);
    const ContainerSplitter splitter{};

    std::vector<geometry::Box> boxes;
    if (!splitter.Split(container, cuts, rng, &boxes, outError))
    {
        return false;
    }

    DistributeDebuffs(boxes, distribution, rng);

    std::cout << "[Splitter] Seed=" << seed << " cuts=" << cuts << " boxes=" << boxes.size()
              << " fragile=" << CountDebuff(boxes, geometry::Debuff::Fragile)
              << " heavy=" << CountDebuff(boxes, geometry::Debuff::Heavy)
              << " non_tiltable=" << CountDebuff(boxes, geometry::Debuff::NonTiltable) << "\n";

    *outBoxes = std::move(boxes);
    return true;
}
} // namespace boxpuzzle::generation
