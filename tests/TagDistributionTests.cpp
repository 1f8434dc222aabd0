#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "boxpuzzle/generation/TagDistribution.hpp"

using boxpuzzle::core::SeededRandom;
using namespace boxpuzzle::generation;
using namespace boxpuzzle::geometry;

TEST(TagDistribution, ShuffleIsPermutation)
{
    SeededRandom rng(10);
    std::vector<std::size_t> shuffled = ShuffleIndices(12, rng);
    ASSERT_EQ(shuffled.size(), 12U);
    std::sort(shuffled.begin(), shuffled.end());
    for (std::size_t i = 0; i < shuffled.size(); ++i)
    {
        EXPECT_EQ(shuffled[i], i);
    }
}

TEST(TagDistribution, ShuffleOfTinySetsUsesNoDraws)
{
    SeededRandom rng(10);
    const std::uint32_t before = rng.GetState();
    EXPECT_TRUE(ShuffleIndices(0, rng).empty());
    EXPECT_EQ(ShuffleIndices(1, rng), std::vector<std::size_t>{0});
    EXPECT_EQ(rng.GetState(), before);
}

TEST(TagDistribution, QuotasAreCappedAtBoxCount)
{
    std::vector<Box> boxes(6);
    SeededRandom rng(4);
    DistributeDebuffs(boxes, {{Debuff::Fragile, 2}, {Debuff::Heavy, 10}, {Debuff::NonTiltable, 0}}, rng);

    EXPECT_EQ(CountDebuff(boxes, Debuff::Fragile), 2U);
    EXPECT_EQ(CountDebuff(boxes, Debuff::Heavy), 6U);
    EXPECT_EQ(CountDebuff(boxes, Debuff::NonTiltable), 0U);
}

TEST(TagDistribution, NonPositiveQuotaConsumesNoDraws)
{
    std::vector<Box> boxes(5);
    SeededRandom rng(4);
    const std::uint32_t before = rng.GetState();
    DistributeDebuffs(boxes, {{Debuff::Fragile, 0}, {Debuff::Heavy, -2}}, rng);
    EXPECT_EQ(rng.GetState(), before);
    EXPECT_EQ(CountDebuff(boxes, Debuff::Fragile), 0U);
}

TEST(TagDistribution, EmptyBoxSetIsUntouched)
{
    std::vector<Box> boxes;
    SeededRandom rng(4);
    DistributeDebuffs(boxes, {{Debuff::Fragile, 3}}, rng);
    EXPECT_TRUE(boxes.empty());
}

TEST(TagDistribution, MaterialQuota)
{
    std::vector<Box> boxes(5);
    SeededRandom rng(6);
    DistributeMaterial(boxes, Material::Glass, 3, rng);
    const auto glass = std::count_if(boxes.begin(), boxes.end(), [](const Box& box) {
        return box.material == Material::Glass;
    });
    EXPECT_EQ(glass, 3);
}

TEST(TagDistribution, DebuffChances)
{
    SeededRandom rng(2);
    Box box;
    ApplyDebuffChances(box, {{Debuff::Fragile, 1.0F}, {Debuff::Heavy, 0.0F}, {Debuff::NonTiltable, 1.0F}}, rng);
    EXPECT_TRUE(box.HasDebuff(Debuff::Fragile));
    EXPECT_FALSE(box.HasDebuff(Debuff::Heavy));
    EXPECT_TRUE(box.HasDebuff(Debuff::NonTiltable));
}

TEST(TagDistribution, GenerateWithDistribution)
{
    const ContainerDimensions container{3.0F, 3.0F, 3.0F};
    const DebuffDistribution distribution{{Debuff::Fragile, 1}, {Debuff::Heavy, 2}, {Debuff::NonTiltable, 1}};

    std::vector<Box> boxes;
    ASSERT_TRUE(GenerateBoxesWithDistribution(123, 5, container, distribution, &boxes));
    ASSERT_EQ(boxes.size(), 6U);
    EXPECT_EQ(CountDebuff(boxes, Debuff::Fragile), 1U);
    EXPECT_EQ(CountDebuff(boxes, Debuff::Heavy), 2U);
    EXPECT_EQ(CountDebuff(boxes, Debuff::NonTiltable), 1U);
    EXPECT_NEAR(TotalVolume(boxes), 27.0F, 1.0e-3F);

    std::vector<Box> again;
    ASSERT_TRUE(GenerateBoxesWithDistribution(123, 5, container, distribution, &again));
    EXPECT_EQ(boxes, again);
}

TEST(TagDistribution, GeometryMatchesPlainSplit)
{
    const ContainerDimensions container{4.0F, 3.0F, 2.0F};
    std::vector<Box> tagged;
    std::vector<Box> plain;
    ASSERT_TRUE(GenerateBoxesWithDistribution(55, 6, container, {{Debuff::Heavy, 2}}, &tagged));
    ASSERT_TRUE(GenerateTiledBoxes(container, 6, 55U, &plain));
    ASSERT_EQ(tagged.size(), plain.size());
    for (std::size_t i = 0; i < plain.size(); ++i)
    {
        EXPECT_EQ(tagged[i].center, plain[i].center);
        EXPECT_EQ(tagged[i].size, plain[i].size);
    }
}

TEST(TagDistribution, InvalidSplitIsReported)
{
    std::vector<Box> boxes;
    std::string error;
    EXPECT_FALSE(GenerateBoxesWithDistribution(1, 100, {2.0F, 2.0F, 2.0F}, {}, &boxes, &error));
    EXPECT_NE(error.find("Too many cuts"), std::string::npos);
    EXPECT_FALSE(GenerateBoxesWithDistribution(1, 1, {2.0F, 2.0F, 2.0F}, {}, nullptr, &error));
}
