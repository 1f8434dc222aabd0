#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "boxpuzzle/generation/FigureAssembler.hpp"

using boxpuzzle::core::SeededRandom;
using boxpuzzle::generation::Figure;
using boxpuzzle::generation::FigureAssembler;
using boxpuzzle::generation::FigureOptions;
using boxpuzzle::generation::GenerateFigure;
using namespace boxpuzzle::geometry;

TEST(FigureAssembler, FigureIsConnectedAndNonOverlapping)
{
    for (std::uint32_t seed = 1; seed <= 20; ++seed)
    {
        const Figure figure = GenerateFigure(seed, 6);
        ASSERT_EQ(figure.boxes.size(), 6U) << "seed " << seed;
        EXPECT_TRUE(IsConnected(figure.boxes)) << "seed " << seed;

        for (std::size_t i = 0; i < figure.boxes.size(); ++i)
        {
            for (std::size_t j = i + 1; j < figure.boxes.size(); ++j)
            {
                EXPECT_FALSE(BoxesOverlap(figure.boxes[i], figure.boxes[j])) << "seed " << seed;
            }
        }
    }
}

TEST(FigureAssembler, FigureIsRecentered)
{
    const Figure figure = GenerateFigure(7, 5);
    const auto bounds = ComputeBounds(figure.boxes);
    ASSERT_TRUE(bounds.has_value());
    const glm::vec3 center = bounds->Center();
    EXPECT_NEAR(center.x, 0.0F, 1.0e-4F);
    EXPECT_NEAR(center.y, 0.0F, 1.0e-4F);
    EXPECT_NEAR(center.z, 0.0F, 1.0e-4F);
}

TEST(FigureAssembler, BoxesCarryIdsAndIntegerSizes)
{
    const Figure figure = GenerateFigure(12, 5);
    EXPECT_EQ(figure.seed, 12U);
    for (std::size_t i = 0; i < figure.boxes.size(); ++i)
    {
        const Box& box = figure.boxes[i];
        ASSERT_TRUE(box.id.has_value());
        EXPECT_EQ(*box.id, static_cast<int>(i));
        ASSERT_TRUE(box.location.has_value());
        EXPECT_EQ(*box.location, BoxLocation::Container);
        for (int axis = 0; axis < 3; ++axis)
        {
            EXPECT_GE(box.size[axis], 1.0F);
            EXPECT_LE(box.size[axis], 3.0F);
            EXPECT_EQ(box.size[axis], std::floor(box.size[axis]));
        }
    }
}

TEST(FigureAssembler, SameSeedSameFigure)
{
    const Figure a = GenerateFigure(7, 5);
    const Figure b = GenerateFigure(7, 5);
    EXPECT_EQ(a.boxes, b.boxes);
}

TEST(FigureAssembler, DifferentSeedsDiffer)
{
    const Figure a = GenerateFigure(7, 5);
    const Figure b = GenerateFigure(8, 5);
    EXPECT_NE(a.boxes, b.boxes);
}

TEST(FigureAssembler, NonPositiveCountIsEmpty)
{
    EXPECT_TRUE(GenerateFigure(7, 0).boxes.empty());
    EXPECT_TRUE(GenerateFigure(7, -3).boxes.empty());
}

TEST(FigureAssembler, SingleBoxSitsAtOrigin)
{
    const Figure figure = GenerateFigure(99, 1);
    ASSERT_EQ(figure.boxes.size(), 1U);
    EXPECT_EQ(figure.boxes[0].center, glm::vec3(0.0F));
}

TEST(FigureAssembler, GlassChanceExtremes)
{
    FigureOptions options;
    options.seed = 5;
    options.boxCount = 6;

    options.glassChance = 0.0F;
    for (const Box& box : GenerateFigure(options).boxes)
    {
        EXPECT_EQ(box.material, Material::Standard);
    }

    options.glassChance = 1.0F;
    for (const Box& box : GenerateFigure(options).boxes)
    {
        EXPECT_EQ(box.material, Material::Glass);
    }
}

TEST(FigureAssembler, CertainDebuffChanceTagsEveryBox)
{
    FigureOptions options;
    options.seed = 5;
    options.boxCount = 4;
    options.debuffChances = {{Debuff::Heavy, 1.0F}, {Debuff::Fragile, 0.0F}};

    for (const Box& box : GenerateFigure(options).boxes)
    {
        EXPECT_TRUE(box.HasDebuff(Debuff::Heavy));
        EXPECT_FALSE(box.HasDebuff(Debuff::Fragile));
    }
}

TEST(FigureAssembler, SmallerCandidateStaysInsideAnchorFace)
{
    Box anchor;
    anchor.size = glm::vec3(2.0F);
    Box candidate;
    candidate.size = glm::vec3(1.0F);

    SeededRandom rng(3);
    for (int i = 0; i < 50; ++i)
    {
        const Box placed = FigureAssembler::PlaceAdjacentBox(anchor, candidate, Axis::X, 1, rng);
        EXPECT_FLOAT_EQ(placed.center.x, 1.5F);
        EXPECT_LE(std::abs(placed.center.y), 0.5F);
        EXPECT_LE(std::abs(placed.center.z), 0.5F);
        EXPECT_TRUE(BoxesTouch(anchor, placed));
        EXPECT_FALSE(BoxesOverlap(anchor, placed));
    }
}

TEST(FigureAssembler, LargerCandidateAlignsAnEdge)
{
    Box anchor;
    anchor.size = glm::vec3(1.0F);
    Box candidate;
    candidate.size = glm::vec3(2.0F);

    SeededRandom rng(9);
    for (int i = 0; i < 20; ++i)
    {
        const Box placed = FigureAssembler::PlaceAdjacentBox(anchor, candidate, Axis::Y, -1, rng);
        EXPECT_FLOAT_EQ(placed.center.y, -1.5F);
        EXPECT_FLOAT_EQ(std::abs(placed.center.x), 0.5F);
        EXPECT_FLOAT_EQ(std::abs(placed.center.z), 0.5F);
        EXPECT_TRUE(BoxesTouch(anchor, placed));
    }
}

TEST(FigureAssembler, StopsEarlyWhenPlacementKeepsFailing)
{
    FigureAssembler::Settings settings;
    settings.maxPlacementAttempts = 0;
    const FigureAssembler assembler(settings);

    SeededRandom rng(7);
    const std::vector<Box> boxes = assembler.Assemble(5, rng);
    ASSERT_EQ(boxes.size(), 1U);
    EXPECT_TRUE(IsConnected(boxes));
    EXPECT_EQ(boxes[0].center, glm::vec3(0.0F));
}

TEST(FigureAssembler, UnplaceableBoxesEndTheFigure)
{
    // Unit boxes snap to a grid, so an attempt aimed at an occupied neighbor cell collides.
    // With a single attempt per box the first collision ends the figure.
    FigureAssembler::Settings settings;
    settings.minDimension = 1;
    settings.maxDimension = 1;
    settings.maxPlacementAttempts = 1;
    const FigureAssembler assembler(settings);

    SeededRandom rng(3);
    const std::vector<Box> boxes = assembler.Assemble(200, rng);
    EXPECT_GE(boxes.size(), 1U);
    EXPECT_LT(boxes.size(), 200U);
    EXPECT_TRUE(IsConnected(boxes));

    const auto bounds = ComputeBounds(boxes);
    ASSERT_TRUE(bounds.has_value());
    EXPECT_NEAR(bounds->Center().x, 0.0F, 1.0e-4F);
    EXPECT_NEAR(bounds->Center().y, 0.0F, 1.0e-4F);
    EXPECT_NEAR(bounds->Center().z, 0.0F, 1.0e-4F);
}

TEST(FigureAssembler, HugeRequestDoesNotPreallocate)
{
    FigureAssembler::Settings settings;
    settings.maxPlacementAttempts = 0;
    const FigureAssembler assembler(settings);

    SeededRandom rng(1);
    const std::vector<Box> boxes = assembler.Assemble(2000000000, rng);
    EXPECT_EQ(boxes.size(), 1U);
    EXPECT_LE(boxes.capacity(), 1024U);
}

TEST(FigureAssembler, RandomBoxRespectsSettings)
{
    FigureAssembler::Settings settings;
    settings.minDimension = 2;
    settings.maxDimension = 2;
    const FigureAssembler assembler(settings);

    SeededRandom rng(1);
    const Box box = assembler.CreateRandomBox(rng);
    EXPECT_EQ(box.size, glm::vec3(2.0F));
}
