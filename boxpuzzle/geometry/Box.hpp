#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include <glm/vec3.hpp>

namespace boxpuzzle::geometry
{
enum class Axis : std::uint8_t
{
    X = 0,
    Y = 1,
    Z = 2
};

enum class Material : std::uint8_t
{
    Standard,
    Glass
};

// Gameplay modifiers, stored as bits in Box::debuffs.
enum class Debuff : std::uint8_t
{
    Fragile = 1U << 0U,
    Heavy = 1U << 1U,
    NonTiltable = 1U << 2U
};

constexpr std::array<Debuff, 3> kAllDebuffs{Debuff::Fragile, Debuff::Heavy, Debuff::NonTiltable};

// Lifecycle zone assigned by the game, never read during generation.
enum class BoxLocation : std::uint8_t
{
    Queue,
    Buffer,
    Active,
    Container
};

// Overlap tolerance for boxes placed by attachment.
constexpr float kOverlapEpsilon = 1.0e-4F;

struct Box
{
    glm::vec3 center{0.0F};
    glm::vec3 size{1.0F};     // width, height, depth
    std::optional<int> id;    // assigned when emitted
    Material material = Material::Standard;
    std::uint8_t debuffs = 0;
    std::optional<BoxLocation> location;

    [[nodiscard]] float Volume() const { return size.x * size.y * size.z; }
    [[nodiscard]] glm::vec3 Min() const { return center - size * 0.5F; }
    [[nodiscard]] glm::vec3 Max() const { return center + size * 0.5F; }

    [[nodiscard]] bool HasDebuff(Debuff debuff) const
    {
        return (debuffs & static_cast<std::uint8_t>(debuff)) != 0;
    }
    void AddDebuff(Debuff debuff) { debuffs |= static_cast<std::uint8_t>(debuff); }

    bool operator==(const Box& o) const
    {
        return center == o.center && size == o.size && id == o.id && material == o.material &&
               debuffs == o.debuffs && location == o.location;
    }
};

struct BoxBounds
{
    glm::vec3 min{0.0F};
    glm::vec3 max{0.0F};

    [[nodiscard]] glm::vec3 Center() const { return (min + max) * 0.5F; }
    [[nodiscard]] glm::vec3 Extent() const { return max - min; }
};

[[nodiscard]] inline int AxisIndex(Axis axis)
{
    return static_cast<int>(axis);
}

// Interior overlap on all three axes: |ca - cb| * 2 < ea + eb - epsilon.
[[nodiscard]] bool BoxesOverlap(const Box& a, const Box& b, float epsilon = kOverlapEpsilon);

// Face contact: flush on one axis, overlapping extents on the other two.
[[nodiscard]] bool BoxesTouch(const Box& a, const Box& b, float epsilon = kOverlapEpsilon);

// Splits along axis at integer offset cut (measured from the min side).
// The first box keeps the lower part; both children exactly partition the parent.
[[nodiscard]] std::pair<Box, Box> SplitBox(const Box& parent, Axis axis, float cut);

[[nodiscard]] std::optional<BoxBounds> ComputeBounds(const std::vector<Box>& boxes);

// Shifts every box so the bounding box center lands on the origin.
void RecenterBoxes(std::vector<Box>& boxes);

// True when the face-touch graph has a single component (empty set counts as connected).
[[nodiscard]] bool IsConnected(const std::vector<Box>& boxes, float epsilon = kOverlapEpsilon);

[[nodiscard]] float TotalVolume(const std::vector<Box>& boxes);
} // namespace boxpuzzle::geometry
