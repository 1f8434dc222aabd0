#include "boxpuzzle/geometry/Box.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>

#include <glm/common.hpp>

namespace boxpuzzle::geometry
{
namespace
{
bool OverlapOnAxis(const Box& a, const Box& b, int axis, float epsilon)
{
    return std::abs(a.center[axis] - b.center[axis]) * 2.0F < a.size[axis] + b.size[axis] - epsilon;
}

bool FlushOnAxis(const Box& a, const Box& b, int axis, float epsilon)
{
    const float gap = std::abs(a.center[axis] - b.center[axis]) * 2.0F - (a.size[axis] + b.size[axis]);
    return std::abs(gap) <= epsilon;
}
} // namespace

bool BoxesOverlap(const Box& a, const Box& b, float epsilon)
{
    return OverlapOnAxis(a, b, 0, epsilon) && OverlapOnAxis(a, b, 1, epsilon) && OverlapOnAxis(a, b, 2, epsilon);
}

bool BoxesTouch(const Box& a, const Box& b, float epsilon)
{
    for (int axis = 0; axis < 3; ++axis)
    {
        const int u = (axis + 1) % 3;
        const int v = (axis + 2) % 3;
        if (FlushOnAxis(a, b, axis, epsilon) && OverlapOnAxis(a, b, u, epsilon) && OverlapOnAxis(a, b, v, epsilon))
        {
            return true;
        }
    }
    return false;
}

std::pair<Box, Box> SplitBox(const Box& parent, Axis axis, float cut)
{
    const int i = AxisIndex(axis);
    const float size = parent.size[i];

    Box first = parent;
    first.size[i] = cut;
    first.center[i] = parent.center[i] + (cut - size) * 0.5F;

    Box second = parent;
    second.size[i] = size - cut;
    second.center[i] = parent.center[i] + cut * 0.5F;

    return {first, second};
}

std::optional<BoxBounds> ComputeBounds(const std::vector<Box>& boxes)
{
    if (boxes.empty())
    {
        return std::nullopt;
    }

    BoxBounds bounds;
    bounds.min = glm::vec3(std::numeric_limits<float>::max());
    bounds.max = glm::vec3(std::numeric_limits<float>::lowest());
    for (const Box& box : boxes)
    {
        bounds.min = glm::min(bounds.min, box.Min());
        bounds.max = glm::max(bounds.max, box.Max());
    }
    return bounds;
}

void RecenterBoxes(std::vector<Box>& boxes)
{
    const std::optional<BoxBounds> bounds = ComputeBounds(boxes);
    if (!bounds.has_value())
    {
        return;
    }

    const glm::vec3 center = bounds->Center();
    for (Box& box : boxes)
    {
        box.center -= center;
    }
}

bool IsConnected(const std::vector<Box>& boxes, float epsilon)
{
    if (boxes.size() < 2)
    {
        return true;
    }

    std::vector<bool> visited(boxes.size(), false);
    std::queue<std::size_t> open;
    open.push(0);
    visited[0] = true;
    std::size_t reached = 1;

    while (!open.empty())
    {
        const std::size_t current = open.front();
        open.pop();
        for (std::size_t i = 0; i < boxes.size(); ++i)
        {
            if (visited[i] || !BoxesTouch(boxes[current], boxes[i], epsilon))
            {
                continue;
            }
            visited[i] = true;
            ++reached;
            open.push(i);
        }
    }
    return reached == boxes.size();
}

float TotalVolume(const std::vector<Box>& boxes)
{
    float total = 0.0F;
    for (const Box& box : boxes)
    {
        total += box.Volume();
    }
    return total;
}
} // namespace boxpuzzle::geometry
