#include "boxpuzzle/level/SilhouetteMatch.hpp"

#include <algorithm>
#include <cstddef>

namespace boxpuzzle::level
{
Mask RgbaToMask(const std::vector<std::uint8_t>& rgba, int width, int height)
{
    const std::size_t total = static_cast<std::size_t>(std::max(0, width)) * static_cast<std::size_t>(std::max(0, height));
    Mask mask(total, 0);
    for (std::size_t i = 0, j = 0; i < rgba.size() && j < total; i += 4, ++j)
    {
        mask[j] = rgba[i] > 0 ? 1 : 0;
    }
    return mask;
}

std::vector<std::uint8_t> FlipMaskVertically(int width, int height, const std::vector<std::uint8_t>& rgba)
{
    std::vector<std::uint8_t> output(rgba.size(), 0);
    if (width <= 0 || height <= 0)
    {
        return output;
    }

    const std::size_t stride = static_cast<std::size_t>(width) * 4;
    const std::size_t rows = std::min(static_cast<std::size_t>(height), rgba.size() / stride);
    for (std::size_t row = 0; row < rows; ++row)
    {
        const std::size_t src = row * stride;
        const std::size_t dst = (rows - 1 - row) * stride;
        std::copy(rgba.begin() + static_cast<std::ptrdiff_t>(src),
                  rgba.begin() + static_cast<std::ptrdiff_t>(src + stride),
                  output.begin() + static_cast<std::ptrdiff_t>(dst));
    }
    return output;
}

double ComputeIoU(const Mask& a, const Mask& b)
{
    const std::size_t total = std::min(a.size(), b.size());
    std::size_t intersection = 0;
    std::size_t unionCount = 0;
    for (std::size_t i = 0; i < total; ++i)
    {
        const bool inA = a[i] > 0;
        const bool inB = b[i] > 0;
        if (inA && inB)
        {
            ++intersection;
        }
        if (inA || inB)
        {
            ++unionCount;
        }
    }
    if (unionCount == 0)
    {
        return 0.0;
    }
    return static_cast<double>(intersection) / static_cast<double>(unionCount);
}

MatchTracker::MatchTracker(float threshold, double holdDurationMs)
    : m_threshold(threshold)
    , m_holdDurationMs(std::max(holdDurationMs, 0.0))
{
}

float MatchTracker::Update(double iou, double nowMs)
{
    m_lastIoU = iou;
    if (m_completed)
    {
        return m_progress;
    }

    if (iou < m_threshold)
    {
        m_holding = false;
        m_progress = 0.0F;
        return m_progress;
    }

    if (!m_holding)
    {
        m_holding = true;
        m_holdStartMs = nowMs;
    }

    const double elapsed = nowMs - m_holdStartMs;
    m_progress = m_holdDurationMs <= 0.0 ? 1.0F : static_cast<float>(std::min(1.0, elapsed / m_holdDurationMs));
    if (m_progress >= 1.0F)
    {
        m_progress = 1.0F;
        m_completed = true;
    }
    return m_progress;
}

void MatchTracker::Reset()
{
    m_holding = false;
    m_completed = false;
    m_progress = 0.0F;
    m_holdStartMs = 0.0;
    m_lastIoU = 0.0;
}
} // namespace boxpuzzle::level
