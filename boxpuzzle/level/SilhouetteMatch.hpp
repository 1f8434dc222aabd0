#pragma once

#include <cstdint>
#include <vector>

namespace boxpuzzle::level
{
using Mask = std::vector<std::uint8_t>;

constexpr int kSilhouetteResolution = 256;
constexpr double kMatchHoldDurationMs = 600.0;

// 1 where the red channel is non-zero. rgba holds width * height * 4 bytes.
[[nodiscard]] Mask RgbaToMask(const std::vector<std::uint8_t>& rgba, int width, int height);

// Reverses row order of an RGBA image (GL read-back is bottom-up).
[[nodiscard]] std::vector<std::uint8_t> FlipMaskVertically(int width, int height, const std::vector<std::uint8_t>& rgba);

// Intersection over union over the common length. 0 when both are empty.
[[nodiscard]] double ComputeIoU(const Mask& a, const Mask& b);

// Completes once the IoU stays at or above the threshold for the hold duration.
class MatchTracker
{
public:
    explicit MatchTracker(float threshold, double holdDurationMs = kMatchHoldDurationMs);

    // Returns the hold progress in [0, 1].
    float Update(double iou, double nowMs);
    void Reset();

    [[nodiscard]] bool IsCompleted() const { return m_completed; }
    [[nodiscard]] float GetProgress() const { return m_progress; }
    [[nodiscard]] double GetLastIoU() const { return m_lastIoU; }
    [[nodiscard]] float GetThreshold() const { return m_threshold; }

private:
    float m_threshold = 0.0F;
    double m_holdDurationMs = kMatchHoldDurationMs;
    double m_holdStartMs = 0.0;
    bool m_holding = false;
    bool m_completed = false;
    float m_progress = 0.0F;
    double m_lastIoU = 0.0;
};
} // namespace boxpuzzle::level
