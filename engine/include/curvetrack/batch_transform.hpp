#pragma once

#include "curvetrack/curve_data.hpp"
#include "curvetrack/diagnostics.hpp"
#include <optional>

namespace curvetrack {

// All operations touch only the valid selected positions (each once, however
// often it is listed) and keep every frame.

// Scales about center, or about the selection centroid when center is unset.
CurveData scalePoints(const CurveData& curve, const IndexSet& indices, double scaleX, double scaleY,
                      std::optional<Vec2> center = std::nullopt, Diagnostics* diag = nullptr);

// Rotates counter-clockwise by angleDegrees about center, or about the
// selection centroid when center is unset.
CurveData rotatePoints(const CurveData& curve, const IndexSet& indices, double angleDegrees,
                       std::optional<Vec2> center = std::nullopt, Diagnostics* diag = nullptr);

CurveData offsetPoints(const CurveData& curve, const IndexSet& indices, double dx, double dy,
                       Diagnostics* diag = nullptr);

// Re-times a contiguous selection to a uniform speed. The first selected point
// stays fixed; each following point is placed along its original segment
// direction at targetVelocity * frame step from the previously placed point.
// targetVelocity defaults to the mean segment speed. A non-contiguous
// selection leaves the curve unchanged.
CurveData normalizeVelocity(const CurveData& curve, const IndexSet& indices,
                            std::optional<double> targetVelocity = std::nullopt, Diagnostics* diag = nullptr);

// Moving average whose window grows with smoothnessFactor, which is clamped to
// [0, 1]: window = 3 + int(12 * factor), rounded up to odd. 0 is a no-op.
CurveData adjustSmoothness(const CurveData& curve, const IndexSet& indices, double smoothnessFactor,
                           Diagnostics* diag = nullptr);

} // namespace curvetrack
