#pragma once

#include "curvetrack/curve_data.hpp"
#include "curvetrack/diagnostics.hpp"
#include <cstdint>

namespace curvetrack {

enum class FillMethod : uint8_t {
    Linear = 0,
    CubicSpline = 1,
    ConstantVelocity = 2,
    AcceleratedMotion = 3,
    Average = 4,
};

struct FillParams {
    double tension {0.5};     // CubicSpline, 0 = full tangents, 1 = none
    int windowSize {3};       // ConstantVelocity, AcceleratedMotion, Average
    double accelWeight {1.0}; // AcceleratedMotion
};

// Fills frames [startFrame, endFrame] from the nearest points outside the
// range. Needs a point before startFrame and one after endFrame, otherwise
// the curve is returned unchanged. With preserveEndpoints, frames that already
// exist are kept. Generated points are marked Interpolated and the result is
// sorted by frame.
CurveData fillGap(const CurveData& curve,
                  int startFrame,
                  int endFrame,
                  FillMethod method,
                  bool preserveEndpoints = true,
                  const FillParams& params = {},
                  Diagnostics* diag = nullptr);

CurveData fillLinear(const CurveData& curve, int startFrame, int endFrame, bool preserveEndpoints = true,
                     Diagnostics* diag = nullptr);

// Hermite segment between the nearest boundary points, tangents from one point
// further out on each side. Falls back to fillLinear without 2 points per side.
CurveData fillCubicSpline(const CurveData& curve, int startFrame, int endFrame, double tension,
                          bool preserveEndpoints = true, Diagnostics* diag = nullptr);

// Mean per-frame velocity of windowSize points on each side, projected from the
// nearest point before the gap. Falls back to fillLinear without enough points.
CurveData fillConstantVelocity(const CurveData& curve, int startFrame, int endFrame, int windowSize,
                               bool preserveEndpoints = true, Diagnostics* diag = nullptr);

// Like fillConstantVelocity plus a constant acceleration blending the before
// velocity into the after velocity, scaled by accelWeight. Falls back to
// fillConstantVelocity without enough points.
CurveData fillAcceleratedMotion(const CurveData& curve, int startFrame, int endFrame, int windowSize,
                                double accelWeight, bool preserveEndpoints = true, Diagnostics* diag = nullptr);

// Blends the mean of up to windowSize points before the gap into the mean of up
// to windowSize points after it.
CurveData fillAverage(const CurveData& curve, int startFrame, int endFrame, int windowSize,
                      bool preserveEndpoints = true, Diagnostics* diag = nullptr);

} // namespace curvetrack
