#pragma once

#include "curvetrack/curve_data.hpp"
#include "curvetrack/diagnostics.hpp"
#include <cstdint>
#include <vector>

namespace curvetrack {

enum class SmoothMethod : uint8_t {
    MovingAverage = 0,
    Gaussian = 1,
    SavitzkyGolay = 2,
};

struct SmoothParams {
    int windowSize {5};  // full window; half = windowSize / 2 on each side
    double sigma {1.0};  // Gaussian only
};

// Smooths the points at the given positions. Each output point keeps its frame
// and is computed from the unmodified input, so the order of indices does not
// matter. Out-of-range indices are skipped.
CurveData smooth(const CurveData& curve,
                 const IndexSet& indices,
                 SmoothMethod method,
                 const SmoothParams& params = {},
                 Diagnostics* diag = nullptr);

// Arithmetic mean over the clamped window. No-op when windowSize < 3.
CurveData smoothMovingAverage(const CurveData& curve, const IndexSet& indices, int windowSize,
                              Diagnostics* diag = nullptr);

// Gaussian-weighted mean. Weights are normalized over the full requested window;
// at sequence boundaries the overlapping weights are renormalized by their
// partial sum. No-op when windowSize < 3 or sigma <= 0.
CurveData smoothGaussian(const CurveData& curve, const IndexSet& indices, int windowSize, double sigma,
                         Diagnostics* diag = nullptr);

// Quadratic least-squares fit over the window (at least 5 points), evaluated at
// the target's position inside the window. No-op when windowSize < 5.
CurveData smoothSavitzkyGolay(const CurveData& curve, const IndexSet& indices, int windowSize,
                              Diagnostics* diag = nullptr);

// Normalized kernel exp(-k^2 / (2 sigma^2)) for k in [-windowSize/2, windowSize/2].
std::vector<double> gaussianKernel(int windowSize, double sigma);

// Fits y = a + b t + c t^2 with t = 0..n-1 and evaluates it at t = target.
// Returns values[target] when the normal equations are near singular and sets
// *degenerate if given.
double savitzkyGolayFit(const std::vector<double>& values, int target, bool* degenerate = nullptr);

} // namespace curvetrack
