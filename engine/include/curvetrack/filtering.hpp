#pragma once

#include "curvetrack/curve_data.hpp"
#include "curvetrack/diagnostics.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace curvetrack {

enum class FilterMethod : uint8_t {
    Median = 0,
    Average = 1,
    Gaussian = 2,
    Butterworth = 3,
};

struct FilterParams {
    int windowSize {5};
    double sigma {1.0};   // Gaussian
    double cutoff {0.2};  // Butterworth, normalized
    int order {2};        // Butterworth
};

CurveData filter(const CurveData& curve,
                 const IndexSet& indices,
                 FilterMethod method,
                 const FilterParams& params = {},
                 Diagnostics* diag = nullptr);

// Per-axis median of the clamped window; the upper middle element for even
// windows. No-op when windowSize < 3.
CurveData filterMedian(const CurveData& curve, const IndexSet& indices, int windowSize,
                       Diagnostics* diag = nullptr);

// Same algorithm and edge policy as smoothMovingAverage.
CurveData filterAverage(const CurveData& curve, const IndexSet& indices, int windowSize,
                        Diagnostics* diag = nullptr);

// Same algorithm and edge policy as smoothGaussian.
CurveData filterGaussian(const CurveData& curve, const IndexSet& indices, int windowSize, double sigma,
                         Diagnostics* diag = nullptr);

// Runs butterworthFilter over the contiguous range [min(indices), max(indices)]
// and writes back only the selected positions. Needs at least 3 valid indices.
CurveData filterButterworth(const CurveData& curve, const IndexSet& indices, double cutoff, int order,
                            Diagnostics* diag = nullptr);

// One-pole low-pass with alpha = 1 / (1 + (1/cutoff)^(2*order)), run forward
// then backward over the result. An approximation, not a textbook Butterworth.
std::vector<double> butterworthFilter(const std::vector<double>& data, double cutoff, int order);

// Every smoothing and filtering method behind one closed enum.
enum class FilterKind : uint8_t {
    MovingAverage = 0,
    Gaussian = 1,
    SavitzkyGolay = 2,
    Median = 3,
    Butterworth = 4,
    FilterAverage = 5,
    FilterGaussian = 6,
};

CurveData applySmoothingFiltering(const CurveData& curve,
                                  const IndexSet& indices,
                                  FilterKind kind,
                                  const FilterParams& params = {},
                                  Diagnostics* diag = nullptr);

const char* filterKindName(FilterKind kind);
// Inverse of filterKindName; nullopt for an unknown name.
std::optional<FilterKind> filterKindFromName(const std::string& name);

} // namespace curvetrack
