#pragma once

#include <array>
#include <optional>
#include <vector>

namespace curvetrack {

// Least-squares y = c[0] + c[1] x + c[2] x^2 via the 3x3 normal equations,
// solved by Gaussian elimination with partial pivoting. nullopt when the sizes
// differ, there are fewer than 3 samples, or a pivot falls below 1e-10.
std::optional<std::array<double, 3>> fitQuadratic(const std::vector<double>& x, const std::vector<double>& y);

inline double evaluateQuadratic(const std::array<double, 3>& c, double x) {
    return c[0] + c[1] * x + c[2] * x * x;
}

} // namespace curvetrack
