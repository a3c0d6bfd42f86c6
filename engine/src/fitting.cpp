#include "curvetrack/fitting.hpp"
#include <cmath>
#include <utility>

namespace curvetrack {

std::optional<std::array<double, 3>> fitQuadratic(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 3) return std::nullopt;

    double s1 = 0, s2 = 0, s3 = 0, s4 = 0, sy = 0, sxy = 0, sx2y = 0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const double xi = x[i];
        const double x2 = xi * xi;
        s1 += xi;
        s2 += x2;
        s3 += x2 * xi;
        s4 += x2 * x2;
        sy += y[i];
        sxy += xi * y[i];
        sx2y += x2 * y[i];
    }
    double A[3][3] = {{double(x.size()), s1, s2}, {s1, s2, s3}, {s2, s3, s4}};
    double b[3] = {sy, sxy, sx2y};

    for (int i = 0; i < 3; ++i) {
        int pivot = i;
        for (int j = i + 1; j < 3; ++j) {
            if (std::abs(A[j][i]) > std::abs(A[pivot][i])) pivot = j;
        }
        if (pivot != i) {
            std::swap(A[i], A[pivot]);
            std::swap(b[i], b[pivot]);
        }
        if (std::abs(A[i][i]) < 1e-10) return std::nullopt;
        for (int j = i + 1; j < 3; ++j) {
            const double f = A[j][i] / A[i][i];
            for (int k = i; k < 3; ++k) A[j][k] -= f * A[i][k];
            b[j] -= f * b[i];
        }
    }

    std::array<double, 3> c {0.0, 0.0, 0.0};
    for (int i = 2; i >= 0; --i) {
        double v = b[i];
        for (int j = i + 1; j < 3; ++j) v -= A[i][j] * c[static_cast<std::size_t>(j)];
        c[static_cast<std::size_t>(i)] = v / A[i][i];
    }
    return c;
}

} // namespace curvetrack
