#include "curvetrack/smoothing.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace curvetrack {

namespace {

struct Window {
    int start;
    int end;  // inclusive
};

inline Window clamped_window(int idx, int half, std::size_t size) {
    return Window{std::max(0, idx - half), std::min(static_cast<int>(size) - 1, idx + half)};
}

// Shared loop: every valid index gets fn(window) unless the clamped window is
// shorter than minPoints.
template <typename Fn>
CurveData smooth_each(const CurveData& curve, const IndexSet& indices, int half, int minPoints,
                      Diagnostics* diag, Fn&& fn) {
    CurveData result = curve;
    for (int idx : indices) {
        if (idx < 0 || static_cast<std::size_t>(idx) >= curve.size()) {
            report(diag, DiagnosticCode::InvalidSelection, idx, "index out of range");
            continue;
        }
        const Window w = clamped_window(idx, half, curve.size());
        if (w.end - w.start + 1 < minPoints) {
            report(diag, DiagnosticCode::InsufficientData, idx,
                   "window has " + std::to_string(w.end - w.start + 1) + " points, need " + std::to_string(minPoints));
            continue;
        }
        Point& out = result[static_cast<std::size_t>(idx)];
        const Vec2 v = fn(idx, w);
        out.x = v.x;
        out.y = v.y;
    }
    return result;
}

} // namespace

std::vector<double> gaussianKernel(int windowSize, double sigma) {
    const int half = windowSize / 2;
    std::vector<double> w;
    w.reserve(static_cast<std::size_t>(2 * half + 1));
    double sum = 0.0;
    for (int k = -half; k <= half; ++k) {
        double v = std::exp(-double(k * k) / (2.0 * sigma * sigma));
        w.push_back(v);
        sum += v;
    }
    for (auto& v : w) v /= sum;
    return w;
}

CurveData smoothMovingAverage(const CurveData& curve, const IndexSet& indices, int windowSize, Diagnostics* diag) {
    if (indices.empty()) return curve;
    if (windowSize < 3) {
        report(diag, DiagnosticCode::InsufficientData, -1, "moving average needs windowSize >= 3");
        return curve;
    }
    return smooth_each(curve, indices, windowSize / 2, 3, diag, [&curve](int, const Window& w) {
        Vec2 sum;
        for (int i = w.start; i <= w.end; ++i) {
            sum.x += curve[static_cast<std::size_t>(i)].x;
            sum.y += curve[static_cast<std::size_t>(i)].y;
        }
        const double n = double(w.end - w.start + 1);
        return Vec2{sum.x / n, sum.y / n};
    });
}

CurveData smoothGaussian(const CurveData& curve, const IndexSet& indices, int windowSize, double sigma,
                         Diagnostics* diag) {
    if (indices.empty()) return curve;
    if (windowSize < 3) {
        report(diag, DiagnosticCode::InsufficientData, -1, "gaussian needs windowSize >= 3");
        return curve;
    }
    if (!(sigma > 0.0)) {
        report(diag, DiagnosticCode::ParameterOutOfRange, -1, "gaussian sigma must be positive");
        return curve;
    }
    const int half = windowSize / 2;
    const std::vector<double> weights = gaussianKernel(windowSize, sigma);
    return smooth_each(curve, indices, half, 3, diag, [&](int idx, const Window& w) {
        Vec2 acc;
        double wsum = 0.0;
        for (int i = w.start; i <= w.end; ++i) {
            // kernel slot of sample i relative to the unclamped window start
            const int k = i - (idx - half);
            const double wk = weights[static_cast<std::size_t>(k)];
            acc.x += curve[static_cast<std::size_t>(i)].x * wk;
            acc.y += curve[static_cast<std::size_t>(i)].y * wk;
            wsum += wk;
        }
        if (wsum > 0.0) {
            acc.x /= wsum;
            acc.y /= wsum;
        }
        return acc;
    });
}

double savitzkyGolayFit(const std::vector<double>& values, int target, bool* degenerate) {
    if (degenerate) *degenerate = false;
    const int n = static_cast<int>(values.size());
    if (target < 0 || target >= n) return 0.0;
    if (n < 3) return values[static_cast<std::size_t>(target)];

    double sx = 0, sx2 = 0, sx3 = 0, sx4 = 0, sy = 0, sxy = 0, sx2y = 0;
    for (int i = 0; i < n; ++i) {
        const double t = double(i);
        const double v = values[static_cast<std::size_t>(i)];
        sx += t;
        sx2 += t * t;
        sx3 += t * t * t;
        sx4 += t * t * t * t;
        sy += v;
        sxy += t * v;
        sx2y += t * t * v;
    }
    const double dn = double(n);
    const double det = dn * sx2 * sx4 + sx * sx3 * sx2 + sx2 * sx * sx3
                     - sx2 * sx2 * sx2 - sx * sx * sx4 - dn * sx3 * sx3;
    if (std::abs(det) < 1e-10) {
        if (degenerate) *degenerate = true;
        return values[static_cast<std::size_t>(target)];
    }
    // Cramer's rule on the 3x3 normal equations
    const double a = (sy * sx2 * sx4 + sx * sx3 * sx2y + sx2 * sxy * sx3
                    - sx2 * sx2 * sx2y - sx * sxy * sx4 - sy * sx3 * sx3) / det;
    const double b = (dn * sxy * sx4 + sy * sx3 * sx2 + sx2 * sx * sx2y
                    - sx2 * sxy * sx2 - sy * sx * sx4 - dn * sx3 * sx2y) / det;
    const double c = (dn * sx2 * sx2y + sx * sxy * sx2 + sy * sx * sx3
                    - sy * sx2 * sx2 - sx * sx * sx2y - dn * sxy * sx3) / det;
    const double t = double(target);
    return a + b * t + c * t * t;
}

CurveData smoothSavitzkyGolay(const CurveData& curve, const IndexSet& indices, int windowSize, Diagnostics* diag) {
    if (indices.empty()) return curve;
    if (windowSize < 5) {
        report(diag, DiagnosticCode::InsufficientData, -1, "savitzky-golay needs windowSize >= 5");
        return curve;
    }
    return smooth_each(curve, indices, windowSize / 2, 5, diag, [&](int idx, const Window& w) {
        std::vector<double> xs, ys;
        xs.reserve(static_cast<std::size_t>(w.end - w.start + 1));
        ys.reserve(xs.capacity());
        for (int i = w.start; i <= w.end; ++i) {
            xs.push_back(curve[static_cast<std::size_t>(i)].x);
            ys.push_back(curve[static_cast<std::size_t>(i)].y);
        }
        bool degX = false, degY = false;
        const int rel = idx - w.start;
        Vec2 v{savitzkyGolayFit(xs, rel, &degX), savitzkyGolayFit(ys, rel, &degY)};
        if (degX || degY) report(diag, DiagnosticCode::DegenerateFit, idx, "near-singular quadratic fit");
        return v;
    });
}

CurveData smooth(const CurveData& curve, const IndexSet& indices, SmoothMethod method, const SmoothParams& params,
                 Diagnostics* diag) {
    switch (method) {
    case SmoothMethod::MovingAverage: return smoothMovingAverage(curve, indices, params.windowSize, diag);
    case SmoothMethod::Gaussian: return smoothGaussian(curve, indices, params.windowSize, params.sigma, diag);
    case SmoothMethod::SavitzkyGolay: return smoothSavitzkyGolay(curve, indices, params.windowSize, diag);
    }
    return curve;
}

} // namespace curvetrack
