// Moving average, Gaussian and Savitzky-Golay smoothing.
#include "curvetrack/smoothing.hpp"
#include <cassert>
#include <cmath>
#include <numeric>
#include <vector>

using namespace curvetrack;

static bool nearly(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

static CurveData fromX(const std::vector<double>& xs, int firstFrame = 1) {
    CurveData c;
    for (std::size_t i = 0; i < xs.size(); ++i) {
        c.push_back(Point{firstFrame + static_cast<int>(i), xs[i], 2.0 * xs[i], PointStatus::Tracked});
    }
    return c;
}

static bool framesPreserved(const CurveData& a, const CurveData& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].frame != b[i].frame || a[i].status != b[i].status) return false;
    }
    return true;
}

int main() {
    const CurveData spike = fromX({0, 0, 9, 0, 0});
    const IndexSet all{0, 1, 2, 3, 4};

    // Empty selection and undersized windows are no-ops
    assert(smoothGaussian(spike, IndexSet{}, 3, 1.0) == spike);
    assert(smoothMovingAverage(spike, all, 2) == spike);
    assert(smoothGaussian(spike, all, 2, 1.0) == spike);
    assert(smoothSavitzkyGolay(spike, all, 4) == spike);
    assert(smooth(spike, all, SmoothMethod::SavitzkyGolay, SmoothParams{3, 1.0}) == spike);

    // Frames and statuses survive every method
    for (auto m : {SmoothMethod::MovingAverage, SmoothMethod::Gaussian, SmoothMethod::SavitzkyGolay}) {
        CurveData out = smooth(fromX({1, 5, 2, 8, 3, 7, 4}), IndexSet{0, 1, 2, 3, 4, 5, 6}, m, SmoothParams{5, 1.5});
        assert(framesPreserved(out, fromX({1, 5, 2, 8, 3, 7, 4})));
    }

    // Moving average over the clamped window
    CurveData ma = smoothMovingAverage(spike, IndexSet{2}, 3);
    assert(nearly(ma[2].x, 3.0) && nearly(ma[2].y, 6.0));
    assert(ma[1] == spike[1]);
    // Boundary window [0,1] has only 2 points and is skipped
    CurveData edge = smoothMovingAverage(spike, IndexSet{0}, 3);
    assert(edge == spike);
    // Each point reads the original data, not already-smoothed neighbours
    CurveData both = smoothMovingAverage(spike, IndexSet{1, 2}, 3);
    assert(nearly(both[1].x, 3.0) && nearly(both[2].x, 3.0));

    // Invalid indices are skipped per point and reported
    Diagnostics diag;
    CurveData skipped = smoothMovingAverage(spike, IndexSet{-1, 2, 42}, 3, &diag);
    assert(nearly(skipped[2].x, 3.0));
    int invalid = 0;
    for (const auto& d : diag) invalid += d.code == DiagnosticCode::InvalidSelection ? 1 : 0;
    assert(invalid == 2);

    // Gaussian kernel sums to one and is symmetric
    for (int w : {3, 5, 7, 9}) {
        for (double s : {0.5, 1.0, 2.0}) {
            std::vector<double> k = gaussianKernel(w, s);
            assert(k.size() == static_cast<std::size_t>(2 * (w / 2) + 1));
            assert(nearly(std::accumulate(k.begin(), k.end(), 0.0), 1.0));
            assert(nearly(k.front(), k.back()));
        }
    }

    // Interior Gaussian on a straight line leaves it on the line
    const CurveData line = fromX({0, 10, 20, 30, 40});
    CurveData g = smoothGaussian(line, IndexSet{2}, 5, 1.0);
    assert(nearly(g[2].x, 20.0) && nearly(g[2].y, 40.0));

    // At the boundary only the overlapping weights count, renormalized by their sum
    CurveData gb = smoothGaussian(line, IndexSet{0}, 5, 1.0);
    const double w0 = 1.0, w1 = std::exp(-0.5), w2 = std::exp(-2.0);
    const double expected = (0.0 * w0 + 10.0 * w1 + 20.0 * w2) / (w0 + w1 + w2);
    assert(nearly(gb[0].x, expected));
    assert(gb[0].frame == 1);

    // Non-positive sigma is rejected as a whole-call no-op
    Diagnostics sigmaDiag;
    assert(smoothGaussian(line, IndexSet{2}, 5, 0.0, &sigmaDiag) == line);
    assert(!sigmaDiag.empty() && sigmaDiag[0].code == DiagnosticCode::ParameterOutOfRange);

    // Savitzky-Golay reproduces a quadratic exactly
    CurveData quad;
    for (int i = 0; i < 7; ++i) quad.push_back(Point{i, double(i), double(i * i), {}});
    CurveData sg = smoothSavitzkyGolay(quad, IndexSet{1, 2, 3, 4, 5}, 5);
    for (int i = 2; i <= 4; ++i) {
        assert(nearly(sg[static_cast<std::size_t>(i)].x, double(i), 1e-6));
        assert(nearly(sg[static_cast<std::size_t>(i)].y, double(i * i), 1e-6));
    }
    // Index 1 clamps to [0,3] (4 points) and is skipped
    assert(sg[1] == quad[1]);

    // and pulls a lone spike down
    CurveData sgSpike = smoothSavitzkyGolay(fromX({0, 0, 0, 10, 0, 0, 0}), IndexSet{3}, 5);
    assert(sgSpike[3].x < 10.0 && sgSpike[3].x > 0.0);

    // Fit helper evaluates at the target position in the window
    assert(nearly(savitzkyGolayFit({1, 4, 9, 16, 25}, 4), 25.0, 1e-6));
    bool degenerate = true;
    assert(nearly(savitzkyGolayFit({3, 7}, 1, &degenerate), 7.0));
    assert(!degenerate);

    return 0;
}
