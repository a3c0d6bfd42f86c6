// Extrapolation and the shared quadratic fit.
#include "curvetrack/extrapolation.hpp"
#include "curvetrack/fitting.hpp"
#include <cassert>
#include <cmath>

using namespace curvetrack;

static bool nearly(double a, double b, double eps = 1e-6) { return std::fabs(a - b) <= eps; }

static CurveData squares(int from, int to) {
    CurveData c;
    for (int f = from; f <= to; ++f) c.push_back(Point{f, double(f * f), double(-f), PointStatus::Tracked});
    return c;
}

int main() {
    // fitQuadratic recovers exact coefficients
    {
        std::vector<double> x {0, 1, 2, 3};
        std::vector<double> y;
        for (double v : x) y.push_back(2 + 3 * v + 4 * v * v);
        auto c = fitQuadratic(x, y);
        assert(c);
        assert(nearly((*c)[0], 2.0) && nearly((*c)[1], 3.0) && nearly((*c)[2], 4.0));
        assert(nearly(evaluateQuadratic(*c, 5.0), 2 + 15 + 100));

        assert(!fitQuadratic({0, 1}, {0, 1}));
        assert(!fitQuadratic({0, 1, 2}, {0, 1}));
        assert(!fitQuadratic({1, 1, 1}, {0, 1, 2}));
    }

    // Linear uses the two outermost points
    CurveData two{{0, 0.0, 0.0, PointStatus::Keyframe}, {1, 2.0, 1.0, PointStatus::Keyframe}};
    CurveData lin = extrapolate(two, 3, ExtrapolateMethod::Linear);
    assert(lin.size() == 5);
    assert(lin[2].frame == 2 && nearly(lin[2].x, 4.0) && nearly(lin[2].y, 2.0));
    assert(lin[4].frame == 4 && nearly(lin[4].x, 8.0));
    assert(lin[4].status == PointStatus::Interpolated);
    assert(lin[1].status == PointStatus::Keyframe);

    // Last velocity averages the per-frame velocities of the window
    CurveData accel{{0, 0.0, 0.0, {}}, {1, 10.0, 0.0, {}}, {2, 20.0, 0.0, {}}, {3, 35.0, 0.0, {}}, {4, 50.0, 0.0, {}}};
    CurveData lv = extrapolate(accel, 2, ExtrapolateMethod::LastVelocity, 5);
    assert(lv.size() == 7);
    assert(nearly(lv[5].x, 62.5));
    assert(nearly(lv[6].x, 75.0));
    // a shorter window only sees the last segments
    assert(nearly(extrapolate(accel, 1, ExtrapolateMethod::LastVelocity, 2)[5].x, 65.0));

    // Quadratic continues x = f^2
    CurveData sq = squares(0, 4);
    CurveData quad = extrapolate(sq, 2, ExtrapolateMethod::Quadratic, 5);
    assert(quad.size() == 7);
    assert(nearly(quad[5].x, 25.0) && nearly(quad[5].y, -5.0));
    assert(nearly(quad[6].x, 36.0));
    // frames are normalized to the window, so large frame numbers stay exact
    CurveData late = squares(1000, 1004);
    assert(nearly(extrapolate(late, 1, ExtrapolateMethod::Quadratic, 3).back().x, 1005.0 * 1005.0, 1e-3));

    // Backward extension
    CurveData tail{{10, 10.0, 5.0, {}}, {11, 12.0, 5.0, {}}, {12, 14.0, 5.0, {}}};
    CurveData back = extrapolateBackward(tail, 2, ExtrapolateMethod::Linear);
    assert(back.size() == 5);
    assert(back[0].frame == 8 && nearly(back[0].x, 6.0) && nearly(back[0].y, 5.0));
    assert(back[1].frame == 9 && nearly(back[1].x, 8.0));
    assert(isSortedByFrame(back));
    CurveData backQuad = extrapolateBackward(squares(0, 4), 1, ExtrapolateMethod::Quadratic);
    assert(backQuad.front().frame == -1 && nearly(backQuad.front().x, 1.0));
    assert(nearly(extrapolateBackward(accel, 1, ExtrapolateMethod::LastVelocity, 3).front().x, -10.0));

    // Not enough data: unchanged
    Diagnostics diag;
    assert(extrapolate(two, 0, ExtrapolateMethod::Linear, 5, ExtrapolateDirection::Forward, &diag) == two);
    assert(extrapolate({}, 4, ExtrapolateMethod::Linear) == CurveData{});
    CurveData one{{3, 1.0, 1.0, {}}};
    assert(extrapolate(one, 2, ExtrapolateMethod::Linear) == one);
    assert(extrapolate(one, 2, ExtrapolateMethod::LastVelocity) == one);
    diag.clear();
    assert(extrapolateForward(two, 2, ExtrapolateMethod::Quadratic, 5, &diag) == two);
    assert(diag.size() == 1 && diag[0].code == DiagnosticCode::InsufficientData);

    return 0;
}
