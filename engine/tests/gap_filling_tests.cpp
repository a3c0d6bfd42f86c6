// Gap filling between tracked segments.
#include "curvetrack/gap_filling.hpp"
#include <cassert>
#include <cmath>

using namespace curvetrack;

static bool nearly(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

static const Point* at(const CurveData& c, int frame) {
    for (const auto& p : c) {
        if (p.frame == frame) return &p;
    }
    return nullptr;
}

static CurveData ramp(int from, int to, double slope) {
    CurveData c;
    for (int f = from; f <= to; ++f) c.push_back(Point{f, slope * f, 0.0, PointStatus::Tracked});
    return c;
}

int main() {
    // Linear midpoint is exact
    const CurveData ends{{0, 0.0, 0.0, PointStatus::Keyframe}, {10, 100.0, 100.0, PointStatus::Keyframe}};
    CurveData lin = fillGap(ends, 1, 9, FillMethod::Linear);
    assert(lin.size() == 11);
    assert(isSortedByFrame(lin));
    const Point* mid = at(lin, 5);
    assert(mid && nearly(mid->x, 50.0) && nearly(mid->y, 50.0));
    assert(mid->status == PointStatus::Interpolated);
    assert(at(lin, 0)->status == PointStatus::Keyframe);

    // Both sides are required
    Diagnostics diag;
    assert(fillLinear(ends, 1, 12, true, &diag) == ends);
    assert(!diag.empty() && diag[0].code == DiagnosticCode::InsufficientData);
    assert(fillLinear(ends, -5, 3) == ends);

    // preserveEndpoints keeps frames that already exist
    CurveData withMid{{0, 0.0, 0.0, {}}, {5, 7.0, -7.0, PointStatus::Keyframe}, {10, 10.0, 10.0, {}}};
    CurveData kept = fillLinear(withMid, 1, 9, true);
    assert(kept.size() == 11);
    assert(at(kept, 5)->x == 7.0 && at(kept, 5)->status == PointStatus::Keyframe);
    CurveData replaced = fillLinear(withMid, 1, 9, false);
    assert(nearly(at(replaced, 5)->x, 5.0));
    // boundary points are chosen outside the range, so frame 5 does not split it
    assert(nearly(at(replaced, 3)->x, 3.0));

    // Cubic spline falls back to linear with one point per side
    Diagnostics fallback;
    assert(fillCubicSpline(ends, 1, 9, 0.5, true, &fallback) == fillLinear(ends, 1, 9));
    assert(fallback[0].code == DiagnosticCode::MethodFallback);

    // Hermite basis: u = 0 at startFrame lands on the nearest point before the gap
    CurveData sides{{0, 0.0, 0.0, {}}, {1, 1.0, 1.0, {}}, {5, 5.0, 5.0, {}}, {6, 6.0, 6.0, {}}};
    CurveData spline = fillCubicSpline(sides, 2, 4, 0.0);
    assert(nearly(at(spline, 2)->x, 1.0));
    // with tension 1 the tangents vanish
    CurveData taut = fillGap(sides, 2, 4, FillMethod::CubicSpline, true, FillParams{1.0, 3, 1.0});
    const double u = 1.0 / 3.0;
    const double h1 = 2 * u * u * u - 3 * u * u + 1;
    const double h2 = -2 * u * u * u + 3 * u * u;
    assert(nearly(at(taut, 3)->x, h1 * 1.0 + h2 * 5.0));
    // tangents come from p2 - p0 and p3 - p1
    const double h3 = u * u * u - 2 * u * u + u;
    const double h4 = u * u * u - u * u;
    const double t = 1.0 - 0.5;
    assert(nearly(at(fillCubicSpline(sides, 2, 4, 0.5), 3)->y,
                  h1 * 1.0 + h2 * 5.0 + h3 * t * (5.0 - 0.0) + h4 * t * (6.0 - 1.0)));

    // Constant velocity continues uniform motion exactly
    CurveData moving = ramp(0, 4, 2.0);
    for (const auto& p : ramp(10, 14, 2.0)) moving.push_back(p);
    CurveData cv = fillGap(moving, 5, 9, FillMethod::ConstantVelocity, true, FillParams{0.5, 3, 1.0});
    for (int f = 5; f <= 9; ++f) assert(nearly(at(cv, f)->x, 2.0 * f));

    // Not enough context: linear
    assert(fillConstantVelocity(moving, 5, 9, 10) == fillLinear(moving, 5, 9));
    assert(fillConstantVelocity(moving, 5, 9, 1) == fillLinear(moving, 5, 9));

    // Accelerated motion with equal velocities on both sides is constant velocity
    CurveData acc = fillAcceleratedMotion(moving, 5, 9, 3, 1.0);
    for (int f = 5; f <= 9; ++f) assert(nearly(at(acc, f)->x, 2.0 * f));

    // Speeding up: before 1 px/frame, after 3 px/frame
    CurveData speeding = ramp(0, 2, 1.0);
    for (int f = 8; f <= 10; ++f) speeding.push_back(Point{f, 3.0 * f, 0.0, {}});
    CurveData sp = fillAcceleratedMotion(speeding, 3, 7, 3, 1.0);
    const double a = (3.0 - 1.0) / 5.0;
    assert(nearly(at(sp, 5)->x, 2.0 + 1.0 * 3 + 0.5 * a * 9));

    // Average fill blends the two side means
    CurveData flat{{0, 0.0, 0.0, {}}, {1, 0.0, 0.0, {}}, {2, 0.0, 0.0, {}},
                   {6, 10.0, 10.0, {}}, {7, 10.0, 10.0, {}}, {8, 10.0, 10.0, {}}};
    CurveData avg = fillGap(flat, 3, 5, FillMethod::Average, true, FillParams{0.5, 3, 1.0});
    assert(nearly(at(avg, 3)->x, 0.0));
    assert(nearly(at(avg, 4)->x, 10.0 / 3.0));
    assert(nearly(at(avg, 5)->y, 20.0 / 3.0));

    return 0;
}
