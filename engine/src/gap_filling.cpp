#include "curvetrack/gap_filling.hpp"
#include <algorithm>
#include <set>
#include <string>

namespace curvetrack {

namespace {

// Points on each side of the gap, nearest first.
struct GapContext {
    std::vector<Point> before;
    std::vector<Point> after;
    std::set<int> existing;
};

GapContext gather(const CurveData& curve, int startFrame, int endFrame) {
    GapContext ctx;
    for (const auto& p : curve) {
        ctx.existing.insert(p.frame);
        if (p.frame < startFrame) ctx.before.push_back(p);
        else if (p.frame > endFrame) ctx.after.push_back(p);
    }
    std::stable_sort(ctx.before.begin(), ctx.before.end(), [](const Point& a, const Point& b) { return a.frame > b.frame; });
    std::stable_sort(ctx.after.begin(), ctx.after.end(), [](const Point& a, const Point& b) { return a.frame < b.frame; });
    return ctx;
}

bool has_both_sides(const GapContext& ctx, int startFrame, int endFrame, Diagnostics* diag) {
    if (startFrame > endFrame) {
        report(diag, DiagnosticCode::ParameterOutOfRange, startFrame, "gap start is after gap end");
        return false;
    }
    if (ctx.before.empty() || ctx.after.empty()) {
        report(diag, DiagnosticCode::InsufficientData, startFrame, "gap needs a point on each side");
        return false;
    }
    return true;
}

// Generates a point for every frame of the gap that is not protected and
// merges the result into the curve.
template <typename Fn>
CurveData fill_frames(const CurveData& curve, const GapContext& ctx, int startFrame, int endFrame,
                      bool preserveEndpoints, Fn&& position) {
    CurveData added;
    added.reserve(static_cast<std::size_t>(endFrame - startFrame + 1));
    for (int frame = startFrame; frame <= endFrame; ++frame) {
        if (preserveEndpoints && ctx.existing.count(frame)) continue;
        const Vec2 v = position(frame);
        added.push_back(Point{frame, v.x, v.y, PointStatus::Interpolated});
    }
    return mergePoints(curve, added);
}

struct Velocity {
    double x {0.0};
    double y {0.0};
};

// Mean per-frame velocity over the first windowSize points of pts, which are
// ordered by distance from the gap. towardGap flips the frame order for the
// "before" side.
Velocity window_velocity(const std::vector<Point>& pts, int windowSize, bool towardGap) {
    Velocity v;
    for (int i = 1; i < windowSize; ++i) {
        const Point& near = pts[static_cast<std::size_t>(i - 1)];
        const Point& far = pts[static_cast<std::size_t>(i)];
        const Point& a = towardGap ? far : near;
        const Point& b = towardGap ? near : far;
        const int df = b.frame - a.frame;
        if (df == 0) continue;
        v.x += (b.x - a.x) / df;
        v.y += (b.y - a.y) / df;
    }
    v.x /= double(windowSize - 1);
    v.y /= double(windowSize - 1);
    return v;
}

} // namespace

CurveData fillLinear(const CurveData& curve, int startFrame, int endFrame, bool preserveEndpoints, Diagnostics* diag) {
    const GapContext ctx = gather(curve, startFrame, endFrame);
    if (!has_both_sides(ctx, startFrame, endFrame, diag)) return curve;
    const Point& b = ctx.before.front();
    const Point& a = ctx.after.front();
    const double span = double(a.frame - b.frame);
    return fill_frames(curve, ctx, startFrame, endFrame, preserveEndpoints, [&](int frame) {
        const double t = double(frame - b.frame) / span;
        return Vec2{b.x + (a.x - b.x) * t, b.y + (a.y - b.y) * t};
    });
}

CurveData fillCubicSpline(const CurveData& curve, int startFrame, int endFrame, double tension,
                          bool preserveEndpoints, Diagnostics* diag) {
    const GapContext ctx = gather(curve, startFrame, endFrame);
    if (!has_both_sides(ctx, startFrame, endFrame, diag)) return curve;
    if (ctx.before.size() < 2 || ctx.after.size() < 2) {
        report(diag, DiagnosticCode::MethodFallback, startFrame, "cubic spline needs 2 points per side, using linear");
        return fillLinear(curve, startFrame, endFrame, preserveEndpoints, diag);
    }
    const Point& p0 = ctx.before[1];
    const Point& p1 = ctx.before[0];
    const Point& p2 = ctx.after[0];
    const Point& p3 = ctx.after[1];
    const double totalFrames = double(endFrame - startFrame + 1);
    const double t = 1.0 - tension;
    return fill_frames(curve, ctx, startFrame, endFrame, preserveEndpoints, [&](int frame) {
        const double u = double(frame - startFrame) / totalFrames;
        const double u2 = u * u;
        const double u3 = u2 * u;
        const double h1 = 2 * u3 - 3 * u2 + 1;
        const double h2 = -2 * u3 + 3 * u2;
        const double h3 = (u3 - 2 * u2 + u) * t;
        const double h4 = (u3 - u2) * t;
        return Vec2{h1 * p1.x + h2 * p2.x + h3 * (p2.x - p0.x) + h4 * (p3.x - p1.x),
                    h1 * p1.y + h2 * p2.y + h3 * (p2.y - p0.y) + h4 * (p3.y - p1.y)};
    });
}

CurveData fillConstantVelocity(const CurveData& curve, int startFrame, int endFrame, int windowSize,
                               bool preserveEndpoints, Diagnostics* diag) {
    const GapContext ctx = gather(curve, startFrame, endFrame);
    if (!has_both_sides(ctx, startFrame, endFrame, diag)) return curve;
    if (windowSize < 2) {
        report(diag, DiagnosticCode::ParameterOutOfRange, startFrame, "constant velocity needs windowSize >= 2, using linear");
        return fillLinear(curve, startFrame, endFrame, preserveEndpoints, diag);
    }
    const std::size_t need = static_cast<std::size_t>(windowSize);
    if (ctx.before.size() < need || ctx.after.size() < need) {
        report(diag, DiagnosticCode::MethodFallback, startFrame,
               "constant velocity needs " + std::to_string(windowSize) + " points per side, using linear");
        return fillLinear(curve, startFrame, endFrame, preserveEndpoints, diag);
    }
    const Velocity vb = window_velocity(ctx.before, windowSize, true);
    const Velocity va = window_velocity(ctx.after, windowSize, false);
    const Velocity v{(vb.x + va.x) / 2.0, (vb.y + va.y) / 2.0};
    const Point& b = ctx.before.front();
    return fill_frames(curve, ctx, startFrame, endFrame, preserveEndpoints, [&](int frame) {
        const double steps = double(frame - b.frame);
        return Vec2{b.x + v.x * steps, b.y + v.y * steps};
    });
}

CurveData fillAcceleratedMotion(const CurveData& curve, int startFrame, int endFrame, int windowSize,
                                double accelWeight, bool preserveEndpoints, Diagnostics* diag) {
    const GapContext ctx = gather(curve, startFrame, endFrame);
    if (!has_both_sides(ctx, startFrame, endFrame, diag)) return curve;
    const std::size_t need = static_cast<std::size_t>(std::max(windowSize, 0));
    if (windowSize < 2 || ctx.before.size() < need || ctx.after.size() < need) {
        report(diag, DiagnosticCode::MethodFallback, startFrame, "accelerated motion lacks context, using constant velocity");
        return fillConstantVelocity(curve, startFrame, endFrame, windowSize, preserveEndpoints, diag);
    }
    const Velocity vb = window_velocity(ctx.before, windowSize, true);
    const Velocity va = window_velocity(ctx.after, windowSize, false);
    const double totalGap = double(endFrame - startFrame + 1);
    const Velocity acc{(va.x - vb.x) / totalGap * accelWeight, (va.y - vb.y) / totalGap * accelWeight};
    const Point& b = ctx.before.front();
    return fill_frames(curve, ctx, startFrame, endFrame, preserveEndpoints, [&](int frame) {
        const double s = double(frame - b.frame);
        return Vec2{b.x + vb.x * s + 0.5 * acc.x * s * s, b.y + vb.y * s + 0.5 * acc.y * s * s};
    });
}

CurveData fillAverage(const CurveData& curve, int startFrame, int endFrame, int windowSize,
                      bool preserveEndpoints, Diagnostics* diag) {
    const GapContext ctx = gather(curve, startFrame, endFrame);
    if (!has_both_sides(ctx, startFrame, endFrame, diag)) return curve;
    if (windowSize < 1) {
        report(diag, DiagnosticCode::ParameterOutOfRange, startFrame, "average fill needs windowSize >= 1, using linear");
        return fillLinear(curve, startFrame, endFrame, preserveEndpoints, diag);
    }
    auto mean_of = [windowSize](const std::vector<Point>& pts) {
        const std::size_t n = std::min(pts.size(), static_cast<std::size_t>(windowSize));
        Vec2 m;
        for (std::size_t i = 0; i < n; ++i) {
            m.x += pts[i].x;
            m.y += pts[i].y;
        }
        m.x /= double(n);
        m.y /= double(n);
        return m;
    };
    const Vec2 mb = mean_of(ctx.before);
    const Vec2 ma = mean_of(ctx.after);
    const double totalFrames = double(endFrame - startFrame + 1);
    return fill_frames(curve, ctx, startFrame, endFrame, preserveEndpoints, [&](int frame) {
        const double t = double(frame - startFrame) / totalFrames;
        return Vec2{mb.x * (1.0 - t) + ma.x * t, mb.y * (1.0 - t) + ma.y * t};
    });
}

CurveData fillGap(const CurveData& curve, int startFrame, int endFrame, FillMethod method, bool preserveEndpoints,
                  const FillParams& params, Diagnostics* diag) {
    switch (method) {
    case FillMethod::Linear:
        return fillLinear(curve, startFrame, endFrame, preserveEndpoints, diag);
    case FillMethod::CubicSpline:
        return fillCubicSpline(curve, startFrame, endFrame, params.tension, preserveEndpoints, diag);
    case FillMethod::ConstantVelocity:
        return fillConstantVelocity(curve, startFrame, endFrame, params.windowSize, preserveEndpoints, diag);
    case FillMethod::AcceleratedMotion:
        return fillAcceleratedMotion(curve, startFrame, endFrame, params.windowSize, params.accelWeight,
                                     preserveEndpoints, diag);
    case FillMethod::Average:
        return fillAverage(curve, startFrame, endFrame, params.windowSize, preserveEndpoints, diag);
    }
    return curve;
}

} // namespace curvetrack
