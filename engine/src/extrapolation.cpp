#include "curvetrack/extrapolation.hpp"
#include "curvetrack/fitting.hpp"
#include <algorithm>
#include <array>
#include <string>
#include <vector>

namespace curvetrack {

namespace {

// The outermost `count` points in time order, with the edge point last for
// Forward and first for Backward.
std::vector<Point> edge_points(const CurveData& curve, std::size_t count, ExtrapolateDirection dir) {
    count = std::min(count, curve.size());
    if (dir == ExtrapolateDirection::Forward) {
        return std::vector<Point>(curve.end() - static_cast<std::ptrdiff_t>(count), curve.end());
    }
    return std::vector<Point>(curve.begin(), curve.begin() + static_cast<std::ptrdiff_t>(count));
}

} // namespace

CurveData extrapolate(const CurveData& curve, int numFrames, ExtrapolateMethod method, int fitPoints,
                      ExtrapolateDirection direction, Diagnostics* diag) {
    if (curve.empty() || numFrames <= 0) {
        report(diag, DiagnosticCode::InsufficientData, -1, "nothing to extrapolate");
        return curve;
    }
    const bool forward = direction == ExtrapolateDirection::Forward;
    const Point& edge = forward ? curve.back() : curve.front();
    // +1 per step forward, -1 per step backward
    const int sign = forward ? 1 : -1;

    Vec2 vel;
    std::vector<Point> window;
    std::array<double, 3> cx {}, cy {};
    int minFrame = 0;

    switch (method) {
    case ExtrapolateMethod::Linear: {
        if (curve.size() < 2) {
            report(diag, DiagnosticCode::InsufficientData, edge.frame, "linear extrapolation needs 2 points");
            return curve;
        }
        window = edge_points(curve, 2, direction);
        const int df = window[1].frame - window[0].frame;
        if (df == 0) {
            report(diag, DiagnosticCode::DegenerateFit, edge.frame, "edge points share a frame");
            return curve;
        }
        vel = Vec2{(window[1].x - window[0].x) / df, (window[1].y - window[0].y) / df};
        break;
    }
    case ExtrapolateMethod::LastVelocity: {
        window = edge_points(curve, static_cast<std::size_t>(std::max(fitPoints, 0)), direction);
        int count = 0;
        for (std::size_t i = 1; i < window.size(); ++i) {
            const int df = window[i].frame - window[i - 1].frame;
            if (df <= 0) continue;
            vel.x += (window[i].x - window[i - 1].x) / df;
            vel.y += (window[i].y - window[i - 1].y) / df;
            ++count;
        }
        if (count == 0) {
            report(diag, DiagnosticCode::InsufficientData, edge.frame, "no usable velocity samples");
            return curve;
        }
        vel.x /= count;
        vel.y /= count;
        break;
    }
    case ExtrapolateMethod::Quadratic: {
        window = edge_points(curve, static_cast<std::size_t>(std::max(fitPoints, 0)), direction);
        if (window.size() < 3) {
            report(diag, DiagnosticCode::InsufficientData, edge.frame, "quadratic extrapolation needs 3 fit points");
            return curve;
        }
        minFrame = window.front().frame;
        for (const auto& p : window) minFrame = std::min(minFrame, p.frame);
        std::vector<double> fs, xs, ys;
        for (const auto& p : window) {
            fs.push_back(double(p.frame - minFrame));
            xs.push_back(p.x);
            ys.push_back(p.y);
        }
        auto fx = fitQuadratic(fs, xs);
        auto fy = fitQuadratic(fs, ys);
        if (!fx || !fy) {
            report(diag, DiagnosticCode::DegenerateFit, edge.frame, "quadratic fit is singular");
            return curve;
        }
        cx = *fx;
        cy = *fy;
        break;
    }
    }

    CurveData added;
    added.reserve(static_cast<std::size_t>(numFrames));
    for (int i = 1; i <= numFrames; ++i) {
        const int frame = edge.frame + sign * i;
        Point p{frame, 0.0, 0.0, PointStatus::Interpolated};
        if (method == ExtrapolateMethod::Quadratic) {
            const double f = double(frame - minFrame);
            p.x = evaluateQuadratic(cx, f);
            p.y = evaluateQuadratic(cy, f);
        } else {
            p.x = edge.x + sign * vel.x * i;
            p.y = edge.y + sign * vel.y * i;
        }
        added.push_back(p);
    }
    return mergePoints(curve, added);
}

} // namespace curvetrack
