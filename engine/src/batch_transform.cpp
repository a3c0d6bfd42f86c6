#include "curvetrack/batch_transform.hpp"
#include "curvetrack/smoothing.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace curvetrack {

namespace {

constexpr double kPi = 3.14159265358979323846;

IndexSet checked_selection(const CurveData& curve, const IndexSet& indices, Diagnostics* diag) {
    IndexSet valid = validIndices(indices, curve.size());
    for (int i : indices) {
        if (i < 0 || static_cast<std::size_t>(i) >= curve.size()) {
            report(diag, DiagnosticCode::InvalidSelection, i, "index out of range");
        }
    }
    return valid;
}

Vec2 pivot_or_centroid(const CurveData& curve, const IndexSet& valid, const std::optional<Vec2>& center) {
    if (center) return *center;
    return selectionCentroid(curve, valid).value_or(Vec2{});
}

} // namespace

CurveData scalePoints(const CurveData& curve, const IndexSet& indices, double scaleX, double scaleY,
                      std::optional<Vec2> center, Diagnostics* diag) {
    const IndexSet valid = checked_selection(curve, indices, diag);
    if (valid.empty()) return curve;
    const Vec2 c = pivot_or_centroid(curve, valid, center);
    CurveData result = curve;
    for (int i : valid) {
        Point& p = result[static_cast<std::size_t>(i)];
        p.x = c.x + (p.x - c.x) * scaleX;
        p.y = c.y + (p.y - c.y) * scaleY;
    }
    return result;
}

CurveData rotatePoints(const CurveData& curve, const IndexSet& indices, double angleDegrees,
                       std::optional<Vec2> center, Diagnostics* diag) {
    const IndexSet valid = checked_selection(curve, indices, diag);
    if (valid.empty()) return curve;
    const Vec2 c = pivot_or_centroid(curve, valid, center);
    const double rad = angleDegrees * kPi / 180.0;
    const double cs = std::cos(rad);
    const double sn = std::sin(rad);
    CurveData result = curve;
    for (int i : valid) {
        Point& p = result[static_cast<std::size_t>(i)];
        const double dx = p.x - c.x;
        const double dy = p.y - c.y;
        p.x = c.x + dx * cs - dy * sn;
        p.y = c.y + dx * sn + dy * cs;
    }
    return result;
}

CurveData offsetPoints(const CurveData& curve, const IndexSet& indices, double dx, double dy, Diagnostics* diag) {
    const IndexSet valid = checked_selection(curve, indices, diag);
    CurveData result = curve;
    for (int i : valid) {
        result[static_cast<std::size_t>(i)].x += dx;
        result[static_cast<std::size_t>(i)].y += dy;
    }
    return result;
}

CurveData normalizeVelocity(const CurveData& curve, const IndexSet& indices, std::optional<double> targetVelocity,
                            Diagnostics* diag) {
    const IndexSet sel = checked_selection(curve, indices, diag);
    if (sel.size() < 2) {
        report(diag, DiagnosticCode::InsufficientData, -1, "velocity normalization needs 2 selected points");
        return curve;
    }
    if (sel.back() - sel.front() + 1 != static_cast<int>(sel.size())) {
        report(diag, DiagnosticCode::InvalidSelection, sel.front(), "selection is not contiguous");
        return curve;
    }

    const std::size_t first = static_cast<std::size_t>(sel.front());
    const std::size_t last = static_cast<std::size_t>(sel.back());
    double target = 0.0;
    if (targetVelocity) {
        target = *targetVelocity;
    } else {
        double sum = 0.0;
        int count = 0;
        for (std::size_t i = first + 1; i <= last; ++i) {
            const int df = curve[i].frame - curve[i - 1].frame;
            if (df <= 0) continue;
            sum += std::hypot(curve[i].x - curve[i - 1].x, curve[i].y - curve[i - 1].y) / df;
            ++count;
        }
        if (count == 0) {
            report(diag, DiagnosticCode::InsufficientData, sel.front(), "no segment with a positive frame step");
            return curve;
        }
        target = sum / count;
    }

    CurveData result = curve;
    for (std::size_t i = first + 1; i <= last; ++i) {
        const double dx = curve[i].x - curve[i - 1].x;
        const double dy = curve[i].y - curve[i - 1].y;
        const double len = std::hypot(dx, dy);
        const Point& prev = result[i - 1];
        if (len <= 0.0) {
            // no direction to follow: stays on the previously placed point
            result[i].x = prev.x;
            result[i].y = prev.y;
            continue;
        }
        const int df = curve[i].frame - curve[i - 1].frame;
        const double step = df > 0 ? target * df : target;
        result[i].x = prev.x + dx / len * step;
        result[i].y = prev.y + dy / len * step;
    }
    return result;
}

CurveData adjustSmoothness(const CurveData& curve, const IndexSet& indices, double smoothnessFactor,
                           Diagnostics* diag) {
    if (indices.empty()) return curve;
    if (smoothnessFactor < 0.0 || smoothnessFactor > 1.0) {
        report(diag, DiagnosticCode::ParameterOutOfRange, -1,
               "smoothness factor " + std::to_string(smoothnessFactor) + " clamped to [0, 1]");
    }
    const double f = std::max(0.0, std::min(1.0, smoothnessFactor));
    if (f == 0.0) return curve;
    int window = 3 + static_cast<int>((15 - 3) * f);
    if (window % 2 == 0) ++window;
    return smoothMovingAverage(curve, indices, window, diag);
}

} // namespace curvetrack
