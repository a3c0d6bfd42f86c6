#include "curvetrack/problem_detector.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace curvetrack {

namespace {

inline double distance(const Point& a, const Point& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

std::string describe(const char* fmt, double a, double b = 0.0) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), fmt, a, b);
    return std::string(buf);
}

void check_jumps(const CurveData& c, const DetectorThresholds& th, std::vector<Problem>& out) {
    for (std::size_t i = 1; i < c.size(); ++i) {
        const int gap = c[i].frame - c[i - 1].frame;
        const double d = distance(c[i - 1], c[i]);
        const double perFrame = gap > 1 ? d / gap : d;
        if (perFrame > th.jumpHigh) {
            out.push_back(Problem{c[i].frame, ProblemCategory::SuddenJump,
                                  std::min(1.0, perFrame / (th.jumpHigh * 2)),
                                  describe("moved %.2f px from previous point (%.2f px/frame)", d, perFrame)});
        } else if (perFrame > th.jumpMedium) {
            out.push_back(Problem{c[i].frame, ProblemCategory::LargeMovement,
                                  std::min(0.7, perFrame / th.jumpHigh),
                                  describe("moved %.2f px from previous point (%.2f px/frame)", d, perFrame)});
        }
    }
}

void check_acceleration(const CurveData& c, const DetectorThresholds& th, std::vector<Problem>& out) {
    for (std::size_t i = 2; i < c.size(); ++i) {
        const int dt0 = c[i - 1].frame - c[i - 2].frame;
        const int dt1 = c[i].frame - c[i - 1].frame;
        if (dt0 <= 0 || dt1 <= 0) continue;
        const double v0 = distance(c[i - 2], c[i - 1]) / dt0;
        const double v1 = distance(c[i - 1], c[i]) / dt1;
        const double accel = std::abs(v1 - v0) / ((dt0 + dt1) / 2.0);
        if (accel > th.accelHigh) {
            out.push_back(Problem{c[i].frame, ProblemCategory::HighAcceleration,
                                  std::min(1.0, accel / (th.accelHigh * 2)),
                                  describe("acceleration of %.2f px/frame^2", accel)});
        } else if (accel > th.accelMedium) {
            out.push_back(Problem{c[i].frame, ProblemCategory::MediumAcceleration,
                                  std::min(0.7, accel / th.accelHigh),
                                  describe("acceleration of %.2f px/frame^2", accel)});
        }
    }
}

void check_jitter(const CurveData& c, const DetectorThresholds& th, std::vector<Problem>& out) {
    const std::size_t w = static_cast<std::size_t>(std::max(th.jitterWindow, 1));
    for (std::size_t s = 0; s + w <= c.size(); ++s) {
        double cx = 0.0, cy = 0.0;
        for (std::size_t i = s; i < s + w; ++i) {
            cx += c[i].x;
            cy += c[i].y;
        }
        cx /= double(w);
        cy /= double(w);
        double dev = 0.0;
        for (std::size_t i = s; i < s + w; ++i) dev += std::hypot(c[i].x - cx, c[i].y - cy);
        dev /= double(w);
        const int frame = c[s + w / 2].frame;
        if (dev > th.jitterHigh) {
            out.push_back(Problem{frame, ProblemCategory::StrongJitter, std::min(1.0, dev / (th.jitterHigh * 2)),
                                  describe("mean deviation of %.2f px over %.0f points", dev, double(w))});
        } else if (dev > th.jitterMedium) {
            out.push_back(Problem{frame, ProblemCategory::ModerateJitter, std::min(0.7, dev / th.jitterHigh),
                                  describe("mean deviation of %.2f px over %.0f points", dev, double(w))});
        }
    }
}

void check_gaps(const CurveData& c, std::vector<Problem>& out) {
    for (std::size_t i = 1; i < c.size(); ++i) {
        const int gap = c[i].frame - c[i - 1].frame;
        if (gap > 1) {
            out.push_back(Problem{c[i - 1].frame, ProblemCategory::FrameGap, std::min(1.0, gap / 10.0),
                                  describe("%.0f missing frames before frame %.0f", double(gap - 1), double(c[i].frame))});
        }
    }
}

} // namespace

std::vector<Problem> detectProblems(const CurveData& curve, const DetectorThresholds& thresholds) {
    std::vector<Problem> out;
    if (curve.size() < static_cast<std::size_t>(std::max(thresholds.minPoints, 0))) return out;
    check_jumps(curve, thresholds, out);
    check_acceleration(curve, thresholds, out);
    check_jitter(curve, thresholds, out);
    check_gaps(curve, out);
    std::stable_sort(out.begin(), out.end(), [](const Problem& a, const Problem& b) { return a.severity > b.severity; });
    return out;
}

const char* problemCategoryName(ProblemCategory category) {
    switch (category) {
    case ProblemCategory::SuddenJump: return "Sudden Jump";
    case ProblemCategory::LargeMovement: return "Large Movement";
    case ProblemCategory::HighAcceleration: return "High Acceleration";
    case ProblemCategory::MediumAcceleration: return "Medium Acceleration";
    case ProblemCategory::StrongJitter: return "Strong Jitter";
    case ProblemCategory::ModerateJitter: return "Moderate Jitter";
    case ProblemCategory::FrameGap: return "Frame Gap";
    }
    return "Unknown";
}

std::vector<double> calculateCurvature(const CurveData& curve) {
    std::vector<double> out(curve.size(), 0.0);
    for (std::size_t i = 1; i + 1 < curve.size(); ++i) {
        const double v1x = curve[i].x - curve[i - 1].x;
        const double v1y = curve[i].y - curve[i - 1].y;
        const double v2x = curve[i + 1].x - curve[i].x;
        const double v2y = curve[i + 1].y - curve[i].y;
        const double d1 = std::hypot(v1x, v1y);
        const double d2 = std::hypot(v2x, v2y);
        if (d1 <= 0.0 || d2 <= 0.0) continue;
        const double angle = std::atan2(v1x * v2y - v1y * v2x, v1x * v2x + v1y * v2y);
        out[i] = std::abs(angle) / ((d1 + d2) / 2.0);
    }
    return out;
}

IndexSet findVelocityOutliers(const CurveData& curve, double factor) {
    IndexSet out;
    if (curve.size() < 3) return out;
    std::vector<std::pair<int, double>> speeds;
    for (std::size_t i = 1; i < curve.size(); ++i) {
        const int df = curve[i].frame - curve[i - 1].frame;
        if (df <= 0) continue;
        speeds.emplace_back(static_cast<int>(i), distance(curve[i - 1], curve[i]) / df);
    }
    if (speeds.empty()) return out;
    double mean = 0.0;
    for (const auto& s : speeds) mean += s.second;
    mean /= double(speeds.size());
    if (mean <= 0.0) return out;
    const double threshold = mean * factor;
    for (const auto& s : speeds) {
        if (s.second >= threshold) out.push_back(s.first);
    }
    return out;
}

} // namespace curvetrack
