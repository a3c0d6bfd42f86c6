#include "curvetrack/curve_data.hpp"
#include <algorithm>
#include <map>

namespace curvetrack {

CurveData sortByFrame(const CurveData& curve) {
    CurveData out = curve;
    std::stable_sort(out.begin(), out.end(), [](const Point& a, const Point& b) { return a.frame < b.frame; });
    return out;
}

bool isSortedByFrame(const CurveData& curve) {
    return std::is_sorted(curve.begin(), curve.end(), [](const Point& a, const Point& b) { return a.frame < b.frame; });
}

CurveData removeDuplicateFrames(const CurveData& curve) {
    CurveData out;
    out.reserve(curve.size());
    std::vector<int> seen;
    seen.reserve(curve.size());
    for (const auto& p : curve) {
        auto it = std::lower_bound(seen.begin(), seen.end(), p.frame);
        if (it != seen.end() && *it == p.frame) continue;
        seen.insert(it, p.frame);
        out.push_back(p);
    }
    return out;
}

CurveData mergePoints(const CurveData& base, const CurveData& added) {
    std::map<int, Point> byFrame;
    for (const auto& p : base) byFrame[p.frame] = p;
    for (const auto& p : added) byFrame[p.frame] = p;
    CurveData out;
    out.reserve(byFrame.size());
    for (auto& kv : byFrame) out.push_back(kv.second);
    return out;
}

IndexSet validIndices(const IndexSet& indices, std::size_t size) {
    IndexSet out;
    out.reserve(indices.size());
    for (int i : indices) {
        if (i >= 0 && static_cast<std::size_t>(i) < size) out.push_back(i);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::optional<Vec2> selectionCentroid(const CurveData& curve, const IndexSet& indices) {
    const IndexSet valid = validIndices(indices, curve.size());
    if (valid.empty()) return std::nullopt;
    Vec2 c;
    for (int i : valid) {
        c.x += curve[static_cast<std::size_t>(i)].x;
        c.y += curve[static_cast<std::size_t>(i)].y;
    }
    c.x /= double(valid.size());
    c.y /= double(valid.size());
    return c;
}

} // namespace curvetrack
