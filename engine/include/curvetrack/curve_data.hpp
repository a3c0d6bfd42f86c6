#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace curvetrack {

enum class PointStatus : uint8_t {
    Normal = 0,
    Interpolated = 1,
    Keyframe = 2,
    Tracked = 3,
    Endframe = 4,
};

// One tracked sample. status is metadata for the editor and never enters the math.
struct Point {
    int frame {0};
    double x {0.0};
    double y {0.0};
    std::optional<PointStatus> status;
};

inline bool operator==(const Point& a, const Point& b) {
    return a.frame == b.frame && a.x == b.x && a.y == b.y && a.status == b.status;
}
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

struct Vec2 {
    double x {0.0};
    double y {0.0};
};

// Ordered point sequence. Frame-range operations expect it sorted by frame.
using CurveData = std::vector<Point>;

// Positional indices into a CurveData (not frame numbers).
using IndexSet = std::vector<int>;

// Stable sort by frame.
CurveData sortByFrame(const CurveData& curve);

bool isSortedByFrame(const CurveData& curve);

// Keeps the first point seen for each frame, original order otherwise.
CurveData removeDuplicateFrames(const CurveData& curve);

// Overlays added points on base by frame (added wins) and returns the
// result sorted by frame.
CurveData mergePoints(const CurveData& base, const CurveData& added);

// In-range indices, deduplicated and ascending.
IndexSet validIndices(const IndexSet& indices, std::size_t size);

// Mean position of the valid selected points; nullopt if none are valid.
std::optional<Vec2> selectionCentroid(const CurveData& curve, const IndexSet& indices);

} // namespace curvetrack
