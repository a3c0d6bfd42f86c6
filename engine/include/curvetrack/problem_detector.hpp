#pragma once

#include "curvetrack/curve_data.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace curvetrack {

enum class ProblemCategory : uint8_t {
    SuddenJump = 0,
    LargeMovement = 1,
    HighAcceleration = 2,
    MediumAcceleration = 3,
    StrongJitter = 4,
    ModerateJitter = 5,
    FrameGap = 6,
};

struct Problem {
    int frame;
    ProblemCategory category;
    double severity;  // [0, 1]
    std::string message;
};

// Defaults are the editor's heuristics, in pixels and frames.
struct DetectorThresholds {
    double jumpHigh {30.0};     // px/frame
    double jumpMedium {10.0};
    double accelHigh {1.5};     // px/frame^2
    double accelMedium {0.5};
    double jitterHigh {8.0};    // mean px from window centroid
    double jitterMedium {3.0};
    int jitterWindow {5};
    int minPoints {5};
};

// Scans a frame-sorted curve for jumps, acceleration spikes, jitter and frame
// gaps. Checks run independently and may report the same frame more than
// once. Sorted by descending severity; empty for fewer than minPoints points.
std::vector<Problem> detectProblems(const CurveData& curve, const DetectorThresholds& thresholds = {});

const char* problemCategoryName(ProblemCategory category);

// Turning angle over mean segment length at each interior point; 0 at the
// ends and where a segment has zero length.
std::vector<double> calculateCurvature(const CurveData& curve);

// Positions reached by a segment whose speed is at least factor * mean speed.
IndexSet findVelocityOutliers(const CurveData& curve, double factor = 2.0);

} // namespace curvetrack
