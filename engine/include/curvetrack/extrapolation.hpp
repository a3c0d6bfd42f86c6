#pragma once

#include "curvetrack/curve_data.hpp"
#include "curvetrack/diagnostics.hpp"
#include <cstdint>

namespace curvetrack {

enum class ExtrapolateMethod : uint8_t {
    Linear = 0,        // velocity of the two outermost points
    LastVelocity = 1,  // mean velocity over the outermost fitPoints points
    Quadratic = 2,     // least-squares quadratic over the outermost fitPoints points
};

enum class ExtrapolateDirection : uint8_t {
    Forward = 0,   // frames after the last point
    Backward = 1,  // frames before the first point
};

// Adds numFrames points past the end (or before the start) of a frame-sorted
// curve. Generated points are marked Interpolated and merged by frame.
CurveData extrapolate(const CurveData& curve,
                      int numFrames,
                      ExtrapolateMethod method,
                      int fitPoints = 5,
                      ExtrapolateDirection direction = ExtrapolateDirection::Forward,
                      Diagnostics* diag = nullptr);

inline CurveData extrapolateForward(const CurveData& curve, int numFrames, ExtrapolateMethod method,
                                    int fitPoints = 5, Diagnostics* diag = nullptr) {
    return extrapolate(curve, numFrames, method, fitPoints, ExtrapolateDirection::Forward, diag);
}

inline CurveData extrapolateBackward(const CurveData& curve, int numFrames, ExtrapolateMethod method,
                                     int fitPoints = 5, Diagnostics* diag = nullptr) {
    return extrapolate(curve, numFrames, method, fitPoints, ExtrapolateDirection::Backward, diag);
}

} // namespace curvetrack
