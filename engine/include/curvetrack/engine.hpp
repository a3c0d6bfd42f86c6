#pragma once

// Curve-processing engine: stateless operations on tracked point sequences.
// Every function takes its whole input by const reference and returns a new
// curve; none keeps references or state between calls.

#include "curvetrack/batch_transform.hpp"
#include "curvetrack/curve_data.hpp"
#include "curvetrack/diagnostics.hpp"
#include "curvetrack/extrapolation.hpp"
#include "curvetrack/filtering.hpp"
#include "curvetrack/fitting.hpp"
#include "curvetrack/gap_filling.hpp"
#include "curvetrack/problem_detector.hpp"
#include "curvetrack/smoothing.hpp"
