#include "commands/fill_gap.hpp"
#include "commands/diff_json.hpp"

namespace curvetrack {

const char* fillMethodName(FillMethod method) {
    switch (method) {
    case FillMethod::Linear: return "linear";
    case FillMethod::CubicSpline: return "cubic_spline";
    case FillMethod::ConstantVelocity: return "constant_velocity";
    case FillMethod::AcceleratedMotion: return "accelerated_motion";
    case FillMethod::Average: return "average";
    }
    return "unknown";
}

std::optional<FillMethod> fillMethodFromName(const std::string& name) {
    if (name == "linear") return FillMethod::Linear;
    if (name == "cubic_spline") return FillMethod::CubicSpline;
    if (name == "constant_velocity") return FillMethod::ConstantVelocity;
    if (name == "accelerated_motion") return FillMethod::AcceleratedMotion;
    if (name == "average") return FillMethod::Average;
    return std::nullopt;
}

FillGapCommand::FillGapCommand(int startFrame, int endFrame, FillMethod method, bool preserveEndpoints,
                               FillParams params)
    : start_(startFrame), end_(endFrame), method_(method), preserve_(preserveEndpoints), params_(params) {}

CurveData FillGapCommand::apply(const CurveData& curve, Diagnostics* diag) const {
    return fillGap(curve, start_, end_, method_, preserve_, params_, diag);
}

std::optional<std::string> FillGapCommand::diffJson() const {
    return std::string("{\"op\":\"fill_gap\",\"method\":\"") + fillMethodName(method_) +
           "\",\"start\":" + std::to_string(start_) + ",\"end\":" + std::to_string(end_) +
           ",\"preserve\":" + (preserve_ ? "true" : "false") + ",\"tension\":" + json_number(params_.tension) +
           ",\"window\":" + std::to_string(params_.windowSize) +
           ",\"accel_weight\":" + json_number(params_.accelWeight) + "}";
}

} // namespace curvetrack
