#include "commands/extrapolate.hpp"

namespace curvetrack {

const char* extrapolateMethodName(ExtrapolateMethod method) {
    switch (method) {
    case ExtrapolateMethod::Linear: return "linear";
    case ExtrapolateMethod::LastVelocity: return "last_velocity";
    case ExtrapolateMethod::Quadratic: return "quadratic";
    }
    return "unknown";
}

std::optional<ExtrapolateMethod> extrapolateMethodFromName(const std::string& name) {
    if (name == "linear") return ExtrapolateMethod::Linear;
    if (name == "last_velocity") return ExtrapolateMethod::LastVelocity;
    if (name == "quadratic") return ExtrapolateMethod::Quadratic;
    return std::nullopt;
}

ExtrapolateCommand::ExtrapolateCommand(int numFrames, ExtrapolateMethod method, int fitPoints,
                                       ExtrapolateDirection direction)
    : frames_(numFrames), method_(method), fit_points_(fitPoints), direction_(direction) {}

CurveData ExtrapolateCommand::apply(const CurveData& curve, Diagnostics* diag) const {
    return extrapolate(curve, frames_, method_, fit_points_, direction_, diag);
}

std::optional<std::string> ExtrapolateCommand::diffJson() const {
    return std::string("{\"op\":\"extrapolate\",\"method\":\"") + extrapolateMethodName(method_) +
           "\",\"frames\":" + std::to_string(frames_) + ",\"fit_points\":" + std::to_string(fit_points_) +
           ",\"direction\":\"" + (direction_ == ExtrapolateDirection::Forward ? "forward" : "backward") + "\"}";
}

} // namespace curvetrack
