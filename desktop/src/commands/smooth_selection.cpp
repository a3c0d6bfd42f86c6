#include "commands/smooth_selection.hpp"
#include "commands/diff_json.hpp"

namespace curvetrack {

const char* smoothMethodName(SmoothMethod method) {
    switch (method) {
    case SmoothMethod::MovingAverage: return "moving_average";
    case SmoothMethod::Gaussian: return "gaussian";
    case SmoothMethod::SavitzkyGolay: return "savitzky_golay";
    }
    return "unknown";
}

std::optional<SmoothMethod> smoothMethodFromName(const std::string& name) {
    if (name == "moving_average") return SmoothMethod::MovingAverage;
    if (name == "gaussian") return SmoothMethod::Gaussian;
    if (name == "savitzky_golay") return SmoothMethod::SavitzkyGolay;
    return std::nullopt;
}

SmoothSelectionCommand::SmoothSelectionCommand(IndexSet indices, SmoothMethod method, SmoothParams params)
    : indices_(std::move(indices)), method_(method), params_(params) {}

CurveData SmoothSelectionCommand::apply(const CurveData& curve, Diagnostics* diag) const {
    return smooth(curve, indices_, method_, params_, diag);
}

std::optional<std::string> SmoothSelectionCommand::diffJson() const {
    return std::string("{\"op\":\"smooth\",\"method\":\"") + smoothMethodName(method_) +
           "\",\"window\":" + std::to_string(params_.windowSize) + ",\"sigma\":" + json_number(params_.sigma) +
           ",\"indices\":" + json_indices(indices_) + "}";
}

} // namespace curvetrack
