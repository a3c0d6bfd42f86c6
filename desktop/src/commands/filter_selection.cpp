#include "commands/filter_selection.hpp"
#include "commands/diff_json.hpp"

namespace curvetrack {

FilterSelectionCommand::FilterSelectionCommand(IndexSet indices, FilterKind kind, FilterParams params)
    : indices_(std::move(indices)), kind_(kind), params_(params) {}

CurveData FilterSelectionCommand::apply(const CurveData& curve, Diagnostics* diag) const {
    return applySmoothingFiltering(curve, indices_, kind_, params_, diag);
}

std::optional<std::string> FilterSelectionCommand::diffJson() const {
    return std::string("{\"op\":\"filter\",\"method\":\"") + filterKindName(kind_) +
           "\",\"window\":" + std::to_string(params_.windowSize) + ",\"sigma\":" + json_number(params_.sigma) +
           ",\"cutoff\":" + json_number(params_.cutoff) + ",\"order\":" + std::to_string(params_.order) +
           ",\"indices\":" + json_indices(indices_) + "}";
}

} // namespace curvetrack
