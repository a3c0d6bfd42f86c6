#pragma once

#include "commands/curve_edit.hpp"
#include "curvetrack/filtering.hpp"
#include <string>

namespace curvetrack {

// Any smoothing or filtering method, dispatched by FilterKind.
class FilterSelectionCommand : public CurveEditCommand {
public:
    FilterSelectionCommand(IndexSet indices, FilterKind kind, FilterParams params = {});
    std::string label() const override { return "FilterSelection"; }
    std::optional<std::string> diffJson() const override;

protected:
    CurveData apply(const CurveData& curve, Diagnostics* diag) const override;

private:
    IndexSet indices_;
    FilterKind kind_;
    FilterParams params_;
};

} // namespace curvetrack
