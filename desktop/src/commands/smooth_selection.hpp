#pragma once

#include "commands/curve_edit.hpp"
#include "curvetrack/smoothing.hpp"
#include <optional>
#include <string>

namespace curvetrack {

const char* smoothMethodName(SmoothMethod method);
std::optional<SmoothMethod> smoothMethodFromName(const std::string& name);

class SmoothSelectionCommand : public CurveEditCommand {
public:
    SmoothSelectionCommand(IndexSet indices, SmoothMethod method, SmoothParams params = {});
    std::string label() const override { return "SmoothSelection"; }
    std::optional<std::string> diffJson() const override;

protected:
    CurveData apply(const CurveData& curve, Diagnostics* diag) const override;

private:
    IndexSet indices_;
    SmoothMethod method_;
    SmoothParams params_;
};

} // namespace curvetrack
