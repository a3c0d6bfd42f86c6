#pragma once

#include "commands/curve_edit.hpp"
#include "curvetrack/gap_filling.hpp"
#include <optional>
#include <string>

namespace curvetrack {

const char* fillMethodName(FillMethod method);
std::optional<FillMethod> fillMethodFromName(const std::string& name);

class FillGapCommand : public CurveEditCommand {
public:
    FillGapCommand(int startFrame, int endFrame, FillMethod method, bool preserveEndpoints = true,
                   FillParams params = {});
    std::string label() const override { return "FillGap"; }
    std::optional<std::string> diffJson() const override;

protected:
    CurveData apply(const CurveData& curve, Diagnostics* diag) const override;

private:
    int start_;
    int end_;
    FillMethod method_;
    bool preserve_;
    FillParams params_;
};

} // namespace curvetrack
