#pragma once

#include "commands/curve_edit.hpp"
#include "curvetrack/extrapolation.hpp"
#include <optional>
#include <string>

namespace curvetrack {

const char* extrapolateMethodName(ExtrapolateMethod method);
std::optional<ExtrapolateMethod> extrapolateMethodFromName(const std::string& name);

class ExtrapolateCommand : public CurveEditCommand {
public:
    ExtrapolateCommand(int numFrames, ExtrapolateMethod method, int fitPoints = 5,
                       ExtrapolateDirection direction = ExtrapolateDirection::Forward);
    std::string label() const override { return "Extrapolate"; }
    std::optional<std::string> diffJson() const override;

protected:
    CurveData apply(const CurveData& curve, Diagnostics* diag) const override;

private:
    int frames_;
    ExtrapolateMethod method_;
    int fit_points_;
    ExtrapolateDirection direction_;
};

} // namespace curvetrack
