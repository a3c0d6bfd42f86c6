#pragma once

#include "curvetrack/command.hpp"
#include "curvetrack/diagnostics.hpp"
#include <optional>
#include <utility>

namespace curvetrack {

// Base for commands that replace the document curve with the result of one
// engine call. The result is computed on the first doAction and reused on
// redo; undo reinstalls the curve seen before the first doAction.
class CurveEditCommand : public ICommand {
public:
    void doAction(CurveDocument& doc, IStorage& store) override;
    void undoAction(CurveDocument& doc, IStorage& store) override;

    // What the engine absorbed while computing the result
    const Diagnostics& diagnostics() const { return diagnostics_; }
    bool changedCurve() const { return before_ && after_ && *before_ != *after_; }

protected:
    virtual CurveData apply(const CurveData& curve, Diagnostics* diag) const = 0;

private:
    std::optional<CurveData> before_;
    std::optional<CurveData> after_;
    Diagnostics diagnostics_;
};

} // namespace curvetrack
