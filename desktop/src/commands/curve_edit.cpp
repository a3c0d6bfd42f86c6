#include "commands/curve_edit.hpp"

namespace curvetrack {

void CurveEditCommand::doAction(CurveDocument& doc, IStorage& store) {
    (void)store;
    if (!after_) {
        diagnostics_.clear();
        before_ = doc.curve();
        after_ = apply(*before_, &diagnostics_);
    }
    doc.setCurve(*after_);
}

void CurveEditCommand::undoAction(CurveDocument& doc, IStorage& store) {
    (void)store;
    if (before_) doc.setCurve(*before_);
}

} // namespace curvetrack
