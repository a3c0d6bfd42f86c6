#include "commands/transform_selection.hpp"
#include "commands/diff_json.hpp"
#include "curvetrack/batch_transform.hpp"

namespace curvetrack {

const char* transformKindName(TransformKind kind) {
    switch (kind) {
    case TransformKind::Scale: return "scale";
    case TransformKind::Rotate: return "rotate";
    case TransformKind::Offset: return "offset";
    case TransformKind::NormalizeVelocity: return "normalize_velocity";
    case TransformKind::Smoothness: return "smoothness";
    }
    return "unknown";
}

std::optional<TransformKind> transformKindFromName(const std::string& name) {
    if (name == "scale") return TransformKind::Scale;
    if (name == "rotate") return TransformKind::Rotate;
    if (name == "offset") return TransformKind::Offset;
    if (name == "normalize_velocity") return TransformKind::NormalizeVelocity;
    if (name == "smoothness") return TransformKind::Smoothness;
    return std::nullopt;
}

TransformSelectionCommand::TransformSelectionCommand(IndexSet indices, TransformParams params)
    : indices_(std::move(indices)), params_(params) {}

std::unique_ptr<TransformSelectionCommand> TransformSelectionCommand::scale(IndexSet indices, double sx, double sy,
                                                                            std::optional<Vec2> center) {
    TransformParams p;
    p.kind = TransformKind::Scale;
    p.x = sx;
    p.y = sy;
    p.center = center;
    return std::make_unique<TransformSelectionCommand>(std::move(indices), p);
}

std::unique_ptr<TransformSelectionCommand> TransformSelectionCommand::rotate(IndexSet indices, double degrees,
                                                                             std::optional<Vec2> center) {
    TransformParams p;
    p.kind = TransformKind::Rotate;
    p.x = degrees;
    p.center = center;
    return std::make_unique<TransformSelectionCommand>(std::move(indices), p);
}

std::unique_ptr<TransformSelectionCommand> TransformSelectionCommand::offset(IndexSet indices, double dx, double dy) {
    TransformParams p;
    p.kind = TransformKind::Offset;
    p.x = dx;
    p.y = dy;
    return std::make_unique<TransformSelectionCommand>(std::move(indices), p);
}

std::unique_ptr<TransformSelectionCommand> TransformSelectionCommand::normalizeVelocity(IndexSet indices,
                                                                                        std::optional<double> target) {
    TransformParams p;
    p.kind = TransformKind::NormalizeVelocity;
    p.targetVelocity = target;
    return std::make_unique<TransformSelectionCommand>(std::move(indices), p);
}

std::unique_ptr<TransformSelectionCommand> TransformSelectionCommand::smoothness(IndexSet indices, double factor) {
    TransformParams p;
    p.kind = TransformKind::Smoothness;
    p.x = factor;
    return std::make_unique<TransformSelectionCommand>(std::move(indices), p);
}

std::string TransformSelectionCommand::label() const {
    switch (params_.kind) {
    case TransformKind::Scale: return "ScaleSelection";
    case TransformKind::Rotate: return "RotateSelection";
    case TransformKind::Offset: return "OffsetSelection";
    case TransformKind::NormalizeVelocity: return "NormalizeVelocity";
    case TransformKind::Smoothness: return "AdjustSmoothness";
    }
    return "TransformSelection";
}

CurveData TransformSelectionCommand::apply(const CurveData& curve, Diagnostics* diag) const {
    switch (params_.kind) {
    case TransformKind::Scale:
        return scalePoints(curve, indices_, params_.x, params_.y, params_.center, diag);
    case TransformKind::Rotate:
        return rotatePoints(curve, indices_, params_.x, params_.center, diag);
    case TransformKind::Offset:
        return offsetPoints(curve, indices_, params_.x, params_.y, diag);
    case TransformKind::NormalizeVelocity:
        return curvetrack::normalizeVelocity(curve, indices_, params_.targetVelocity, diag);
    case TransformKind::Smoothness:
        return adjustSmoothness(curve, indices_, params_.x, diag);
    }
    return curve;
}

std::optional<std::string> TransformSelectionCommand::diffJson() const {
    std::string s = std::string("{\"op\":\"transform\",\"kind\":\"") + transformKindName(params_.kind) +
                    "\",\"x\":" + json_number(params_.x) + ",\"y\":" + json_number(params_.y);
    if (params_.center) {
        s += ",\"cx\":" + json_number(params_.center->x) + ",\"cy\":" + json_number(params_.center->y);
    }
    if (params_.targetVelocity) s += ",\"target\":" + json_number(*params_.targetVelocity);
    s += ",\"indices\":" + json_indices(indices_) + "}";
    return s;
}

} // namespace curvetrack
