#pragma once

#include "commands/curve_edit.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace curvetrack {

enum class TransformKind : uint8_t {
    Scale = 0,
    Rotate = 1,
    Offset = 2,
    NormalizeVelocity = 3,
    Smoothness = 4,
};

const char* transformKindName(TransformKind kind);
std::optional<TransformKind> transformKindFromName(const std::string& name);

// Arguments of one batch transform. x and y carry the kind's scalars:
// Scale sx, sy; Rotate degrees; Offset dx, dy; Smoothness factor.
struct TransformParams {
    TransformKind kind {TransformKind::Offset};
    double x {0.0};
    double y {0.0};
    std::optional<Vec2> center;
    std::optional<double> targetVelocity;
};

class TransformSelectionCommand : public CurveEditCommand {
public:
    TransformSelectionCommand(IndexSet indices, TransformParams params);

    static std::unique_ptr<TransformSelectionCommand> scale(IndexSet indices, double sx, double sy,
                                                            std::optional<Vec2> center = std::nullopt);
    static std::unique_ptr<TransformSelectionCommand> rotate(IndexSet indices, double degrees,
                                                             std::optional<Vec2> center = std::nullopt);
    static std::unique_ptr<TransformSelectionCommand> offset(IndexSet indices, double dx, double dy);
    static std::unique_ptr<TransformSelectionCommand> normalizeVelocity(IndexSet indices,
                                                                        std::optional<double> target = std::nullopt);
    static std::unique_ptr<TransformSelectionCommand> smoothness(IndexSet indices, double factor);

    std::string label() const override;
    std::optional<std::string> diffJson() const override;

protected:
    CurveData apply(const CurveData& curve, Diagnostics* diag) const override;

private:
    IndexSet indices_;
    TransformParams params_;
};

} // namespace curvetrack
