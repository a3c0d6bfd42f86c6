#include "curvetrack/diagnostics.hpp"

namespace curvetrack {

const char* diagnosticCodeName(DiagnosticCode code) {
    switch (code) {
    case DiagnosticCode::InsufficientData: return "InsufficientData";
    case DiagnosticCode::DegenerateFit: return "DegenerateFit";
    case DiagnosticCode::InvalidSelection: return "InvalidSelection";
    case DiagnosticCode::ParameterOutOfRange: return "ParameterOutOfRange";
    case DiagnosticCode::MethodFallback: return "MethodFallback";
    }
    return "Unknown";
}

} // namespace curvetrack
