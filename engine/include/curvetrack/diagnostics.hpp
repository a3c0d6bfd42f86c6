#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace curvetrack {

// Conditions the engine absorbs instead of failing. Reported through an
// optional Diagnostics* parameter; results are the same with or without it.
enum class DiagnosticCode : uint8_t {
    InsufficientData = 0,
    DegenerateFit = 1,
    InvalidSelection = 2,
    ParameterOutOfRange = 3,
    MethodFallback = 4,
};

struct Diagnostic {
    DiagnosticCode code;
    int where;  // point index or frame, -1 when the whole call is affected
    std::string message;
};

using Diagnostics = std::vector<Diagnostic>;

const char* diagnosticCodeName(DiagnosticCode code);

inline void report(Diagnostics* diag, DiagnosticCode code, int where, std::string message) {
    if (diag) diag->push_back(Diagnostic{code, where, std::move(message)});
}

} // namespace curvetrack
