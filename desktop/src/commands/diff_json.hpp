#pragma once

#include "curvetrack/curve_data.hpp"
#include <cstdio>
#include <string>

namespace curvetrack {

// Writers for the journal's diff_json; the reader side lives in replay.cpp.

inline std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '"': out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out.push_back(c); break;
        }
    }
    return out;
}

// Round-trips exactly through strtod
inline std::string json_number(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

inline std::string json_indices(const IndexSet& indices) {
    std::string s = "[";
    for (size_t i = 0; i < indices.size(); ++i) {
        s += std::to_string(indices[i]);
        if (i + 1 < indices.size()) s += ",";
    }
    s += "]";
    return s;
}

} // namespace curvetrack
