#include "curvetrack/replay.hpp"
#include "commands/extrapolate.hpp"
#include "commands/fill_gap.hpp"
#include "commands/filter_selection.hpp"
#include "commands/smooth_selection.hpp"
#include "commands/transform_selection.hpp"
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace curvetrack {

// Position of the first character of key's value, or npos
static size_t value_pos(const std::string& json, const std::string& key) {
    const std::string needle = std::string("\"") + key + "\"";
    auto k = json.find(needle);
    if (k == std::string::npos) return std::string::npos;
    auto colon = json.find(':', k + needle.size());
    if (colon == std::string::npos) return std::string::npos;
    size_t i = colon + 1;
    while (i < json.size() && std::isspace(static_cast<unsigned char>(json[i]))) ++i;
    return i < json.size() ? i : std::string::npos;
}

static bool has_key(const std::string& json, const std::string& key) {
    return value_pos(json, key) != std::string::npos;
}

static std::string get_string(const std::string& json, const std::string& key) {
    auto q = value_pos(json, key);
    if (q == std::string::npos || json[q] != '"') return {};
    std::string out;
    for (size_t i = q + 1; i < json.size(); ++i) {
        char c = json[i];
        if (c == '\\') {
            if (i + 1 < json.size()) {
                char n = json[++i];
                switch (n) {
                case '\\': out.push_back('\\'); break;
                case '"': out.push_back('"'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                default: out.push_back(n); break;
                }
            }
            continue;
        }
        if (c == '"') break;
        out.push_back(c);
    }
    return out;
}

static double get_double(const std::string& json, const std::string& key) {
    auto i = value_pos(json, key);
    if (i == std::string::npos) throw std::invalid_argument("journal entry is missing \"" + key + "\"");
    const char* begin = json.c_str() + i;
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin) throw std::invalid_argument("journal field \"" + key + "\" is not a number");
    return v;
}

static int get_int(const std::string& json, const std::string& key) {
    auto i = value_pos(json, key);
    if (i == std::string::npos) throw std::invalid_argument("journal entry is missing \"" + key + "\"");
    int sign = 1;
    if (i < json.size() && (json[i] == '-' || json[i] == '+')) {
        if (json[i] == '-') sign = -1;
        ++i;
    }
    if (i >= json.size() || !std::isdigit(static_cast<unsigned char>(json[i]))) {
        throw std::invalid_argument("journal field \"" + key + "\" is not an integer");
    }
    int val = 0;
    while (i < json.size() && std::isdigit(static_cast<unsigned char>(json[i]))) {
        val = val * 10 + (json[i] - '0');
        ++i;
    }
    return sign * val;
}

static bool get_bool(const std::string& json, const std::string& key, bool fallback) {
    auto i = value_pos(json, key);
    if (i == std::string::npos) return fallback;
    return json.compare(i, 4, "true") == 0;
}

static IndexSet get_indices(const std::string& json) {
    IndexSet out;
    auto lb = value_pos(json, "indices");
    if (lb == std::string::npos || json[lb] != '[') {
        throw std::invalid_argument("journal entry is missing \"indices\"");
    }
    auto rb = json.find(']', lb);
    if (rb == std::string::npos) throw std::invalid_argument("unterminated \"indices\" array");
    const char* p = json.c_str() + lb + 1;
    const char* stop = json.c_str() + rb;
    while (p < stop) {
        char* end = nullptr;
        long v = std::strtol(p, &end, 10);
        if (end == p) {
            ++p; // separator
            continue;
        }
        out.push_back(static_cast<int>(v));
        p = end;
    }
    return out;
}

template <typename E>
static E require(const std::optional<E>& v, const std::string& what, const std::string& name) {
    if (!v) throw std::invalid_argument("unknown " + what + " '" + name + "' in journal");
    return *v;
}

static void replay_one(CommandStack& stack, const std::string& json);

static void replay_batch(CommandStack& stack, const std::string& json) {
    // naive scan for items array
    const std::string tag = "\"items\":";
    auto p = json.find(tag);
    if (p == std::string::npos) return;
    auto lb = json.find('[', p + tag.size());
    if (lb == std::string::npos) return;
    auto rb = json.rfind(']');
    if (rb == std::string::npos || rb <= lb) return;
    std::string items = json.substr(lb + 1, rb - lb - 1);
    // split on commas between top-level objects; arrays only occur inside them
    size_t depth = 0;
    size_t start = 0;
    for (size_t i = 0; i <= items.size(); ++i) {
        if (i == items.size() || (items[i] == ',' && depth == 0)) {
            std::string obj = items.substr(start, i - start);
            if (!obj.empty()) replay_one(stack, obj);
            start = i + 1;
        } else if (items[i] == '{') {
            ++depth;
        } else if (items[i] == '}') {
            if (depth > 0) --depth;
        }
    }
}

static void replay_one(CommandStack& stack, const std::string& json) {
    const auto op = get_string(json, "op");
    if (op == "smooth") {
        const auto name = get_string(json, "method");
        SmoothParams params;
        params.windowSize = get_int(json, "window");
        params.sigma = get_double(json, "sigma");
        stack.execute(std::make_unique<SmoothSelectionCommand>(
            get_indices(json), require(smoothMethodFromName(name), "smoothing method", name), params));
    } else if (op == "filter") {
        const auto name = get_string(json, "method");
        FilterParams params;
        params.windowSize = get_int(json, "window");
        params.sigma = get_double(json, "sigma");
        params.cutoff = get_double(json, "cutoff");
        params.order = get_int(json, "order");
        stack.execute(std::make_unique<FilterSelectionCommand>(
            get_indices(json), require(filterKindFromName(name), "filter", name), params));
    } else if (op == "fill_gap") {
        const auto name = get_string(json, "method");
        FillParams params;
        params.tension = get_double(json, "tension");
        params.windowSize = get_int(json, "window");
        params.accelWeight = get_double(json, "accel_weight");
        stack.execute(std::make_unique<FillGapCommand>(get_int(json, "start"), get_int(json, "end"),
                                                       require(fillMethodFromName(name), "fill method", name),
                                                       get_bool(json, "preserve", true), params));
    } else if (op == "extrapolate") {
        const auto name = get_string(json, "method");
        const auto dir = get_string(json, "direction");
        if (dir != "forward" && dir != "backward") {
            throw std::invalid_argument("unknown extrapolation direction '" + dir + "' in journal");
        }
        stack.execute(std::make_unique<ExtrapolateCommand>(
            get_int(json, "frames"), require(extrapolateMethodFromName(name), "extrapolation method", name),
            get_int(json, "fit_points"),
            dir == "forward" ? ExtrapolateDirection::Forward : ExtrapolateDirection::Backward));
    } else if (op == "transform") {
        const auto name = get_string(json, "kind");
        TransformParams params;
        params.kind = require(transformKindFromName(name), "transform", name);
        params.x = get_double(json, "x");
        params.y = get_double(json, "y");
        if (has_key(json, "cx")) params.center = Vec2{get_double(json, "cx"), get_double(json, "cy")};
        if (has_key(json, "target")) params.targetVelocity = get_double(json, "target");
        stack.execute(std::make_unique<TransformSelectionCommand>(get_indices(json), params));
    } else if (op == "undo") {
        if (!stack.canUndo()) throw std::invalid_argument("journal undoes past the first entry");
        stack.undo();
    } else if (op == "redo") {
        if (!stack.canRedo()) throw std::invalid_argument("journal redoes with nothing to redo");
        stack.redo();
    } else if (op == "batch") {
        // Reconstruct a batch by executing items within begin/endBatch
        stack.beginBatch(get_string(json, "label"));
        try {
            replay_batch(stack, json);
        } catch (...) {
            stack.cancelBatch();
            throw;
        }
        stack.endBatch();
    } else {
        throw std::invalid_argument("unknown journal op '" + op + "'");
    }
}

void restore_from_revisions(CommandStack& stack, const std::vector<RevisionRecord>& records) {
    const bool journaling = stack.journaling();
    stack.setJournaling(false);
    try {
        for (const auto& r : records) {
            replay_one(stack, r.diff_json);
        }
    } catch (...) {
        stack.setJournaling(journaling);
        throw;
    }
    stack.setJournaling(journaling);
}

} // namespace curvetrack
