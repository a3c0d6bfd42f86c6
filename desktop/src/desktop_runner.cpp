#include "curvetrack/command.hpp"
#include "curvetrack/db.hpp"
#include "curvetrack/problem_detector.hpp"
#include "curvetrack/replay.hpp"
#include "commands/extrapolate.hpp"
#include "commands/fill_gap.hpp"
#include "commands/filter_selection.hpp"
#include "commands/smooth_selection.hpp"
#include "commands/transform_selection.hpp"
#include <cmath>
#include <iostream>
#include <numeric>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>

using namespace curvetrack;

static std::optional<std::string> get_arg(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (flag == argv[i]) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

static bool has_flag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) return true;
    }
    return false;
}

// A noisy circular track with one tracking glitch and a hole of 10 frames
// in the middle.
static CurveData synthetic_track(int frames, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, 1.5);
    const int holeStart = frames / 2;
    CurveData curve;
    for (int f = 0; f < frames; ++f) {
        if (f >= holeStart && f < holeStart + 10) continue;
        const double t = f * 0.05;
        Point p{f, 640.0 + 200.0 * std::cos(t) + noise(rng), 360.0 + 200.0 * std::sin(t) + noise(rng),
                PointStatus::Tracked};
        if (f == frames / 4) p.x += 80.0;
        curve.push_back(p);
    }
    if (!curve.empty()) {
        curve.front().status = PointStatus::Keyframe;
        curve.back().status = PointStatus::Keyframe;
    }
    return curve;
}

static IndexSet all_indices(const CurveDocument& doc) {
    IndexSet out(doc.curve().size());
    std::iota(out.begin(), out.end(), 0);
    return out;
}

static void report_problems(const char* when, const CurveData& curve) {
    const auto problems = detectProblems(curve);
    std::cout << when << ": " << problems.size() << " problems\n";
    for (size_t i = 0; i < problems.size() && i < 5; ++i) {
        const auto& p = problems[i];
        std::cout << "  frame " << p.frame << " " << problemCategoryName(p.category) << " severity "
                  << p.severity << ": " << p.message << "\n";
    }
}

static void report_diagnostics(const CurveEditCommand& cmd) {
    for (const auto& d : cmd.diagnostics()) {
        std::cerr << cmd.label() << ": " << diagnosticCodeName(d.code) << " at " << d.where << ": " << d.message
                  << "\n";
    }
}

int main(int argc, char** argv) {
    // Demo runner: cleans up a synthetic track through the command stack, journaling
    // to SQLite when --db is provided
    int frames = 200;
    unsigned seed = 7;
    try {
        if (auto v = get_arg(argc, argv, "--frames")) frames = std::stoi(*v);
        if (auto v = get_arg(argc, argv, "--seed")) seed = static_cast<unsigned>(std::stoul(*v));
    } catch (const std::exception&) {
        std::cerr << "usage: curvetrack_runner [--db <path> [--restore]] [--frames <n>] [--seed <n>]\n"
                     "  --restore replays the journal and reports the curve without editing it\n";
        return 2;
    }
    if (frames < 40) {
        std::cerr << "--frames must be at least 40\n";
        return 2;
    }

    const bool restore = has_flag(argc, argv, "--restore");
    std::unique_ptr<IStorage> storage;
    if (auto db = get_arg(argc, argv, "--db")) {
#if CURVETRACK_DESKTOP_SQLITE
        try {
            storage = std::make_unique<SqliteStorage>(*db);
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
#else
        (void)restore;
        std::cerr << "SQLite not enabled; rebuild with -DENABLE_SQLITE=ON\n";
        return 2;
#endif
    } else {
        storage = std::make_unique<NullStorage>();
    }

    CurveDocument doc(synthetic_track(frames, seed));
    CommandStack stack(doc, *storage);
    std::cout << "Track: " << doc.curve().size() << " points\n";

#if CURVETRACK_DESKTOP_SQLITE
    if (restore) {
        if (auto* sql = dynamic_cast<SqliteStorage*>(storage.get())) {
            auto revs = sql->readRevisions();
            try {
                restore_from_revisions(stack, revs);
            } catch (const std::exception& e) {
                std::cerr << "Restore stopped: " << e.what() << "\n";
                return 1;
            }
            std::cout << "Restored from revisions: " << revs.size() << " entries, "
                      << doc.curve().size() << " points\n";
            // the journal already holds the demo edits; running them again would duplicate it
            report_problems("Restored", doc.curve());
            return 0;
        }
    }
#endif

    report_problems("Before", doc.curve());

    const int holeStart = frames / 2;
    try {
        stack.beginBatch("Clean up track");
        auto median = std::make_unique<FilterSelectionCommand>(all_indices(doc), FilterKind::Median);
        auto* medianCmd = median.get();
        stack.execute(std::move(median));
        report_diagnostics(*medianCmd);

        auto smoothCmd = std::make_unique<SmoothSelectionCommand>(all_indices(doc), SmoothMethod::Gaussian,
                                                                  SmoothParams{5, 1.5});
        auto* smoothPtr = smoothCmd.get();
        stack.execute(std::move(smoothCmd));
        report_diagnostics(*smoothPtr);

        auto fill = std::make_unique<FillGapCommand>(holeStart, holeStart + 9, FillMethod::CubicSpline);
        auto* fillPtr = fill.get();
        stack.execute(std::move(fill));
        report_diagnostics(*fillPtr);
        stack.endBatch();
    } catch (const std::exception& e) {
        stack.cancelBatch();
        std::cerr << "Clean up failed: " << e.what() << "\n";
        return 1;
    }
    std::cout << "Executed " << stack.undoLabel() << ": " << doc.curve().size() << " points\n";

    try {
        auto extend = std::make_unique<ExtrapolateCommand>(10, ExtrapolateMethod::Quadratic, 8);
        auto* extendPtr = extend.get();
        stack.execute(std::move(extend));
        report_diagnostics(*extendPtr);
        std::cout << "Executed Extrapolate: " << doc.curve().size() << " points\n";

        stack.execute(TransformSelectionCommand::smoothness(all_indices(doc), 0.3));
        std::cout << "Executed " << stack.undoLabel() << "\n";

        report_problems("After", doc.curve());

        if (stack.canUndo()) {
            stack.undo();
            std::cout << "Undo\n";
            stack.redo();
            std::cout << "Redo\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Edit failed: " << e.what() << "\n";
        return 1;
    }
#if CURVETRACK_DESKTOP_SQLITE
    if (auto* sql = dynamic_cast<SqliteStorage*>(storage.get())) {
        std::cout << "Journal: " << sql->revisionCount() << " revisions in " << sql->dbPath() << "\n";
    }
#endif
    return 0;
}
