#include "commands/extrapolate.hpp"
#include "commands/fill_gap.hpp"
#include "commands/filter_selection.hpp"
#include "commands/smooth_selection.hpp"
#include "commands/transform_selection.hpp"
#include "curvetrack/command.hpp"
#include "curvetrack/replay.hpp"
#include <cassert>
#include <stdexcept>
#include <string>

using namespace curvetrack;

// Counts transactions and keeps every revision written
struct RecordingStorage : public IStorage {
    int begins {0};
    int commits {0};
    int rollbacks {0};
    std::vector<RevisionRecord> revisions;
    void begin() override { ++begins; }
    void commit() override { ++commits; }
    void rollback() override { ++rollbacks; }
    void addRevision(const RevisionRecord& r) override { revisions.push_back(r); }
};

// Scribbles on the document, then fails
struct FailingCommand : public ICommand {
    std::string label() const override { return "Failing"; }
    void doAction(CurveDocument& doc, IStorage&) override {
        doc.setCurve(CurveData{});
        throw std::runtime_error("boom");
    }
    void undoAction(CurveDocument&, IStorage&) override {}
};

static CurveData spike() {
    return CurveData{{0, 0.0, 0.0, PointStatus::Keyframe}, {1, 0.0, 0.0, {}}, {2, 9.0, 9.0, {}},
                     {3, 0.0, 0.0, {}}, {4, 0.0, 0.0, PointStatus::Keyframe}};
}

static CurveData holey() {
    CurveData c;
    for (int f = 0; f < 20; ++f) {
        if (f >= 8 && f < 12) continue;
        c.push_back(Point{f, f * 2.0 + (f % 3), f * 0.5 - (f % 2), PointStatus::Tracked});
    }
    return c;
}

static bool contains(const std::string& s, const char* needle) { return s.find(needle) != std::string::npos; }

int main() {
    // Execute, undo, redo
    {
        RecordingStorage store;
        CurveDocument doc(spike());
        CommandStack stack(doc, store);
        stack.execute(std::make_unique<SmoothSelectionCommand>(IndexSet{2}, SmoothMethod::MovingAverage,
                                                               SmoothParams{3, 1.0}));
        assert(doc.curve()[2].x == 3.0 && doc.curve()[2].y == 3.0);
        assert(store.begins == 1 && store.commits == 1 && store.rollbacks == 0);
        assert(store.revisions.size() == 1);
        assert(store.revisions[0].label == "SmoothSelection");
        assert(contains(store.revisions[0].diff_json, "\"op\":\"smooth\""));
        assert(contains(store.revisions[0].diff_json, "\"method\":\"moving_average\""));
        assert(stack.undoLabel() == "SmoothSelection");

        assert(doc.revision() == 1);

        stack.undo();
        assert(doc.curve() == spike());
        assert(doc.revision() == 2);
        assert(!stack.canUndo() && stack.canRedo());
        stack.redo();
        assert(doc.curve()[2].x == 3.0);
        assert(doc.revision() == 3);
        assert(store.revisions.size() == 3);
        assert(store.revisions[1].label == "Undo SmoothSelection");
        assert(store.revisions[1].diff_json == "{\"op\":\"undo\"}");
        assert(store.revisions[2].label == "Redo SmoothSelection");
        assert(store.revisions[2].diff_json == "{\"op\":\"redo\"}");
        assert(store.commits == 3);

        // a new command clears redo
        stack.undo();
        stack.execute(TransformSelectionCommand::offset(IndexSet{0}, 1.0, 0.0));
        assert(!stack.canRedo());
        assert(doc.curve()[0].x == 1.0 && doc.curve()[2].x == 9.0);
    }

    // Engine diagnostics stay with the command
    {
        CurveDocument doc(spike());
        NullStorage store;
        CommandStack stack(doc, store);
        auto fill = std::make_unique<FillGapCommand>(5, 8, FillMethod::Linear);
        auto* fillPtr = fill.get();
        stack.execute(std::move(fill));
        assert(doc.curve() == spike());
        assert(!fillPtr->changedCurve());
        assert(fillPtr->diagnostics().size() == 1);
        assert(fillPtr->diagnostics()[0].code == DiagnosticCode::InsufficientData);
        assert(stack.canUndo());
    }

    // Batches collapse into one undo step and one revision
    {
        RecordingStorage store;
        CurveDocument doc(holey());
        CommandStack stack(doc, store);
        stack.beginBatch("Cleanup \"A\"");
        assert(stack.inBatch());
        bool threw = false;
        try {
            stack.beginBatch("nested");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        threw = false;
        try {
            stack.undo();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        stack.execute(std::make_unique<FillGapCommand>(8, 11, FillMethod::CubicSpline));
        stack.execute(std::make_unique<ExtrapolateCommand>(3, ExtrapolateMethod::Linear));
        assert(store.revisions.empty());
        stack.endBatch();
        assert(!stack.inBatch());
        assert(doc.curve().size() == 23);
        assert(store.begins == 1 && store.commits == 1);
        assert(store.revisions.size() == 1);
        assert(store.revisions[0].label == "Cleanup \"A\"");
        assert(contains(store.revisions[0].diff_json, "{\"op\":\"batch\""));
        assert(contains(store.revisions[0].diff_json, "\"op\":\"fill_gap\""));
        assert(contains(store.revisions[0].diff_json, "\"op\":\"extrapolate\""));
        assert(stack.undoLabel() == "Cleanup \"A\"");
        stack.undo();
        assert(doc.curve() == holey());
        assert(!stack.canUndo());
        stack.redo();
        assert(doc.curve().size() == 23);

        // an empty batch leaves nothing behind
        stack.beginBatch("empty");
        stack.endBatch();
        assert(store.rollbacks == 1);
        assert(stack.undoLabel() == "Cleanup \"A\"");
    }

    // Failures roll back and restore the document
    {
        RecordingStorage store;
        CurveDocument doc(spike());
        CommandStack stack(doc, store);
        bool threw = false;
        try {
            stack.execute(std::make_unique<FailingCommand>());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        assert(doc.curve() == spike());
        assert(store.rollbacks == 1 && store.commits == 0);
        assert(!stack.canUndo());

        stack.beginBatch("Doomed");
        stack.execute(TransformSelectionCommand::scale(IndexSet{0, 1, 2}, 2.0, 2.0));
        assert(doc.curve() != spike());
        threw = false;
        try {
            stack.execute(std::make_unique<FailingCommand>());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        assert(doc.curve() == spike());
        assert(store.rollbacks == 2);
        threw = false;
        try {
            stack.execute(TransformSelectionCommand::offset(IndexSet{0}, 1.0, 1.0));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        stack.endBatch();
        assert(!stack.inBatch() && !stack.canUndo());
        assert(store.revisions.empty());

        // cancelling keeps nothing either
        stack.beginBatch("Cancelled");
        stack.execute(TransformSelectionCommand::rotate(IndexSet{2}, 90.0, Vec2{0.0, 0.0}));
        stack.cancelBatch();
        assert(doc.curve() == spike());
        assert(store.rollbacks == 3);
        assert(!stack.canUndo());
    }

    // Replaying the journal rebuilds the same curve without writing to it
    {
        RecordingStorage store;
        CurveDocument doc(holey());
        CommandStack stack(doc, store);
        stack.execute(std::make_unique<FilterSelectionCommand>(IndexSet{0, 1, 2, 3, 4, 5}, FilterKind::Butterworth,
                                                               FilterParams{5, 1.0, 0.3, 2}));
        stack.beginBatch("Fill and nudge");
        stack.execute(std::make_unique<FillGapCommand>(8, 11, FillMethod::AcceleratedMotion, true,
                                                       FillParams{0.5, 3, 0.75}));
        stack.execute(TransformSelectionCommand::scale(IndexSet{8, 9, 10}, 1.1, 0.9, Vec2{1.0 / 3.0, -2.5}));
        stack.endBatch();
        stack.execute(std::make_unique<ExtrapolateCommand>(4, ExtrapolateMethod::Quadratic, 6,
                                                           ExtrapolateDirection::Backward));
        stack.execute(TransformSelectionCommand::normalizeVelocity(IndexSet{12, 13, 14, 15}, 2.5));
        stack.execute(TransformSelectionCommand::smoothness(IndexSet{3, 4, 5}, 0.4));
        stack.execute(std::make_unique<SmoothSelectionCommand>(IndexSet{6, 7, 8, 9, 10}, SmoothMethod::SavitzkyGolay));
        assert(store.revisions.size() == 6);

        RecordingStorage replayStore;
        CurveDocument copy(holey());
        CommandStack replayStack(copy, replayStore);
        restore_from_revisions(replayStack, store.revisions);
        assert(copy.curve() == doc.curve());
        assert(replayStore.revisions.empty());
        assert(replayStack.journaling());
        replayStack.undo(); // last command comes back as its own undo step
        replayStack.undo();
        replayStack.undo();
        replayStack.undo();
        replayStack.undo(); // the batch
        replayStack.undo();
        assert(copy.curve() == holey());
        assert(!replayStack.canUndo());
    }

    // Undone edits stay undone after a replay
    {
        RecordingStorage store;
        CurveDocument doc(spike());
        CommandStack stack(doc, store);
        stack.execute(TransformSelectionCommand::offset(IndexSet{0}, 100.0, 0.0));
        stack.undo();
        stack.execute(std::make_unique<SmoothSelectionCommand>(IndexSet{2}, SmoothMethod::MovingAverage,
                                                               SmoothParams{3, 1.0}));
        stack.execute(TransformSelectionCommand::scale(IndexSet{1, 2, 3}, 2.0, 2.0));
        stack.undo();
        stack.undo();
        stack.redo();
        assert(doc.curve()[0].x == 0.0 && doc.curve()[2].x == 3.0);
        assert(store.revisions.size() == 7);

        CurveDocument copy(spike());
        NullStorage replayStore;
        CommandStack replayStack(copy, replayStore);
        restore_from_revisions(replayStack, store.revisions);
        assert(copy.curve() == doc.curve());
        assert(replayStack.undoLabel() == "SmoothSelection");
        assert(replayStack.redoLabel() == "ScaleSelection");

        // an undo with nothing to undo cannot be replayed
        CurveDocument fresh(spike());
        CommandStack freshStack(fresh, replayStore);
        bool threw = false;
        try {
            restore_from_revisions(freshStack, {RevisionRecord{"Undo", "{\"op\":\"undo\"}"}});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // Undecodable entries are rejected
    {
        CurveDocument doc(spike());
        NullStorage store;
        CommandStack stack(doc, store);
        bool threw = false;
        try {
            restore_from_revisions(stack, {RevisionRecord{"x", "{\"op\":\"teleport\"}"}});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(stack.journaling());

        threw = false;
        try {
            restore_from_revisions(stack, {RevisionRecord{"x", "{\"op\":\"smooth\",\"method\":\"wavelet\",\"window\":3,"
                                                               "\"sigma\":1,\"indices\":[2]}"}});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        // a bad item drops the whole batch
        threw = false;
        const std::string bad = "{\"op\":\"batch\",\"label\":\"b\",\"items\":["
                                "{\"op\":\"transform\",\"kind\":\"offset\",\"x\":1,\"y\":1,\"indices\":[0,1]},"
                                "{\"op\":\"fill_gap\",\"method\":\"linear\",\"start\":1}]}";
        try {
            restore_from_revisions(stack, {RevisionRecord{"b", bad}});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(doc.curve() == spike());
        assert(!stack.inBatch() && !stack.canUndo());
    }

    return 0;
}
