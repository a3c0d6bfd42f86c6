#pragma once

#include "curvetrack/curve_data.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace curvetrack {

struct RevisionRecord {
    std::string label;
    std::string diff_json; // serialized operation for the journal
};

// Abstract storage transaction API (SQLite-backed implementation optional)
class IStorage {
public:
    virtual ~IStorage() = default;
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
    virtual void addRevision(const RevisionRecord& r) = 0; // persist revision
};

class NullStorage : public IStorage {
public:
    void begin() override {}
    void commit() override {}
    void rollback() override {}
    void addRevision(const RevisionRecord&) override {}
};

// The curve being edited. Commands replace it wholesale.
class CurveDocument {
public:
    CurveDocument() = default;
    explicit CurveDocument(CurveData curve) : curve_(std::move(curve)) {}

    const CurveData& curve() const { return curve_; }
    void setCurve(CurveData curve) {
        curve_ = std::move(curve);
        ++revision_;
    }
    // Bumped on every setCurve
    int revision() const { return revision_; }

private:
    CurveData curve_;
    int revision_ {0};
};

// Command interface
class ICommand {
public:
    virtual ~ICommand() = default;
    virtual std::string label() const = 0;
    virtual void doAction(CurveDocument& doc, IStorage& store) = 0;
    virtual void undoAction(CurveDocument& doc, IStorage& store) = 0;
    // Optional serialized operation for the journal
    virtual std::optional<std::string> diffJson() const { return std::nullopt; }
};

// Batch groups multiple commands as one unit for undo/redo and the journal
struct CommandBatch {
    std::string label;
    std::vector<std::unique_ptr<ICommand>> commands;
    std::vector<std::string> diffs;
    CurveData before; // document when the batch opened
};

class CommandStack {
public:
    CommandStack(CurveDocument& doc, IStorage& storage);

    // Opens one storage transaction for the whole batch. Throws
    // std::runtime_error when a batch is already open.
    void beginBatch(std::string label);
    void endBatch();
    // Rolls back the open batch and restores the document to where it began
    void cancelBatch();
    bool inBatch() const { return batch_.has_value(); }

    // Runs cmd inside a transaction. If cmd throws, the transaction (the whole
    // batch when one is open) is rolled back, the document is restored and the
    // exception propagates.
    void execute(std::unique_ptr<ICommand> cmd);
    bool canUndo() const { return !undo_.empty(); }
    bool canRedo() const { return !redo_.empty(); }
    // Undo and redo are journaled too, so a replay ends on the same curve.
    // Throws std::runtime_error while a batch is open.
    void undo();
    void redo();
    std::string undoLabel() const { return undo_.empty() ? std::string() : undo_.back()->label(); }
    std::string redoLabel() const { return redo_.empty() ? std::string() : redo_.back()->label(); }

    // Replay runs with journaling off so restored entries are not written twice
    void setJournaling(bool on) { journaling_ = on; }
    bool journaling() const { return journaling_; }

private:
    CurveDocument& doc_;
    IStorage& storage_;
    std::optional<CommandBatch> batch_;
    bool batch_failed_ {false};
    bool journaling_ {true};
    std::vector<std::unique_ptr<ICommand>> undo_;
    std::vector<std::unique_ptr<ICommand>> redo_;
};

} // namespace curvetrack
