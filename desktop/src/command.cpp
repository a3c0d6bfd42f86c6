#include "curvetrack/command.hpp"
#include "commands/diff_json.hpp"
#include <stdexcept>

namespace curvetrack {

CommandStack::CommandStack(CurveDocument& doc, IStorage& storage) : doc_(doc), storage_(storage) {}

void CommandStack::beginBatch(std::string label) {
    if (batch_.has_value()) {
        throw std::runtime_error("Batch already in progress");
    }
    batch_ = CommandBatch{std::move(label), {}, {}, doc_.curve()};
    batch_failed_ = false;
    // Begin a single transaction for the whole batch
    storage_.begin();
}

void CommandStack::endBatch() {
    if (!batch_.has_value()) return;
    if (batch_failed_) {
        // Already rolled back on failure during execute(); drop the batch
        batch_.reset();
        batch_failed_ = false;
        return;
    }
    if (batch_->commands.empty()) {
        // Nothing happened; rollback the empty transaction
        storage_.rollback();
        batch_.reset();
        return;
    }
    // Collapse into a single composite command by capturing the batch commands
    struct Composite : public ICommand {
        std::string lbl;
        std::vector<std::unique_ptr<ICommand>> cmds;
        std::string label() const override { return lbl; }
        void doAction(CurveDocument& doc, IStorage& store) override {
            for (auto& c : cmds) c->doAction(doc, store);
        }
        void undoAction(CurveDocument& doc, IStorage& store) override {
            for (auto it = cmds.rbegin(); it != cmds.rend(); ++it) {
                (*it)->undoAction(doc, store);
            }
        }
    };
    auto composite = std::make_unique<Composite>();
    composite->lbl = batch_->label;
    composite->cmds = std::move(batch_->commands);

    // Write a single coalesced revision for the batch, inside its transaction
    try {
        if (journaling_ && !batch_->diffs.empty()) {
            std::string items;
            for (size_t i = 0; i < batch_->diffs.size(); ++i) {
                items += batch_->diffs[i];
                if (i + 1 < batch_->diffs.size()) items += ",";
            }
            std::string diff = std::string("{\"op\":\"batch\",\"label\":\"") + json_escape(composite->lbl) +
                               "\",\"items\":[" + items + "]}";
            storage_.addRevision(RevisionRecord{composite->lbl, diff});
        }
        storage_.commit();
    } catch (...) {
        storage_.rollback();
        doc_.setCurve(std::move(batch_->before));
        batch_.reset();
        throw;
    }

    batch_.reset();
    undo_.push_back(std::move(composite));
    redo_.clear();
}

void CommandStack::cancelBatch() {
    if (!batch_.has_value()) return;
    if (!batch_failed_) {
        storage_.rollback();
        doc_.setCurve(std::move(batch_->before));
    }
    batch_.reset();
    batch_failed_ = false;
}

void CommandStack::execute(std::unique_ptr<ICommand> cmd) {
    const bool batched = batch_.has_value();
    if (batched && batch_failed_) {
        throw std::runtime_error("Batch '" + batch_->label + "' was rolled back; end it before executing");
    }
    CurveData before;
    if (!batched) {
        before = doc_.curve();
        storage_.begin();
    }
    try {
        cmd->doAction(doc_, storage_);
        auto diff = journaling_ ? cmd->diffJson() : std::nullopt;
        if (batched) {
            if (diff) batch_->diffs.push_back(*diff);
        } else {
            if (diff) storage_.addRevision(RevisionRecord{cmd->label(), *diff});
            storage_.commit();
        }
    } catch (...) {
        storage_.rollback();
        if (batched) {
            doc_.setCurve(batch_->before);
            batch_->commands.clear();
            batch_->diffs.clear();
            batch_failed_ = true;
        } else {
            doc_.setCurve(std::move(before));
        }
        throw;
    }

    if (batched) {
        batch_->commands.push_back(std::move(cmd));
    } else {
        undo_.push_back(std::move(cmd));
        redo_.clear();
    }
}

void CommandStack::undo() {
    if (batch_.has_value()) throw std::runtime_error("Cannot undo while a batch is open");
    if (undo_.empty()) return;
    auto cmd = std::move(undo_.back());
    undo_.pop_back();
    CurveData before = doc_.curve();
    storage_.begin();
    try {
        cmd->undoAction(doc_, storage_);
        if (journaling_) storage_.addRevision(RevisionRecord{"Undo " + cmd->label(), "{\"op\":\"undo\"}"});
        storage_.commit();
    } catch (...) {
        storage_.rollback();
        doc_.setCurve(std::move(before));
        undo_.push_back(std::move(cmd));
        throw;
    }
    redo_.push_back(std::move(cmd));
}

void CommandStack::redo() {
    if (batch_.has_value()) throw std::runtime_error("Cannot redo while a batch is open");
    if (redo_.empty()) return;
    auto cmd = std::move(redo_.back());
    redo_.pop_back();
    CurveData before = doc_.curve();
    storage_.begin();
    try {
        cmd->doAction(doc_, storage_);
        if (journaling_) storage_.addRevision(RevisionRecord{"Redo " + cmd->label(), "{\"op\":\"redo\"}"});
        storage_.commit();
    } catch (...) {
        storage_.rollback();
        doc_.setCurve(std::move(before));
        redo_.push_back(std::move(cmd));
        throw;
    }
    undo_.push_back(std::move(cmd));
}

} // namespace curvetrack
