#include "ui/models/HistoryJournal.hpp"

#include "storage/page_codec.hpp"
#include "ui/logging.hpp"

#include <QHash>
#include <QUndoCommand>

namespace pagetree::ui {

namespace {

struct ScopedApplySuppression {
    HistoryJournal& journal;
    explicit ScopedApplySuppression(HistoryJournal& j) : journal(j) { journal.setApplySuppressed(true); }
    ~ScopedApplySuppression() { journal.setApplySuppressed(false); }
};

class HistoryCommand final : public QUndoCommand {
public:
    HistoryCommand(HistoryJournal& journal, HistoryTask task, QString mergeKey)
        : journal_(journal),
          task_(std::move(task)),
          merge_key_(std::move(mergeKey)),
          fixed_(task_.fixed)
    {
        setText(merge_key_);
    }

    // Commands without a key never merge.
    int id() const override {
        if (merge_key_.isEmpty()) return -1;
        return static_cast<int>(qHash(merge_key_) & 0x7fffffff);
    }

    bool mergeWith(const QUndoCommand* other) override {
        const auto* o = dynamic_cast<const HistoryCommand*>(other);
        if (!o) return false;
        if (fixed_) return false;
        if (o->merge_key_ != merge_key_) return false;
        task_.replay = o->task_.replay;
        fixed_ = o->fixed_;
        return true;
    }

    void undo() override { apply(task_.revert); }
    void redo() override { apply(task_.replay); }

    [[nodiscard]] const PagesSnapshot& revertSnapshot() const { return task_.revert; }
    [[nodiscard]] const PagesSnapshot& replaySnapshot() const { return task_.replay; }

    // QUndoStack only hands out const commands.
    void seal() const { fixed_ = true; }

private:
    HistoryJournal& journal_;
    HistoryTask task_;
    QString merge_key_;
    mutable bool fixed_;

    void apply(const PagesSnapshot& snapshot) {
        if (journal_.applySuppressed()) return;
        journal_.noteApplied(snapshot);
    }
};

const HistoryCommand* command_at(const QUndoStack& stack, int index) {
    if (index < 0 || index >= stack.count()) return nullptr;
    return static_cast<const HistoryCommand*>(stack.command(index));
}

} // namespace

HistoryJournal::HistoryJournal(int undo_limit, QObject* parent)
    : QObject(parent)
{
    undo_stack_.setUndoLimit(undo_limit < 0 ? 0 : undo_limit);
    connect(&undo_stack_, &QUndoStack::canUndoChanged, this, [this](bool) { emit canUndoChanged(); });
    connect(&undo_stack_, &QUndoStack::canRedoChanged, this, [this](bool) { emit canRedoChanged(); });
}

int HistoryJournal::registerTask(HistoryTask task, const QString& merge_key) {
    {
        ScopedApplySuppression guard(*this);
        undo_stack_.push(new HistoryCommand(*this, std::move(task), merge_key));
    }
    emit countsChanged();
    return undoCount();
}

void HistoryJournal::sealTop() {
    if (const auto* top = command_at(undo_stack_, undo_stack_.index() - 1)) {
        top->seal();
    }
}

Result<std::optional<HistoryStep>, Error> HistoryJournal::undo() {
    const auto* top = command_at(undo_stack_, undo_stack_.index() - 1);
    if (!top) {
        return Result<std::optional<HistoryStep>, Error>::ok(std::nullopt);
    }

    // Decode before moving the stack so a bad snapshot leaves history as it was.
    auto decoded = decode(top->revertSnapshot());
    if (decoded.is_err()) {
        return Result<std::optional<HistoryStep>, Error>::err(decoded.unwrap_err());
    }

    undo_stack_.undo();
    emit countsChanged();

    auto step = std::move(decoded).unwrap();
    step.undo_count = undoCount();
    step.redo_count = redoCount();
    return Result<std::optional<HistoryStep>, Error>::ok(std::move(step));
}

Result<std::optional<HistoryStep>, Error> HistoryJournal::redo() {
    const auto* next = command_at(undo_stack_, undo_stack_.index());
    if (!next) {
        return Result<std::optional<HistoryStep>, Error>::ok(std::nullopt);
    }

    auto decoded = decode(next->replaySnapshot());
    if (decoded.is_err()) {
        return Result<std::optional<HistoryStep>, Error>::err(decoded.unwrap_err());
    }

    undo_stack_.redo();
    emit countsChanged();

    auto step = std::move(decoded).unwrap();
    step.undo_count = undoCount();
    step.redo_count = redoCount();
    return Result<std::optional<HistoryStep>, Error>::ok(std::move(step));
}

void HistoryJournal::clear() {
    undo_stack_.clear();
    last_applied_.reset();
    emit countsChanged();
}

void HistoryJournal::setUndoLimit(int limit) {
    limit = limit < 0 ? 0 : limit;
    if (limit == undo_stack_.undoLimit()) return;
    // QUndoStack only takes a new limit while empty.
    if (undo_stack_.count() > 0) {
        qCInfo(lcHistory) << "Undo limit changed to" << limit << "; dropping" << undo_stack_.count() << "tasks";
    }
    undo_stack_.clear();
    last_applied_.reset();
    undo_stack_.setUndoLimit(limit);
    emit countsChanged();
}

void HistoryJournal::noteApplied(const PagesSnapshot& snapshot) {
    last_applied_ = snapshot;
}

Result<HistoryStep, Error> HistoryJournal::decode(const PagesSnapshot& snapshot) const {
    auto pages = storage::pages_from_json(snapshot.pages);
    if (pages.is_err()) {
        return Result<HistoryStep, Error>::err(pages.unwrap_err());
    }

    HistoryStep step;
    step.pages = std::move(pages).unwrap();
    step.index = snapshot.current_index;
    return Result<HistoryStep, Error>::ok(std::move(step));
}

} // namespace pagetree::ui
