#pragma once

#include "core/page.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QUndoStack>

#include <optional>

namespace pagetree::ui {

/**
 * PagesSnapshot - page list in primitive form (see storage::pages_to_json)
 * plus the cursor that goes with it.
 */
struct PagesSnapshot {
    QByteArray pages;
    int current_index{0};

    bool operator==(const PagesSnapshot&) const = default;
};

/**
 * HistoryTask - one reversible edit. `revert` restores the state before the
 * edit, `replay` the state after it. A fixed task never absorbs later edits.
 */
struct HistoryTask {
    PagesSnapshot revert;
    PagesSnapshot replay;
    bool fixed{false};
};

/** Decoded result of an undo or redo. */
struct HistoryStep {
    PageList pages;
    int index{0};
    int undo_count{0};
    int redo_count{0};
};

/**
 * HistoryRecorder - what editing code needs from the history.
 */
class HistoryRecorder {
public:
    virtual ~HistoryRecorder() = default;

    /**
     * Record `task`. With a non-empty `merge_key` equal to the top task's key
     * the two are merged instead. Returns the undo count afterwards.
     */
    virtual int registerTask(HistoryTask task, const QString& merge_key) = 0;

    /** Stop the top task from absorbing later edits. */
    virtual void sealTop() = 0;

    /** Empty stack -> ok(nullopt). A snapshot that fails to decode -> err. */
    [[nodiscard]] virtual Result<std::optional<HistoryStep>, Error> undo() = 0;
    [[nodiscard]] virtual Result<std::optional<HistoryStep>, Error> redo() = 0;

    [[nodiscard]] virtual int undoCount() const = 0;
    [[nodiscard]] virtual int redoCount() const = 0;

    /** Changing the limit drops the recorded tasks. */
    virtual void setUndoLimit(int limit) = 0;
};

/**
 * HistoryJournal - undo/redo of page list snapshots on a QUndoStack.
 */
class HistoryJournal : public QObject, public HistoryRecorder {
    Q_OBJECT

    Q_PROPERTY(bool canUndo READ canUndo NOTIFY canUndoChanged)
    Q_PROPERTY(bool canRedo READ canRedo NOTIFY canRedoChanged)
    Q_PROPERTY(int undoCount READ undoCount NOTIFY countsChanged)
    Q_PROPERTY(int redoCount READ redoCount NOTIFY countsChanged)

public:
    /** `undo_limit` of 0 keeps every task. */
    explicit HistoryJournal(int undo_limit = 200, QObject* parent = nullptr);

    int registerTask(HistoryTask task, const QString& merge_key) override;
    void sealTop() override;

    [[nodiscard]] Result<std::optional<HistoryStep>, Error> undo() override;
    [[nodiscard]] Result<std::optional<HistoryStep>, Error> redo() override;

    [[nodiscard]] int undoCount() const override { return undo_stack_.index(); }
    [[nodiscard]] int redoCount() const override { return undo_stack_.count() - undo_stack_.index(); }

    [[nodiscard]] bool canUndo() const { return undo_stack_.canUndo(); }
    [[nodiscard]] bool canRedo() const { return undo_stack_.canRedo(); }
    [[nodiscard]] int undoLimit() const { return undo_stack_.undoLimit(); }
    void setUndoLimit(int limit) override;

    Q_INVOKABLE void clear();

    void setApplySuppressed(bool suppressed) { suppress_apply_ = suppressed; }
    [[nodiscard]] bool applySuppressed() const { return suppress_apply_; }

    /** Snapshot most recently restored by an undo or redo. */
    [[nodiscard]] const std::optional<PagesSnapshot>& lastApplied() const { return last_applied_; }
    void noteApplied(const PagesSnapshot& snapshot);

signals:
    void canUndoChanged();
    void canRedoChanged();
    void countsChanged();

private:
    QUndoStack undo_stack_;
    bool suppress_apply_ = false;
    std::optional<PagesSnapshot> last_applied_;

    [[nodiscard]] Result<HistoryStep, Error> decode(const PagesSnapshot& snapshot) const;
};

} // namespace pagetree::ui
