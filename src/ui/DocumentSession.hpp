#pragma once

#include "core/page.hpp"
#include "core/page_tree.hpp"
#include "core/result.hpp"
#include "storage/document_repository.hpp"
#include "ui/models/HistoryJournal.hpp"

#include <QObject>
#include <QString>

#include <optional>

namespace pagetree::ui {

/**
 * DocumentState - everything the editor shows for one document.
 */
struct DocumentState {
    Tree tree;
    PageList pages;
    int current_index{0};
    std::optional<NodeId> active_node_id;
    bool tree_enabled{false};
};

/**
 * DocumentSession - owner of the current document state.
 *
 * Every edit goes through commit(), which brings pages into tree order,
 * records one history task and publishes the result. Undo and redo restore
 * page snapshots from the history; the tree travels inside those snapshots.
 *
 * A DocumentRepository may be attached; it then receives the page list after
 * every publish.
 */
class DocumentSession : public QObject {
    Q_OBJECT

    Q_PROPERTY(int currentIndex READ currentIndex NOTIFY stateChanged)
    Q_PROPERTY(int pageCount READ pageCount NOTIFY stateChanged)
    Q_PROPERTY(bool treeEnabled READ treeEnabled NOTIFY stateChanged)
    Q_PROPERTY(int undoCount READ undoCount NOTIFY historyCountChanged)
    Q_PROPERTY(int redoCount READ redoCount NOTIFY historyCountChanged)

public:
    explicit DocumentSession(HistoryRecorder& history, QObject* parent = nullptr);

    [[nodiscard]] const DocumentState& state() const { return state_; }
    [[nodiscard]] int currentIndex() const { return state_.current_index; }
    [[nodiscard]] int pageCount() const { return static_cast<int>(state_.pages.size()); }
    [[nodiscard]] bool treeEnabled() const { return state_.tree_enabled; }
    [[nodiscard]] int undoCount() const { return undo_count_; }
    [[nodiscard]] int redoCount() const { return redo_count_; }

    /**
     * Replace the document. An embedded tree is extracted and switches tree
     * mode on. The load itself is recorded so it can be undone.
     */
    void loadPages(const PageList& pages, int index);

    /** Apply pages restored from history, keeping or rebuilding the tree. */
    void loadPagesViaHistory(const PageList& pages, int index, int undo_count, int redo_count);

    /** False when there was nothing to undo or the snapshot did not decode. */
    bool undo();
    bool redo();

    void registerHistoryTask(HistoryTask task, const QString& merge_key = {});
    void setHistoryCount(int undo_count, int redo_count);

    /** Current state in primitive form, tree embedded when tree mode is on. */
    [[nodiscard]] PagesSnapshot snapshot() const;

    /**
     * Make `next` current. In tree mode the tree is validated and the pages
     * are reordered to match it; an invalid tree leaves the state untouched
     * and returns false. `prev` is the snapshot the edit started from.
     */
    bool commit(DocumentState next, const PagesSnapshot& prev, const QString& merge_key = {});

    /** Move the cursor to `node_id` without recording history. */
    bool selectNode(NodeId node_id);

    /**
     * Switch tree mode. Turning it on keeps an in-memory tree that still fits
     * the pages and otherwise builds the linear tree.
     */
    void setTreeEnabled(bool enabled);

    void attachRepository(storage::DocumentRepository* repository, storage::DocumentId document_id);
    void detachRepository();

    /** Load the attached document through loadPages(). */
    [[nodiscard]] Result<void, Error> loadFromRepository();

    /** Whether saved pages carry the tree marker. */
    void setEmbedOnSave(bool enabled) { embed_on_save_ = enabled; }

signals:
    void stateChanged();
    void historyCountChanged();

private:
    HistoryRecorder& history_;
    DocumentState state_;
    int undo_count_ = 0;
    int redo_count_ = 0;

    storage::DocumentRepository* repository_ = nullptr;
    storage::DocumentId document_id_ = 0;
    bool embed_on_save_ = true;

    void publish();
    void persist();
    bool applyStep(Result<std::optional<HistoryStep>, Error> step, const char* what);
};

} // namespace pagetree::ui
