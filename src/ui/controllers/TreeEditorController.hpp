#pragma once

#include "core/drag_reparent.hpp"
#include "ui/DocumentSession.hpp"
#include "ui/TreeSettings.hpp"
#include "ui/models/HistoryJournal.hpp"

#include <QObject>
#include <QString>

#include <optional>

namespace pagetree::ui {

/**
 * TreeEditorController - tree actions and drag handling for the tree view.
 *
 * Node ids cross the QML boundary as ints; -1 means "none". Every successful
 * edit is committed through the session as one history task.
 */
class TreeEditorController : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool dragging READ dragging NOTIFY dragStateChanged)
    Q_PROPERTY(int dragMode READ dragModeValue NOTIFY dragStateChanged)
    Q_PROPERTY(int activeNodeId READ activeNodeId NOTIFY activeNodeChanged)

public:
    TreeEditorController(DocumentSession& session,
                         HistoryRecorder& history,
                         TreeSettings& settings,
                         QObject* parent = nullptr);

    [[nodiscard]] const DragState& dragState() const { return drag_; }
    [[nodiscard]] bool dragging() const { return drag_.dragging(); }
    [[nodiscard]] int dragModeValue() const { return static_cast<int>(drag_.mode); }
    [[nodiscard]] int activeNodeId() const;

    Q_INVOKABLE void toggleTreeMode();
    Q_INVOKABLE bool selectNode(int nodeId);

    // Both add a page copied from the parent node's page; -1 uses the active node.
    Q_INVOKABLE bool addBranchFromCurrentNode(int parentNodeId = -1);
    Q_INVOKABLE bool insertNodeAfterCurrent(int parentNodeId = -1);
    Q_INVOKABLE bool addPageInTreeMode(int parentNodeId = -1);

    Q_INVOKABLE bool removeCurrentNode(bool removeDescendants = true);

    /** Edits of the same page coalesce into one history entry until the selection moves. */
    Q_INVOKABLE bool setCurrentComment(const QString& text);

    // Drag
    Q_INVOKABLE void setDragMode(int mode);
    Q_INVOKABLE void startDrag(int sourceNodeId);
    Q_INVOKABLE void updateDragTarget(int targetNodeId);
    Q_INVOKABLE void updateDropSlot(int slotIndex);
    Q_INVOKABLE void updateButtonTarget(int parentNodeId, int buttonType);
    Q_INVOKABLE void endDrag();
    Q_INVOKABLE bool executeDrop();

signals:
    void dragStateChanged();
    void activeNodeChanged();
    void dropRejected(const QString& reason);

private:
    DocumentSession& session_;
    HistoryRecorder& history_;
    TreeSettings& settings_;
    DragState drag_;
    std::optional<PagesSnapshot> drag_origin_;

    [[nodiscard]] const Node* currentNode(std::optional<NodeId> override_id) const;
    bool addChildPage(std::optional<NodeId> parent_id, bool insert);
    bool commitTreeChange(Tree tree, std::optional<NodeId> focus, const PagesSnapshot& prev);
    void setDragState(DragState next);
    void applyUndoLimit();
};

} // namespace pagetree::ui
