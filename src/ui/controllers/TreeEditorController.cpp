#include "ui/controllers/TreeEditorController.hpp"

#include "core/linearizer.hpp"
#include "core/tree_mutations.hpp"
#include "ui/logging.hpp"

#include <QStringList>

#include <set>

namespace pagetree::ui {

namespace {

std::optional<NodeId> node_id_arg(int id) {
    if (id < 0) return std::nullopt;
    return static_cast<NodeId>(id);
}

std::optional<ButtonType> button_type_arg(int type) {
    switch (type) {
        case static_cast<int>(ButtonType::Insert): return ButtonType::Insert;
        case static_cast<int>(ButtonType::Branch): return ButtonType::Branch;
        case static_cast<int>(ButtonType::Delete): return ButtonType::Delete;
        default: return std::nullopt;
    }
}

std::set<int> real_page_indices(const Tree& tree) {
    std::set<int> indices;
    tree.for_each([&](const Node& node) {
        if (!is_virtual_node(node)) indices.insert(node.page_index);
    });
    return indices;
}

const char* to_string(DropOutcome::Kind kind) {
    switch (kind) {
        case DropOutcome::Kind::Cancelled: return "cancelled";
        case DropOutcome::Kind::Rejected: return "rejected";
        case DropOutcome::Kind::Invalid: return "invalid";
        case DropOutcome::Kind::Moved: return "moved";
        case DropOutcome::Kind::Deleted: return "deleted";
    }
    return "unknown";
}

} // namespace

TreeEditorController::TreeEditorController(DocumentSession& session,
                                           HistoryRecorder& history,
                                           TreeSettings& settings,
                                           QObject* parent)
    : QObject(parent),
      session_(session),
      history_(history),
      settings_(settings)
{
    drag_.mode = settings_.dragMode();
    session_.setEmbedOnSave(settings_.embedOnSave());
    connect(&session_, &DocumentSession::stateChanged, this, &TreeEditorController::activeNodeChanged);
    connect(&settings_, &TreeSettings::embedOnSaveChanged, this,
            [this]() { session_.setEmbedOnSave(settings_.embedOnSave()); });
    applyUndoLimit();
    connect(&settings_, &TreeSettings::undoLimitChanged, this, &TreeEditorController::applyUndoLimit);
}

void TreeEditorController::applyUndoLimit() {
    history_.setUndoLimit(settings_.undoLimit());
    session_.setHistoryCount(history_.undoCount(), history_.redoCount());
}

int TreeEditorController::activeNodeId() const {
    const auto& active = session_.state().active_node_id;
    return active ? static_cast<int>(*active) : -1;
}

const Node* TreeEditorController::currentNode(std::optional<NodeId> override_id) const {
    const auto& state = session_.state();
    if (override_id) {
        if (const auto* node = find_node(state.tree, *override_id)) return node;
    }
    if (state.active_node_id) {
        if (const auto* node = find_node(state.tree, *state.active_node_id)) return node;
    }
    return find_node_by_page_index(state.tree, state.current_index);
}

// ============================================================================
// Tree mode and selection
// ============================================================================

void TreeEditorController::toggleTreeMode() {
    session_.setTreeEnabled(!session_.treeEnabled());
    if (!session_.treeEnabled() && drag_.dragging()) {
        endDrag();
    }
}

bool TreeEditorController::selectNode(int nodeId) {
    const auto id = node_id_arg(nodeId);
    if (!id || !session_.treeEnabled()) return false;
    if (!session_.selectNode(*id)) return false;
    history_.sealTop();
    return true;
}

// ============================================================================
// Adding and removing pages
// ============================================================================

bool TreeEditorController::addBranchFromCurrentNode(int parentNodeId) {
    return addChildPage(node_id_arg(parentNodeId), false);
}

bool TreeEditorController::insertNodeAfterCurrent(int parentNodeId) {
    return addChildPage(node_id_arg(parentNodeId), true);
}

bool TreeEditorController::addPageInTreeMode(int parentNodeId) {
    if (!session_.treeEnabled()) return false;
    if (settings_.addMode() == TreeAddMode::Branch) {
        return addBranchFromCurrentNode(parentNodeId);
    }
    return insertNodeAfterCurrent(parentNodeId);
}

bool TreeEditorController::addChildPage(std::optional<NodeId> parent_id, bool insert) {
    if (!session_.treeEnabled()) return false;

    const auto* current = currentNode(parent_id);
    if (!current || is_virtual_node(*current)) return false;
    const auto current_id = current->id;
    const auto current_page = current->page_index;

    const auto prev = session_.snapshot();
    DocumentState next = session_.state();

    const int new_index = static_cast<int>(next.pages.size());
    next.pages.push_back(make_child_page(next.pages, current_page, new_index));

    auto inserted = insert ? insert_node(next.tree, current_id, new_index)
                           : add_branch_node(next.tree, current_id, new_index);
    if (!inserted.new_node_id) return false;

    next.tree = std::move(inserted.tree);
    next.current_index = new_index;
    next.active_node_id = inserted.new_node_id;

    qCDebug(lcTree) << (insert ? "Insert" : "Branch") << "page after node" << current_id;
    return session_.commit(std::move(next), prev);
}

bool TreeEditorController::removeCurrentNode(bool removeDescendants) {
    if (!session_.treeEnabled()) return false;

    const auto& tree = session_.state().tree;
    const auto* current = currentNode(std::nullopt);
    if (!current || is_virtual_node(*current)) return false;

    auto after = remove_node(tree, current->id, removeDescendants);
    if (after == tree) {
        qCDebug(lcTree) << "Node" << current->id << "cannot be removed";
        return false;
    }

    std::optional<NodeId> focus;
    if (current->parent_id && after.contains(*current->parent_id) &&
        !is_virtual_node(*after.find(*current->parent_id))) {
        focus = current->parent_id;
    } else {
        focus = get_default_active_node_id(after);
    }
    return commitTreeChange(std::move(after), focus, session_.snapshot());
}

bool TreeEditorController::setCurrentComment(const QString& text) {
    const auto& state = session_.state();
    if (state.pages.empty()) return false;

    const int index = state.current_index;
    if (resolve_comment(state.pages, index) == text.toStdString() &&
        !has_comment_ref(state.pages[static_cast<size_t>(index)])) {
        return false;
    }

    const auto prev = session_.snapshot();
    DocumentState next = state;
    next.pages[static_cast<size_t>(index)].comment = text.toStdString();
    return session_.commit(std::move(next), prev, QStringLiteral("comment/%1").arg(index));
}

// Pages whose nodes left the tree are dropped with them.
bool TreeEditorController::commitTreeChange(Tree tree, std::optional<NodeId> focus, const PagesSnapshot& prev) {
    const auto& state = session_.state();

    const auto kept = real_page_indices(tree);
    std::set<int> removed;
    for (const auto index : real_page_indices(state.tree)) {
        if (!kept.contains(index)) removed.insert(index);
    }

    DocumentState next = state;
    if (removed.empty()) {
        next.tree = std::move(tree);
    } else {
        auto dropped = drop_pages(tree, state.pages, removed);
        next.tree = std::move(dropped.tree);
        next.pages = std::move(dropped.pages);
        next.current_index = remap_index(dropped.index_map, state.current_index);
    }

    if (!focus || !next.tree.contains(*focus)) {
        focus = next.active_node_id && next.tree.contains(*next.active_node_id)
                    ? next.active_node_id
                    : get_default_active_node_id(next.tree);
    }
    next.active_node_id = focus;
    if (focus) {
        next.current_index = next.tree.find(*focus)->page_index;
    }
    return session_.commit(std::move(next), prev);
}

// ============================================================================
// Drag
// ============================================================================

void TreeEditorController::setDragState(DragState next) {
    if (next == drag_) return;
    drag_ = std::move(next);
    emit dragStateChanged();
}

void TreeEditorController::setDragMode(int mode) {
    settings_.setDragModeValue(mode);
    setDragState(set_drag_mode(drag_, settings_.dragMode()));
}

void TreeEditorController::startDrag(int sourceNodeId) {
    if (!session_.treeEnabled()) return;
    const auto id = node_id_arg(sourceNodeId);
    if (!id || !session_.state().tree.contains(*id)) return;

    drag_origin_ = session_.snapshot();
    setDragState(start_drag(drag_, *id));
}

void TreeEditorController::updateDragTarget(int targetNodeId) {
    if (!session_.treeEnabled() || !drag_.dragging()) return;
    setDragState(update_drag_target(session_.state().tree, drag_, node_id_arg(targetNodeId)));
}

void TreeEditorController::updateDropSlot(int slotIndex) {
    if (!session_.treeEnabled() || !drag_.dragging()) return;
    setDragState(update_drop_slot(drag_, slotIndex));
}

void TreeEditorController::updateButtonTarget(int parentNodeId, int buttonType) {
    if (!session_.treeEnabled() || !drag_.dragging()) return;
    setDragState(update_button_target(session_.state().tree, drag_, node_id_arg(parentNodeId),
                                      button_type_arg(buttonType)));
}

void TreeEditorController::endDrag() {
    drag_origin_.reset();
    setDragState(end_drag(drag_));
}

bool TreeEditorController::executeDrop() {
    if (!session_.treeEnabled() || !drag_.dragging()) {
        endDrag();
        return false;
    }

    const auto outcome = plan_drop(session_.state().tree, drag_,
                                   DropOptions{.button_drop_moves_subtree = settings_.buttonDropMovesSubtree()});
    const auto prev = drag_origin_.value_or(session_.snapshot());
    endDrag();

    switch (outcome.kind) {
        case DropOutcome::Kind::Cancelled:
            return false;
        case DropOutcome::Kind::Rejected:
            qCDebug(lcTree) << "Drop rejected";
            emit dropRejected(QString::fromLatin1(to_string(outcome.kind)));
            return false;
        case DropOutcome::Kind::Invalid: {
            QStringList errors;
            for (const auto& e : outcome.errors) errors << QString::fromStdString(e);
            qCWarning(lcTree) << "Drop would break the tree:" << errors.join(QStringLiteral("; "));
            emit dropRejected(QString::fromLatin1(to_string(outcome.kind)));
            return false;
        }
        case DropOutcome::Kind::Moved:
        case DropOutcome::Kind::Deleted:
            break;
    }

    qCDebug(lcTree) << "Drop" << to_string(outcome.kind);
    return commitTreeChange(outcome.tree, outcome.focus_node_id, prev);
}

} // namespace pagetree::ui
