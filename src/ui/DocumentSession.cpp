#include "ui/DocumentSession.hpp"

#include "core/linearizer.hpp"
#include "core/tree_validation.hpp"
#include "storage/page_codec.hpp"
#include "storage/tree_codec.hpp"
#include "ui/logging.hpp"

#include <QStringList>

#include <algorithm>

namespace pagetree::ui {

namespace {

int clamp_index(int index, size_t page_count) {
    if (page_count == 0) return 0;
    return std::clamp(index, 0, static_cast<int>(page_count) - 1);
}

std::optional<NodeId> active_node_for(const Tree& tree, int page_index) {
    if (tree.empty()) return std::nullopt;
    if (const auto* node = find_node_by_page_index(tree, page_index)) {
        return node->id;
    }
    return get_default_active_node_id(tree);
}

QString joined(const std::vector<std::string>& errors) {
    QStringList parts;
    for (const auto& e : errors) {
        parts << QString::fromStdString(e);
    }
    return parts.join(QStringLiteral("; "));
}

} // namespace

DocumentSession::DocumentSession(HistoryRecorder& history, QObject* parent)
    : QObject(parent),
      history_(history),
      undo_count_(history.undoCount()),
      redo_count_(history.redoCount())
{
}

void DocumentSession::loadPages(const PageList& pages, int index) {
    const auto prev = snapshot();

    auto extraction = storage::extract_tree_from_pages(with_positional_indices(pages));

    DocumentState next;
    next.pages = std::move(extraction.cleaned_pages);
    next.current_index = clamp_index(index, next.pages.size());

    if (extraction.tree) {
        auto tree = ensure_virtual_root(*extraction.tree);
        if (page_indices_in_bounds(tree, next.pages.size())) {
            next.tree = std::move(tree);
            next.tree_enabled = true;
        } else {
            qCWarning(lcTree) << "Embedded tree points past the page list; ignoring it";
        }
    } else if (extraction.status != storage::TreeParseStatus::NoMarker) {
        qCWarning(lcTree) << "Ignoring tree marker:" << storage::to_string(extraction.status)
                          << joined(extraction.errors);
    }

    if (!next.tree_enabled && state_.tree_enabled) {
        next.tree = create_tree_from_pages(next.pages);
        next.tree_enabled = true;
    }
    next.active_node_id = active_node_for(next.tree, next.current_index);

    if (!commit(std::move(next), prev)) {
        qCWarning(lcTree) << "Loaded pages were rejected";
    }
}

void DocumentSession::loadPagesViaHistory(const PageList& pages, int index, int undo_count, int redo_count) {
    auto extraction = storage::extract_tree_from_pages(with_positional_indices(pages));

    DocumentState next;
    next.pages = std::move(extraction.cleaned_pages);
    next.current_index = clamp_index(index, next.pages.size());

    const auto restored = extraction.tree
        ? std::optional<Tree>(ensure_virtual_root(*extraction.tree))
        : std::nullopt;

    if (restored && page_indices_in_bounds(*restored, next.pages.size())) {
        next.tree = *restored;
        next.tree_enabled = true;
        next.active_node_id = active_node_for(next.tree, next.current_index);
    } else if (!state_.tree.empty() && page_indices_in_bounds(state_.tree, next.pages.size())) {
        next.tree = state_.tree;
        next.tree_enabled = state_.tree_enabled;
        if (const auto* node = find_node_by_page_index(next.tree, next.current_index)) {
            next.active_node_id = node->id;
        } else if (state_.active_node_id && next.tree.contains(*state_.active_node_id)) {
            next.active_node_id = state_.active_node_id;
        } else {
            next.active_node_id = get_default_active_node_id(next.tree);
        }
    } else if (state_.tree_enabled) {
        next.tree = create_tree_from_pages(next.pages);
        next.tree_enabled = true;
        next.active_node_id = active_node_for(next.tree, next.current_index);
    }

    state_ = std::move(next);
    setHistoryCount(undo_count, redo_count);
    publish();
}

bool DocumentSession::undo() {
    return applyStep(history_.undo(), "Undo");
}

bool DocumentSession::redo() {
    return applyStep(history_.redo(), "Redo");
}

bool DocumentSession::applyStep(Result<std::optional<HistoryStep>, Error> step, const char* what) {
    if (step.is_err()) {
        qCCritical(lcHistory) << what << "failed, keeping the current document:"
                              << QString::fromStdString(step.unwrap_err().message);
        return false;
    }

    auto value = std::move(step).unwrap();
    if (!value) return false;

    loadPagesViaHistory(value->pages, value->index, value->undo_count, value->redo_count);
    return true;
}

void DocumentSession::registerHistoryTask(HistoryTask task, const QString& merge_key) {
    const int undo_count = history_.registerTask(std::move(task), merge_key);
    setHistoryCount(undo_count, 0);
}

void DocumentSession::setHistoryCount(int undo_count, int redo_count) {
    if (undo_count_ == undo_count && redo_count_ == redo_count) return;
    undo_count_ = undo_count;
    redo_count_ = redo_count;
    emit historyCountChanged();
}

PagesSnapshot DocumentSession::snapshot() const {
    const bool embed = state_.tree_enabled && !state_.tree.empty();
    return PagesSnapshot{
        .pages = storage::pages_to_json(storage::embed_tree_in_pages(state_.pages, &state_.tree, embed)),
        .current_index = state_.current_index,
    };
}

bool DocumentSession::commit(DocumentState next, const PagesSnapshot& prev, const QString& merge_key) {
    if (next.tree_enabled && !next.tree.empty()) {
        const auto validation = validate_tree(next.tree);
        if (!validation.valid) {
            qCWarning(lcTree) << "Rejected edit, tree is inconsistent:" << joined(validation.errors);
            return false;
        }
        if (!page_indices_in_bounds(next.tree, next.pages.size())) {
            qCWarning(lcTree) << "Rejected edit, tree points past" << next.pages.size() << "pages";
            return false;
        }

        auto normalized = normalize_tree_and_pages(next.tree, next.pages);
        if (normalized.changed) {
            next.current_index = remap_index(normalized.index_map, next.current_index);
            next.tree = std::move(normalized.tree);
            next.pages = std::move(normalized.pages);
        }
    }

    next.pages = with_positional_indices(std::move(next.pages));
    next.current_index = clamp_index(next.current_index, next.pages.size());
    if (!next.active_node_id || !next.tree.contains(*next.active_node_id)) {
        next.active_node_id = active_node_for(next.tree, next.current_index);
    }

    state_ = std::move(next);
    registerHistoryTask(HistoryTask{.revert = prev, .replay = snapshot(), .fixed = false}, merge_key);
    publish();
    return true;
}

bool DocumentSession::selectNode(NodeId node_id) {
    const auto* node = find_node(state_.tree, node_id);
    if (!node || is_virtual_node(*node)) return false;

    state_.active_node_id = node_id;
    state_.current_index = node->page_index;
    emit stateChanged();
    return true;
}

void DocumentSession::setTreeEnabled(bool enabled) {
    if (state_.tree_enabled == enabled) return;

    if (enabled && (state_.tree.empty() || !page_indices_in_bounds(state_.tree, state_.pages.size()))) {
        state_.tree = create_tree_from_pages(state_.pages);
        state_.active_node_id = active_node_for(state_.tree, state_.current_index);
    }
    state_.tree_enabled = enabled;
    qCInfo(lcTree) << "Tree mode" << (enabled ? "on" : "off");
    emit stateChanged();
}

void DocumentSession::attachRepository(storage::DocumentRepository* repository, storage::DocumentId document_id) {
    repository_ = repository;
    document_id_ = document_id;
}

void DocumentSession::detachRepository() {
    repository_ = nullptr;
    document_id_ = 0;
}

Result<void, Error> DocumentSession::loadFromRepository() {
    if (!repository_) {
        return Result<void, Error>::err(Error{"No document repository attached"});
    }

    auto loaded = repository_->load(document_id_);
    if (loaded.is_err()) {
        qCWarning(lcStorage) << "Failed to load document" << document_id_ << ":"
                             << QString::fromStdString(loaded.unwrap_err().message);
        return Result<void, Error>::err(loaded.unwrap_err());
    }

    auto document = std::move(loaded).unwrap();
    if (!document) {
        return Result<void, Error>::err(
            Error{"Document " + std::to_string(document_id_) + " not found", SQLITE_NOTFOUND});
    }

    loadPages(document->pages, document->current_index);
    return Result<void, Error>::ok();
}

void DocumentSession::publish() {
    emit stateChanged();
    persist();
}

void DocumentSession::persist() {
    if (!repository_) return;

    const bool embed = embed_on_save_ && state_.tree_enabled;
    const auto pages = storage::embed_tree_in_pages(state_.pages, &state_.tree, embed);
    auto saved = repository_->save_pages(document_id_, pages, state_.current_index);
    if (saved.is_err()) {
        qCWarning(lcStorage) << "Failed to save document" << document_id_ << ":"
                             << QString::fromStdString(saved.unwrap_err().message);
    }
}

} // namespace pagetree::ui
