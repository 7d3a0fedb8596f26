#pragma once

#include "core/page_tree.hpp"
#include "core/tree_mutations.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pagetree {

enum class DragMode {
    Reorder,
    AttachSingle,
    AttachBranch
};

enum class ButtonType {
    Insert,
    Branch,
    Delete
};

/**
 * DragState - an in-progress pointer gesture over the tree view.
 *
 * The state is a plain value: the functions below take one and return the
 * next. A state without a source node is idle.
 */
struct DragState {
    DragMode mode{DragMode::AttachSingle};
    std::optional<NodeId> source_node_id;
    std::optional<NodeId> target_node_id;
    std::optional<int> drop_slot_index;
    std::optional<NodeId> target_button_parent_id;
    std::optional<ButtonType> target_button_type;

    [[nodiscard]] bool dragging() const { return source_node_id.has_value(); }

    bool operator==(const DragState&) const = default;
};

[[nodiscard]] DragState set_drag_mode(DragState state, DragMode mode);

/** Begin dragging `source_id`; previous targets are cleared. */
[[nodiscard]] DragState start_drag(DragState state, NodeId source_id);

/** Hover over a node. A target the source can never move to is cleared instead. */
[[nodiscard]] DragState update_drag_target(const Tree& tree, DragState state, std::optional<NodeId> target_id);

/** Hover over a slot between pages; negative slots count as none. */
[[nodiscard]] DragState update_drop_slot(DragState state, std::optional<int> slot_index);

/** Hover over a node's insert / branch / delete button, or leave it (nullopt). */
[[nodiscard]] DragState update_button_target(const Tree& tree,
                                             DragState state,
                                             std::optional<NodeId> parent_id,
                                             std::optional<ButtonType> type);

/** Back to idle, keeping the mode. */
[[nodiscard]] DragState end_drag(DragState state);

struct DropOptions {
    bool button_drop_moves_subtree = false;
};

struct DropOutcome {
    enum class Kind {
        Cancelled,
        Rejected,
        Invalid,
        Moved,
        Deleted
    };

    Kind kind{Kind::Cancelled};
    Tree tree;
    std::optional<NodeId> focus_node_id;
    std::vector<std::string> errors;

    [[nodiscard]] bool committed() const { return kind == Kind::Moved || kind == Kind::Deleted; }
};

/**
 * Decide what releasing the drag does to `tree`.
 *
 * Button targets win over node targets. Moves onto a descendant of the source
 * detach the source first, leaving its children behind; a root source is
 * rerooted by its first child first. Every changed tree is validated, and a
 * tree that fails validation is returned as Kind::Invalid with the input
 * tree. Reorder mode always cancels.
 */
[[nodiscard]] DropOutcome plan_drop(const Tree& tree, const DragState& drag, DropOptions options = {});

} // namespace pagetree
