#include "core/drag_reparent.hpp"

#include "core/tree_validation.hpp"

#include <utility>

namespace pagetree {
namespace {

DropOutcome outcome(DropOutcome::Kind kind, const Tree& tree, std::optional<NodeId> focus = std::nullopt) {
    return DropOutcome{.kind = kind, .tree = tree, .focus_node_id = focus, .errors = {}};
}

bool is_root(const Tree& tree, NodeId id) {
    return tree.root_id() == id;
}

// Move one node, leaving its children behind.
Tree move_single(const Tree& tree, NodeId source_id, NodeId target_id, AttachPosition position) {
    if (!can_move_node(tree, source_id, target_id, MoveOptions{.allow_descendant = true})) return tree;

    Tree detached;
    if (is_root(tree, source_id)) {
        if (tree.find(source_id)->children_ids.empty()) return tree;
        detached = reroot_by_first_child(tree, source_id);
    } else if (is_descendant(tree, source_id, target_id)) {
        detached = detach_leaving_children(tree, source_id);
    } else {
        return position == AttachPosition::Branch ? move_node_to_parent(tree, source_id, target_id)
                                                  : move_node_to_insert_position(tree, source_id, target_id);
    }

    auto attached = attach_node(detached, source_id, target_id, position);
    // A failed attach would leave the source detached.
    if (attached == detached) return tree;
    return attached;
}

Tree move_subtree(const Tree& tree, NodeId source_id, NodeId target_id, AttachPosition position) {
    if (is_root(tree, source_id)) return tree;
    return position == AttachPosition::Branch ? move_subtree_to_parent(tree, source_id, target_id)
                                              : move_subtree_to_insert_position(tree, source_id, target_id);
}

Tree move_branch(const Tree& tree, NodeId source_id, NodeId target_id) {
    if (is_root(tree, source_id)) {
        return move_single(tree, source_id, target_id, AttachPosition::Branch);
    }
    if (!is_descendant(tree, source_id, target_id)) {
        return move_node_with_right_siblings_to_parent(tree, source_id, target_id);
    }

    // Target sits under the source: the source leaves its children in place,
    // then it and its right siblings land under the target in order.
    const auto siblings = get_right_siblings(tree, source_id);
    const auto detached = detach_leaving_children(tree, source_id);
    auto out = attach_node(detached, source_id, target_id, AttachPosition::Branch);
    if (out == detached) return tree;
    for (const auto sibling : siblings) {
        auto next = move_subtree_to_parent(out, sibling, target_id);
        if (next == out) return tree;
        out = std::move(next);
    }
    return out;
}

DropOutcome checked(const Tree& before, Tree after, DropOutcome::Kind kind, std::optional<NodeId> focus) {
    if (after == before) {
        return outcome(DropOutcome::Kind::Rejected, before);
    }
    auto validation = validate_tree(after);
    if (!validation.valid) {
        auto result = outcome(DropOutcome::Kind::Invalid, before);
        result.errors = std::move(validation.errors);
        return result;
    }
    return outcome(kind, after, focus);
}

} // namespace

DragState set_drag_mode(DragState state, DragMode mode) {
    state.mode = mode;
    return state;
}

DragState start_drag(DragState state, NodeId source_id) {
    state.source_node_id = source_id;
    state.target_node_id.reset();
    state.drop_slot_index.reset();
    state.target_button_parent_id.reset();
    state.target_button_type.reset();
    return state;
}

DragState update_drag_target(const Tree& tree, DragState state, std::optional<NodeId> target_id) {
    if (!state.dragging()) return state;
    if (target_id &&
        !can_move_node(tree, *state.source_node_id, *target_id, MoveOptions{.allow_descendant = true})) {
        target_id.reset();
    }
    state.target_node_id = target_id;
    return state;
}

DragState update_drop_slot(DragState state, std::optional<int> slot_index) {
    if (!state.dragging()) return state;
    if (slot_index && *slot_index < 0) slot_index.reset();
    state.drop_slot_index = slot_index;
    return state;
}

DragState update_button_target(const Tree& tree,
                               DragState state,
                               std::optional<NodeId> parent_id,
                               std::optional<ButtonType> type) {
    if (!state.dragging()) return state;

    const bool usable = parent_id && type && tree.contains(*parent_id) &&
                        (*type == ButtonType::Delete || *parent_id != *state.source_node_id);
    if (!usable) {
        state.target_button_parent_id.reset();
        state.target_button_type.reset();
        return state;
    }
    state.target_button_parent_id = parent_id;
    state.target_button_type = type;
    return state;
}

DragState end_drag(DragState state) {
    return DragState{.mode = state.mode};
}

DropOutcome plan_drop(const Tree& tree, const DragState& drag, DropOptions options) {
    if (!drag.dragging() || drag.mode == DragMode::Reorder) {
        return outcome(DropOutcome::Kind::Cancelled, tree);
    }

    const auto source_id = *drag.source_node_id;
    const auto* source = tree.find(source_id);
    if (!source || is_virtual_node(*source)) {
        return outcome(DropOutcome::Kind::Rejected, tree);
    }

    if (drag.target_button_type && drag.target_button_parent_id) {
        const auto button_parent = *drag.target_button_parent_id;
        switch (*drag.target_button_type) {
            case ButtonType::Delete: {
                auto after = remove_node(tree, source_id, options.button_drop_moves_subtree);
                std::optional<NodeId> focus;
                if (source->parent_id && after.contains(*source->parent_id) &&
                    !is_virtual_node(*after.find(*source->parent_id))) {
                    focus = source->parent_id;
                } else {
                    focus = get_default_active_node_id(after);
                }
                return checked(tree, std::move(after), DropOutcome::Kind::Deleted, focus);
            }
            case ButtonType::Insert:
            case ButtonType::Branch: {
                const auto position = *drag.target_button_type == ButtonType::Insert ? AttachPosition::Insert
                                                                                      : AttachPosition::Branch;
                auto after = options.button_drop_moves_subtree
                                 ? move_subtree(tree, source_id, button_parent, position)
                                 : move_single(tree, source_id, button_parent, position);
                return checked(tree, std::move(after), DropOutcome::Kind::Moved, source_id);
            }
        }
    }

    if (!drag.target_node_id) {
        return outcome(DropOutcome::Kind::Cancelled, tree);
    }
    const auto target_id = *drag.target_node_id;
    if (!can_move_node(tree, source_id, target_id, MoveOptions{.allow_descendant = true})) {
        return outcome(DropOutcome::Kind::Rejected, tree);
    }

    auto after = drag.mode == DragMode::AttachBranch
                     ? move_branch(tree, source_id, target_id)
                     : move_single(tree, source_id, target_id, AttachPosition::Branch);
    return checked(tree, std::move(after), DropOutcome::Kind::Moved, source_id);
}

} // namespace pagetree
