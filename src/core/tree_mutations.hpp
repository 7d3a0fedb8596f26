#pragma once

#include "core/page_tree.hpp"

#include <optional>
#include <vector>

namespace pagetree {

// All mutators return a new tree and leave their input untouched. An operation
// that does not apply (unknown node, cycle, last real node) returns the input
// tree unchanged.

struct NodeInsertion {
    Tree tree;
    std::optional<NodeId> new_node_id;
};

/** New last child of `parent_id`. */
[[nodiscard]] NodeInsertion add_branch_node(const Tree& tree, NodeId parent_id, int page_index);

/**
 * New first child of `parent_id`. The parent's previous first child becomes the
 * new node's only child; without children this equals add_branch_node().
 */
[[nodiscard]] NodeInsertion insert_node(const Tree& tree, NodeId parent_id, int page_index);

/**
 * Delete `node_id` and, when `remove_descendants`, its whole subtree. Otherwise
 * its children take its slot in the parent. Removing a root without its
 * descendants promotes the first child (see reroot_by_first_child()).
 */
[[nodiscard]] Tree remove_node(const Tree& tree, NodeId node_id, bool remove_descendants);

struct MoveOptions {
    bool allow_descendant = false;
};

[[nodiscard]] bool can_move_node(const Tree& tree,
                                 NodeId source_id,
                                 NodeId target_id,
                                 MoveOptions options = {});

// Single-node moves: the source leaves its children behind in its old slot.
// Every node lies under the root, so a root source is refused here; drops
// reroot it first (see plan_drop()).
[[nodiscard]] Tree move_node_to_parent(const Tree& tree, NodeId source_id, NodeId target_id);
[[nodiscard]] Tree move_node_to_insert_position(const Tree& tree, NodeId source_id, NodeId target_id);

// Subtree moves: the source keeps its descendants.
[[nodiscard]] Tree move_subtree_to_parent(const Tree& tree, NodeId source_id, NodeId target_id);
[[nodiscard]] Tree move_subtree_to_insert_position(const Tree& tree, NodeId source_id, NodeId target_id);

/** Move the source and the siblings after it to the end of the target's children. */
[[nodiscard]] Tree move_node_with_right_siblings_to_parent(const Tree& tree,
                                                           NodeId source_id,
                                                           NodeId target_id);

/**
 * Promote the root's first child to root. The old root's other children are
 * prepended to the new root's children and the old root is left detached
 * (no parent, no children) but still present.
 */
[[nodiscard]] Tree reroot_by_first_child(const Tree& tree, NodeId root_id);

/**
 * Unlink `node_id` from its parent, splicing its children into its slot.
 * The node stays in the tree, detached.
 */
[[nodiscard]] Tree detach_leaving_children(const Tree& tree, NodeId node_id);

enum class AttachPosition {
    Branch,
    Insert
};

/** Attach a detached node under `target_id`. */
[[nodiscard]] Tree attach_node(const Tree& tree,
                               NodeId node_id,
                               NodeId target_id,
                               AttachPosition position);

// ============================================================================
// Page-index bookkeeping for list edits
// ============================================================================

/**
 * A page was inserted at `insert_index`: shift indices at or after it and add
 * a node for it between the node of `parent_page_index` and its first child.
 */
[[nodiscard]] Tree insert_page_into_tree(const Tree& tree, int insert_index, int parent_page_index);

/** The page at `remove_index` was removed: splice its node out and shift later indices down. */
[[nodiscard]] Tree remove_page_from_tree(const Tree& tree, int remove_index);

/** `count` pages inserted at `start_index` as a chain after `parent_page_index`. */
[[nodiscard]] Tree insert_pages_into_tree(const Tree& tree,
                                          int start_index,
                                          int count,
                                          int parent_page_index);

/** Pages in [start_index, end_index) were removed. */
[[nodiscard]] Tree remove_pages_from_tree(const Tree& tree, int start_index, int end_index);

/**
 * Append `incoming` as further top-level sequences of `base` under a virtual
 * root. Incoming page indices are shifted by `page_offset`; ids are reassigned.
 */
[[nodiscard]] Tree merge_independent_trees(const Tree& base, const Tree& incoming, int page_offset);

} // namespace pagetree
