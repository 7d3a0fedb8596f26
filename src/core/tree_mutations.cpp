#include "core/tree_mutations.hpp"

#include <algorithm>
#include <map>

namespace pagetree {
namespace {

void replace_child(Node& parent, NodeId child, const std::vector<NodeId>& replacement) {
    auto& children = parent.children_ids;
    auto it = std::find(children.begin(), children.end(), child);
    if (it == children.end()) return;
    it = children.erase(it);
    children.insert(it, replacement.begin(), replacement.end());
}

void remove_child(Node& parent, NodeId child) {
    auto& children = parent.children_ids;
    children.erase(std::remove(children.begin(), children.end(), child), children.end());
}

bool is_detached(const Tree& tree, const Node& node) {
    return !node.parent_id && tree.root_id() != node.id;
}

// Unlink `node_id` together with its subtree.
Tree detach_subtree(const Tree& tree, NodeId node_id) {
    const auto* node = tree.find(node_id);
    if (!node || !node->parent_id) return tree;

    Tree out = tree;
    if (auto* parent = out.edit(*node->parent_id)) {
        remove_child(*parent, node_id);
    }
    out.edit(node_id)->parent_id.reset();
    return out;
}

void shift_page_indices(Tree& tree, int from, int delta) {
    std::vector<NodeId> affected;
    tree.for_each([&](const Node& node) {
        if (!is_virtual_node(node) && node.page_index >= from) affected.push_back(node.id);
    });
    for (const auto id : affected) {
        tree.edit(id)->page_index += delta;
    }
}

} // namespace

// ============================================================================
// Add / insert / remove
// ============================================================================

NodeInsertion add_branch_node(const Tree& tree, NodeId parent_id, int page_index) {
    if (!tree.contains(parent_id)) return {tree, std::nullopt};

    Tree out = tree;
    const auto id = out.allocate_id();
    out.put(Node{.id = id, .page_index = page_index, .parent_id = parent_id, .children_ids = {}});
    out.edit(parent_id)->children_ids.push_back(id);
    return {std::move(out), id};
}

NodeInsertion insert_node(const Tree& tree, NodeId parent_id, int page_index) {
    const auto* parent = tree.find(parent_id);
    if (!parent) return {tree, std::nullopt};
    if (parent->children_ids.empty()) return add_branch_node(tree, parent_id, page_index);

    const auto first_child = parent->children_ids.front();
    Tree out = tree;
    const auto id = out.allocate_id();
    out.put(Node{.id = id, .page_index = page_index, .parent_id = parent_id, .children_ids = {first_child}});
    out.edit(parent_id)->children_ids.front() = id;
    out.edit(first_child)->parent_id = id;
    return {std::move(out), id};
}

Tree remove_node(const Tree& tree, NodeId node_id, bool remove_descendants) {
    const auto* node = tree.find(node_id);
    if (!node || is_virtual_node(*node)) return tree;

    const std::vector<NodeId> doomed =
        remove_descendants ? get_descendants(tree, node_id) : std::vector<NodeId>{node_id};
    size_t doomed_real = 0;
    for (const auto id : doomed) {
        if (!is_virtual_node(*tree.find(id))) ++doomed_real;
    }
    if (real_node_count(tree) <= doomed_real) return tree;

    Tree out = tree;
    if (!node->parent_id) {
        if (!remove_descendants) {
            if (node->children_ids.empty()) return tree;
            out = reroot_by_first_child(tree, node_id);
        }
        for (const auto id : doomed) out.erase(id);
        return out;
    }

    const auto parent_id = *node->parent_id;
    if (remove_descendants) {
        remove_child(*out.edit(parent_id), node_id);
    } else {
        replace_child(*out.edit(parent_id), node_id, node->children_ids);
        for (const auto child : node->children_ids) {
            out.edit(child)->parent_id = parent_id;
        }
    }
    for (const auto id : doomed) out.erase(id);
    return out;
}

// ============================================================================
// Moves
// ============================================================================

bool can_move_node(const Tree& tree, NodeId source_id, NodeId target_id, MoveOptions options) {
    if (source_id == target_id) return false;
    const auto* source = tree.find(source_id);
    if (!source || !tree.contains(target_id)) return false;
    if (is_virtual_node(*source)) return false;
    if (!options.allow_descendant && is_descendant(tree, source_id, target_id)) return false;
    return true;
}

Tree move_node_to_parent(const Tree& tree, NodeId source_id, NodeId target_id) {
    if (!can_move_node(tree, source_id, target_id)) return tree;
    const auto detached = detach_leaving_children(tree, source_id);
    if (detached == tree) return tree;
    return attach_node(detached, source_id, target_id, AttachPosition::Branch);
}

Tree move_node_to_insert_position(const Tree& tree, NodeId source_id, NodeId target_id) {
    if (!can_move_node(tree, source_id, target_id)) return tree;
    const auto detached = detach_leaving_children(tree, source_id);
    if (detached == tree) return tree;
    return attach_node(detached, source_id, target_id, AttachPosition::Insert);
}

Tree move_subtree_to_parent(const Tree& tree, NodeId source_id, NodeId target_id) {
    if (!can_move_node(tree, source_id, target_id)) return tree;
    const auto detached = detach_subtree(tree, source_id);
    if (detached == tree) return tree;
    return attach_node(detached, source_id, target_id, AttachPosition::Branch);
}

Tree move_subtree_to_insert_position(const Tree& tree, NodeId source_id, NodeId target_id) {
    if (!can_move_node(tree, source_id, target_id)) return tree;
    const auto detached = detach_subtree(tree, source_id);
    if (detached == tree) return tree;
    return attach_node(detached, source_id, target_id, AttachPosition::Insert);
}

Tree move_node_with_right_siblings_to_parent(const Tree& tree, NodeId source_id, NodeId target_id) {
    const auto* source = tree.find(source_id);
    if (!source || !source->parent_id) return tree;

    std::vector<NodeId> moving{source_id};
    const auto siblings = get_right_siblings(tree, source_id);
    moving.insert(moving.end(), siblings.begin(), siblings.end());
    for (const auto id : moving) {
        if (!can_move_node(tree, id, target_id)) return tree;
    }

    const auto old_parent = *source->parent_id;
    Tree out = tree;
    auto& old_children = out.edit(old_parent)->children_ids;
    old_children.erase(std::remove_if(old_children.begin(), old_children.end(),
                                      [&](NodeId id) {
                                          return std::find(moving.begin(), moving.end(), id) != moving.end();
                                      }),
                       old_children.end());

    auto& target_children = out.edit(target_id)->children_ids;
    target_children.insert(target_children.end(), moving.begin(), moving.end());
    for (const auto id : moving) {
        out.edit(id)->parent_id = target_id;
    }
    return out;
}

// ============================================================================
// Detach / attach
// ============================================================================

Tree reroot_by_first_child(const Tree& tree, NodeId root_id) {
    const auto* root = tree.find(root_id);
    if (!root || root->parent_id || tree.root_id() != root_id) return tree;
    if (is_virtual_node(*root) || root->children_ids.empty()) return tree;

    const auto new_root_id = root->children_ids.front();
    const std::vector<NodeId> others(root->children_ids.begin() + 1, root->children_ids.end());

    Tree out = tree;
    auto* new_root = out.edit(new_root_id);
    new_root->parent_id.reset();
    new_root->children_ids.insert(new_root->children_ids.begin(), others.begin(), others.end());
    for (const auto id : others) {
        out.edit(id)->parent_id = new_root_id;
    }

    out.edit(root_id)->children_ids.clear();
    out.set_root_id(new_root_id);
    return out;
}

Tree detach_leaving_children(const Tree& tree, NodeId node_id) {
    const auto* node = tree.find(node_id);
    if (!node || !node->parent_id) return tree;

    const auto parent_id = *node->parent_id;
    Tree out = tree;
    replace_child(*out.edit(parent_id), node_id, node->children_ids);
    for (const auto child : node->children_ids) {
        out.edit(child)->parent_id = parent_id;
    }
    auto* detached = out.edit(node_id);
    detached->parent_id.reset();
    detached->children_ids.clear();
    return out;
}

Tree attach_node(const Tree& tree, NodeId node_id, NodeId target_id, AttachPosition position) {
    const auto* node = tree.find(node_id);
    const auto* target = tree.find(target_id);
    if (!node || !target || node_id == target_id) return tree;
    if (!is_detached(tree, *node)) return tree;
    // A detached subtree must not be attached inside itself.
    if (is_descendant(tree, node_id, target_id)) return tree;

    Tree out = tree;
    out.edit(node_id)->parent_id = target_id;
    auto* new_parent = out.edit(target_id);
    if (position == AttachPosition::Branch || new_parent->children_ids.empty()) {
        new_parent->children_ids.push_back(node_id);
        return out;
    }

    const auto displaced = new_parent->children_ids.front();
    new_parent->children_ids.front() = node_id;
    out.edit(displaced)->parent_id = node_id;
    out.edit(node_id)->children_ids.push_back(displaced);
    return out;
}

// ============================================================================
// Page-index bookkeeping
// ============================================================================

Tree insert_page_into_tree(const Tree& tree, int insert_index, int parent_page_index) {
    const auto* parent = find_node_by_page_index(tree, parent_page_index);
    const std::optional<NodeId> parent_id = parent ? std::optional<NodeId>{parent->id} : std::nullopt;

    Tree out = tree;
    shift_page_indices(out, insert_index, 1);

    if (parent_id) {
        return insert_node(out, *parent_id, insert_index).tree;
    }

    const auto id = out.allocate_id();
    const auto root = out.root_id();
    if (!root) {
        out.put(Node{.id = id, .page_index = insert_index, .parent_id = std::nullopt, .children_ids = {}});
        out.set_root_id(id);
        return out;
    }
    if (has_virtual_root(out)) {
        // New leading top-level sequence.
        out.put(Node{.id = id, .page_index = insert_index, .parent_id = *root, .children_ids = {}});
        auto& tops = out.edit(*root)->children_ids;
        tops.insert(tops.begin(), id);
        return out;
    }
    // No parent page: the new page goes in front of the current root.
    out.put(Node{.id = id, .page_index = insert_index, .parent_id = std::nullopt, .children_ids = {*root}});
    out.edit(*root)->parent_id = id;
    out.set_root_id(id);
    return out;
}

Tree remove_page_from_tree(const Tree& tree, int remove_index) {
    Tree out = tree;
    if (const auto* node = find_node_by_page_index(tree, remove_index)) {
        out = remove_node(tree, node->id, false);
    }
    shift_page_indices(out, remove_index + 1, -1);
    return out;
}

Tree insert_pages_into_tree(const Tree& tree, int start_index, int count, int parent_page_index) {
    Tree out = tree;
    for (int i = 0; i < count; ++i) {
        const int parent = i == 0 ? parent_page_index : start_index + i - 1;
        out = insert_page_into_tree(out, start_index + i, parent);
    }
    return out;
}

Tree remove_pages_from_tree(const Tree& tree, int start_index, int end_index) {
    Tree out = tree;
    for (int i = end_index - 1; i >= start_index; --i) {
        out = remove_page_from_tree(out, i);
    }
    return out;
}

// ============================================================================
// Merge
// ============================================================================

Tree merge_independent_trees(const Tree& base, const Tree& incoming, int page_offset) {
    const auto incoming_root = incoming.root_id();
    if (!incoming_root || !incoming.contains(*incoming_root)) return base;

    Tree out = base.empty() ? Tree{} : wrap_in_virtual_root(base);
    if (out.empty()) {
        const auto id = out.allocate_id();
        out.put(Node{.id = id, .page_index = kVirtualPageIndex, .parent_id = std::nullopt, .children_ids = {}});
        out.set_root_id(id);
    }
    const auto virtual_id = *out.root_id();

    std::map<NodeId, NodeId> id_map;
    std::vector<NodeId> order;
    for (const auto id : get_descendants(incoming, *incoming_root)) {
        if (is_virtual_node(*incoming.find(id))) continue;
        id_map[id] = out.allocate_id();
        order.push_back(id);
    }

    for (const auto old_id : order) {
        const auto* source = incoming.find(old_id);
        Node node;
        node.id = id_map.at(old_id);
        node.page_index = source->page_index + page_offset;

        const auto parent_it = source->parent_id ? id_map.find(*source->parent_id) : id_map.end();
        if (parent_it != id_map.end()) {
            node.parent_id = parent_it->second;
        } else {
            node.parent_id = virtual_id;
            out.edit(virtual_id)->children_ids.push_back(node.id);
        }
        for (const auto child : source->children_ids) {
            if (const auto it = id_map.find(child); it != id_map.end()) {
                node.children_ids.push_back(it->second);
            }
        }
        out.put(std::move(node));
    }
    return out;
}

} // namespace pagetree
