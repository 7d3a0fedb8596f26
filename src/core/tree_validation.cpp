#include "core/tree_validation.hpp"

#include <algorithm>
#include <set>

namespace pagetree {
namespace {

std::string node_label(NodeId id) {
    return "Node " + std::to_string(id);
}

} // namespace

TreeValidation validate_tree(const Tree& tree) {
    TreeValidation result;
    auto fail = [&](std::string message) {
        result.valid = false;
        result.errors.push_back(std::move(message));
    };

    if (tree.empty()) {
        if (tree.root_id()) fail("Empty tree has root " + std::to_string(*tree.root_id()));
        return result;
    }

    const auto root = tree.root_id();
    if (!root) {
        fail("Tree has nodes but no root");
    } else if (const auto* node = tree.find(*root); !node) {
        fail("Root node " + std::to_string(*root) + " not found in nodes");
    } else if (node->parent_id) {
        fail("Root node " + std::to_string(*root) + " has parent " + std::to_string(*node->parent_id));
    }

    size_t virtual_count = 0;
    tree.for_each([&](const Node& node) {
        if (is_virtual_node(node)) {
            ++virtual_count;
            if (node.id != root) fail(node_label(node.id) + " is virtual but not the root");
        } else if (node.page_index < 0) {
            fail(node_label(node.id) + " has invalid page index " + std::to_string(node.page_index));
        }

        if (!node.parent_id) {
            if (node.id != root) fail(node_label(node.id) + " has no parent but is not the root");
        } else if (const auto* parent = tree.find(*node.parent_id); !parent) {
            fail(node_label(node.id) + " has invalid parent " + std::to_string(*node.parent_id));
        } else {
            const auto listed = std::count(parent->children_ids.begin(), parent->children_ids.end(), node.id);
            if (listed != 1) {
                fail(node_label(node.id) + " is listed " + std::to_string(listed) + " times by parent " +
                     std::to_string(parent->id));
            }
        }

        std::set<NodeId> seen;
        for (const auto child_id : node.children_ids) {
            if (!seen.insert(child_id).second) continue;
            const auto* child = tree.find(child_id);
            if (!child) {
                fail(node_label(node.id) + " has invalid child " + std::to_string(child_id));
            } else if (child->parent_id != node.id) {
                fail(node_label(node.id) + " lists child " + std::to_string(child_id) +
                     " whose parent is elsewhere");
            }
        }
    });

    if (virtual_count > 1) {
        fail("Tree has " + std::to_string(virtual_count) + " virtual nodes");
    }

    // Any path to the root longer than the node count must contain a cycle.
    tree.for_each([&](const Node& node) {
        std::optional<NodeId> current = node.id;
        size_t steps = 0;
        while (current && steps <= tree.size()) {
            const auto* step = tree.find(*current);
            current = step ? step->parent_id : std::nullopt;
            ++steps;
        }
        if (steps > tree.size()) fail("Cycle detected starting from node " + std::to_string(node.id));
    });

    if (root && tree.contains(*root)) {
        const auto reachable = get_descendants(tree, *root).size();
        if (reachable != tree.size()) {
            fail(std::to_string(tree.size() - reachable) + " node(s) unreachable from the root");
        }
    }

    return result;
}

} // namespace pagetree
