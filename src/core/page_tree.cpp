#include "core/page_tree.hpp"

#include <algorithm>
#include <set>

namespace pagetree {

// ============================================================================
// Tree storage
// ============================================================================

const std::optional<Node>* Tree::slot(NodeId id) const {
    const auto chunk_index = static_cast<size_t>(id) / kChunkSize;
    if (chunk_index >= chunks_.size() || !chunks_[chunk_index]) return nullptr;
    return &chunks_[chunk_index]->slots[static_cast<size_t>(id) % kChunkSize];
}

Tree::Chunk& Tree::writable_chunk(size_t chunk_index) {
    if (chunk_index >= chunks_.size()) {
        chunks_.resize(chunk_index + 1);
    }
    auto& chunk = chunks_[chunk_index];
    if (!chunk) {
        chunk = std::make_shared<Chunk>();
    } else if (chunk.use_count() > 1) {
        chunk = std::make_shared<Chunk>(*chunk);
    }
    return *chunk;
}

const Node* Tree::find(NodeId id) const {
    const auto* s = slot(id);
    if (!s || !s->has_value()) return nullptr;
    return &**s;
}

void Tree::put(Node node) {
    const auto id = static_cast<size_t>(node.id);
    auto& target = writable_chunk(id / kChunkSize).slots[id % kChunkSize];
    if (!target) ++size_;
    if (node.id >= next_id_) next_id_ = node.id + 1;
    target = std::move(node);
}

Node* Tree::edit(NodeId id) {
    if (!contains(id)) return nullptr;
    const auto index = static_cast<size_t>(id);
    return &*writable_chunk(index / kChunkSize).slots[index % kChunkSize];
}

bool Tree::erase(NodeId id) {
    if (!contains(id)) return false;
    const auto index = static_cast<size_t>(id);
    writable_chunk(index / kChunkSize).slots[index % kChunkSize].reset();
    --size_;
    if (root_id_ == id) root_id_.reset();
    return true;
}

std::vector<NodeId> Tree::ids() const {
    std::vector<NodeId> out;
    out.reserve(size_);
    for_each([&](const Node& node) { out.push_back(node.id); });
    return out;
}

bool Tree::shares_node_storage(const Tree& other, NodeId id) const {
    const auto chunk_index = static_cast<size_t>(id) / kChunkSize;
    if (chunk_index >= chunks_.size() || chunk_index >= other.chunks_.size()) return false;
    return chunks_[chunk_index] && chunks_[chunk_index] == other.chunks_[chunk_index];
}

bool Tree::operator==(const Tree& other) const {
    if (size_ != other.size_ || root_id_ != other.root_id_ || version_ != other.version_) {
        return false;
    }
    bool equal = true;
    for_each([&](const Node& node) {
        if (!equal) return;
        const auto* theirs = other.find(node.id);
        equal = theirs && *theirs == node;
    });
    return equal;
}

// ============================================================================
// Queries
// ============================================================================

Tree create_tree_from_pages(const PageList& pages) {
    Tree tree;
    std::optional<NodeId> previous;
    for (size_t i = 0; i < pages.size(); ++i) {
        Node node;
        node.id = tree.allocate_id();
        node.page_index = static_cast<int>(i);
        node.parent_id = previous;
        if (previous) {
            tree.edit(*previous)->children_ids.push_back(node.id);
        } else {
            tree.set_root_id(node.id);
        }
        previous = node.id;
        tree.put(std::move(node));
    }
    return tree;
}

const Node* find_node(const Tree& tree, NodeId id) {
    return tree.find(id);
}

const Node* find_node_by_page_index(const Tree& tree, int page_index) {
    const Node* found = nullptr;
    tree.for_each([&](const Node& node) {
        if (!found && !is_virtual_node(node) && node.page_index == page_index) {
            found = &node;
        }
    });
    return found;
}

std::vector<NodeId> get_path_to_node(const Tree& tree, NodeId id) {
    std::vector<NodeId> path;
    std::optional<NodeId> current = id;
    while (current) {
        const auto* node = tree.find(*current);
        // A cycle would make the path longer than the tree.
        if (!node || path.size() > tree.size()) break;
        path.push_back(node->id);
        current = node->parent_id;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::vector<NodeId> get_descendants(const Tree& tree, NodeId id) {
    std::vector<NodeId> out;
    if (!tree.contains(id)) return out;

    std::set<NodeId> visited;
    std::vector<NodeId> stack{id};
    while (!stack.empty()) {
        const auto current = stack.back();
        stack.pop_back();
        if (!visited.insert(current).second) continue;
        const auto* node = tree.find(current);
        if (!node) continue;
        out.push_back(current);
        for (auto it = node->children_ids.rbegin(); it != node->children_ids.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return out;
}

bool is_descendant(const Tree& tree, NodeId ancestor, NodeId candidate) {
    if (!tree.contains(ancestor) || !tree.contains(candidate)) return false;
    // Walking up from the candidate is cheaper than collecting the subtree.
    std::optional<NodeId> current = candidate;
    size_t steps = 0;
    while (current && steps <= tree.size()) {
        if (*current == ancestor) return true;
        const auto* node = tree.find(*current);
        if (!node) return false;
        current = node->parent_id;
        ++steps;
    }
    return false;
}

std::vector<NodeId> get_right_siblings(const Tree& tree, NodeId id) {
    const auto* node = tree.find(id);
    if (!node || !node->parent_id) return {};
    const auto* parent = tree.find(*node->parent_id);
    if (!parent) return {};

    const auto& siblings = parent->children_ids;
    auto it = std::find(siblings.begin(), siblings.end(), id);
    if (it == siblings.end()) return {};
    return std::vector<NodeId>(std::next(it), siblings.end());
}

std::vector<NodeId> get_leaf_nodes(const Tree& tree) {
    std::vector<NodeId> leaves;
    tree.for_each([&](const Node& node) {
        if (node.children_ids.empty() && !is_virtual_node(node)) {
            leaves.push_back(node.id);
        }
    });
    return leaves;
}

bool is_virtual_node(const Node& node) {
    return node.page_index == kVirtualPageIndex;
}

bool has_virtual_root(const Tree& tree) {
    const auto root = tree.root_id();
    if (!root) return false;
    const auto* node = tree.find(*root);
    return node && is_virtual_node(*node);
}

size_t real_node_count(const Tree& tree) {
    size_t count = 0;
    tree.for_each([&](const Node& node) {
        if (!is_virtual_node(node)) ++count;
    });
    return count;
}

Tree ensure_virtual_root(const Tree& tree) {
    std::vector<NodeId> tops;
    if (const auto root = tree.root_id(); root && tree.contains(*root)) {
        const auto* node = tree.find(*root);
        if (!node->parent_id) tops.push_back(*root);
    }
    tree.for_each([&](const Node& node) {
        if (!node.parent_id && std::find(tops.begin(), tops.end(), node.id) == tops.end()) {
            tops.push_back(node.id);
        }
    });

    if (tops.size() <= 1) {
        if (tops.empty() || tree.root_id() == tops.front()) return tree;
        Tree out = tree;
        out.set_root_id(tops.front());
        return out;
    }

    Tree out = tree;
    const auto* first = tree.find(tops.front());
    NodeId virtual_id;
    std::vector<NodeId> adopted;
    if (is_virtual_node(*first)) {
        virtual_id = first->id;
        adopted.assign(tops.begin() + 1, tops.end());
    } else {
        virtual_id = out.allocate_id();
        out.put(Node{.id = virtual_id, .page_index = kVirtualPageIndex, .parent_id = std::nullopt, .children_ids = {}});
        adopted = tops;
    }

    for (const auto id : adopted) {
        if (const auto* node = out.find(id); node && is_virtual_node(*node)) {
            // A second virtual node: hand its children over and drop it.
            const auto children = node->children_ids;
            for (const auto child : children) {
                if (auto* moved = out.edit(child)) moved->parent_id = virtual_id;
                out.edit(virtual_id)->children_ids.push_back(child);
            }
            out.erase(id);
            continue;
        }
        out.edit(id)->parent_id = virtual_id;
        out.edit(virtual_id)->children_ids.push_back(id);
    }
    out.set_root_id(virtual_id);
    return out;
}

Tree wrap_in_virtual_root(const Tree& tree) {
    Tree out = ensure_virtual_root(tree);
    const auto root = out.root_id();
    if (!root || has_virtual_root(out)) return out;

    const auto virtual_id = out.allocate_id();
    out.put(Node{.id = virtual_id, .page_index = kVirtualPageIndex, .parent_id = std::nullopt, .children_ids = {*root}});
    out.edit(*root)->parent_id = virtual_id;
    out.set_root_id(virtual_id);
    return out;
}

std::optional<NodeId> get_default_active_node_id(const Tree& tree) {
    const auto root = tree.root_id();
    if (!root) return std::nullopt;
    const auto* node = tree.find(*root);
    if (!node) return std::nullopt;
    if (!is_virtual_node(*node)) return node->id;
    if (node->children_ids.empty()) return std::nullopt;
    return node->children_ids.front();
}

Tree update_tree_page_indices(const Tree& tree, const std::map<int, int>& index_map) {
    Tree out = tree;
    tree.for_each([&](const Node& node) {
        if (is_virtual_node(node)) return;
        const auto it = index_map.find(node.page_index);
        if (it != index_map.end() && it->second != node.page_index) {
            out.edit(node.id)->page_index = it->second;
        }
    });
    return out;
}

std::vector<int> flatten_tree_to_page_indices(const Tree& tree) {
    std::vector<int> indices;
    const auto root = tree.root_id();
    if (!root) return indices;
    for (const auto id : get_descendants(tree, *root)) {
        const auto* node = tree.find(id);
        if (!is_virtual_node(*node)) indices.push_back(node->page_index);
    }
    return indices;
}

std::map<NodeId, int> get_node_dfs_numbers(const Tree& tree) {
    std::map<NodeId, int> numbers;
    const auto root = tree.root_id();
    if (!root) return numbers;
    int counter = 1;
    for (const auto id : get_descendants(tree, *root)) {
        if (!is_virtual_node(*tree.find(id))) numbers[id] = counter++;
    }
    return numbers;
}

bool page_indices_in_bounds(const Tree& tree, size_t page_count) {
    bool ok = true;
    tree.for_each([&](const Node& node) {
        if (is_virtual_node(node)) return;
        if (node.page_index < 0 || static_cast<size_t>(node.page_index) >= page_count) ok = false;
    });
    return ok;
}

} // namespace pagetree
