#pragma once

#include "core/page.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace pagetree {

using NodeId = std::uint32_t;

/** Page index carried by the virtual root; never a real page. */
inline constexpr int kVirtualPageIndex = -1;

/** Current schema version of the serialized tree. */
inline constexpr int kTreeSchemaVersion = 1;

/** Largest node id accepted from a serialized tree. */
inline constexpr NodeId kMaxNodeId = 1u << 20;

/**
 * Node - one vertex of the page tree.
 *
 * `children_ids[0]` is the main route; later children are branches.
 */
struct Node {
    NodeId id{0};
    int page_index{0};
    std::optional<NodeId> parent_id;
    std::vector<NodeId> children_ids;

    bool operator==(const Node&) const = default;
};

/**
 * Tree - immutable-by-convention tree value.
 *
 * Nodes live in fixed-size chunks shared between copies. Copying a Tree copies
 * one pointer per chunk; the first write to a shared chunk clones only that
 * chunk, so an edit leaves untouched parts of the old tree shared with the new
 * one. Functions in this library take trees by const reference and return new
 * trees; the mutating members below are for building those results.
 */
class Tree {
public:
    Tree() = default;

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] size_t size() const noexcept { return size_; }

    [[nodiscard]] std::optional<NodeId> root_id() const noexcept { return root_id_; }
    void set_root_id(std::optional<NodeId> id) { root_id_ = id; }

    [[nodiscard]] int version() const noexcept { return version_; }
    void set_version(int version) { version_ = version; }

    /** Next id handed out by allocate_id(). Not part of equality. */
    [[nodiscard]] NodeId next_id() const noexcept { return next_id_; }
    NodeId allocate_id() { return next_id_++; }

    [[nodiscard]] const Node* find(NodeId id) const;
    [[nodiscard]] bool contains(NodeId id) const { return find(id) != nullptr; }

    /** Insert or replace a node. */
    void put(Node node);

    /** Mutable access to an existing node, or nullptr. */
    [[nodiscard]] Node* edit(NodeId id);

    bool erase(NodeId id);

    /** Node ids in ascending order. */
    [[nodiscard]] std::vector<NodeId> ids() const;

    template<typename F>
    void for_each(F&& f) const {
        for (const auto& chunk : chunks_) {
            if (!chunk) continue;
            for (const auto& slot : chunk->slots) {
                if (slot) f(*slot);
            }
        }
    }

    /** True when both trees reference the same storage for `id`. */
    [[nodiscard]] bool shares_node_storage(const Tree& other, NodeId id) const;

    bool operator==(const Tree& other) const;

private:
    static constexpr size_t kChunkSize = 32;

    struct Chunk {
        std::array<std::optional<Node>, kChunkSize> slots;
    };

    [[nodiscard]] const std::optional<Node>* slot(NodeId id) const;
    [[nodiscard]] Chunk& writable_chunk(size_t chunk_index);

    std::vector<std::shared_ptr<Chunk>> chunks_;
    size_t size_ = 0;
    std::optional<NodeId> root_id_;
    int version_ = kTreeSchemaVersion;
    NodeId next_id_ = 1;
};

// ============================================================================
// Queries
// ============================================================================

/**
 * Build a linear chain from a page list: page i is the only child of page i-1.
 */
[[nodiscard]] Tree create_tree_from_pages(const PageList& pages);

[[nodiscard]] const Node* find_node(const Tree& tree, NodeId id);

/** First real node (lowest id) pointing at `page_index`. */
[[nodiscard]] const Node* find_node_by_page_index(const Tree& tree, int page_index);

/** Ids from the root down to `id`; empty when `id` is unknown. */
[[nodiscard]] std::vector<NodeId> get_path_to_node(const Tree& tree, NodeId id);

/** `id` followed by all its descendants in pre-order. */
[[nodiscard]] std::vector<NodeId> get_descendants(const Tree& tree, NodeId id);

/** True when `candidate` is inside the subtree rooted at `ancestor` (itself included). */
[[nodiscard]] bool is_descendant(const Tree& tree, NodeId ancestor, NodeId candidate);

/** Siblings listed after `id` in its parent's children. */
[[nodiscard]] std::vector<NodeId> get_right_siblings(const Tree& tree, NodeId id);

[[nodiscard]] std::vector<NodeId> get_leaf_nodes(const Tree& tree);

[[nodiscard]] bool is_virtual_node(const Node& node);
[[nodiscard]] bool has_virtual_root(const Tree& tree);

/** Number of nodes that stand for real pages. */
[[nodiscard]] size_t real_node_count(const Tree& tree);

/**
 * Give trees with several parentless nodes a single virtual root adopting all
 * of them (the recorded root first). Other trees are returned unchanged.
 */
[[nodiscard]] Tree ensure_virtual_root(const Tree& tree);

/**
 * Wrap the current root under a new virtual root unless it already is one.
 */
[[nodiscard]] Tree wrap_in_virtual_root(const Tree& tree);

/** Root, or the virtual root's first child. */
[[nodiscard]] std::optional<NodeId> get_default_active_node_id(const Tree& tree);

/** Rewrite page indices through `index_map`; unmapped indices are kept. */
[[nodiscard]] Tree update_tree_page_indices(const Tree& tree, const std::map<int, int>& index_map);

/** Real page indices in pre-order, main route first. */
[[nodiscard]] std::vector<int> flatten_tree_to_page_indices(const Tree& tree);

/** 1-based pre-order number of every real node. */
[[nodiscard]] std::map<NodeId, int> get_node_dfs_numbers(const Tree& tree);

/** True when every real page index lies in [0, page_count). */
[[nodiscard]] bool page_indices_in_bounds(const Tree& tree, size_t page_count);

} // namespace pagetree
