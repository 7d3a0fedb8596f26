#pragma once

#include "core/page.hpp"
#include "core/page_tree.hpp"

#include <map>
#include <set>
#include <vector>

namespace pagetree {

struct NormalizeResult {
    Tree tree;
    PageList pages;
    bool changed{false};
    /** Old page position -> new page position. */
    std::map<int, int> index_map;
};

/**
 * Page order implied by `tree`: real page indices in pre-order (out-of-range
 * and repeated indices skipped), then every page the tree does not reach, in
 * its current order.
 */
[[nodiscard]] std::vector<int> linear_page_order(const Tree& tree, size_t page_count);

/**
 * Bring `pages` into the order of `tree`.
 *
 * When the order is already the identity nothing is copied and `changed` is
 * false. Otherwise pages are moved, their references rewritten (see
 * reorder_pages()), and the tree's page indices updated through the same map.
 */
[[nodiscard]] NormalizeResult normalize_tree_and_pages(const Tree& tree, const PageList& pages);

/**
 * Build a new page list from `order` (positions in `pages`; positions left out
 * are dropped).
 *
 * A reference that still points backward after the move is renumbered. Any
 * other reference is resolved in the old list and replaced by a copy of the
 * value it showed, or by an empty value when the chain is broken. The new
 * first page keeps the colorize flag of the old first page.
 */
[[nodiscard]] PageList reorder_pages(const PageList& pages, const std::vector<int>& order);

/**
 * Remove the pages at `removed` (positions), renumbering the survivors and the
 * tree's page indices.
 */
[[nodiscard]] NormalizeResult drop_pages(const Tree& tree, const PageList& pages, const std::set<int>& removed);

/**
 * Map a cursor through an index map. A position that was dropped lands on the
 * nearest surviving page before it, or 0.
 */
[[nodiscard]] int remap_index(const std::map<int, int>& index_map, int index);

} // namespace pagetree
