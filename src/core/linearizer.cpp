#include "core/linearizer.hpp"

#include <iterator>

namespace pagetree {
namespace {

std::map<int, int> index_map_from_order(const std::vector<int>& order) {
    std::map<int, int> map;
    for (size_t i = 0; i < order.size(); ++i) {
        map[order[i]] = static_cast<int>(i);
    }
    return map;
}

bool is_identity(const std::vector<int>& order) {
    for (size_t i = 0; i < order.size(); ++i) {
        if (order[i] != static_cast<int>(i)) return false;
    }
    return true;
}

} // namespace

std::vector<int> linear_page_order(const Tree& tree, size_t page_count) {
    std::vector<int> order;
    order.reserve(page_count);
    std::vector<bool> placed(page_count, false);

    for (const int index : flatten_tree_to_page_indices(tree)) {
        if (index < 0 || static_cast<size_t>(index) >= page_count) continue;
        if (placed[static_cast<size_t>(index)]) continue;
        placed[static_cast<size_t>(index)] = true;
        order.push_back(index);
    }
    for (size_t i = 0; i < page_count; ++i) {
        if (!placed[i]) order.push_back(static_cast<int>(i));
    }
    return order;
}

PageList reorder_pages(const PageList& pages, const std::vector<int>& order) {
    const auto new_position = index_map_from_order(order);
    const bool first_colorize = pages.empty() ? true : pages.front().flags.colorize;

    PageList out;
    out.reserve(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        const int position = static_cast<int>(i);
        const auto& old = pages[static_cast<size_t>(order[i])];
        Page page = old;
        page.index = position;

        if (position == 0) {
            page.flags.colorize = first_colorize;
        }

        if (const auto* ref = std::get_if<PageRef>(&old.field)) {
            const auto it = new_position.find(ref->index);
            if (it != new_position.end() && it->second < position) {
                page.field = PageRef{it->second};
            } else {
                page.field = resolve_field(pages, ref->index);
            }
        }

        if (const auto* ref = std::get_if<PageRef>(&old.comment)) {
            const auto it = new_position.find(ref->index);
            if (it != new_position.end() && it->second < position) {
                page.comment = PageRef{it->second};
            } else {
                page.comment = resolve_comment(pages, ref->index);
            }
        }

        out.push_back(std::move(page));
    }
    return out;
}

NormalizeResult normalize_tree_and_pages(const Tree& tree, const PageList& pages) {
    const auto order = linear_page_order(tree, pages.size());
    if (is_identity(order)) {
        return NormalizeResult{
            .tree = tree,
            .pages = pages,
            .changed = false,
            .index_map = index_map_from_order(order),
        };
    }

    auto index_map = index_map_from_order(order);
    return NormalizeResult{
        .tree = update_tree_page_indices(tree, index_map),
        .pages = reorder_pages(pages, order),
        .changed = true,
        .index_map = std::move(index_map),
    };
}

NormalizeResult drop_pages(const Tree& tree, const PageList& pages, const std::set<int>& removed) {
    std::vector<int> order;
    order.reserve(pages.size());
    for (size_t i = 0; i < pages.size(); ++i) {
        if (!removed.contains(static_cast<int>(i))) order.push_back(static_cast<int>(i));
    }
    if (order.size() == pages.size()) {
        return NormalizeResult{
            .tree = tree,
            .pages = pages,
            .changed = false,
            .index_map = index_map_from_order(order),
        };
    }

    auto index_map = index_map_from_order(order);
    return NormalizeResult{
        .tree = update_tree_page_indices(tree, index_map),
        .pages = reorder_pages(pages, order),
        .changed = true,
        .index_map = std::move(index_map),
    };
}

int remap_index(const std::map<int, int>& index_map, int index) {
    if (const auto it = index_map.find(index); it != index_map.end()) {
        return it->second;
    }
    auto it = index_map.upper_bound(index);
    if (it == index_map.begin()) return 0;
    return std::prev(it)->second;
}

} // namespace pagetree
