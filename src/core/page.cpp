#include "core/page.hpp"

namespace pagetree {
namespace {

bool in_range(const PageList& pages, int index) {
    return index >= 0 && index < static_cast<int>(pages.size());
}

} // namespace

BoardField resolve_field(const PageList& pages, int index) {
    // A valid chain is strictly decreasing, so it cannot be longer than the list.
    for (size_t steps = 0; in_range(pages, index) && steps <= pages.size(); ++steps) {
        const auto& source = pages[static_cast<size_t>(index)].field;
        if (const auto* field = std::get_if<BoardField>(&source)) {
            return field->copy();
        }
        index = std::get<PageRef>(source).index;
    }
    return BoardField{};
}

int comment_source_index(const PageList& pages, int index) {
    for (size_t steps = 0; in_range(pages, index) && steps <= pages.size(); ++steps) {
        const auto& source = pages[static_cast<size_t>(index)].comment;
        if (std::holds_alternative<std::string>(source)) {
            return index;
        }
        index = std::get<PageRef>(source).index;
    }
    return -1;
}

std::string resolve_comment(const PageList& pages, int index) {
    const int source = comment_source_index(pages, index);
    if (source < 0) return {};
    return std::get<std::string>(pages[static_cast<size_t>(source)].comment);
}

Page make_child_page(const PageList& pages, int parent_index, int new_index) {
    Page page;
    page.index = new_index;
    page.field = resolve_field(pages, parent_index);

    const int comment_source = comment_source_index(pages, parent_index);
    if (comment_source >= 0 && comment_source < new_index) {
        page.comment = PageRef{comment_source};
    } else {
        page.comment = std::string{};
    }

    if (in_range(pages, parent_index)) {
        page.flags = pages[static_cast<size_t>(parent_index)].flags;
    }
    page.flags.quiz = false;
    return page;
}

bool references_point_backward(const PageList& pages) {
    for (size_t i = 0; i < pages.size(); ++i) {
        const auto& page = pages[i];
        if (const auto* ref = std::get_if<PageRef>(&page.field)) {
            if (ref->index < 0 || ref->index >= static_cast<int>(i)) return false;
        }
        if (const auto* ref = std::get_if<PageRef>(&page.comment)) {
            if (ref->index < 0 || ref->index >= static_cast<int>(i)) return false;
        }
    }
    return true;
}

PageList with_positional_indices(PageList pages) {
    for (size_t i = 0; i < pages.size(); ++i) {
        pages[i].index = static_cast<int>(i);
    }
    return pages;
}

} // namespace pagetree
