#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pagetree {

/**
 * BoardField - encoded board state of a page.
 *
 * The encoding belongs to the board editor; here it is an opaque value that
 * can be copied and compared. A default-constructed field is the empty board.
 */
class BoardField {
public:
    BoardField() = default;
    explicit BoardField(std::string encoded) : encoded_(std::move(encoded)) {}

    [[nodiscard]] const std::string& encoded() const noexcept { return encoded_; }
    [[nodiscard]] bool empty() const noexcept { return encoded_.empty(); }

    [[nodiscard]] BoardField copy() const { return *this; }

    bool operator==(const BoardField&) const = default;

private:
    std::string encoded_;
};

/**
 * PageRef - a reference to an earlier page's value.
 */
struct PageRef {
    int index{0};

    bool operator==(const PageRef&) const = default;
};

using FieldSource = std::variant<BoardField, PageRef>;
using CommentSource = std::variant<std::string, PageRef>;

struct PageFlags {
    bool colorize = true;
    bool lock = true;
    bool mirror = false;
    bool rise = false;
    bool quiz = false;

    bool operator==(const PageFlags&) const = default;
};

/**
 * Page - one entry of the flat page sequence.
 *
 * `field` and `comment` either hold a concrete value or reference an earlier
 * page. Reference chains always point backward and end at a concrete value.
 */
struct Page {
    int index{0};
    FieldSource field{BoardField{}};
    CommentSource comment{std::string{}};
    PageFlags flags{};

    bool operator==(const Page&) const = default;
};

using PageList = std::vector<Page>;

[[nodiscard]] inline bool has_field_ref(const Page& page) {
    return std::holds_alternative<PageRef>(page.field);
}

[[nodiscard]] inline bool has_comment_ref(const Page& page) {
    return std::holds_alternative<PageRef>(page.comment);
}

/**
 * Create a page holding concrete values.
 */
[[nodiscard]] inline Page make_page(int index,
                                    BoardField field,
                                    std::string comment = {},
                                    PageFlags flags = {}) {
    return Page{
        .index = index,
        .field = std::move(field),
        .comment = std::move(comment),
        .flags = flags,
    };
}

/**
 * Follow the field reference chain of `pages[index]` to a concrete board.
 * Returns the empty board when the chain is broken or loops.
 */
[[nodiscard]] BoardField resolve_field(const PageList& pages, int index);

/**
 * Follow the comment reference chain of `pages[index]` to concrete text.
 * Returns an empty string when the chain is broken or loops.
 */
[[nodiscard]] std::string resolve_comment(const PageList& pages, int index);

/**
 * Index of the page that holds the concrete comment `pages[index]` shows,
 * or -1 when the chain does not resolve.
 */
[[nodiscard]] int comment_source_index(const PageList& pages, int index);

/**
 * Build the page that a new tree node under `parent_index` starts with: the
 * parent's resolved board, a reference to the parent's comment source, and
 * the parent's flags with quiz cleared.
 */
[[nodiscard]] Page make_child_page(const PageList& pages, int parent_index, int new_index);

/**
 * Check that every reference points to an earlier page.
 */
[[nodiscard]] bool references_point_backward(const PageList& pages);

/**
 * Rewrite each page's `index` to its position.
 */
[[nodiscard]] PageList with_positional_indices(PageList pages);

} // namespace pagetree
