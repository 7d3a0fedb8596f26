#pragma once

#include "core/page.hpp"
#include "core/page_tree.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagetree::storage {

/** Prefix of the tree marker inside the first page's comment. */
inline constexpr std::string_view kTreeMarker = "#TREE=";

enum class TreeParseStatus {
    NoMarker,
    Parsed,
    Malformed,
    UnsupportedVersion,
    InvalidTree
};

struct TreeParseResult {
    TreeParseStatus status{TreeParseStatus::NoMarker};
    std::optional<Tree> tree;
    std::vector<std::string> errors;
};

/**
 * `#TREE=` followed by base64 of
 * {"version":1,"rootId":..,"nodes":[{"id","pageIndex","parentId","childrenIds"}]}.
 * An empty tree serializes to an empty string.
 */
[[nodiscard]] std::string serialize_tree_to_comment(const Tree& tree);

/**
 * Find and decode the marker in `comment`.
 *
 * Besides the JSON payload the older compact payload
 * ("root;page,parent,child...;..." by node position) is accepted; its nodes get
 * fresh ids 1..n. A payload with a newer schema version than this build knows
 * reports UnsupportedVersion and no tree. Decoded trees are validated.
 */
[[nodiscard]] TreeParseResult parse_tree_from_comment(std::string_view comment);

/**
 * Remove the marker line. A marker at the end also takes the one newline that
 * append_tree_to_comment() put in front of it.
 */
[[nodiscard]] std::string remove_tree_from_comment(std::string comment);

/** Replace any marker in `comment` with the marker for `tree`, on its own line. */
[[nodiscard]] std::string append_tree_to_comment(const std::string& comment, const Tree& tree);

/**
 * Write `tree` into the first page's comment. Returns `pages` unchanged when
 * disabled, when there is no tree or no page.
 */
[[nodiscard]] PageList embed_tree_in_pages(const PageList& pages, const Tree* tree, bool enabled);

struct TreeExtraction {
    PageList cleaned_pages;
    std::optional<Tree> tree;
    TreeParseStatus status{TreeParseStatus::NoMarker};
    std::vector<std::string> errors;
};

/**
 * Read the tree from the first page's comment and strip the marker. Pages are
 * returned unchanged unless a tree was parsed.
 */
[[nodiscard]] TreeExtraction extract_tree_from_pages(const PageList& pages);

[[nodiscard]] const char* to_string(TreeParseStatus status);

} // namespace pagetree::storage
