#pragma once

#include "core/page_tree.hpp"

#include <string>
#include <vector>

namespace pagetree {

struct TreeValidation {
    bool valid{true};
    std::vector<std::string> errors;
};

/**
 * Check every structural invariant of `tree`:
 * - the root exists, has no parent, and is the only parentless node;
 * - parent and child links exist and agree in both directions;
 * - each non-root node is listed exactly once by its parent;
 * - no node is its own ancestor and every node is reachable from the root;
 * - at most one virtual node, and only as the root;
 * - real page indices are non-negative.
 */
[[nodiscard]] TreeValidation validate_tree(const Tree& tree);

} // namespace pagetree
