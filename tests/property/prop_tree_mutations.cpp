#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/tree_mutations.hpp"
#include "core/tree_validation.hpp"

#include <tuple>
#include <vector>

using namespace pagetree;

namespace {

using Op = std::tuple<unsigned, unsigned, unsigned>;

NodeId pick(const Tree& tree, unsigned value) {
    const auto ids = tree.ids();
    return ids[value % ids.size()];
}

Tree apply_op(const Tree& tree, const Op& op, int& next_page) {
    const auto [kind, a, b] = op;
    const auto source = pick(tree, a);
    const auto target = pick(tree, b);
    switch (kind % 8) {
        case 0:
            return add_branch_node(tree, source, next_page++).tree;
        case 1:
            return insert_node(tree, source, next_page++).tree;
        case 2:
            return remove_node(tree, source, b % 2 == 0);
        case 3:
            return move_node_to_parent(tree, source, target);
        case 4:
            return move_node_to_insert_position(tree, source, target);
        case 5:
            return move_subtree_to_parent(tree, source, target);
        case 6:
            return move_subtree_to_insert_position(tree, source, target);
        default:
            return move_node_with_right_siblings_to_parent(tree, source, target);
    }
}

Tree random_tree(const std::vector<Op>& ops) {
    auto tree = create_tree_from_pages(PageList(3));
    int next_page = 3;
    for (const auto& op : ops) {
        tree = apply_op(tree, op, next_page);
    }
    return tree;
}

} // namespace

TEST_CASE("Property: mutations keep trees valid", "[property][tree]") {
    rc::check("every mutation result passes validation",
        [](const std::vector<Op>& ops) {
            auto tree = create_tree_from_pages(PageList(3));
            int next_page = 3;
            for (const auto& op : ops) {
                const auto before = tree;
                tree = apply_op(tree, op, next_page);
                RC_ASSERT(validate_tree(tree).valid);
                RC_ASSERT(validate_tree(before).valid);
                RC_ASSERT(real_node_count(tree) >= 1);
            }
        }
    );
}

TEST_CASE("Property: mutations leave their input untouched", "[property][tree]") {
    rc::check("the input tree compares equal after a mutation",
        [](const std::vector<Op>& ops, const Op& last) {
            const auto tree = random_tree(ops);
            const auto copy = tree;
            int next_page = 1000;
            const auto result = apply_op(tree, last, next_page);
            (void)result;
            RC_ASSERT(tree == copy);
        }
    );
}

TEST_CASE("Property: a node never moves under its own subtree", "[property][tree]") {
    rc::check("moves onto a descendant are refused",
        [](const std::vector<Op>& ops, unsigned pick_source) {
            const auto tree = random_tree(ops);
            const auto source = pick(tree, pick_source);
            for (const auto descendant : get_descendants(tree, source)) {
                RC_ASSERT(!can_move_node(tree, source, descendant));
                RC_ASSERT(move_subtree_to_parent(tree, source, descendant) == tree);
            }
            RC_ASSERT(!can_move_node(tree, source, source));
        }
    );
}

TEST_CASE("Property: subtree moves keep the subtree", "[property][tree]") {
    rc::check("descendants follow a subtree move",
        [](const std::vector<Op>& ops, unsigned a, unsigned b) {
            const auto tree = random_tree(ops);
            const auto source = pick(tree, a);
            const auto target = pick(tree, b);
            RC_PRE(can_move_node(tree, source, target));

            const auto moved = move_subtree_to_parent(tree, source, target);
            if (moved == tree) return;

            RC_ASSERT(find_node(moved, source)->parent_id == std::optional<NodeId>(target));
            RC_ASSERT(get_descendants(moved, source) == get_descendants(tree, source));
        }
    );
}
