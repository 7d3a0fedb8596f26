#include <catch2/catch_test_macros.hpp>
#include "core/tree_mutations.hpp"
#include "core/tree_validation.hpp"

using namespace pagetree;

namespace {

Node node(NodeId id, int page, std::optional<NodeId> parent, std::vector<NodeId> children = {}) {
    return Node{.id = id, .page_index = page, .parent_id = parent, .children_ids = std::move(children)};
}

const std::vector<NodeId>& children_of(const Tree& tree, NodeId id) {
    return find_node(tree, id)->children_ids;
}

// A(1,p0) with children [B(2,p1), C(3,p2)]; B has child D(4,p3); C has child E(5,p4).
Tree sample_tree() {
    Tree tree;
    tree.put(node(1, 0, std::nullopt, {2, 3}));
    tree.put(node(2, 1, 1, {4}));
    tree.put(node(3, 2, 1, {5}));
    tree.put(node(4, 3, 2));
    tree.put(node(5, 4, 3));
    tree.set_root_id(1);
    return tree;
}

} // namespace

TEST_CASE("Mutations: branch then remove keeps sibling order", "[tree][mutations]") {
    Tree tree;
    tree.put(node(1, 0, std::nullopt, {2}));
    tree.put(node(2, 1, 1));
    tree.set_root_id(1);

    const auto branched = add_branch_node(tree, 1, 2);
    REQUIRE(branched.new_node_id);
    const auto c = *branched.new_node_id;
    REQUIRE(children_of(branched.tree, 1) == std::vector<NodeId>{2, c});
    REQUIRE(find_node(branched.tree, c)->page_index == 2);

    const auto removed = remove_node(branched.tree, 2, false);
    REQUIRE(children_of(removed, 1) == std::vector<NodeId>{c});
    REQUIRE(validate_tree(removed).valid);
}

TEST_CASE("Mutations: removing a node splices its children into its slot", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto removed = remove_node(tree, 2, false);

    REQUIRE(children_of(removed, 1) == std::vector<NodeId>{4, 3});
    REQUIRE(find_node(removed, 4)->parent_id == NodeId{1});
    REQUIRE_FALSE(removed.contains(2));
    REQUIRE(validate_tree(removed).valid);
}

TEST_CASE("Mutations: removing with descendants drops the subtree", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto removed = remove_node(tree, 3, true);

    REQUIRE(children_of(removed, 1) == std::vector<NodeId>{2});
    REQUIRE_FALSE(removed.contains(3));
    REQUIRE_FALSE(removed.contains(5));
    REQUIRE(removed.size() == 3);
    REQUIRE(tree.size() == 5);
}

TEST_CASE("Mutations: removing the root alone promotes its first child", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto removed = remove_node(tree, 1, false);

    REQUIRE(removed.root_id() == NodeId{2});
    REQUIRE(children_of(removed, 2) == std::vector<NodeId>{3, 4});
    REQUIRE_FALSE(removed.contains(1));
    REQUIRE(validate_tree(removed).valid);
}

TEST_CASE("Mutations: the last real node cannot be removed", "[tree][mutations]") {
    Tree single;
    single.put(node(1, 0, std::nullopt));
    single.set_root_id(1);

    REQUIRE(remove_node(single, 1, false) == single);
    REQUIRE(remove_node(single, 1, true) == single);
    REQUIRE(remove_node(sample_tree(), 1, true) == sample_tree());
}

TEST_CASE("Mutations: the virtual root cannot be removed", "[tree][mutations]") {
    const auto tree = wrap_in_virtual_root(sample_tree());
    const auto virtual_id = *tree.root_id();

    REQUIRE(remove_node(tree, virtual_id, false) == tree);
}

TEST_CASE("Mutations: insert_node goes between parent and first child", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto inserted = insert_node(tree, 1, 5);
    const auto id = *inserted.new_node_id;

    REQUIRE(children_of(inserted.tree, 1) == std::vector<NodeId>{id, 3});
    REQUIRE(children_of(inserted.tree, id) == std::vector<NodeId>{2});
    REQUIRE(find_node(inserted.tree, 2)->parent_id == id);
    REQUIRE(validate_tree(inserted.tree).valid);
}

TEST_CASE("Mutations: insert_node on a leaf adds the only child", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto inserted = insert_node(tree, 4, 5);

    REQUIRE(children_of(inserted.tree, 4) == std::vector<NodeId>{*inserted.new_node_id});
}

TEST_CASE("Mutations: unknown parents leave the tree unchanged", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto branched = add_branch_node(tree, 99, 5);
    REQUIRE_FALSE(branched.new_node_id);
    REQUIRE(branched.tree == tree);
    REQUIRE_FALSE(insert_node(tree, 99, 5).new_node_id);
}

TEST_CASE("Mutations: can_move_node rules", "[tree][mutations]") {
    const auto tree = sample_tree();

    REQUIRE(can_move_node(tree, 4, 3));
    REQUIRE_FALSE(can_move_node(tree, 4, 4));
    REQUIRE_FALSE(can_move_node(tree, 4, 99));
    REQUIRE_FALSE(can_move_node(tree, 2, 4));
    REQUIRE(can_move_node(tree, 2, 4, MoveOptions{.allow_descendant = true}));

    const auto wrapped = wrap_in_virtual_root(tree);
    REQUIRE_FALSE(can_move_node(wrapped, *wrapped.root_id(), 4));
}

TEST_CASE("Mutations: moving onto an own descendant is rejected", "[tree][mutations]") {
    const auto tree = sample_tree();

    REQUIRE(move_node_to_parent(tree, 2, 4) == tree);
    REQUIRE(move_subtree_to_parent(tree, 3, 5) == tree);
    REQUIRE(move_node_to_parent(tree, 1, 5) == tree);
}

TEST_CASE("Mutations: single-node move leaves children behind", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto moved = move_node_to_parent(tree, 3, 4);

    REQUIRE(children_of(moved, 1) == std::vector<NodeId>{2, 5});
    REQUIRE(children_of(moved, 4) == std::vector<NodeId>{3});
    REQUIRE(children_of(moved, 3).empty());
    REQUIRE(find_node(moved, 5)->parent_id == NodeId{1});
    REQUIRE(validate_tree(moved).valid);
}

TEST_CASE("Mutations: single-node insert move takes over the first child", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto moved = move_node_to_insert_position(tree, 4, 3);

    REQUIRE(children_of(moved, 3) == std::vector<NodeId>{4});
    REQUIRE(children_of(moved, 4) == std::vector<NodeId>{5});
    REQUIRE(children_of(moved, 2).empty());
    REQUIRE(validate_tree(moved).valid);
}

TEST_CASE("Mutations: subtree moves keep descendants", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto moved = move_subtree_to_parent(tree, 3, 4);

    REQUIRE(children_of(moved, 1) == std::vector<NodeId>{2});
    REQUIRE(children_of(moved, 4) == std::vector<NodeId>{3});
    REQUIRE(children_of(moved, 3) == std::vector<NodeId>{5});
    REQUIRE(validate_tree(moved).valid);
}

TEST_CASE("Mutations: subtree insert appends the displaced child last", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto moved = move_subtree_to_insert_position(tree, 3, 2);

    REQUIRE(children_of(moved, 2) == std::vector<NodeId>{3});
    REQUIRE(children_of(moved, 3) == std::vector<NodeId>{5, 4});
    REQUIRE(find_node(moved, 4)->parent_id == NodeId{3});
    REQUIRE(validate_tree(moved).valid);
}

TEST_CASE("Mutations: moving a node with its right siblings", "[tree][mutations]") {
    Tree tree;
    tree.put(node(1, 0, std::nullopt, {2, 3, 4}));
    tree.put(node(2, 1, 1));
    tree.put(node(3, 2, 1));
    tree.put(node(4, 3, 1));
    tree.set_root_id(1);

    const auto moved = move_node_with_right_siblings_to_parent(tree, 3, 2);

    REQUIRE(children_of(moved, 1) == std::vector<NodeId>{2});
    REQUIRE(children_of(moved, 2) == std::vector<NodeId>{3, 4});
    REQUIRE(find_node(moved, 4)->parent_id == NodeId{2});
    REQUIRE(validate_tree(moved).valid);

    // One of the siblings being the target makes the whole move invalid.
    REQUIRE(move_node_with_right_siblings_to_parent(tree, 2, 4) == tree);
}

TEST_CASE("Mutations: reroot_by_first_child", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto rerooted = reroot_by_first_child(tree, 1);

    REQUIRE(rerooted.root_id() == NodeId{2});
    REQUIRE_FALSE(find_node(rerooted, 2)->parent_id);
    REQUIRE(children_of(rerooted, 2) == std::vector<NodeId>{3, 4});
    REQUIRE(find_node(rerooted, 3)->parent_id == NodeId{2});
    // The old root stays behind, detached.
    REQUIRE(rerooted.contains(1));
    REQUIRE(children_of(rerooted, 1).empty());
    REQUIRE_FALSE(find_node(rerooted, 1)->parent_id);

    REQUIRE(reroot_by_first_child(tree, 2) == tree);
}

TEST_CASE("Mutations: detach and attach", "[tree][mutations]") {
    const auto tree = sample_tree();

    const auto detached = detach_leaving_children(tree, 2);
    REQUIRE(children_of(detached, 1) == std::vector<NodeId>{4, 3});
    REQUIRE_FALSE(find_node(detached, 2)->parent_id);
    REQUIRE_FALSE(validate_tree(detached).valid);

    const auto attached = attach_node(detached, 2, 5, AttachPosition::Branch);
    REQUIRE(children_of(attached, 5) == std::vector<NodeId>{2});
    REQUIRE(validate_tree(attached).valid);

    // Attached nodes cannot be attached again.
    REQUIRE(attach_node(tree, 2, 5, AttachPosition::Branch) == tree);
}

TEST_CASE("Mutations: insert_page_into_tree shifts later pages", "[tree][mutations]") {
    const auto tree = create_tree_from_pages(PageList(3));

    const auto updated = insert_page_into_tree(tree, 1, 0);

    REQUIRE(flatten_tree_to_page_indices(updated) == std::vector<int>{0, 1, 2, 3});
    REQUIRE(find_node(updated, 2)->page_index == 2);
    REQUIRE(find_node(updated, 3)->page_index == 3);
    const auto* inserted = find_node_by_page_index(updated, 1);
    REQUIRE(inserted->parent_id == NodeId{1});
    REQUIRE(inserted->children_ids == std::vector<NodeId>{2});
}

TEST_CASE("Mutations: insert_page_into_tree without a parent page", "[tree][mutations]") {
    SECTION("empty tree") {
        const auto updated = insert_page_into_tree(Tree{}, 0, -1);
        REQUIRE(updated.size() == 1);
        REQUIRE(find_node(updated, *updated.root_id())->page_index == 0);
    }

    SECTION("new page becomes the root") {
        const auto updated = insert_page_into_tree(create_tree_from_pages(PageList(2)), 0, -1);
        REQUIRE(flatten_tree_to_page_indices(updated) == std::vector<int>{0, 1, 2});
        REQUIRE(validate_tree(updated).valid);
    }

    SECTION("virtual root gains a leading sequence") {
        const auto wrapped = wrap_in_virtual_root(create_tree_from_pages(PageList(2)));
        const auto updated = insert_page_into_tree(wrapped, 0, -1);
        REQUIRE(flatten_tree_to_page_indices(updated) == std::vector<int>{0, 1, 2});
        REQUIRE(children_of(updated, *updated.root_id()).size() == 2);
        REQUIRE(validate_tree(updated).valid);
    }
}

TEST_CASE("Mutations: remove_page_from_tree splices and shifts", "[tree][mutations]") {
    const auto tree = create_tree_from_pages(PageList(4));

    const auto updated = remove_page_from_tree(tree, 1);

    REQUIRE(updated.size() == 3);
    REQUIRE(flatten_tree_to_page_indices(updated) == std::vector<int>{0, 1, 2});
    REQUIRE(validate_tree(updated).valid);
}

TEST_CASE("Mutations: range insert and remove", "[tree][mutations]") {
    const auto tree = create_tree_from_pages(PageList(2));

    const auto grown = insert_pages_into_tree(tree, 1, 3, 0);
    REQUIRE(grown.size() == 5);
    REQUIRE(flatten_tree_to_page_indices(grown) == std::vector<int>{0, 1, 2, 3, 4});
    REQUIRE(validate_tree(grown).valid);

    const auto shrunk = remove_pages_from_tree(grown, 1, 4);
    REQUIRE(shrunk.size() == 2);
    REQUIRE(flatten_tree_to_page_indices(shrunk) == std::vector<int>{0, 1});
    REQUIRE(validate_tree(shrunk).valid);
}

TEST_CASE("Mutations: merge_independent_trees appends under a virtual root", "[tree][mutations]") {
    const auto base = create_tree_from_pages(PageList(2));
    const auto incoming = create_tree_from_pages(PageList(3));

    const auto merged = merge_independent_trees(base, incoming, 2);

    REQUIRE(has_virtual_root(merged));
    REQUIRE(real_node_count(merged) == 5);
    REQUIRE(children_of(merged, *merged.root_id()).size() == 2);
    REQUIRE(flatten_tree_to_page_indices(merged) == std::vector<int>{0, 1, 2, 3, 4});
    REQUIRE(validate_tree(merged).valid);
}

TEST_CASE("Mutations: merging into an empty tree", "[tree][mutations]") {
    const auto merged = merge_independent_trees(Tree{}, create_tree_from_pages(PageList(2)), 0);

    REQUIRE(has_virtual_root(merged));
    REQUIRE(flatten_tree_to_page_indices(merged) == std::vector<int>{0, 1});
    REQUIRE(validate_tree(merged).valid);
}

TEST_CASE("Mutations: inputs are never modified", "[tree][mutations]") {
    const auto tree = sample_tree();
    const auto copy = tree;

    (void)add_branch_node(tree, 2, 5);
    (void)remove_node(tree, 3, false);
    (void)move_subtree_to_parent(tree, 3, 4);
    (void)reroot_by_first_child(tree, 1);

    REQUIRE(tree == copy);
}
