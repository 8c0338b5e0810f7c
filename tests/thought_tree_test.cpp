/**
 * ThoughtTree Unit Tests
 *
 * Validates:
 * - Placement rules (plain, branch, revision) and their fallbacks
 * - Cursor movement and find_node_by_thought_number ancestry preference
 * - Capacity pruning order, protected nodes and best-effort behaviour
 * - Depth-limited views with truncation markers
 */

#include <doctest/doctest.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <trellis/errors.hpp>
#include <trellis/mcts.hpp>
#include <trellis/thought_tree.hpp>

using namespace trellis;
using namespace trellis::tree;

// ============================================================================
// Test helpers
// ============================================================================

namespace {

struct ManualClock {
  std::shared_ptr<TimestampMs> now = std::make_shared<TimestampMs>(1000);
  ClockFn fn() const {
    auto t = now;
    return [t]() { return *t; };
  }
  void advance(TimestampMs ms) { *now += ms; }
};

ThoughtRecord plain(int n, bool more = true) {
  ThoughtRecord t;
  t.thought = "Thought number " + std::to_string(n);
  t.thought_number = n;
  t.total_thoughts = 10;
  t.next_thought_needed = more;
  return t;
}

ThoughtRecord branch(int n, int from, const std::string& id) {
  ThoughtRecord t = plain(n);
  t.branch_from_thought = from;
  t.branch_id = id;
  return t;
}

ThoughtRecord revision(int n, int of) {
  ThoughtRecord t = plain(n);
  t.is_revision = true;
  t.revises_thought = of;
  return t;
}

}  // namespace

// ============================================================================
// Placement
// ============================================================================

TEST_CASE("thought_tree: first thought becomes the root") {
  ThoughtTree tree("s", 10);
  CHECK(tree.empty());
  CHECK(tree.root() == nullptr);

  const ThoughtNode& root = tree.add_thought(plain(1));
  CHECK(root.is_root());
  CHECK(root.depth == 0);
  CHECK(tree.root()->id == root.id);
  CHECK(tree.cursor()->id == root.id);
}

TEST_CASE("thought_tree: plain thoughts chain under the cursor") {
  ThoughtTree tree("s", 10);
  NodeId a = tree.add_thought(plain(1)).id;
  NodeId b = tree.add_thought(plain(2)).id;
  const ThoughtNode& c = tree.add_thought(plain(3));

  CHECK(c.depth == 2);
  CHECK(*c.parent_id == b);
  CHECK(*tree.get_node(b)->parent_id == a);
  CHECK(tree.cursor()->id == c.id);
}

TEST_CASE("thought_tree: branch from #1 makes a second child of the root") {
  ThoughtTree tree("s", 10);
  tree.add_thought(plain(1));
  tree.add_thought(plain(2));
  const ThoughtNode& b1 = tree.add_thought(branch(3, 1, "b1"));

  CHECK(tree.size() == 3);
  CHECK(tree.root()->children.size() == 2);
  CHECK(b1.depth == 1);
  for (const ThoughtNode* child : tree.get_children(tree.root()->id)) {
    CHECK(child->depth == 1);
  }
  CHECK(tree.cursor()->id == b1.id);
}

TEST_CASE("thought_tree: branch to an unknown number falls back to the cursor") {
  ThoughtTree tree("s", 10);
  tree.add_thought(plain(1));
  NodeId cursor = tree.add_thought(plain(2)).id;
  const ThoughtNode& b = tree.add_thought(branch(3, 42, "lost"));
  CHECK(*b.parent_id == cursor);
}

TEST_CASE("thought_tree: revision of a non-root node is its sibling") {
  ThoughtTree tree("s", 10);
  tree.add_thought(plain(1));
  const ThoughtNode& two = tree.add_thought(plain(2));
  NodeId two_id = two.id;
  NodeId two_parent = *two.parent_id;
  int two_depth = two.depth;
  tree.add_thought(plain(3));

  const ThoughtNode& rev = tree.add_thought(revision(4, 2));
  CHECK(*rev.parent_id == two_parent);
  CHECK(rev.depth == two_depth);
  CHECK(rev.id != two_id);
}

TEST_CASE("thought_tree: revision of the root becomes the root's child") {
  ThoughtTree tree("s", 10);
  NodeId root = tree.add_thought(plain(1)).id;
  tree.add_thought(plain(2));
  const ThoughtNode& rev = tree.add_thought(revision(3, 1));
  CHECK(*rev.parent_id == root);
  CHECK(rev.depth == 1);
}

TEST_CASE("thought_tree: terminal flag mirrors next_thought_needed") {
  ThoughtTree tree("s", 10);
  tree.add_thought(plain(1));
  const ThoughtNode& last = tree.add_thought(plain(2, false));
  CHECK(last.is_terminal);
  CHECK(tree.get_expandable_nodes().size() == 1);
}

// ============================================================================
// Cursor and lookup
// ============================================================================

TEST_CASE("thought_tree: set_cursor moves the default parent") {
  ThoughtTree tree("s", 10);
  NodeId root = tree.add_thought(plain(1)).id;
  tree.add_thought(plain(2));

  tree.set_cursor(root);
  const ThoughtNode& next = tree.add_thought(plain(3));
  CHECK(*next.parent_id == root);
  CHECK(tree.root()->children.size() == 2);
}

TEST_CASE("thought_tree: set_cursor on an absent node throws TreeError") {
  ThoughtTree tree("s", 10);
  tree.add_thought(plain(1));
  CHECK_THROWS_AS(tree.set_cursor("node_missing"), TreeError);
}

TEST_CASE("thought_tree: duplicate thought numbers prefer the cursor's ancestry") {
  ThoughtTree tree("s", 10);
  NodeId root = tree.add_thought(plain(1)).id;
  NodeId first_two = tree.add_thought(plain(2)).id;   // root -> 2
  tree.set_cursor(root);
  NodeId second_two = tree.add_thought(plain(2)).id;  // root -> 2'
  tree.add_thought(plain(3));                          // under 2'

  CHECK(tree.find_node_by_thought_number(2)->id == second_two);

  tree.set_cursor(first_two);
  CHECK(tree.find_node_by_thought_number(2)->id == first_two);
  CHECK(tree.find_node_by_thought_number(99) == nullptr);
}

TEST_CASE("thought_tree: ancestor path runs root first") {
  ThoughtTree tree("s", 10);
  NodeId a = tree.add_thought(plain(1)).id;
  NodeId b = tree.add_thought(plain(2)).id;
  NodeId c = tree.add_thought(plain(3)).id;

  auto path = tree.get_ancestor_path(c);
  REQUIRE(path.size() == 3);
  CHECK(path[0]->id == a);
  CHECK(path[1]->id == b);
  CHECK(path[2]->id == c);
  CHECK(tree.get_ancestor_path("nope").empty());
}

TEST_CASE("thought_tree: leaves and all nodes are reported in admission order") {
  ThoughtTree tree("s", 10);
  tree.add_thought(plain(1));
  NodeId two = tree.add_thought(plain(2)).id;
  NodeId b = tree.add_thought(branch(3, 1, "b")).id;

  auto leaves = tree.get_leaf_nodes();
  REQUIRE(leaves.size() == 2);
  CHECK(leaves[0]->id == two);
  CHECK(leaves[1]->id == b);
  CHECK(tree.get_all_nodes().size() == 3);
}

// ============================================================================
// Pruning
// ============================================================================

TEST_CASE("thought_tree: size never exceeds capacity when leaves are prunable") {
  ThoughtTree tree("s", 5);
  NodeId root = tree.add_thought(plain(1)).id;
  for (int i = 2; i <= 30; ++i) {
    tree.set_cursor(root);
    tree.add_thought(plain(i));  // star: every node is a leaf under the root
    CHECK(tree.size() <= 5);
  }
  CHECK(tree.root()->id == root);
}

TEST_CASE("thought_tree: the previous cursor is prunable once a branch is admitted") {
  ThoughtTree tree("s", 2);
  NodeId root = tree.add_thought(plain(1)).id;
  NodeId second = tree.add_thought(plain(2)).id;

  const ThoughtNode& alt = tree.add_thought(branch(3, 1, "b1"));
  CHECK(tree.size() == 2);
  CHECK(tree.get_node(second) == nullptr);
  CHECK(tree.cursor()->id == alt.id);
  CHECK(*alt.parent_id == root);
  CHECK(tree.prune() == 0);
}

TEST_CASE("thought_tree: lowest-valued visited leaf is pruned first") {
  ThoughtTree tree("s", 4);
  mcts::MCTSEngine engine;
  NodeId root = tree.add_thought(plain(1)).id;
  NodeId good = tree.add_thought(plain(2)).id;
  tree.set_cursor(root);
  NodeId bad = tree.add_thought(plain(3)).id;
  tree.set_cursor(root);
  NodeId unvisited = tree.add_thought(plain(4)).id;
  engine.backpropagate(tree, good, 0.9);
  engine.backpropagate(tree, bad, 0.1);

  tree.set_cursor(root);
  tree.add_thought(plain(5));

  CHECK(tree.size() == 4);
  CHECK(tree.get_node(bad) == nullptr);
  CHECK(tree.get_node(good) != nullptr);
  CHECK(tree.get_node(unvisited) != nullptr);
}

TEST_CASE("thought_tree: unvisited leaves are pruned last, oldest first") {
  ThoughtTree tree("s", 3);
  NodeId root = tree.add_thought(plain(1)).id;
  NodeId older = tree.add_thought(plain(2)).id;
  tree.set_cursor(root);
  NodeId newer = tree.add_thought(plain(3)).id;

  tree.set_cursor(root);
  tree.add_thought(plain(4));

  CHECK(tree.size() == 3);
  CHECK(tree.get_node(older) == nullptr);
  CHECK(tree.get_node(newer) != nullptr);
}

TEST_CASE("thought_tree: root, cursor and chosen parent survive pruning") {
  ThoughtTree tree("s", 3);
  NodeId root = tree.add_thought(plain(1)).id;
  NodeId mid = tree.add_thought(plain(2)).id;
  NodeId leaf = tree.add_thought(plain(3)).id;

  // Chain of three: the only leaf is the cursor, nothing is prunable
  const ThoughtNode& next = tree.add_thought(plain(4));
  CHECK(tree.size() == 4);
  CHECK(*next.parent_id == leaf);
  CHECK(tree.get_node(root) != nullptr);
  CHECK(tree.get_node(mid) != nullptr);
}

TEST_CASE("thought_tree: pruning a leaf can expose its parent") {
  ThoughtTree tree("s", 3);
  NodeId root = tree.add_thought(plain(1)).id;
  NodeId m = tree.add_thought(plain(2)).id;
  NodeId l = tree.add_thought(plain(3)).id;
  NodeId n = tree.add_thought(plain(4)).id;  // chain overshoots to 4
  CHECK(tree.size() == 4);

  tree.prune();  // only leaf is the cursor
  CHECK(tree.size() == 4);

  tree.set_cursor(root);
  tree.add_thought(plain(5));  // removes n, then its newly exposed parent l

  CHECK(tree.size() == 3);
  CHECK(tree.get_node(n) == nullptr);
  CHECK(tree.get_node(l) == nullptr);
  CHECK(tree.get_node(m) != nullptr);
  CHECK(tree.root()->children.size() == 2);
  CHECK(tree.find_node_by_thought_number(3) == nullptr);
}

// ============================================================================
// Serialization
// ============================================================================

TEST_CASE("thought_tree: empty tree serializes to null") {
  ThoughtTree tree("s", 10);
  CHECK_FALSE(tree.to_view().has_value());
  CHECK(tree.to_json().is_null());
}

TEST_CASE("thought_tree: max_depth replaces deeper children with a marker") {
  ThoughtTree tree("s", 10);
  tree.add_thought(plain(1));
  tree.add_thought(plain(2));
  tree.add_thought(plain(3));
  tree.add_thought(branch(4, 2, "x"));

  nlohmann::json full = tree.to_json();
  CHECK(full["children"][0]["children"].size() == 2);

  nlohmann::json cut = tree.to_json(1);
  CHECK(cut["children"][0]["children"] == "2 children truncated");
  CHECK(cut["children"][0]["childCount"] == 2);

  auto view = tree.to_view(0);
  REQUIRE(view.has_value());
  const auto* marker = std::get_if<TruncationMarker>(&view->children);
  REQUIRE(marker != nullptr);
  CHECK(marker->count == 1);
}

TEST_CASE("thought_tree: long thoughts are previewed") {
  ThoughtTree tree("s", 10);
  ThoughtRecord t = plain(1);
  t.thought = std::string(150, 'a');
  tree.add_thought(t);

  nlohmann::json j = tree.to_json();
  std::string preview = j["thought"];
  CHECK(preview.size() == THOUGHT_PREVIEW_LENGTH + 3);
  CHECK(preview.substr(preview.size() - 3) == "...");
  CHECK(j["isCursor"] == true);
}

TEST_CASE("thought_tree: timestamps follow the injected clock") {
  ManualClock clock;
  ThoughtTree tree("s", 10, clock.fn());
  CHECK(tree.created_at() == 1000);
  clock.advance(500);
  const ThoughtNode& n = tree.add_thought(plain(1));
  CHECK(n.created_at == 1500);
  CHECK(tree.last_accessed() == 1500);
}
