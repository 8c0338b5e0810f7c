/**
 * MCTS Unit Tests
 *
 * Validates UCB1 scoring, backpropagation, suggestion under each strategy,
 * best-path extraction and aggregate statistics.
 */

#include <cmath>
#include <doctest/doctest.h>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <trellis/errors.hpp>
#include <trellis/mcts.hpp>
#include <trellis/thought_tree.hpp>

using namespace trellis;
using namespace trellis::mcts;
using trellis::tree::NodeId;
using trellis::tree::ThoughtTree;

// ============================================================================
// Test helpers
// ============================================================================

namespace {

ThoughtRecord plain(int n, bool more = true) {
  ThoughtRecord t;
  t.thought = "Step " + std::to_string(n);
  t.thought_number = n;
  t.total_thoughts = 5;
  t.next_thought_needed = more;
  return t;
}

ThoughtRecord branch(int n, int from, const std::string& id) {
  ThoughtRecord t = plain(n);
  t.branch_from_thought = from;
  t.branch_id = id;
  return t;
}

// root(#1) with children a(#2) and b(#3, branch "b")
struct Fork {
  ThoughtTree tree{"s", 100};
  NodeId root, a, b;
  Fork() {
    root = tree.add_thought(plain(1)).id;
    a = tree.add_thought(plain(2)).id;
    b = tree.add_thought(branch(3, 1, "b")).id;
  }
};

}  // namespace

// ============================================================================
// compute_ucb1
// ============================================================================

TEST_CASE("mcts: unvisited nodes score +infinity") {
  for (int parent : {0, 1, 10}) {
    for (double c : {0.0, 1.0, 5.0}) {
      double score = compute_ucb1(0, 3.0, parent, c);
      CHECK(std::isinf(score));
      CHECK(score > 0);
    }
  }
}

TEST_CASE("mcts: ucb1 combines average and exploration bonus") {
  double expected = 0.5 + std::sqrt(2.0) * std::sqrt(std::log(4.0) / 2.0);
  CHECK(compute_ucb1(2, 1.0, 4, std::sqrt(2.0)) == doctest::Approx(expected));
  CHECK(compute_ucb1(2, 1.0, 4, 0.0) == doctest::Approx(0.5));
}

TEST_CASE("mcts: parent without visits contributes no exploration") {
  CHECK(compute_ucb1(3, 1.5, 0, 2.0) == doctest::Approx(0.5));
}

// ============================================================================
// backpropagate
// ============================================================================

TEST_CASE("mcts: backpropagate updates depth + 1 nodes") {
  ThoughtTree tree("s", 100);
  tree.add_thought(plain(1));
  tree.add_thought(plain(2));
  NodeId leaf = tree.add_thought(plain(3)).id;

  MCTSEngine engine;
  CHECK(engine.backpropagate(tree, leaf, 0.6) == 3);
  for (const auto* node : tree.get_ancestor_path(leaf)) {
    CHECK(node->visit_count == 1);
    CHECK(node->total_value == doctest::Approx(0.6));
  }

  engine.backpropagate(tree, leaf, 0.2);
  CHECK(tree.get_node(leaf)->average_value() == doctest::Approx(0.4));
}

TEST_CASE("mcts: backpropagate on the root updates only the root") {
  Fork f;
  MCTSEngine engine;
  CHECK(engine.backpropagate(f.tree, f.root, 1.0) == 1);
  CHECK(f.tree.get_node(f.a)->visit_count == 0);
}

TEST_CASE("mcts: backpropagate on an absent node throws TreeError") {
  Fork f;
  MCTSEngine engine;
  CHECK_THROWS_AS(engine.backpropagate(f.tree, "node_missing", 0.5), TreeError);
}

// ============================================================================
// suggest_next
// ============================================================================

TEST_CASE("mcts: unvisited nodes are suggested first") {
  Fork f;
  MCTSEngine engine;
  engine.backpropagate(f.tree, f.a, 0.8);

  SuggestResult r = engine.suggest_next(f.tree, Strategy::Balanced);
  REQUIRE(r.suggestion.has_value());
  CHECK(r.suggestion->node.node_id == f.b);
  CHECK(std::isinf(r.suggestion->ucb1_score));
  CHECK(r.alternatives.size() == 2);
  CHECK(r.alternatives[0].ucb1_score >= r.alternatives[1].ucb1_score);
}

TEST_CASE("mcts: exploit ranks by average value alone") {
  Fork f;
  MCTSEngine engine;
  engine.backpropagate(f.tree, f.a, 0.2);
  engine.backpropagate(f.tree, f.b, 0.9);

  SuggestResult r = engine.suggest_next(f.tree, Strategy::Exploit);
  REQUIRE(r.suggestion.has_value());
  CHECK(r.suggestion->node.node_id == f.b);
  CHECK(r.suggestion->ucb1_score == doctest::Approx(0.9));
  REQUIRE(r.alternatives.size() == 2);
  CHECK(r.alternatives[0].node.node_id == f.root);  // 1.1 / 2
  CHECK(r.alternatives[0].ucb1_score == doctest::Approx(0.55));
  CHECK(r.alternatives[1].node.node_id == f.a);
  CHECK(r.strategy == Strategy::Exploit);
}

TEST_CASE("mcts: strategy scales the exploration constant") {
  MCTSEngine engine(1.5);
  CHECK(engine.effective_constant(Strategy::Balanced) == doctest::Approx(1.5));
  CHECK(engine.effective_constant(Strategy::Explore) == doctest::Approx(3.0));
  CHECK(engine.effective_constant(Strategy::Exploit) == doctest::Approx(0.0));
}

TEST_CASE("mcts: explore favours the less visited sibling") {
  Fork f;
  MCTSEngine engine;
  for (int i = 0; i < 6; ++i) engine.backpropagate(f.tree, f.a, 0.6);
  engine.backpropagate(f.tree, f.b, 0.4);

  // Exploit prefers a (0.6 > 0.4); explore's bonus outweighs the gap
  SuggestResult exploit = engine.suggest_next(f.tree, Strategy::Exploit);
  SuggestResult explore = engine.suggest_next(f.tree, Strategy::Explore);
  CHECK(exploit.suggestion->node.node_id == f.a);
  CHECK(explore.suggestion->node.node_id == f.b);
}

TEST_CASE("mcts: fully terminal tree has no suggestion") {
  ThoughtTree tree("s", 10);
  tree.add_thought(plain(1, false));
  MCTSEngine engine;
  SuggestResult r = engine.suggest_next(tree, Strategy::Balanced);
  CHECK_FALSE(r.suggestion.has_value());
  CHECK(r.alternatives.empty());

  nlohmann::json j = r;
  CHECK(j["suggestion"].is_null());
}

TEST_CASE("mcts: unvisited suggestion serializes without an infinite score") {
  Fork f;
  MCTSEngine engine;
  nlohmann::json j = engine.suggest_next(f.tree, Strategy::Balanced);
  CHECK(j["suggestion"]["ucb1Score"].is_null());
  CHECK(j["suggestion"]["unexplored"] == true);
  CHECK(j["strategy"] == "balanced");
}

// ============================================================================
// extract_best_path / get_tree_stats
// ============================================================================

TEST_CASE("mcts: best path follows the higher-valued branch") {
  Fork f;
  MCTSEngine engine;
  engine.backpropagate(f.tree, f.a, 0.9);
  engine.backpropagate(f.tree, f.b, 0.1);

  auto path = engine.extract_best_path(f.tree);
  REQUIRE(path.size() == 2);
  CHECK(path[0]->id == f.root);
  CHECK(path[1]->id == f.a);
}

TEST_CASE("mcts: best path of empty and root-only trees") {
  MCTSEngine engine;
  ThoughtTree empty("s", 10);
  CHECK(engine.extract_best_path(empty).empty());

  ThoughtTree single("s", 10);
  single.add_thought(plain(1));
  CHECK(engine.extract_best_path(single).size() == 1);
}

TEST_CASE("mcts: tree stats aggregate counts, depth and value") {
  Fork f;
  MCTSEngine engine;
  f.tree.set_cursor(f.a);
  NodeId end = f.tree.add_thought(plain(4, false)).id;
  engine.backpropagate(f.tree, end, 0.5);

  TreeStats s = engine.get_tree_stats(f.tree);
  CHECK(s.total_nodes == 4);
  CHECK(s.max_depth == 2);
  CHECK(s.unexplored_count == 1);  // b
  CHECK(s.terminal_count == 1);
  CHECK(s.average_value == doctest::Approx(0.5));

  nlohmann::json j = s;
  CHECK(j["totalNodes"] == 4);
  CHECK(j["unexploredCount"] == 1);
}

TEST_CASE("mcts: node info is a detached projection") {
  Fork f;
  TreeNodeInfo info = MCTSEngine::to_node_info(*f.tree.get_node(f.root));
  CHECK(info.node_id == f.root);
  CHECK(info.thought_number == 1);
  CHECK(info.child_count == 2);
  CHECK(info.depth == 0);
  CHECK_FALSE(info.is_terminal);
}

TEST_CASE("mcts: strategy names round-trip") {
  for (Strategy s : {Strategy::Explore, Strategy::Exploit, Strategy::Balanced}) {
    CHECK(parse_strategy(strategy_name(s)) == s);
  }
  CHECK_FALSE(parse_strategy("greedy").has_value());
}
