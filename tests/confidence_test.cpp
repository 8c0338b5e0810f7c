/**
 * Confidence Assessor Unit Tests
 */

#include <algorithm>
#include <doctest/doctest.h>
#include <string>
#include <trellis/confidence.hpp>
#include <vector>

using namespace trellis;

namespace {

bool has_factor(const ConfidenceResult& r, const std::string& f) {
  return std::find(r.factors.begin(), r.factors.end(), f) != r.factors.end();
}

}  // namespace

TEST_CASE("confidence: neutral statement keeps the base score") {
  KeywordConfidenceAssessor a;
  auto r = a.assess("The table lists three columns.", {}, std::nullopt);
  CHECK(r.confidence == doctest::Approx(0.7));
  CHECK(r.factors.empty());
}

TEST_CASE("confidence: assertive and evidential markers raise the score") {
  KeywordConfidenceAssessor a;
  auto r = a.assess("We must index it because the evidence is clear.", {}, std::nullopt);
  CHECK(r.confidence == doctest::Approx(0.9));
  CHECK(has_factor(r, "assertive language"));
  CHECK(has_factor(r, "evidence-based"));
}

TEST_CASE("confidence: hedging and questions lower the score") {
  KeywordConfidenceAssessor a;
  auto r = a.assess("Maybe the cache is stale?", {}, std::nullopt);
  CHECK(r.confidence == doctest::Approx(0.45));
  CHECK(has_factor(r, "hedging language"));
  CHECK(has_factor(r, "question form"));

  auto trailing = a.assess("Is it stale?  ", {}, std::nullopt);
  CHECK(trailing.confidence == doctest::Approx(0.6));
}

TEST_CASE("confidence: explicit uncertainty") {
  KeywordConfidenceAssessor a;
  CHECK(a.assess("I am not sure about the bound.", {}, std::nullopt).confidence ==
        doctest::Approx(0.5));
  CHECK(a.assess("I DON'T KNOW the bound.", {}, std::nullopt).confidence ==
        doctest::Approx(0.5));
}

TEST_CASE("confidence: markers match whole words only") {
  KeywordConfidenceAssessor a;
  // "willow" and "sincerely" contain markers but are not markers
  auto r = a.assess("The willow grows sincerely.", {}, std::nullopt);
  CHECK(r.confidence == doctest::Approx(0.7));
}

TEST_CASE("confidence: repeating a confident thought is penalised") {
  KeywordConfidenceAssessor a;
  std::string text = "Database indexing improves query latency";
  std::vector<std::string> context = {"unrelated opener", text};

  CHECK(a.assess(text, context, 0.8).confidence == doctest::Approx(0.6));
  CHECK(has_factor(a.assess(text, context, 0.8), "repetitive content"));

  // Not penalised when the previous score was low or absent
  CHECK(a.assess(text, context, 0.5).confidence == doctest::Approx(0.7));
  CHECK(a.assess(text, context, std::nullopt).confidence == doctest::Approx(0.7));

  // Only the most recent thought is compared
  std::vector<std::string> older = {text, "something else entirely"};
  CHECK(a.assess(text, older, 0.8).confidence == doctest::Approx(0.7));
}

TEST_CASE("confidence: tokenize drops short and stop words") {
  auto words = KeywordConfidenceAssessor::tokenize("The API is fast, and THE cache_v2 works");
  CHECK(words.count("api") == 1);
  CHECK(words.count("fast") == 1);
  CHECK(words.count("cache_v2") == 1);
  CHECK(words.count("works") == 1);
  CHECK(words.count("the") == 0);
  CHECK(words.count("and") == 0);
  CHECK(words.count("is") == 0);
  CHECK(words.size() == 4);
}

TEST_CASE("confidence: jaccard similarity") {
  using A = KeywordConfidenceAssessor;
  CHECK(A::jaccard({"alpha", "beta"}, {"beta", "gamma"}) == doctest::Approx(1.0 / 3.0));
  CHECK(A::jaccard({"alpha"}, {"alpha"}) == doctest::Approx(1.0));
  CHECK(A::jaccard({}, {"alpha"}) == doctest::Approx(0.0));
}

TEST_CASE("confidence: custom assessors plug in through the interface") {
  struct Fixed : ConfidenceAssessor {
    ConfidenceResult assess(const std::string&, const std::vector<std::string>&,
                            std::optional<double>) const override {
      return ConfidenceResult{0.25, {"fixed"}};
    }
  };
  Fixed f;
  const ConfidenceAssessor& base = f;
  CHECK(base.assess("anything", {}, std::nullopt).confidence == doctest::Approx(0.25));
}
