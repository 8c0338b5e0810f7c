#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file confidence.hpp
 * @brief Confidence scoring for newly admitted thoughts
 *
 * ThoughtTreeManager asks a ConfidenceAssessor for a score in [0, 1] for
 * every node it admits and stores it on the node. The default,
 * KeywordConfidenceAssessor, starts from 0.7 and adjusts for surface
 * markers:
 *
 *   +0.10  assertive   (should, must, need, will, definitely, certainly)
 *   -0.15  hedging     (maybe, perhaps, might, could, possibly, probably)
 *   +0.10  evidential  (because, since, evidence, shown, demonstrated, proved)
 *   -0.10  ends with '?'
 *   -0.20  uncertainty (not sure, don't know, unclear)
 *   -0.10  repeats the previous thought (Jaccard > 0.7) whose score was > 0.6
 *
 * Composers can substitute their own assessor.
 */

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace trellis {

struct ConfidenceResult {
  double confidence = 0.0;
  std::vector<std::string> factors;  ///< Markers that moved the score
};

class ConfidenceAssessor {
public:
  virtual ~ConfidenceAssessor() = default;

  /**
   * @param thought Text of the new thought
   * @param context Earlier thoughts of the session, oldest first
   * @param previous Score of the most recent earlier thought, if any
   */
  virtual ConfidenceResult assess(const std::string& thought,
                                  const std::vector<std::string>& context,
                                  std::optional<double> previous) const = 0;
};

class KeywordConfidenceAssessor : public ConfidenceAssessor {
public:
  ConfidenceResult assess(const std::string& thought,
                          const std::vector<std::string>& context,
                          std::optional<double> previous) const override {
    ConfidenceResult r;
    double conf = 0.7;
    const Markers& m = markers();

    if (std::regex_search(thought, m.action)) {
      conf += 0.1;
      r.factors.push_back("assertive language");
    }
    if (std::regex_search(thought, m.hedge)) {
      conf -= 0.15;
      r.factors.push_back("hedging language");
    }
    if (std::regex_search(thought, m.evidence)) {
      conf += 0.1;
      r.factors.push_back("evidence-based");
    }
    if (ends_with_question(thought)) {
      conf -= 0.1;
      r.factors.push_back("question form");
    }
    if (std::regex_search(thought, m.uncertainty)) {
      conf -= 0.2;
      r.factors.push_back("explicit uncertainty");
    }

    if (previous && !context.empty()) {
      double sim = jaccard(tokenize(thought), tokenize(context.back()));
      if (sim > 0.7 && *previous > 0.6) {
        conf -= 0.1;
        r.factors.push_back("repetitive content");
      }
    }

    r.confidence = std::clamp(conf, 0.0, 1.0);
    return r;
  }

  /// Lowercased content words longer than two characters, stop words removed
  static std::unordered_set<std::string> tokenize(const std::string& text) {
    static const std::unordered_set<std::string> stop = {
        "the", "and", "but", "for", "with", "from", "are", "was", "were",
        "been", "being", "have", "has", "had", "does", "did", "will", "would",
        "could", "should", "may", "might", "must", "shall", "can", "need",
        "this", "that", "these", "those", "you", "she", "they", "what",
        "which", "who", "whom", "when", "where", "why", "how", "all", "each",
        "every", "both", "few", "more", "most", "other", "some", "such", "not",
        "only", "own", "same", "than", "too", "very", "just", "also", "now",
        "here", "there", "then", "once", "about", "into", "through", "during",
        "before", "after", "above", "below", "down", "out", "off", "over",
        "under", "again", "further", "its"};

    std::unordered_set<std::string> words;
    std::string cur;
    auto flush = [&]() {
      if (cur.size() > 2 && !stop.count(cur)) words.insert(cur);
      cur.clear();
    };
    for (unsigned char c : text) {
      if (std::isalnum(c) || c == '_') {
        cur.push_back(static_cast<char>(std::tolower(c)));
      } else {
        flush();
      }
    }
    flush();
    return words;
  }

  static double jaccard(const std::unordered_set<std::string>& a,
                        const std::unordered_set<std::string>& b) {
    if (a.empty() || b.empty()) return 0.0;
    size_t common = 0;
    for (const auto& w : a) {
      if (b.count(w)) ++common;
    }
    size_t uni = a.size() + b.size() - common;
    return static_cast<double>(common) / static_cast<double>(uni);
  }

private:
  struct Markers {
    std::regex action;
    std::regex hedge;
    std::regex evidence;
    std::regex uncertainty;
  };

  static const Markers& markers() {
    static const Markers m = [] {
      auto flags = std::regex::ECMAScript | std::regex::icase;
      return Markers{
          std::regex("\\b(should|must|need|will|definitely|certainly)\\b", flags),
          std::regex("\\b(maybe|perhaps|might|could|possibly|probably)\\b", flags),
          std::regex("\\b(because|since|evidence|shown|demonstrated|proved)\\b", flags),
          std::regex("\\b(not sure|don'?t know|unclear)\\b", flags),
      };
    }();
    return m;
  }

  static bool ends_with_question(const std::string& s) {
    auto it = std::find_if(s.rbegin(), s.rend(),
                           [](unsigned char c) { return std::isspace(c) == 0; });
    return it != s.rend() && *it == '?';
  }
};

}  // namespace trellis
