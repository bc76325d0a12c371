#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <vector>

#include "metrics/errors.hpp"

namespace metrics {

template <typename Token>
using NGram = std::vector<Token>;

template <typename Token>
using NGramCounts = std::map<NGram<Token>, size_t>;

// Number of order-n windows in a sequence of length `length`.
inline size_t ngram_total(size_t length, size_t n) {
  return length >= n ? length - n + 1 : 0;
}

// Every contiguous window of length n, counted with multiplicity.
template <typename Token>
NGramCounts<Token> ngrams(const std::vector<Token>& seq, size_t n) {
  if (n == 0) throw InvalidInput("ngrams: order must be positive");
  NGramCounts<Token> counts;
  if (seq.size() < n) return counts;
  for (size_t i = 0; i + n <= seq.size(); ++i) {
    counts[NGram<Token>(seq.begin() + i, seq.begin() + i + n)]++;
  }
  return counts;
}

/**
 * @brief Modified-precision numerator.
 *
 * For each distinct candidate n-gram adds min(candidate count, max count in
 * any single reference). A candidate repeating one matching n-gram gets
 * credit at most as often as some reference contains it.
 */
template <typename Token>
size_t clipped_match_count(const std::vector<Token>& candidate,
                           const std::vector<std::vector<Token>>& references,
                           size_t n) {
  if (references.empty()) {
    throw InvalidInput("clipped_match_count: reference set is empty");
  }
  const auto cand_counts = ngrams(candidate, n);
  if (cand_counts.empty()) return 0;

  NGramCounts<Token> max_ref_counts;
  for (const auto& ref : references) {
    for (const auto& entry : ngrams(ref, n)) {
      auto& slot = max_ref_counts[entry.first];
      slot = std::max(slot, entry.second);
    }
  }

  size_t clipped = 0;
  for (const auto& entry : cand_counts) {
    auto it = max_ref_counts.find(entry.first);
    if (it == max_ref_counts.end()) continue;
    clipped += std::min(entry.second, it->second);
  }
  return clipped;
}

// Clipped matches over candidate n-gram count; 0 when the candidate is
// shorter than n.
template <typename Token>
double modified_precision(const std::vector<Token>& candidate,
                          const std::vector<std::vector<Token>>& references,
                          size_t n) {
  const size_t matches = clipped_match_count(candidate, references, n);
  const size_t total = ngram_total(candidate.size(), n);
  if (total == 0) return 0.0;
  return static_cast<double>(matches) / static_cast<double>(total);
}

}  // namespace metrics
