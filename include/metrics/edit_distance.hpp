#pragma once

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace metrics {

// Breakdown of a minimal edit script turning a reference into a hypothesis.
struct EditOps {
  size_t substitutions = 0;
  size_t deletions = 0;
  size_t insertions = 0;

  size_t total() const { return substitutions + deletions + insertions; }
};

namespace detail {

using DistanceTable = std::vector<std::vector<size_t>>;

// Full (|a|+1) x (|b|+1) Levenshtein table. Row 0 and column 0 hold the
// distance to the empty prefix.
template <typename Token>
DistanceTable levenshtein_table(const std::vector<Token>& a,
                                const std::vector<Token>& b) {
  const size_t m = a.size();
  const size_t n = b.size();
  DistanceTable table(m + 1, std::vector<size_t>(n + 1, 0));
  for (size_t i = 0; i <= m; ++i) table[i][0] = i;
  for (size_t j = 0; j <= n; ++j) table[0][j] = j;
  for (size_t i = 1; i <= m; ++i) {
    for (size_t j = 1; j <= n; ++j) {
      const size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      table[i][j] = std::min({table[i - 1][j] + 1,  // deletion
                              table[i][j - 1] + 1,  // insertion
                              table[i - 1][j - 1] + cost});
    }
  }
  return table;
}

}  // namespace detail

/**
 * @brief Levenshtein distance over token sequences.
 *
 * Minimum number of single-token insertions, deletions and substitutions
 * turning @p a into @p b. Unit cost, no transpositions. Only two rows of the
 * table are kept.
 *
 * @tparam Token Any equality-comparable token type
 * @return Edit count; the length of the other sequence when one is empty
 */
template <typename Token>
size_t edit_distance(const std::vector<Token>& a, const std::vector<Token>& b) {
  if (a.empty()) return b.size();
  if (b.empty()) return a.size();

  std::vector<size_t> prev(b.size() + 1);
  std::vector<size_t> curr(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

  for (size_t i = 1; i <= a.size(); ++i) {
    curr[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      const size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, curr);
  }
  return prev[b.size()];
}

/**
 * @brief Recover substitution/deletion/insertion counts of a minimal script.
 *
 * Back-traces the full table from the bottom-right corner, preferring a
 * match, then substitution, then deletion, then insertion. The returned
 * total always equals edit_distance(reference, hypothesis).
 */
template <typename Token>
EditOps edit_operations(const std::vector<Token>& reference,
                        const std::vector<Token>& hypothesis) {
  const auto table = detail::levenshtein_table(reference, hypothesis);
  EditOps ops;
  size_t i = reference.size();
  size_t j = hypothesis.size();
  while (i > 0 || j > 0) {
    if (i > 0 && j > 0 && reference[i - 1] == hypothesis[j - 1] &&
        table[i][j] == table[i - 1][j - 1]) {
      --i;
      --j;
    } else if (i > 0 && j > 0 && table[i][j] == table[i - 1][j - 1] + 1) {
      ops.substitutions++;
      --i;
      --j;
    } else if (i > 0 && table[i][j] == table[i - 1][j] + 1) {
      ops.deletions++;
      --i;
    } else {
      ops.insertions++;
      --j;
    }
  }
  return ops;
}

}  // namespace metrics
