#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "metrics/errors.hpp"
#include "metrics/ngram.hpp"

namespace metrics {

enum class BleuSmoothing {
  None,          ///< any zero precision yields a score of exactly 0
  EpsilonFloor,  ///< zero match counts are replaced by epsilon
};

/**
 * @struct BleuConfig
 * @brief Scoring options for corpus and sentence BLEU.
 */
struct BleuConfig {
  int max_order = 4;            ///< Highest n-gram order
  std::vector<double> weights;  ///< Per-order weights; empty means uniform
  BleuSmoothing smoothing = BleuSmoothing::None;
  double epsilon = 0.1;         ///< Numerator used by EpsilonFloor

  /// Throws InvalidInput on a bad order or weight count, a negative or
  /// non-finite weight, or weights that are all zero.
  void validate() const;

  /// Weights to apply, one per order.
  std::vector<double> effective_weights() const;
};

struct BleuResult {
  double score = 0.0;
  double brevity_penalty = 0.0;
  std::vector<double> precisions;  ///< index 0 is unigram precision
  size_t candidate_length = 0;
  size_t reference_length = 0;
};

/**
 * @struct BleuStats
 * @brief Corpus-level sufficient statistics for BLEU.
 *
 * Match and n-gram counts are summed over sentences before dividing, so the
 * corpus precision is an aggregate ratio rather than a mean of sentence
 * precisions.
 */
struct BleuStats {
  std::vector<size_t> matches;  ///< clipped matches per order
  std::vector<size_t> totals;   ///< candidate n-grams per order
  size_t candidate_length = 0;
  size_t reference_length = 0;
  size_t sentences = 0;

  explicit BleuStats(int max_order);

  int max_order() const { return static_cast<int>(matches.size()); }

  template <typename Token>
  void add(const std::vector<Token>& candidate,
           const std::vector<std::vector<Token>>& references);
};

// Length of the reference closest to `candidate_length`; ties go to the
// shorter reference.
size_t closest_reference_length(size_t candidate_length,
                                const std::vector<size_t>& reference_lengths);

// 1 when c > r, exp(1 - r/c) otherwise, 0 when c == 0.
double brevity_penalty(size_t candidate_length, size_t reference_length);

BleuResult compute_bleu(const BleuStats& stats, const BleuConfig& config = {});

template <typename Token>
void BleuStats::add(const std::vector<Token>& candidate,
                    const std::vector<std::vector<Token>>& references) {
  if (references.empty()) {
    throw InvalidInput("bleu: candidate " + std::to_string(sentences) +
                       " has an empty reference set");
  }
  for (size_t n = 1; n <= matches.size(); ++n) {
    matches[n - 1] += clipped_match_count(candidate, references, n);
    totals[n - 1] += ngram_total(candidate.size(), n);
  }
  std::vector<size_t> ref_lengths;
  ref_lengths.reserve(references.size());
  for (const auto& ref : references) ref_lengths.push_back(ref.size());
  candidate_length += candidate.size();
  reference_length += closest_reference_length(candidate.size(), ref_lengths);
  sentences++;
}

template <typename Token>
using BleuPair = std::pair<std::vector<Token>, std::vector<std::vector<Token>>>;

template <typename Token>
BleuResult corpus_bleu_details(const std::vector<BleuPair<Token>>& dataset,
                               const BleuConfig& config = {}) {
  if (dataset.empty()) throw InvalidInput("bleu: empty dataset");
  config.validate();
  BleuStats stats(config.max_order);
  for (const auto& pair : dataset) stats.add(pair.first, pair.second);
  return compute_bleu(stats, config);
}

/**
 * @brief Corpus BLEU over (candidate, reference set) pairs.
 * @return Score in [0, 1]
 * @throws InvalidInput on an empty dataset, empty reference set or bad
 *         configuration
 * @throws DegenerateDataset when every candidate is empty
 */
template <typename Token>
double corpus_bleu(const std::vector<BleuPair<Token>>& dataset,
                   const BleuConfig& config = {}) {
  return corpus_bleu_details(dataset, config).score;
}

// Parallel-list form: references[i] is the reference set of candidates[i].
template <typename Token>
double corpus_bleu(
    const std::vector<std::vector<Token>>& candidates,
    const std::vector<std::vector<std::vector<Token>>>& references,
    const BleuConfig& config = {}) {
  if (candidates.size() != references.size()) {
    throw InvalidInput("bleu: " + std::to_string(candidates.size()) +
                       " candidates but " + std::to_string(references.size()) +
                       " reference sets");
  }
  if (candidates.empty()) throw InvalidInput("bleu: empty dataset");
  config.validate();
  BleuStats stats(config.max_order);
  for (size_t i = 0; i < candidates.size(); ++i) {
    stats.add(candidates[i], references[i]);
  }
  return compute_bleu(stats, config).score;
}

template <typename Token>
double sentence_bleu(const std::vector<Token>& candidate,
                     const std::vector<std::vector<Token>>& references,
                     const BleuConfig& config = {}) {
  config.validate();
  BleuStats stats(config.max_order);
  stats.add(candidate, references);
  return compute_bleu(stats, config).score;
}

}  // namespace metrics
