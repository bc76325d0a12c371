#ifndef BIGRAM_HPP
#define BIGRAM_HPP

#include <cstddef>
#include <vector>

// Count-based bigram language model with add-k smoothing. Usable as a
// metrics::ProbabilityFn<int> through probability().
struct BigramLM {
  int vocab_size;
  double smoothing;
  std::vector<std::vector<int>> table;  // table[prev][next] = count
  std::vector<int> row_totals;
  std::vector<int> unigram;
  size_t total_tokens;

  BigramLM(int vocab_size, const std::vector<int> &train_data,
           double smoothing = 1.0);

  double prob(int prev, int next) const;
  double start_prob(int token) const;
  // P(seq[pos] | seq[pos - 1]); unigram probability at position 0.
  double probability(const std::vector<int> &seq, size_t pos) const;
};

#endif  // BIGRAM_HPP
