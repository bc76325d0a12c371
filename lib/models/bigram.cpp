#include "bigram.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

void check_token(int token, int vocab_size) {
  if (token < 0 || token >= vocab_size) {
    throw std::out_of_range("Token " + std::to_string(token) +
                            " outside vocabulary of size " +
                            std::to_string(vocab_size));
  }
}

}  // namespace

BigramLM::BigramLM(int vocab_size, const std::vector<int> &train_data,
                   double smoothing)
    : vocab_size(vocab_size),
      smoothing(smoothing),
      total_tokens(train_data.size()) {
  if (vocab_size <= 0) {
    throw std::invalid_argument("vocab_size must be positive");
  }
  if (!(smoothing >= 0.0)) {
    throw std::invalid_argument("smoothing must be non-negative");
  }
  table.assign(vocab_size, std::vector<int>(vocab_size, 0));
  row_totals.assign(vocab_size, 0);
  unigram.assign(vocab_size, 0);
  for (size_t i = 0; i < train_data.size(); ++i) {
    check_token(train_data[i], vocab_size);
    unigram[train_data[i]]++;
    if (i + 1 < train_data.size()) {
      check_token(train_data[i + 1], vocab_size);
      table[train_data[i]][train_data[i + 1]]++;
      row_totals[train_data[i]]++;
    }
  }
}

double BigramLM::prob(int prev, int next) const {
  check_token(prev, vocab_size);
  check_token(next, vocab_size);
  const double denom = row_totals[prev] + smoothing * vocab_size;
  if (denom <= 0.0) return 0.0;
  return (table[prev][next] + smoothing) / denom;
}

double BigramLM::start_prob(int token) const {
  check_token(token, vocab_size);
  const double denom =
      static_cast<double>(total_tokens) + smoothing * vocab_size;
  if (denom <= 0.0) return 0.0;
  return (unigram[token] + smoothing) / denom;
}

double BigramLM::probability(const std::vector<int> &seq, size_t pos) const {
  if (pos >= seq.size()) {
    throw std::out_of_range("position past end of sequence");
  }
  if (pos == 0) return start_prob(seq[0]);
  return prob(seq[pos - 1], seq[pos]);
}
