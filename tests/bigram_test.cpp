#include "bigram.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "metrics/perplexity.hpp"
#include "tokenizer.hpp"

TEST(CharTokenizer, EncodesSortedVocabulary) {
  auto tokenizer = CharTokenizer::from_texts({"abba", "cab"});
  EXPECT_EQ(tokenizer.vocab_size(), 3);
  EXPECT_EQ(tokenizer.encode("abc"), (std::vector<int>{0, 1, 2}));
  EXPECT_EQ(tokenizer.encode("cabba"), (std::vector<int>{2, 0, 1, 1, 0}));
  EXPECT_THROW(tokenizer.encode('z'), std::out_of_range);
  EXPECT_THROW(tokenizer.encode("abz"), std::out_of_range);
}

TEST(BigramLM, SmoothedRowsSumToOne) {
  std::vector<int> train = {0, 1, 0, 1, 2, 0};
  BigramLM model(3, train, 0.5);
  for (int prev = 0; prev < 3; ++prev) {
    double row = 0.0;
    for (int next = 0; next < 3; ++next) row += model.prob(prev, next);
    EXPECT_NEAR(row, 1.0, 1e-12);
  }
  double start = 0.0;
  for (int t = 0; t < 3; ++t) start += model.start_prob(t);
  EXPECT_NEAR(start, 1.0, 1e-12);
}

TEST(BigramLM, CountsTransitions) {
  std::vector<int> train = {0, 1, 0, 1, 2, 0};
  BigramLM model(3, train, 0.0);
  EXPECT_DOUBLE_EQ(model.prob(0, 1), 1.0);
  EXPECT_DOUBLE_EQ(model.prob(1, 0), 0.5);
  EXPECT_DOUBLE_EQ(model.prob(1, 2), 0.5);
  EXPECT_DOUBLE_EQ(model.start_prob(0), 0.5);
  EXPECT_DOUBLE_EQ(model.probability({1, 0, 1}, 0), model.start_prob(1));
  EXPECT_DOUBLE_EQ(model.probability({1, 0, 1}, 2), 1.0);
  // start_prob(0) * prob(0, 1) * prob(1, 0) = 0.5 * 1.0 * 0.5
  EXPECT_NEAR(metrics::sequence_cross_entropy(
                  [&model](const std::vector<int>& seq, size_t pos) {
                    return model.probability(seq, pos);
                  },
                  std::vector<int>{0, 1, 0}),
              -std::log(0.25) / 3.0, 1e-12);
}

TEST(BigramLM, RejectsBadArguments) {
  EXPECT_THROW(BigramLM(0, {}), std::invalid_argument);
  EXPECT_THROW(BigramLM(2, {0, 1}, -1.0), std::invalid_argument);
  EXPECT_THROW(BigramLM(2, {0, 5}), std::out_of_range);
  BigramLM model(2, {0, 1});
  EXPECT_THROW(model.prob(0, 2), std::out_of_range);
  EXPECT_THROW(model.probability({0}, 1), std::out_of_range);
}

TEST(BigramLM, DrivesPerplexity) {
  const std::string train = "abababababababab";
  auto tokenizer = CharTokenizer::from_texts({train, "ba", "aa"});
  BigramLM model(tokenizer.vocab_size(), tokenizer.encode(train), 1.0);
  metrics::ProbabilityFn<int> fn = [&model](const std::vector<int>& seq,
                                            size_t pos) {
    return model.probability(seq, pos);
  };
  const double seen =
      metrics::sequence_perplexity(fn, tokenizer.encode("abab"));
  const double unseen =
      metrics::sequence_perplexity(fn, tokenizer.encode("aaaa"));
  EXPECT_GE(seen, 1.0);
  EXPECT_LT(seen, unseen);
}

TEST(BigramLM, UnsmoothedZeroProbabilityIsReported) {
  const std::string train = "ababab";
  auto tokenizer = CharTokenizer::from_texts({train});
  BigramLM model(tokenizer.vocab_size(), tokenizer.encode(train), 0.0);
  metrics::ProbabilityFn<int> fn = [&model](const std::vector<int>& seq,
                                            size_t pos) {
    return model.probability(seq, pos);
  };
  EXPECT_THROW(metrics::sequence_perplexity(fn, tokenizer.encode("aa")),
               metrics::InvalidProbability);
}
