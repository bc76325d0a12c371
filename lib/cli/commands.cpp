#include "cli/commands.hpp"

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "bigram.hpp"
#include "data/scores.hpp"
#include "data/text.hpp"
#include "metrics/bleu.hpp"
#include "metrics/perplexity.hpp"
#include "metrics/ranking.hpp"
#include "metrics/report.hpp"
#include "metrics/wer.hpp"
#include "nlohmann/json.hpp"
#include "tokenizer.hpp"
#include "utils.hpp"

namespace {

using Sentence = std::vector<std::string>;

void write_report(json &report) {
  const std::string path = getenv_str("MLEVAL_REPORT", "");
  if (path.empty()) return;
  dumpJson(report, path);
  std::cout << "Report written to " << path << std::endl;
}

std::vector<Sentence> tokenize_lines(const std::vector<std::string> &lines) {
  std::vector<Sentence> sentences;
  sentences.reserve(lines.size());
  for (const auto &line : lines) sentences.push_back(split_into_words(line));
  return sentences;
}

void require_same_count(const std::vector<std::string> &a,
                        const std::vector<std::string> &b,
                        const std::string &a_name, const std::string &b_name) {
  if (a.size() != b.size()) {
    throw std::runtime_error(a_name + " has " + std::to_string(a.size()) +
                             " lines but " + b_name + " has " +
                             std::to_string(b.size()));
  }
}

void print_ops(const metrics::WerResult &result) {
  std::cout << "Reference tokens: " << result.reference_length
            << ", hypothesis tokens: " << result.hypothesis_length
            << std::endl;
  std::cout << "S=" << result.ops.substitutions
            << " D=" << result.ops.deletions
            << " I=" << result.ops.insertions << std::endl;
}

template <typename Token>
json error_rate_report(const std::vector<std::vector<Token>> &refs,
                       const std::vector<std::vector<Token>> &hyps,
                       const char *label) {
  using std::cout;
  using std::endl;

  const auto corpus = metrics::corpus_wer_details(refs, hyps);
  json sentences = json::array();
  double rate_sum = 0.0;
  size_t scored = 0;
  for (size_t i = 0; i < refs.size(); ++i) {
    if (refs[i].empty()) {
      sentences.push_back(nullptr);
      continue;
    }
    const auto details = metrics::wer_details(refs[i], hyps[i]);
    rate_sum += details.rate;
    scored++;
    sentences.push_back(json(details));
  }

  print_ops(corpus);
  cout << std::fixed << std::setprecision(4);
  cout << "Corpus " << label << ": " << corpus.rate << endl;
  if (scored > 0) {
    cout << "Mean sentence " << label << ": "
         << rate_sum / static_cast<double>(scored) << endl;
  }
  cout.unsetf(std::ios::fixed);
  return json{{"corpus", corpus}, {"sentences", sentences}};
}

}  // namespace

metrics::BleuConfig bleu_config_from_env() {
  metrics::BleuConfig config;
  config.max_order = getenv_int("MLEVAL_BLEU_ORDER", config.max_order);
  const std::string smoothing = getenv_str("MLEVAL_BLEU_SMOOTHING", "none");
  if (smoothing == "none") {
    config.smoothing = metrics::BleuSmoothing::None;
  } else if (smoothing == "epsilon") {
    config.smoothing = metrics::BleuSmoothing::EpsilonFloor;
  } else {
    throw std::invalid_argument("MLEVAL_BLEU_SMOOTHING must be 'none' or "
                                "'epsilon', got '" + smoothing + "'");
  }
  if (!getenv_str("MLEVAL_BLEU_EPSILON", "").empty()) {
    config.epsilon = getenv_float("MLEVAL_BLEU_EPSILON",
                                  static_cast<float>(config.epsilon));
  }
  return config;
}

void RunWer() {
  const std::string ref_file = getenv_str("MLEVAL_REF", "data/ref.txt");
  const std::string hyp_file = getenv_str("MLEVAL_HYP", "data/hyp.txt");
  const auto ref_lines = load_lines(ref_file);
  const auto hyp_lines = load_lines(hyp_file);
  require_same_count(ref_lines, hyp_lines, ref_file, hyp_file);

  json report = error_rate_report(tokenize_lines(ref_lines),
                                  tokenize_lines(hyp_lines), "WER");
  write_report(report);
}

void RunCer() {
  const std::string ref_file = getenv_str("MLEVAL_REF", "data/ref.txt");
  const std::string hyp_file = getenv_str("MLEVAL_HYP", "data/hyp.txt");
  const auto ref_lines = load_lines(ref_file);
  const auto hyp_lines = load_lines(hyp_file);
  require_same_count(ref_lines, hyp_lines, ref_file, hyp_file);

  auto to_chars = [](const std::vector<std::string> &lines) {
    std::vector<std::vector<char>> out;
    out.reserve(lines.size());
    for (const auto &line : lines) out.emplace_back(line.begin(), line.end());
    return out;
  };
  json report = error_rate_report(to_chars(ref_lines), to_chars(hyp_lines),
                                  "CER");
  write_report(report);
}

void RunBleu() {
  using std::cout;
  using std::endl;

  const std::string hyp_file = getenv_str("MLEVAL_HYP", "data/hyp.txt");
  const auto ref_files =
      split_list(getenv_str("MLEVAL_REF", "data/ref.txt"), ':');
  if (ref_files.empty()) {
    throw std::invalid_argument("MLEVAL_REF names no reference files");
  }
  const auto config = bleu_config_from_env();

  const auto hyp_lines = load_lines(hyp_file);
  const auto candidates = tokenize_lines(hyp_lines);
  std::vector<std::vector<Sentence>> references(candidates.size());
  for (const auto &ref_file : ref_files) {
    const auto ref_lines = load_lines(ref_file);
    require_same_count(ref_lines, hyp_lines, ref_file, hyp_file);
    for (size_t i = 0; i < ref_lines.size(); ++i) {
      references[i].push_back(split_into_words(ref_lines[i]));
    }
  }

  metrics::BleuStats stats(config.max_order);
  for (size_t i = 0; i < candidates.size(); ++i) {
    stats.add(candidates[i], references[i]);
  }
  const auto result = metrics::compute_bleu(stats, config);

  cout << "Sentences: " << stats.sentences
       << ", references per sentence: " << ref_files.size() << endl;
  cout << std::fixed << std::setprecision(4);
  for (size_t n = 0; n < result.precisions.size(); ++n) {
    cout << "p" << n + 1 << "=" << result.precisions[n] << " ";
  }
  cout << endl;
  cout << "BP=" << result.brevity_penalty
       << " (c=" << result.candidate_length
       << ", r=" << result.reference_length << ")" << endl;
  cout << "BLEU: " << result.score << endl;
  cout.unsetf(std::ios::fixed);

  json report = result;
  write_report(report);
}

void RunRanking() {
  using std::cout;
  using std::endl;

  const std::string scores_file =
      getenv_str("MLEVAL_SCORES", "data/scores.txt");
  const auto data = load_score_labels(scores_file);
  const auto result = metrics::evaluate_ranking(data.scores, data.labels);

  cout << "Pairs: " << data.scores.size() << " (" << result.positives
       << " positive, " << result.negatives << " negative)" << endl;
  cout << "Distinct thresholds: " << result.roc.size() << endl;
  cout << std::fixed << std::setprecision(4);
  cout << "ROC AUC: " << result.roc_auc << endl;
  cout << "Average precision: " << result.average_precision << endl;
  cout.unsetf(std::ios::fixed);

  json report = result;
  write_report(report);
}

void RunPerplexity() {
  using std::cout;
  using std::endl;

  const std::string train_file = getenv_str("MLEVAL_TRAIN", "data/input.txt");
  const std::string test_file = getenv_str("MLEVAL_TEST", "data/test.txt");
  const double smoothing = getenv_float("MLEVAL_BIGRAM_SMOOTHING", 1.0f);

  const auto train_text = load_text_data(train_file);
  std::vector<std::string> test_lines;
  for (auto &line : load_lines(test_file)) {
    if (!line.empty()) test_lines.push_back(line);
  }
  if (train_text.size() < 2) {
    throw std::runtime_error("Not enough training text in " + train_file);
  }

  std::vector<std::string> texts = test_lines;
  texts.push_back(train_text);
  const CharTokenizer tokenizer = CharTokenizer::from_texts(texts);
  const BigramLM model(tokenizer.vocab_size(), tokenizer.encode(train_text),
                       smoothing);
  cout << "Vocabulary: " << tokenizer.vocab_size()
       << ", training tokens: " << model.total_tokens
       << ", smoothing: " << smoothing << endl;

  std::vector<std::vector<int>> encoded;
  encoded.reserve(test_lines.size());
  for (const auto &line : test_lines) encoded.push_back(tokenizer.encode(line));

  const metrics::ProbabilityFn<int> probability =
      [&model](const std::vector<int> &seq, size_t pos) {
        return model.probability(seq, pos);
      };

  json sentences = json::array();
  for (const auto &seq : encoded) {
    sentences.push_back(metrics::sequence_perplexity(probability, seq));
  }
  const double corpus = metrics::corpus_perplexity(probability, encoded);

  cout << "Test sequences: " << encoded.size() << endl;
  cout << "Corpus perplexity: " << corpus << endl;

  json report = json{{"corpus_perplexity", corpus},
                     {"sentences", sentences},
                     {"vocab_size", tokenizer.vocab_size()},
                     {"smoothing", smoothing}};
  write_report(report);
}
