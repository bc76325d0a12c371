#include "metrics/report.hpp"

#include "metrics/bleu.hpp"
#include "metrics/edit_distance.hpp"
#include "metrics/ranking.hpp"
#include "metrics/wer.hpp"
#include "nlohmann/json.hpp"

namespace metrics {

void to_json(json &j, const EditOps &ops) {
  j = json{{"substitutions", ops.substitutions},
           {"deletions", ops.deletions},
           {"insertions", ops.insertions},
           {"total", ops.total()}};
}

void to_json(json &j, const WerResult &result) {
  j = json{{"reference_length", result.reference_length},
           {"hypothesis_length", result.hypothesis_length},
           {"ops", result.ops},
           {"rate", result.rate}};
}

void to_json(json &j, const BleuResult &result) {
  j = json{{"score", result.score},
           {"brevity_penalty", result.brevity_penalty},
           {"precisions", result.precisions},
           {"candidate_length", result.candidate_length},
           {"reference_length", result.reference_length}};
}

void to_json(json &j, const CurvePoint &point) {
  j = json{{"x", point.x}, {"y", point.y}, {"threshold", point.threshold}};
}

void to_json(json &j, const RankingReport &report) {
  j = json{{"roc", report.roc},
           {"precision_recall", report.precision_recall},
           {"roc_auc", report.roc_auc},
           {"average_precision", report.average_precision},
           {"positives", report.positives},
           {"negatives", report.negatives}};
}

}  // namespace metrics
