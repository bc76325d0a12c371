#pragma once

#include <string>
#include <vector>

struct ScoredLabels {
  std::vector<double> scores;
  std::vector<int> labels;
};

// Reads "score label" or "score,label" lines. Blank lines and lines starting
// with '#' are skipped. A malformed score or a label other than 0/1 throws
// std::runtime_error naming file:line.
ScoredLabels load_score_labels(const std::string& filename);
