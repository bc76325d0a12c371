#include "data/scores.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

ScoredLabels load_score_labels(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    std::cout << "Could not open file for reading: " << filename << std::endl;
    throw std::runtime_error("FILE_NOT_FOUND");
  }

  ScoredLabels data;
  std::string line;
  int line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    std::replace(line.begin(), line.end(), ',', ' ');
    std::stringstream ss(line);
    std::string score_text;
    if (!(ss >> score_text) || score_text[0] == '#') continue;
    const std::string where = filename + ":" + std::to_string(line_no);

    std::string label_text;
    std::string extra;
    if (!(ss >> label_text) || (ss >> extra)) {
      throw std::runtime_error(where + ": expected '<score> <label>'");
    }

    char* end = nullptr;
    const double score = std::strtod(score_text.c_str(), &end);
    if (end == score_text.c_str() || *end != '\0') {
      throw std::runtime_error(where + ": invalid score '" + score_text + "'");
    }
    if (label_text != "0" && label_text != "1") {
      throw std::runtime_error(where + ": label must be 0 or 1, got '" +
                               label_text + "'");
    }
    data.scores.push_back(score);
    data.labels.push_back(label_text == "1" ? 1 : 0);
  }
  return data;
}
