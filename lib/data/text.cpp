#include "data/text.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

std::string load_text_data(std::string filename) {
  std::ifstream file(filename, std::ios::ate);
  if (!file) throw std::runtime_error("open failed: " + filename);
  std::streamsize size = file.tellg();
  file.seekg(0, std::ios::beg);
  std::string data(size, '\0');
  file.read(&data[0], size);
  return data;
}

std::vector<std::string> load_lines(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) throw std::runtime_error("open failed: " + filename);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

std::vector<std::string> split_into_words(const std::string& text) {
  std::vector<std::string> words;
  std::stringstream ss(text);
  std::string word;
  while (ss >> word) {
    words.push_back(word);
  }
  return words;
}
