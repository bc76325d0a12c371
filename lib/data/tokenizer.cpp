#include "tokenizer.hpp"

#include <stdexcept>

CharTokenizer::CharTokenizer(const std::set<char> &chars) {
  id_to_char.reserve(chars.size());
  for (char c : chars) {
    char_to_id[c] = static_cast<int>(id_to_char.size());
    id_to_char.push_back(c);
  }
}

CharTokenizer CharTokenizer::from_texts(const std::vector<std::string> &texts) {
  std::set<char> chars;
  for (const auto &text : texts) chars.insert(text.begin(), text.end());
  return CharTokenizer(chars);
}

std::vector<int> CharTokenizer::encode(const std::string &text) const {
  std::vector<int> encoded;
  encoded.reserve(text.size());
  for (char c : text) encoded.push_back(encode(c));
  return encoded;
}

int CharTokenizer::encode(char c) const {
  auto it = char_to_id.find(c);
  if (it == char_to_id.end()) {
    throw std::out_of_range("Character not in tokenizer");
  }
  return it->second;
}
