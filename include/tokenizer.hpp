#ifndef TOKENIZER_HPP
#define TOKENIZER_HPP

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

struct CharTokenizer {
  std::unordered_map<char, int> char_to_id;
  std::vector<char> id_to_char;

  // must initialize with a set of unique characters
  CharTokenizer(const std::set<char> &chars);
  // vocabulary covering every character of every text
  static CharTokenizer from_texts(const std::vector<std::string> &texts);

  int vocab_size() const { return static_cast<int>(id_to_char.size()); }

  std::vector<int> encode(const std::string &text) const;
  int encode(char c) const;
};

#endif  // TOKENIZER_HPP
