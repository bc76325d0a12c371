#pragma once

#include <string>
#include <vector>

std::string load_text_data(std::string filename);

// One entry per line, trailing '\r' stripped. Empty lines are kept so that
// line numbers stay aligned across parallel files.
std::vector<std::string> load_lines(const std::string& filename);

std::vector<std::string> split_into_words(const std::string& text);
