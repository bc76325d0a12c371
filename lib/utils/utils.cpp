#include "utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "nlohmann/json.hpp"

void dumpJson(json &j, const std::string &filename) {
  std::ofstream file(filename);
  if (!file.is_open()) {
    std::cout << "Could not open file for writing: " << filename << std::endl;
    throw std::runtime_error("FILE_NOT_FOUND");
  }
  file << j.dump(4) << std::endl;
}

void dumpJson(json &j, const char *filename) {
  dumpJson(j, std::string(filename));
}

int getenv_int(const char *name, int fallback) {
  if (!name) return fallback;
  if (const char *value = std::getenv(name)) {
    char *end = nullptr;
    errno = 0;
    long parsed = std::strtol(value, &end, 10);
    if (end == value) return fallback;
    if (errno == ERANGE || parsed < std::numeric_limits<int>::min() ||
        parsed > std::numeric_limits<int>::max()) {
      throw std::out_of_range(std::string(name) + "=" + value +
                              " does not fit in an int");
    }
    return static_cast<int>(parsed);
  }
  return fallback;
}

float getenv_float(const char *name, float fallback) {
  if (!name) return fallback;
  if (const char *value = std::getenv(name)) {
    char *end = nullptr;
    float parsed = std::strtof(value, &end);
    if (end != value) return parsed;
  }
  return fallback;
}

std::string getenv_str(const char *name, const std::string &fallback) {
  if (!name) return fallback;
  if (const char *value = std::getenv(name)) {
    if (value[0] != '\0') return std::string(value);
  }
  return fallback;
}

std::vector<std::string> split_list(const std::string &value, char sep) {
  std::vector<std::string> parts;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, sep)) {
    if (!item.empty()) parts.push_back(item);
  }
  return parts;
}
