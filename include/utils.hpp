#pragma once

#include <string>
#include <vector>

#include "nlohmann/json_fwd.hpp"

using json = nlohmann::json;

void dumpJson(json &j, const std::string &filename);
void dumpJson(json &j, const char *filename);

// Unset or unparsable values give `fallback`; values outside int range throw
// std::out_of_range.
int getenv_int(const char *name, int fallback);
float getenv_float(const char *name, float fallback);
std::string getenv_str(const char *name, const std::string &fallback);

// Split on `sep`, dropping empty pieces.
std::vector<std::string> split_list(const std::string &value, char sep);
