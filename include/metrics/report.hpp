#pragma once

#include "nlohmann/json_fwd.hpp"

namespace metrics {

struct EditOps;
struct WerResult;
struct BleuResult;
struct CurvePoint;
struct RankingReport;

using json = nlohmann::json;

// nlohmann::json hooks, found through ADL on the metrics types.
void to_json(json &j, const EditOps &ops);
void to_json(json &j, const WerResult &result);
void to_json(json &j, const BleuResult &result);
void to_json(json &j, const CurvePoint &point);
void to_json(json &j, const RankingReport &report);

}  // namespace metrics
