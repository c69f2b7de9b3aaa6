#pragma once

#include <string>
#include "FeatureTypes.h"
#include "PipelineTypes.h"

namespace theory_validator
{
  namespace pipeline
  {
    /**
     * @brief Reads JSON request documents.
     *
     * Analysis requests look like
     *
     *   {
     *     "league": "NBA",
     *     "filters": {"seasons": [2023], "season_scope": "full", "team": "Lakers", ...},
     *     "features": ["home_fg_pct", "pace_game"],
     *     "target": {"target_class": "market", "market_type": "spread", "side": "home",
     *                "odds_assumption": "use_closing"},
     *     "cleaning": {"drop_if_any_null": true},
     *     "context": "deployable",
     *     "trigger": {"prob_threshold": 0.55},
     *     "exposure": {"max_bets_per_day": 5},
     *     "window": {"train_days": 180, "test_days": 14, "step_days": 7}
     *   }
     *
     * Every section but league is optional. Dates are ISO YYYY-MM-DD. An
     * explicit null for an exposure cap removes the cap.
     *
     * Parsing checks shape and types only; ranges are checked by
     * RequestValidator. Errors raise ConfigurationException with reason
     * invalid_json, invalid_type, invalid_date or invalid_value.
     */
    class RequestParser
    {
    public:
      static AnalysisRequest parseAnalysisRequest(const std::string& json);

      // {"league", "raw_stat_keys", "include_rest_days", "include_rolling", "rolling_window"}
      static features::FeatureGenerationRequest parseFeatureRequest(const std::string& json);
    };
  }
}
