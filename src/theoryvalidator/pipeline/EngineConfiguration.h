#pragma once

#include <cstddef>
#include <istream>
#include <set>
#include <string>
#include "ModelBuilder.h"
#include "MonteCarloTypes.h"
#include "RetryingGameStore.h"
#include "VerdictPolicy.h"
#include "WalkForwardTypes.h"

namespace theory_validator
{
  namespace pipeline
  {
    /**
     * @brief Every tunable policy of the engine, with defaults.
     *
     * Read from an INI-style file whose sections mirror the members:
     *
     *   [engine]   leagues, threads, timeout_seconds
     *   [cohort]   games_limit_max
     *   [verdict]  strong_lift, moderate_lift, large_sample, moderate_sample
     *   [model]    learning_rate, epochs, l2_lambda, max_missing_fraction,
     *              min_values, collinearity_threshold,
     *              max_collinearity_features, zero_weight_epsilon,
     *              min_training_rows, roi_proxy_threshold
     *   [montecarlo] resamples, min_bets, seed
     *   [walkforward] min_train_rows, min_test_rows
     *   [store]    retry_attempts, retry_base_delay_ms, retry_max_delay_ms
     */
    struct EngineConfiguration
    {
      std::set<std::string> leagues{"NBA", "NCAAB", "NFL", "NCAAF", "NHL", "MLB", "WNBA"};
      unsigned int threads{0};
      unsigned int timeoutSeconds{0};
      int gamesLimitMax{5000};
      evaluation::VerdictPolicy verdict;
      modeling::ModelPolicy model;
      montecarlo::MonteCarloPolicy monteCarlo;
      walkforward::WalkForwardPolicy walkForward;
      sportsdata::RetryPolicy storeRetry;
    };

    class EngineConfigurationReader
    {
    public:
      /**
       * @throws ConfigurationException (field "config") for unknown keys,
       *         malformed values or values outside their valid range
       */
      static EngineConfiguration read(std::istream& in);

      static EngineConfiguration readFile(const std::string& path);

      // Range checks shared by both readers and programmatic configuration.
      static void validate(const EngineConfiguration& config);
    };
  }
}
