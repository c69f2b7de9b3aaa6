#pragma once

#include <ostream>
#include <vector>
#include "CancellationToken.h"
#include "IParallelExecutor.h"
#include "MonteCarloTypes.h"

namespace theory_validator
{
  namespace montecarlo
  {
    /**
     * @brief Bootstrap of a realized bet sequence.
     *
     * Each trial draws betCount outcomes with replacement from the realized
     * unit PnL values and replays them as a cumulative path. Trial t uses an
     * engine seeded from (seed, t) only, so the distribution does not depend
     * on how trials are spread across threads.
     *
     * Bets are treated as exchangeable: streaks and correlation between bets
     * on the same day are not modeled.
     */
    class MonteCarloEngine
    {
    public:
      MonteCarloEngine(const MonteCarloPolicy& policy,
		       concurrency::IParallelExecutor& executor,
		       const concurrency::CancellationToken& token);

      MonteCarloStatus run(const std::vector<double>& unitPnl,
			   const MonteCarloAssumptions& assumptions,
			   bool exposureWarnings,
			   std::ostream& os) const;

      static std::vector<std::string> interpretationLines(const MonteCarloMetrics& metrics, bool exposureWarnings);

    private:
      MonteCarloPolicy mPolicy;
      concurrency::IParallelExecutor& mExecutor;
      const concurrency::CancellationToken& mToken;
    };
  }
}
