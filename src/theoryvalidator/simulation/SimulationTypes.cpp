#include "SimulationTypes.h"
#include "TheoryValidatorException.h"

namespace theory_validator
{
  namespace simulation
  {
    void validateTrigger(const TriggerDefinition& trigger)
    {
      if (trigger.probThreshold < 0.0 || trigger.probThreshold > 1.0)
	throw ConfigurationException("prob_threshold", "out_of_range", "prob_threshold must be within [0, 1]");
      if (trigger.confidenceBand && (*trigger.confidenceBand < 0.0 || *trigger.confidenceBand > 0.5))
	throw ConfigurationException("confidence_band", "out_of_range", "confidence_band must be within [0, 0.5]");
      if (trigger.minEdgeVsImplied && (*trigger.minEdgeVsImplied < -1.0 || *trigger.minEdgeVsImplied > 1.0))
	throw ConfigurationException("min_edge_vs_implied", "out_of_range",
				     "min_edge_vs_implied must be within [-1, 1]");
    }

    void validateExposure(const ExposureControls& exposure)
    {
      if (exposure.maxBetsPerDay && *exposure.maxBetsPerDay < 0)
	throw ConfigurationException("max_bets_per_day", "out_of_range", "max_bets_per_day must be >= 0");
      if (exposure.maxBetsPerSidePerDay && *exposure.maxBetsPerSidePerDay < 0)
	throw ConfigurationException("max_bets_per_side_per_day", "out_of_range",
				     "max_bets_per_side_per_day must be >= 0");
      if (exposure.spreadAbsMin && *exposure.spreadAbsMin < 0.0)
	throw ConfigurationException("exposure.spread_abs_min", "out_of_range", "spread_abs_min must be >= 0");
      if (exposure.spreadAbsMax && *exposure.spreadAbsMax < 0.0)
	throw ConfigurationException("exposure.spread_abs_max", "out_of_range", "spread_abs_max must be >= 0");
      if (exposure.spreadAbsMin && exposure.spreadAbsMax && *exposure.spreadAbsMin > *exposure.spreadAbsMax)
	throw ConfigurationException("exposure.spread_abs_min", "invalid_range",
				     "spread_abs_min is greater than spread_abs_max");
    }
  }
}
