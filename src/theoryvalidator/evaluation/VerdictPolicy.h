#pragma once

#include <cstddef>
#include <string>

namespace theory_validator
{
  namespace evaluation
  {
    /**
     * @brief Advisory labels for lift and sample size.
     *
     * The thresholds are tunable policy. The labels are not statistical tests.
     */
    struct VerdictPolicy
    {
      double strongLift{0.10};
      double moderateLift{0.05};
      std::size_t largeSample{5000};
      std::size_t moderateSample{1000};

      std::string liftLabel(double lift) const
      {
	if (lift > strongLift)
	  return "strong lift";
	if (lift > moderateLift)
	  return "moderate lift";
	if (lift > 0.0)
	  return "small lift";
	return "negative/no lift";
      }

      std::string sampleLabel(std::size_t sampleSize) const
      {
	if (sampleSize >= largeSample)
	  return "large";
	if (sampleSize >= moderateSample)
	  return "moderate";
	return "small";
      }
    };
  }
}
