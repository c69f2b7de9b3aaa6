#include "RequestValidator.h"
#include "TheoryValidatorException.h"

namespace theory_validator
{
  namespace pipeline
  {
    void validateRequest(const AnalysisRequest& request,
			 RunType runType,
			 const std::set<std::string>& knownLeagues)
    {
      cohort::validateFilters(request.filters, knownLeagues);

      if (request.cleaning.minNonNullFeatures && *request.cleaning.minNonNullFeatures < 0)
	throw ConfigurationException("min_non_null_features", "out_of_range",
				     "min_non_null_features must be >= 0");

      if (runType == RunType::Analyze)
	return;

      simulation::validateTrigger(request.trigger);
      simulation::validateExposure(request.exposure);

      if (runType == RunType::Walkforward)
	walkforward::validateWindow(request.window);
    }

    void validateFeatureRequest(const features::FeatureGenerationRequest& request,
				const std::set<std::string>& knownLeagues)
    {
      cohort::FilterBundle filters;
      filters.league = request.league;
      cohort::validateFilters(filters, knownLeagues);
    }
  }
}
