#pragma once

#include <set>
#include <string>
#include "FeatureTypes.h"
#include "PipelineTypes.h"

namespace theory_validator
{
  namespace pipeline
  {
    /**
     * @brief Range checks run before any store access.
     *
     * Trigger and exposure are checked for build and walk-forward runs, the
     * window for walk-forward runs only.
     *
     * @throws ConfigurationException naming the offending field
     */
    void validateRequest(const AnalysisRequest& request,
			 RunType runType,
			 const std::set<std::string>& knownLeagues);

    void validateFeatureRequest(const features::FeatureGenerationRequest& request,
				const std::set<std::string>& knownLeagues);
  }
}
