#pragma once

#include <string>
#include <rapidjson/document.h>
#include "EngineConfiguration.h"
#include "FeaturePolicy.h"
#include "PipelineTypes.h"

namespace theory_validator
{
  namespace pipeline
  {
    struct RunSnapshot
    {
      std::string canonicalJson;
      std::string hash;
      std::string runId;
    };

    /**
     * @brief Builds the payload a run is identified by.
     *
     * The payload holds the request inputs, the feature policy outcome and
     * the engine policies that shape the result. Sections a run type does not
     * read (trigger and exposure for analyze, window for analyze and build)
     * are null so unrelated settings do not change the hash. Set-like arrays
     * are sorted.
     */
    class SnapshotBuilder
    {
    public:
      static constexpr int kPayloadVersion = 1;

      static rapidjson::Document payload(const AnalysisRequest& request,
					 RunType runType,
					 const features::FeatureSelection& selection,
					 const EngineConfiguration& config);

      static RunSnapshot snapshot(const AnalysisRequest& request,
				  RunType runType,
				  const features::FeatureSelection& selection,
				  const EngineConfiguration& config);
    };

    rapidjson::Value droppedFeatureToJson(const features::DroppedFeature& dropped,
					  rapidjson::Document::AllocatorType& alloc);

    rapidjson::Value policyReportToJson(const features::FeaturePolicyReport& report,
					rapidjson::Document::AllocatorType& alloc);

    rapidjson::Value targetToJson(const evaluation::TargetDefinition& target,
				  rapidjson::Document::AllocatorType& alloc);
  }
}
