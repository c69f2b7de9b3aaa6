#pragma once

#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "FeatureTypes.h"
#include "PipelineTypes.h"
#include "RunStore.h"
#include "SnapshotBuilder.h"

namespace theory_validator
{
  namespace pipeline
  {
    /**
     * @brief JSON forms of operation results.
     *
     * Documents never carry wall-clock timestamps, so the same run always
     * serializes to the same text. Missing and non-finite numbers are null;
     * dates are ISO YYYY-MM-DD.
     */
    class ResultSerializer
    {
    public:
      static rapidjson::Document featureCatalog(const features::FeatureCatalog& catalog);

      static rapidjson::Document analyzeResult(const AnalysisContext& ctx, const RunSnapshot& snapshot);

      static rapidjson::Document buildResult(const AnalysisContext& ctx, const RunSnapshot& snapshot);

      static rapidjson::Document walkforwardResult(const AnalysisContext& ctx,
						   const walkforward::WalkForwardResult& result,
						   const RunSnapshot& snapshot);

      // Full run with embedded snapshot and result, or just its listing entry.
      static rapidjson::Document storedRun(const runstore::StoredRun& run, bool includePayload);

      static rapidjson::Document runList(const std::vector<runstore::StoredRun>& runs);

      static rapidjson::Document error(const std::string& reasonCode,
				       const std::string& field,
				       const std::string& message);

      static std::string compact(const rapidjson::Value& value);

      static std::string pretty(const rapidjson::Value& value);
    };
  }
}
