#include "PipelineTypes.h"

namespace theory_validator
{
  namespace pipeline
  {
    const char* runTypeToString(RunType type)
    {
      switch (type)
	{
	case RunType::Build:
	  return "build";
	case RunType::Walkforward:
	  return "walkforward";
	case RunType::Analyze:
	default:
	  return "analyze";
	}
    }

    std::vector<features::DroppedFeature> AnalysisContext::droppedFeatures() const
    {
      std::vector<features::DroppedFeature> dropped(featureSelection.dropped);
      if (model)
	dropped.insert(dropped.end(), model->dropped.begin(), model->dropped.end());
      return dropped;
    }

    std::vector<std::string> AnalysisContext::usedFeatureNames() const
    {
      std::vector<std::string> names;
      names.reserve(featureSelection.used.size());
      for (const auto& feature : featureSelection.used)
	names.push_back(feature.name);
      return names;
    }

    std::vector<const cohort::CohortRow*> AnalysisContext::rowPointers() const
    {
      std::vector<const cohort::CohortRow*> rows;
      rows.reserve(dataset.rows.size());
      for (const auto& row : dataset.rows)
	rows.push_back(&row);
      return rows;
    }
  }
}
