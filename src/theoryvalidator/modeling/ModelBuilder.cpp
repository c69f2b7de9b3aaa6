#include "ModelBuilder.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include "TheoryValidatorException.h"

namespace theory_validator
{
  namespace modeling
  {
    using cohort::CohortRow;
    using features::DroppedFeature;
    using features::GeneratedFeature;

    const char* modelingStateToString(ModelingState state)
    {
      switch (state)
	{
	case ModelingState::Unavailable:
	  return "unavailable";
	case ModelingState::NotRun:
	  return "not_run";
	case ModelingState::Complete:
	default:
	  return "complete";
	}
    }

    ModelBuilder::ModelBuilder(const ModelPolicy& policy)
      : mPolicy(policy)
    {}

    ModelBuildResult ModelBuilder::build(const cohort::CohortDataset& dataset,
					 const evaluation::TargetDefinition& target,
					 std::ostream& os) const
    {
      std::vector<const CohortRow*> rows;
      rows.reserve(dataset.rows.size());
      for (const auto& row : dataset.rows)
	rows.push_back(&row);
      return build(dataset.columns, rows, target, os);
    }

    ModelBuildResult ModelBuilder::build(const std::vector<GeneratedFeature>& columns,
					 const std::vector<const CohortRow*>& rows,
					 const evaluation::TargetDefinition& target,
					 std::ostream& os) const
    {
      std::vector<const CohortRow*> training;
      for (const auto* row : rows)
	{
	  if (row->target)
	    training.push_back(row);
	}

      if (training.size() < mPolicy.minTrainingRows)
	{
	  os << "✗ Model not fitted: " << training.size() << " training rows < "
	     << mPolicy.minTrainingRows << "\n";
	  return ModelBuildResult{ModelingStatus::Unavailable("insufficient_sample",
							      std::to_string(training.size()) +
							      " rows with a resolved target"), {}, std::nullopt};
	}

      if (columns.empty())
	return ModelBuildResult{ModelingStatus::Unavailable("no_features_selected",
							    "no usable features were selected"), {}, std::nullopt};

      FeaturePruner pruner(mPolicy.pruning);
      PruneResult pruned = pruner.prune(columns, training);
      ModelBuildResult result{ModelingStatus::Unavailable("no_features_after_pruning",
							  "every feature was pruned"),
			      pruned.dropped, std::nullopt};
      if (pruned.kept.empty())
	{
	  os << "✗ Model not fitted: all " << columns.size() << " features pruned\n";
	  return result;
	}

      std::vector<std::size_t> kept = pruned.kept;
      const bool binary = target.isBinary();
      try
	{
	  // Features whose fitted weight is effectively zero leave the model,
	  // which is refitted on the rest until every weight carries signal.
	  while (true)
	    {
	      FeatureScaler scaler = FeatureScaler::fit(training, kept);
	      std::vector<std::vector<double>> x;
	      std::vector<double> y;
	      x.reserve(training.size());
	      y.reserve(training.size());
	      for (const auto* row : training)
		{
		  x.push_back(scaler.transform(*row));
		  y.push_back(*row->target);
		}

	      ScoringModel model = binary ? ScoringModel::fitLogistic(x, y, mPolicy.fit)
					  : ScoringModel::fitRidge(x, y, mPolicy.fit.l2Lambda);

	      std::vector<std::size_t> carrying;
	      for (std::size_t j = 0; j < kept.size(); ++j)
		{
		  if (std::fabs(model.weights()[j]) > mPolicy.zeroWeightEpsilon)
		    {
		      carrying.push_back(kept[j]);
		      continue;
		    }
		  DroppedFeature d;
		  d.feature = columns[kept[j]].name;
		  d.reason = "near_zero_weight";
		  d.threshold = mPolicy.zeroWeightEpsilon;
		  d.detail = "fitted weight " + std::to_string(model.weights()[j]) +
		    " is effectively zero; removed and refitted";
		  result.dropped.push_back(d);
		}

	      if (carrying.empty())
		{
		  os << "✗ Model not fitted: every fitted weight is effectively zero\n";
		  result.status = ModelingStatus::Unavailable("no_features_after_pruning",
							      "every fitted weight is effectively zero");
		  return result;
		}
	      if (carrying.size() < kept.size())
		{
		  kept = std::move(carrying);
		  continue;
		}

	      ModelMetrics metrics = summarize(columns, kept, model, x, y, binary);
	      os << "   [Model] " << metrics.modelType << " fitted on " << training.size() << " rows with "
		 << metrics.weights.size() << " features\n";
	      result.status = ModelingStatus::Complete(metrics);
	      result.model.emplace(std::move(scaler), std::move(model));
	      break;
	    }
	}
      catch (const ModelFitException& e)
	{
	  os << "✗ Model fit failed: " << e.what() << "\n";
	  for (std::size_t c : kept)
	    {
	      DroppedFeature d;
	      d.feature = columns[c].name;
	      d.reason = "model_fit_failed";
	      d.detail = e.what();
	      result.dropped.push_back(d);
	    }
	  result.status = ModelingStatus::Unavailable(e.reasonCode(), e.what());
	}
      return result;
    }

    ModelMetrics ModelBuilder::summarize(const std::vector<GeneratedFeature>& columns,
					 const std::vector<std::size_t>& kept,
					 const ScoringModel& model,
					 const std::vector<std::vector<double>>& x,
					 const std::vector<double>& y,
					 bool binary) const
    {
      ModelMetrics metrics;
      metrics.modelType = binary ? "logistic_l2" : "ridge";
      metrics.trainingRows = x.size();
      metrics.intercept = model.intercept();

      std::map<std::string, GroupDriver> groups;
      for (std::size_t j = 0; j < kept.size(); ++j)
	{
	  const double w = model.weights()[j];
	  const auto& column = columns[kept[j]];
	  metrics.weights.push_back(FeatureWeight{column.name, column.group, w});
	  auto& driver = groups[column.group];
	  driver.group = column.group;
	  driver.totalAbsWeight += std::fabs(w);
	  ++driver.featureCount;
	}

      std::sort(metrics.weights.begin(), metrics.weights.end(), [](const FeatureWeight& a, const FeatureWeight& b) {
	if (std::fabs(a.weight) != std::fabs(b.weight))
	  return std::fabs(a.weight) > std::fabs(b.weight);
	return a.feature < b.feature;
      });

      for (const auto& kv : groups)
	metrics.drivers.push_back(kv.second);
      std::sort(metrics.drivers.begin(), metrics.drivers.end(), [](const GroupDriver& a, const GroupDriver& b) {
	if (a.totalAbsWeight != b.totalAbsWeight)
	  return a.totalAbsWeight > b.totalAbsWeight;
	return a.group < b.group;
      });

      const double yMean = std::accumulate(y.begin(), y.end(), 0.0) / static_cast<double>(y.size());
      std::size_t agree = 0;
      double roi = 0.0;
      for (std::size_t i = 0; i < x.size(); ++i)
	{
	  const double p = model.predict(x[i]);
	  if (binary)
	    {
	      if ((p >= 0.5) == (y[i] > 0.5))
		++agree;
	      if (p >= mPolicy.roiProxyThreshold)
		{
		  ++metrics.roiProxyBets;
		  roi += y[i] > 0.5 ? 1.0 : -1.0;
		}
	    }
	  else if ((p >= yMean) == (y[i] >= yMean))
	    ++agree;
	}

      metrics.accuracy = static_cast<double>(agree) / static_cast<double>(x.size());
      if (binary)
	{
	  if (metrics.roiProxyBets > 0)
	    metrics.roiProxy = roi / static_cast<double>(metrics.roiProxyBets);
	  metrics.notes.push_back("roi_proxy scores rows at or above the proxy threshold at even money; "
				  "it is a sanity check, not a profitability claim.");
	  metrics.notes.push_back("accuracy is in-sample agreement of p >= 0.5 with the outcome.");
	}
      else
	metrics.notes.push_back("accuracy is in-sample directional agreement around the training mean.");
      return metrics;
    }
  }
}
