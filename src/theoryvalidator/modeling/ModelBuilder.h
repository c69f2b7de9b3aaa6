#pragma once

#include <optional>
#include <ostream>
#include <vector>
#include "CohortDataset.h"
#include "FeaturePruner.h"
#include "FeatureScaler.h"
#include "FeatureTypes.h"
#include "ModelingTypes.h"
#include "ScoringModel.h"
#include "TargetDefinition.h"
#include "TheoryCandidateGenerator.h"

namespace theory_validator
{
  namespace modeling
  {
    struct ModelPolicy
    {
      PruningPolicy pruning;
      FitOptions fit;
      double zeroWeightEpsilon{1e-6};
      std::size_t minTrainingRows{10};
      double roiProxyThreshold{0.55};
      CandidatePolicy candidates;
    };

    // A fitted model together with the scaling learned from its training rows.
    class TrainedModel
    {
    public:
      TrainedModel(FeatureScaler scaler, ScoringModel model)
	: mScaler(std::move(scaler)),
	  mModel(std::move(model))
      {}

      // Probability for logistic models, predicted value for ridge models.
      double score(const cohort::CohortRow& row) const
      {
	return mModel.predict(mScaler.transform(row));
      }

      const FeatureScaler& scaler() const
      {
	return mScaler;
      }

      const ScoringModel& model() const
      {
	return mModel;
      }

    private:
      FeatureScaler mScaler;
      ScoringModel mModel;
    };

    struct ModelBuildResult
    {
      ModelingStatus status;
      std::vector<features::DroppedFeature> dropped;
      std::optional<TrainedModel> model;
    };

    /**
     * @brief Prunes, standardizes and fits a linear scoring model.
     *
     * Binary targets get a logistic model and numeric targets a ridge model.
     * Only rows with a target value are used. Fit failures are reported as
     * ModelingStatus::Unavailable("model_fit_failed") with one dropped entry
     * per feature that went into the failed fit.
     */
    class ModelBuilder
    {
    public:
      explicit ModelBuilder(const ModelPolicy& policy);

      ModelBuildResult build(const std::vector<features::GeneratedFeature>& columns,
			     const std::vector<const cohort::CohortRow*>& rows,
			     const evaluation::TargetDefinition& target,
			     std::ostream& os) const;

      ModelBuildResult build(const cohort::CohortDataset& dataset,
			     const evaluation::TargetDefinition& target,
			     std::ostream& os) const;

    private:
      ModelMetrics summarize(const std::vector<features::GeneratedFeature>& columns,
			     const std::vector<std::size_t>& kept,
			     const ScoringModel& model,
			     const std::vector<std::vector<double>>& x,
			     const std::vector<double>& y,
			     bool binary) const;

    private:
      ModelPolicy mPolicy;
    };
  }
}
