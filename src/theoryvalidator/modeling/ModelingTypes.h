#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace theory_validator
{
  namespace modeling
  {
    struct FeatureWeight
    {
      std::string feature;
      std::string group;
      double weight{0.0};
    };

    struct GroupDriver
    {
      std::string group;
      double totalAbsWeight{0.0};
      std::size_t featureCount{0};
    };

    struct ModelMetrics
    {
      std::string modelType;
      std::size_t trainingRows{0};
      double intercept{0.0};
      std::vector<FeatureWeight> weights;
      std::vector<GroupDriver> drivers;
      std::optional<double> accuracy;
      std::optional<double> roiProxy;
      std::size_t roiProxyBets{0};
      std::vector<std::string> notes;
    };

    enum class ModelingState
    {
      Unavailable,
      NotRun,
      Complete
    };

    const char* modelingStateToString(ModelingState state);

    /**
     * @brief Outcome of the modeling step.
     *
     * Unavailable carries a reason code, NotRun a reason plus an eligibility
     * note, and Complete the fitted metrics.
     */
    class ModelingStatus
    {
    public:
      static ModelingStatus Unavailable(const std::string& reason, const std::string& detail = "")
      {
	return ModelingStatus(ModelingState::Unavailable, reason, detail, std::nullopt);
      }

      static ModelingStatus NotRun(const std::string& reason, const std::string& eligibility)
      {
	return ModelingStatus(ModelingState::NotRun, reason, eligibility, std::nullopt);
      }

      static ModelingStatus Complete(const ModelMetrics& metrics)
      {
	return ModelingStatus(ModelingState::Complete, "", "", metrics);
      }

      ModelingState state() const
      {
	return mState;
      }

      bool isComplete() const
      {
	return mState == ModelingState::Complete;
      }

      const std::string& reason() const
      {
	return mReason;
      }

      // Eligibility for NotRun, detail message for Unavailable.
      const std::string& detail() const
      {
	return mDetail;
      }

      const ModelMetrics& metrics() const
      {
	if (!mMetrics)
	  throw std::logic_error("ModelingStatus::metrics - status is not Complete");
	return *mMetrics;
      }

    private:
      ModelingStatus(ModelingState state,
		     const std::string& reason,
		     const std::string& detail,
		     const std::optional<ModelMetrics>& metrics)
	: mState(state),
	  mReason(reason),
	  mDetail(detail),
	  mMetrics(metrics)
      {}

      ModelingState mState;
      std::string mReason;
      std::string mDetail;
      std::optional<ModelMetrics> mMetrics;
    };
  }
}
