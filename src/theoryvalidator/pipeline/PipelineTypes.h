#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "CohortBuilder.h"
#include "CohortDataset.h"
#include "DatasetCleaner.h"
#include "EvaluationTypes.h"
#include "FeatureComputer.h"
#include "FeaturePolicy.h"
#include "FeatureTypes.h"
#include "FilterBundle.h"
#include "ModelBuilder.h"
#include "MonteCarloTypes.h"
#include "PerformanceSlicer.h"
#include "SimulationTypes.h"
#include "TargetDefinition.h"
#include "WalkForwardTypes.h"

namespace theory_validator
{
  namespace pipeline
  {
    /**
     * @brief Everything a run is defined by.
     *
     * analyze reads filters, features, target, cleaning and context;
     * build_model adds trigger and exposure; run_walkforward adds the window.
     */
    struct AnalysisRequest
    {
      cohort::FilterBundle filters;
      std::vector<std::string> features;
      evaluation::TargetDefinition target{evaluation::TargetDefinitionFactory::defaultStatTarget()};
      cohort::CleaningOptions cleaning;
      features::RunContext context{features::RunContext::Deployable};
      simulation::TriggerDefinition trigger;
      simulation::ExposureControls exposure;
      walkforward::WalkForwardWindow window;
    };

    enum class RunType
    {
      Analyze,
      Build,
      Walkforward
    };

    const char* runTypeToString(RunType type);

    enum class StageDecisionType
    {
      Continue,
      Stop
    };

    struct StageDecision
    {
      StageDecisionType decision{StageDecisionType::Continue};
      std::string rationale;

      static StageDecision Continue(const std::string& reason = "")
      {
	return StageDecision{StageDecisionType::Continue, reason};
      }

      static StageDecision Stop(const std::string& reason)
      {
	return StageDecision{StageDecisionType::Stop, reason};
      }

      bool proceed() const { return decision == StageDecisionType::Continue; }
    };

    struct SimulationOutput
    {
      simulation::ExposureSummary exposure;
      std::vector<simulation::BetTapeRow> tape;
      simulation::PerformanceSlices slices;
      simulation::FailureAnalysis failures;
    };

    enum class SimulationState
    {
      NotRun,
      Complete
    };

    /**
     * @brief Outcome of the trigger and exposure simulation.
     *
     * NotRun carries a reason code (stat_target_numeric, model_unavailable)
     * and an eligibility note for the caller.
     */
    class SimulationStatus
    {
    public:
      static SimulationStatus NotRun(const std::string& reason, const std::string& eligibility)
      {
	return SimulationStatus(SimulationState::NotRun, reason, eligibility, nullptr);
      }

      static SimulationStatus Complete(SimulationOutput output)
      {
	return SimulationStatus(SimulationState::Complete, "", "",
				std::make_shared<const SimulationOutput>(std::move(output)));
      }

      SimulationState state() const
      {
	return mState;
      }

      bool isComplete() const
      {
	return mState == SimulationState::Complete;
      }

      const std::string& reason() const
      {
	return mReason;
      }

      const std::string& eligibility() const
      {
	return mEligibility;
      }

      const SimulationOutput& output() const
      {
	if (!mOutput)
	  throw std::logic_error("SimulationStatus::output - status is not Complete");
	return *mOutput;
      }

    private:
      SimulationStatus(SimulationState state,
		       const std::string& reason,
		       const std::string& eligibility,
		       std::shared_ptr<const SimulationOutput> output)
	: mState(state),
	  mReason(reason),
	  mEligibility(eligibility),
	  mOutput(std::move(output))
      {}

      SimulationState mState;
      std::string mReason;
      std::string mEligibility;
      std::shared_ptr<const SimulationOutput> mOutput;
    };

    /**
     * @brief Shared state the analysis stages read and populate in order.
     *
     * Cohort, dataset and evaluation members are always filled once their
     * stage has run; model, simulation and monteCarlo stay empty for
     * analyze runs.
     */
    struct AnalysisContext
    {
      explicit AnalysisContext(const AnalysisRequest& req)
	: request(req)
      {}

      const AnalysisRequest& request;

      // Populated by CohortStage
      cohort::CohortSelection selection;
      std::shared_ptr<const features::FeatureComputer> computer;

      // Populated by DatasetStage
      features::FeatureSelection featureSelection;
      cohort::CohortDataset dataset;
      cohort::CleaningSummary cleaning;

      // Populated by EvaluationStage
      evaluation::EvaluationResult evaluation;
      std::vector<evaluation::FeatureCorrelation> correlations;
      std::vector<evaluation::FeatureQuality> featureQuality;
      std::vector<std::string> insights;

      // Populated by ModelingStage, SimulationStage and MonteCarloStage
      std::optional<modeling::ModelBuildResult> model;
      std::vector<modeling::TheoryCandidate> theoryCandidates;
      std::vector<modeling::SuggestedTheory> suggestedTheories;
      std::optional<SimulationStatus> simulation;
      std::optional<montecarlo::MonteCarloStatus> monteCarlo;

      // Features removed by the policy followed by those removed while pruning.
      std::vector<features::DroppedFeature> droppedFeatures() const;

      std::vector<std::string> usedFeatureNames() const;

      std::vector<const cohort::CohortRow*> rowPointers() const;
    };

    struct ModelSnapshotRef
    {
      std::string hash;
      std::string runId;
    };

    struct AnalyzeResult
    {
      ModelSnapshotRef snapshot;
      std::size_t sampleSize{0};
      cohort::CleaningSummary cleaning;
      evaluation::EvaluationResult evaluation;
      std::vector<evaluation::FeatureCorrelation> correlations;
      std::vector<evaluation::FeatureQuality> featureQuality;
      std::vector<std::string> insights;
      features::FeaturePolicyReport featurePolicy;
      std::vector<std::string> featuresUsed;
      std::vector<features::DroppedFeature> featuresDropped;
      std::vector<std::string> notes;
      // Serialized result as stored with the run.
      std::string resultJson;
    };

    struct BuildModelResult
    {
      ModelSnapshotRef snapshot;
      std::size_t sampleSize{0};
      cohort::CleaningSummary cleaning;
      features::FeaturePolicyReport featurePolicy;
      std::vector<std::string> featuresUsed;
      std::vector<features::DroppedFeature> featuresDropped;
      modeling::ModelingStatus modeling{modeling::ModelingStatus::NotRun("not_run", "")};
      SimulationStatus simulation{SimulationStatus::NotRun("not_run", "")};
      montecarlo::MonteCarloStatus monteCarlo{montecarlo::MonteCarloStatus::Unavailable("no_bet_tape", "")};
      std::vector<std::string> notes;
      std::string resultJson;
    };

    struct WalkforwardRunResult
    {
      ModelSnapshotRef snapshot;
      std::size_t sampleSize{0};
      cohort::CleaningSummary cleaning;
      features::FeaturePolicyReport featurePolicy;
      std::vector<std::string> featuresUsed;
      std::vector<features::DroppedFeature> featuresDropped;
      walkforward::WalkForwardResult walkforward;
      std::vector<std::string> notes;
      std::string resultJson;
    };
  }
}
