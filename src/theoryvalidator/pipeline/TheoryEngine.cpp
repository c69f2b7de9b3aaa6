#include "TheoryEngine.h"
#include <boost/date_time/posix_time/posix_time.hpp>
#include "AnalysisPipeline.h"
#include "FeatureGenerator.h"
#include "ParallelExecutors.h"
#include "RequestValidator.h"
#include "ResultSerializer.h"
#include "WalkForwardValidator.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace
    {
      std::unique_ptr<concurrency::IParallelExecutor> makeExecutor(unsigned int threads)
      {
	if (threads == 1)
	  return std::make_unique<concurrency::SingleThreadExecutor>();
	return std::make_unique<concurrency::ThreadPoolExecutor>(threads);
      }
    }

    std::string utcTimestamp()
    {
      return boost::posix_time::to_iso_extended_string(boost::posix_time::microsec_clock::universal_time()) + "Z";
    }

    TheoryEngine::TheoryEngine(const sportsdata::HistoricalGameStore& store,
			       runstore::RunStore& runs,
			       const EngineConfiguration& config)
      : mConfig(config),
	mStore(store, config.storeRetry),
	mRuns(runs),
	mExecutor()
    {
      EngineConfigurationReader::validate(mConfig);
      mExecutor = makeExecutor(mConfig.threads);
    }

    TheoryEngine::TheoryEngine(const sportsdata::HistoricalGameStore& store,
			       runstore::RunStore& runs,
			       const EngineConfiguration& config,
			       sportsdata::RetryingGameStore::Sleeper sleeper)
      : mConfig(config),
	mStore(store, config.storeRetry, std::move(sleeper)),
	mRuns(runs),
	mExecutor()
    {
      EngineConfigurationReader::validate(mConfig);
      mExecutor = makeExecutor(mConfig.threads);
    }

    features::FeatureCatalog TheoryEngine::generateFeatures(const features::FeatureGenerationRequest& request) const
    {
      validateFeatureRequest(request, mConfig.leagues);
      return features::FeatureGenerator(mStore).generate(request);
    }

    AnalyzeResult TheoryEngine::analyze(const AnalysisRequest& request,
					const concurrency::CancellationToken& token,
					std::ostream& os)
    {
      validateRequest(request, RunType::Analyze, mConfig.leagues);

      AnalysisContext ctx(request);
      AnalysisPipeline pipeline(mStore, mConfig, *mExecutor, token);
      pipeline.executeAnalysis(ctx, os);

      const auto snapshot = SnapshotBuilder::snapshot(request, RunType::Analyze, ctx.featureSelection, mConfig);
      const auto doc = ResultSerializer::analyzeResult(ctx, snapshot);

      AnalyzeResult result;
      result.snapshot = ModelSnapshotRef{snapshot.hash, snapshot.runId};
      result.sampleSize = ctx.dataset.rows.size();
      result.cleaning = ctx.cleaning;
      result.evaluation = ctx.evaluation;
      result.correlations = ctx.correlations;
      result.featureQuality = ctx.featureQuality;
      result.insights = ctx.insights;
      result.featurePolicy = ctx.featureSelection.report;
      result.featuresUsed = ctx.usedFeatureNames();
      result.featuresDropped = ctx.droppedFeatures();
      result.notes = ctx.evaluation.notes;
      result.resultJson = ResultSerializer::compact(doc);

      persist(RunType::Analyze, snapshot, ctx, result.resultJson, token, os);
      return result;
    }

    BuildModelResult TheoryEngine::buildModel(const AnalysisRequest& request,
					      const concurrency::CancellationToken& token,
					      std::ostream& os)
    {
      validateRequest(request, RunType::Build, mConfig.leagues);

      AnalysisContext ctx(request);
      AnalysisPipeline pipeline(mStore, mConfig, *mExecutor, token);
      pipeline.executeBuild(ctx, os);

      const auto snapshot = SnapshotBuilder::snapshot(request, RunType::Build, ctx.featureSelection, mConfig);
      const auto doc = ResultSerializer::buildResult(ctx, snapshot);

      BuildModelResult result;
      result.snapshot = ModelSnapshotRef{snapshot.hash, snapshot.runId};
      result.sampleSize = ctx.dataset.rows.size();
      result.cleaning = ctx.cleaning;
      result.featurePolicy = ctx.featureSelection.report;
      result.featuresUsed = ctx.usedFeatureNames();
      result.featuresDropped = ctx.droppedFeatures();
      if (ctx.model)
	result.modeling = ctx.model->status;
      if (ctx.simulation)
	result.simulation = *ctx.simulation;
      if (ctx.monteCarlo)
	result.monteCarlo = *ctx.monteCarlo;
      result.notes.push_back("Bet tape and Monte Carlo are historical simulations scored in-sample, not forecasts.");
      result.resultJson = ResultSerializer::compact(doc);

      persist(RunType::Build, snapshot, ctx, result.resultJson, token, os);
      return result;
    }

    WalkforwardRunResult TheoryEngine::runWalkforward(const AnalysisRequest& request,
						      const concurrency::CancellationToken& token,
						      std::ostream& os)
    {
      validateRequest(request, RunType::Walkforward, mConfig.leagues);

      AnalysisContext ctx(request);
      AnalysisPipeline pipeline(mStore, mConfig, *mExecutor, token);
      pipeline.executeDataset(ctx, os);

      walkforward::WalkForwardValidator validator(request.window,
						  mConfig.walkForward,
						  mConfig.model,
						  request.trigger,
						  request.exposure,
						  token);
      const auto wf = validator.run(ctx.dataset.columns, ctx.rowPointers(), request.target, os);

      const auto snapshot = SnapshotBuilder::snapshot(request, RunType::Walkforward, ctx.featureSelection, mConfig);
      const auto doc = ResultSerializer::walkforwardResult(ctx, wf, snapshot);

      WalkforwardRunResult result;
      result.snapshot = ModelSnapshotRef{snapshot.hash, snapshot.runId};
      result.sampleSize = ctx.dataset.rows.size();
      result.cleaning = ctx.cleaning;
      result.featurePolicy = ctx.featureSelection.report;
      result.featuresUsed = ctx.usedFeatureNames();
      result.featuresDropped = ctx.droppedFeatures();
      result.walkforward = wf;
      result.notes = wf.notes;
      result.resultJson = ResultSerializer::compact(doc);

      persist(RunType::Walkforward, snapshot, ctx, result.resultJson, token, os);
      return result;
    }

    runstore::StoredRun TheoryEngine::getRun(const std::string& runId) const
    {
      return mRuns.get(runId);
    }

    std::vector<runstore::StoredRun> TheoryEngine::listRuns() const
    {
      return mRuns.list();
    }

    void TheoryEngine::persist(RunType runType,
			       const RunSnapshot& snapshot,
			       const AnalysisContext& ctx,
			       const std::string& resultJson,
			       const concurrency::CancellationToken& token,
			       std::ostream& os)
    {
      token.throwIfCancelled("saving the run");

      runstore::StoredRun run;
      run.id = snapshot.runId;
      run.createdAt = utcTimestamp();
      run.runType = runTypeToString(runType);
      run.targetName = ctx.request.target.targetName;
      run.targetClass = evaluation::targetClassToString(ctx.request.target.targetClass);
      run.cohortSize = ctx.dataset.rows.size();
      run.snapshotHash = snapshot.hash;
      run.snapshotJson = snapshot.canonicalJson;
      run.resultJson = resultJson;

      if (mRuns.save(run))
	os << "   [RunStore] Saved " << run.id << "\n";
      else
	os << "   [RunStore] " << run.id << " already stored, keeping the first copy\n";
    }
  }
}
