#include "SnapshotBuilder.h"
#include <algorithm>
#include "JsonValues.h"
#include "SnapshotSerializer.h"

using rapidjson::Value;

namespace theory_validator
{
  namespace pipeline
  {
    namespace
    {
      Value cap(const std::optional<int>& v)
      {
	return json::integer(v);
      }

      Value filtersToJson(const cohort::FilterBundle& f, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	std::vector<int> seasons(f.seasons);
	std::sort(seasons.begin(), seasons.end());
	seasons.erase(std::unique(seasons.begin(), seasons.end()), seasons.end());
	Value arr(rapidjson::kArrayType);
	for (int s : seasons)
	  arr.PushBack(s, alloc);

	json::add(obj, "seasons", std::move(arr), alloc);
	json::add(obj, "season_scope", json::str(cohort::seasonScopeToString(f.seasonScope), alloc), alloc);
	json::add(obj, "recent_days", json::integer(f.recentDays), alloc);
	json::add(obj, "date_start", json::optDate(f.dateStart, alloc), alloc);
	json::add(obj, "date_end", json::optDate(f.dateEnd, alloc), alloc);
	json::add(obj, "phase", json::str(sportsdata::seasonPhaseToString(f.phase), alloc), alloc);
	json::add(obj, "team", json::optString(f.team, alloc), alloc);
	json::add(obj, "player", json::optString(f.player, alloc), alloc);
	json::add(obj, "spread_abs_min", json::num(f.spreadAbsMin), alloc);
	json::add(obj, "spread_abs_max", json::num(f.spreadAbsMax), alloc);
	json::add(obj, "games_limit", json::integer(f.gamesLimit), alloc);
	return obj;
      }

      Value cleaningToJson(const cohort::CleaningOptions& c, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "drop_if_all_null", Value(c.dropIfAllNull), alloc);
	json::add(obj, "drop_if_any_null", Value(c.dropIfAnyNull), alloc);
	json::add(obj, "drop_if_non_numeric", Value(c.dropIfNonNumeric), alloc);
	json::add(obj, "min_non_null_features", json::integer(c.minNonNullFeatures), alloc);
	return obj;
      }

      Value triggerToJson(const simulation::TriggerDefinition& t, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "prob_threshold", json::num(t.probThreshold), alloc);
	json::add(obj, "confidence_band", json::num(t.confidenceBand), alloc);
	json::add(obj, "min_edge_vs_implied", json::num(t.minEdgeVsImplied), alloc);
	return obj;
      }

      Value exposureToJson(const simulation::ExposureControls& e, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "max_bets_per_day", cap(e.maxBetsPerDay), alloc);
	json::add(obj, "max_bets_per_side_per_day", cap(e.maxBetsPerSidePerDay), alloc);
	json::add(obj, "spread_abs_min", json::num(e.spreadAbsMin), alloc);
	json::add(obj, "spread_abs_max", json::num(e.spreadAbsMax), alloc);
	return obj;
      }

      Value windowToJson(const walkforward::WalkForwardWindow& w, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "train_days", Value(w.trainDays), alloc);
	json::add(obj, "test_days", Value(w.testDays), alloc);
	json::add(obj, "step_days", Value(w.stepDays), alloc);
	return obj;
      }

      Value policyToJson(const EngineConfiguration& config, RunType runType, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "games_limit_max", Value(config.gamesLimitMax), alloc);

	Value verdict(rapidjson::kObjectType);
	json::add(verdict, "strong_lift", json::num(config.verdict.strongLift), alloc);
	json::add(verdict, "moderate_lift", json::num(config.verdict.moderateLift), alloc);
	json::add(verdict, "large_sample", json::count(config.verdict.largeSample), alloc);
	json::add(verdict, "moderate_sample", json::count(config.verdict.moderateSample), alloc);
	json::add(obj, "verdict", std::move(verdict), alloc);

	if (runType == RunType::Analyze)
	  return obj;

	const auto& m = config.model;
	Value model(rapidjson::kObjectType);
	json::add(model, "learning_rate", json::num(m.fit.learningRate), alloc);
	json::add(model, "epochs", json::count(m.fit.epochs), alloc);
	json::add(model, "l2_lambda", json::num(m.fit.l2Lambda), alloc);
	json::add(model, "max_missing_fraction", json::num(m.pruning.maxMissingFraction), alloc);
	json::add(model, "min_values", json::count(m.pruning.minValues), alloc);
	json::add(model, "collinearity_threshold", json::num(m.pruning.collinearityThreshold), alloc);
	json::add(model, "max_collinearity_features", json::count(m.pruning.maxCollinearityFeatures), alloc);
	json::add(model, "zero_weight_epsilon", json::num(m.zeroWeightEpsilon), alloc);
	json::add(model, "min_training_rows", json::count(m.minTrainingRows), alloc);
	json::add(model, "roi_proxy_threshold", json::num(m.roiProxyThreshold), alloc);
	json::add(model, "candidate_min_sample", json::count(m.candidates.minSampleSize), alloc);
	json::add(model, "candidate_min_lift", json::num(m.candidates.minLift), alloc);
	json::add(obj, "model", std::move(model), alloc);

	if (runType == RunType::Build)
	  {
	    Value mc(rapidjson::kObjectType);
	    json::add(mc, "resamples", json::count(config.monteCarlo.resamples), alloc);
	    json::add(mc, "min_bets", json::count(config.monteCarlo.minBets), alloc);
	    json::add(mc, "seed", Value(static_cast<uint64_t>(config.monteCarlo.seed)), alloc);
	    json::add(obj, "montecarlo", std::move(mc), alloc);
	  }
	else
	  {
	    Value wf(rapidjson::kObjectType);
	    json::add(wf, "min_train_rows", json::count(config.walkForward.minTrainRows), alloc);
	    json::add(wf, "min_test_rows", json::count(config.walkForward.minTestRows), alloc);
	    json::add(obj, "walkforward", std::move(wf), alloc);
	  }
	return obj;
      }

      std::vector<std::string> sortedCopy(std::vector<std::string> values)
      {
	std::sort(values.begin(), values.end());
	return values;
      }
    }

    Value droppedFeatureToJson(const features::DroppedFeature& dropped, json::Allocator& alloc)
    {
      Value obj(rapidjson::kObjectType);
      json::add(obj, "feature", json::str(dropped.feature, alloc), alloc);
      json::add(obj, "reason", json::str(dropped.reason, alloc), alloc);
      if (dropped.with)
	json::add(obj, "with", json::str(*dropped.with, alloc), alloc);
      if (dropped.absCorr)
	json::add(obj, "abs_corr", json::num(*dropped.absCorr), alloc);
      if (dropped.threshold)
	json::add(obj, "threshold", json::num(*dropped.threshold), alloc);
      if (!dropped.detail.empty())
	json::add(obj, "detail", json::str(dropped.detail, alloc), alloc);
      return obj;
    }

    Value policyReportToJson(const features::FeaturePolicyReport& report, json::Allocator& alloc)
    {
      Value obj(rapidjson::kObjectType);
      json::add(obj, "context", json::str(features::runContextToString(report.context), alloc), alloc);
      json::add(obj, "dropped_post_game_features",
		json::strings(sortedCopy(report.droppedPostGameFeatures), alloc), alloc);
      json::add(obj, "dropped_post_game_count", json::count(report.droppedPostGameFeatures.size()), alloc);
      json::add(obj, "contains_post_game_features", Value(report.containsPostGameFeatures), alloc);
      return obj;
    }

    Value targetToJson(const evaluation::TargetDefinition& target, json::Allocator& alloc)
    {
      Value obj(rapidjson::kObjectType);
      json::add(obj, "target_class", json::str(evaluation::targetClassToString(target.targetClass), alloc), alloc);
      json::add(obj, "target_name", json::str(target.targetName, alloc), alloc);
      json::add(obj, "metric_type", json::str(evaluation::metricTypeToString(target.metricType), alloc), alloc);
      if (target.isMarket())
	{
	  json::add(obj, "market_type", json::str(evaluation::marketTypeToString(*target.marketType), alloc), alloc);
	  json::add(obj, "side", json::str(target.side, alloc), alloc);
	  json::add(obj, "odds_assumption",
		    json::str(evaluation::oddsAssumptionToString(target.oddsAssumption), alloc), alloc);
	  json::add(obj, "odds_required", Value(target.oddsRequired), alloc);
	}
      return obj;
    }

    rapidjson::Document SnapshotBuilder::payload(const AnalysisRequest& request,
						 RunType runType,
						 const features::FeatureSelection& selection,
						 const EngineConfiguration& config)
    {
      rapidjson::Document doc;
      doc.SetObject();
      auto& alloc = doc.GetAllocator();

      json::add(doc, "version", Value(kPayloadVersion), alloc);
      json::add(doc, "league", json::str(request.filters.league, alloc), alloc);
      json::add(doc, "filters", filtersToJson(request.filters, alloc), alloc);
      json::add(doc, "context", json::str(features::runContextToString(request.context), alloc), alloc);
      json::add(doc, "target", targetToJson(request.target, alloc), alloc);
      json::add(doc, "cleaning", cleaningToJson(request.cleaning, alloc), alloc);

      const bool simulates = runType != RunType::Analyze;
      json::add(doc, "trigger", simulates ? triggerToJson(request.trigger, alloc) : Value(rapidjson::kNullType), alloc);
      json::add(doc, "exposure", simulates ? exposureToJson(request.exposure, alloc) : Value(rapidjson::kNullType), alloc);
      json::add(doc, "window", runType == RunType::Walkforward
		? windowToJson(request.window, alloc) : Value(rapidjson::kNullType), alloc);

      json::add(doc, "features_requested", json::strings(sortedCopy(selection.requested), alloc), alloc);
      json::add(doc, "feature_policy", policyReportToJson(selection.report, alloc), alloc);

      std::vector<std::string> used;
      for (const auto& feature : selection.used)
	used.push_back(feature.name);
      json::add(doc, "features_used", json::strings(sortedCopy(used), alloc), alloc);

      std::vector<features::DroppedFeature> dropped(selection.dropped);
      std::sort(dropped.begin(), dropped.end(), [](const features::DroppedFeature& a, const features::DroppedFeature& b) {
	return a.feature < b.feature;
      });
      Value droppedArr(rapidjson::kArrayType);
      for (const auto& d : dropped)
	droppedArr.PushBack(droppedFeatureToJson(d, alloc), alloc);
      json::add(doc, "features_dropped", std::move(droppedArr), alloc);

      json::add(doc, "policy", policyToJson(config, runType, alloc), alloc);
      return doc;
    }

    RunSnapshot SnapshotBuilder::snapshot(const AnalysisRequest& request,
					  RunType runType,
					  const features::FeatureSelection& selection,
					  const EngineConfiguration& config)
    {
      const auto doc = payload(request, runType, selection, config);
      RunSnapshot snap;
      snap.canonicalJson = runstore::SnapshotSerializer::canonicalJson(doc);
      snap.hash = runstore::SnapshotSerializer::contentHash(snap.canonicalJson);
      snap.runId = runstore::SnapshotSerializer::runId(runTypeToString(runType), snap.hash);
      return snap;
    }
  }
}
