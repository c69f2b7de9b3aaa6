#include "ResultSerializer.h"
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include "JsonValues.h"
#include "RunStore.h"
#include "TheoryValidatorException.h"

using rapidjson::Value;

namespace theory_validator
{
  namespace pipeline
  {
    namespace
    {
      Value nullValue()
      {
	return Value(rapidjson::kNullType);
      }

      template <typename Map>
      Value countMap(const Map& counts, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	for (const auto& entry : counts)
	  {
	    Value key(entry.first.c_str(), alloc);
	    obj.AddMember(key, json::count(entry.second), alloc);
	  }
	return obj;
      }

      void addHeader(Value& doc, RunType runType, const RunSnapshot& snapshot, json::Allocator& alloc)
      {
	json::add(doc, "run_type", json::str(runTypeToString(runType), alloc), alloc);
	json::add(doc, "run_id", json::str(snapshot.runId, alloc), alloc);
	json::add(doc, "snapshot_hash", json::str(snapshot.hash, alloc), alloc);
      }

      Value cleaningSummary(const cohort::CleaningSummary& c, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "raw_rows", json::count(c.rawRows), alloc);
	json::add(obj, "rows_after_cleaning", json::count(c.rowsAfterCleaning), alloc);
	json::add(obj, "dropped_null", json::count(c.droppedNull), alloc);
	json::add(obj, "dropped_non_numeric", json::count(c.droppedNonNumeric), alloc);
	return obj;
      }

      Value droppedList(const std::vector<features::DroppedFeature>& dropped, json::Allocator& alloc)
      {
	Value arr(rapidjson::kArrayType);
	for (const auto& d : dropped)
	  arr.PushBack(droppedFeatureToJson(d, alloc), alloc);
	return arr;
      }

      // Sample size, cleaning and feature policy shared by every run type.
      void addDatasetSection(Value& doc, const AnalysisContext& ctx, json::Allocator& alloc)
      {
	json::add(doc, "sample_size", json::count(ctx.dataset.rows.size()), alloc);
	json::add(doc, "cleaning_summary", cleaningSummary(ctx.cleaning, alloc), alloc);
	json::add(doc, "feature_policy", policyReportToJson(ctx.featureSelection.report, alloc), alloc);
	json::add(doc, "features_used", json::strings(ctx.usedFeatureNames(), alloc), alloc);
	json::add(doc, "features_dropped", droppedList(ctx.droppedFeatures(), alloc), alloc);

	Value cohort(rapidjson::kObjectType);
	const auto& sel = ctx.selection;
	Value seasons(rapidjson::kArrayType);
	for (int s : sel.seasons)
	  seasons.PushBack(s, alloc);
	json::add(cohort, "seasons", std::move(seasons), alloc);
	json::add(cohort, "baseline_size", json::count(sel.baseline.size()), alloc);
	json::add(cohort, "cohort_size", json::count(sel.cohort.size()), alloc);
	json::add(cohort, "games_limit_applied", Value(sel.gamesLimitApplied), alloc);
	json::add(cohort, "recent_cutoff", json::optDate(sel.recentCutoff, alloc), alloc);
	json::add(doc, "cohort", std::move(cohort), alloc);
      }

      Value stability(const std::vector<evaluation::StabilityBucket>& buckets, json::Allocator& alloc)
      {
	Value arr(rapidjson::kArrayType);
	for (const auto& b : buckets)
	  {
	    Value obj(rapidjson::kObjectType);
	    json::add(obj, "key", json::str(b.key, alloc), alloc);
	    json::add(obj, "n", json::count(b.n), alloc);
	    json::add(obj, "value", json::num(b.value), alloc);
	    arr.PushBack(obj, alloc);
	  }
	return arr;
      }

      Value marketStatistics(const evaluation::MarketStatistics& m, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "resolved_count", json::count(m.resolvedCount), alloc);
	json::add(obj, "push_count", json::count(m.pushCount), alloc);
	json::add(obj, "wins", json::count(m.wins), alloc);
	json::add(obj, "losses", json::count(m.losses), alloc);
	json::add(obj, "rows_with_odds", json::count(m.rowsWithOdds), alloc);
	json::add(obj, "odds_coverage_pct", json::num(m.oddsCoveragePct), alloc);
	json::add(obj, "avg_implied_probability", json::num(m.avgImpliedProbability), alloc);
	json::add(obj, "ev_vs_implied", json::num(m.evVsImplied), alloc);
	json::add(obj, "roi_units", json::num(m.roiUnits), alloc);
	json::add(obj, "sharpe_like", json::num(m.sharpeLike), alloc);
	json::add(obj, "max_drawdown", json::num(m.maxDrawdown), alloc);
	return obj;
      }

      Value evaluationToJson(const evaluation::EvaluationResult& e, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "target_name", json::str(e.targetName, alloc), alloc);
	json::add(obj, "target_class", json::str(evaluation::targetClassToString(e.targetClass), alloc), alloc);
	json::add(obj, "metric_type", json::str(evaluation::metricTypeToString(e.metricType), alloc), alloc);
	json::add(obj, "sample_size", json::count(e.sampleSize), alloc);
	json::add(obj, "baseline_size", json::count(e.baselineSize), alloc);
	json::add(obj, "baseline_value", json::num(e.baselineValue), alloc);
	json::add(obj, "cohort_value", json::num(e.cohortValue), alloc);
	json::add(obj, "delta", json::num(e.delta), alloc);
	json::add(obj, "relative_delta", json::num(e.relativeDelta), alloc);

	if (e.cohortSummary)
	  {
	    const auto& s = *e.cohortSummary;
	    Value summary(rapidjson::kObjectType);
	    json::add(summary, "count", json::count(s.count), alloc);
	    json::add(summary, "mean", json::num(s.mean), alloc);
	    json::add(summary, "std", json::num(s.std), alloc);
	    json::add(summary, "min", json::num(s.min), alloc);
	    json::add(summary, "max", json::num(s.max), alloc);
	    json::add(summary, "p25", json::num(s.p25), alloc);
	    json::add(summary, "p75", json::num(s.p75), alloc);
	    json::add(obj, "summary", std::move(summary), alloc);
	  }
	else
	  json::add(obj, "summary", nullValue(), alloc);

	json::add(obj, "market", e.market ? marketStatistics(*e.market, alloc) : nullValue(), alloc);

	Value stab(rapidjson::kObjectType);
	json::add(stab, "by_season", stability(e.bySeason, alloc), alloc);
	json::add(stab, "by_month", stability(e.byMonth, alloc), alloc);
	json::add(obj, "stability", std::move(stab), alloc);

	json::add(obj, "lift_label", json::str(e.liftLabel, alloc), alloc);
	json::add(obj, "sample_label", json::str(e.sampleLabel, alloc), alloc);
	json::add(obj, "reason_code", json::optString(e.reasonCode, alloc), alloc);
	json::add(obj, "notes", json::strings(e.notes, alloc), alloc);
	return obj;
      }

      Value correlationsToJson(const std::vector<evaluation::FeatureCorrelation>& corr, json::Allocator& alloc)
      {
	Value arr(rapidjson::kArrayType);
	for (const auto& c : corr)
	  {
	    Value obj(rapidjson::kObjectType);
	    json::add(obj, "feature", json::str(c.feature, alloc), alloc);
	    json::add(obj, "group", json::str(c.group, alloc), alloc);
	    json::add(obj, "r", json::num(c.r), alloc);
	    json::add(obj, "n", json::count(c.n), alloc);
	    json::add(obj, "significant", Value(c.significant), alloc);
	    arr.PushBack(obj, alloc);
	  }
	return arr;
      }

      Value qualityToJson(const std::vector<evaluation::FeatureQuality>& quality, json::Allocator& alloc)
      {
	Value arr(rapidjson::kArrayType);
	for (const auto& q : quality)
	  {
	    Value obj(rapidjson::kObjectType);
	    json::add(obj, "feature", json::str(q.feature, alloc), alloc);
	    json::add(obj, "count", json::count(q.count), alloc);
	    json::add(obj, "nulls", json::count(q.nulls), alloc);
	    json::add(obj, "null_pct", json::num(q.nullPct), alloc);
	    json::add(obj, "non_numeric", json::count(q.nonNumeric), alloc);
	    json::add(obj, "distinct", json::count(q.distinct), alloc);
	    json::add(obj, "min", json::num(q.min), alloc);
	    json::add(obj, "max", json::num(q.max), alloc);
	    json::add(obj, "mean", json::num(q.mean), alloc);
	    arr.PushBack(obj, alloc);
	  }
	return arr;
      }

      Value modelMetrics(const modeling::ModelMetrics& m, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "model_type", json::str(m.modelType, alloc), alloc);
	json::add(obj, "training_rows", json::count(m.trainingRows), alloc);
	json::add(obj, "intercept", json::num(m.intercept), alloc);

	Value weights(rapidjson::kArrayType);
	for (const auto& w : m.weights)
	  {
	    Value entry(rapidjson::kObjectType);
	    json::add(entry, "feature", json::str(w.feature, alloc), alloc);
	    json::add(entry, "group", json::str(w.group, alloc), alloc);
	    json::add(entry, "weight", json::num(w.weight), alloc);
	    weights.PushBack(entry, alloc);
	  }
	json::add(obj, "weights", std::move(weights), alloc);

	Value drivers(rapidjson::kArrayType);
	for (const auto& d : m.drivers)
	  {
	    Value entry(rapidjson::kObjectType);
	    json::add(entry, "group", json::str(d.group, alloc), alloc);
	    json::add(entry, "total_abs_weight", json::num(d.totalAbsWeight), alloc);
	    json::add(entry, "feature_count", json::count(d.featureCount), alloc);
	    drivers.PushBack(entry, alloc);
	  }
	json::add(obj, "drivers", std::move(drivers), alloc);

	json::add(obj, "accuracy", json::num(m.accuracy), alloc);
	json::add(obj, "roi_proxy", json::num(m.roiProxy), alloc);
	json::add(obj, "roi_proxy_bets", json::count(m.roiProxyBets), alloc);
	json::add(obj, "notes", json::strings(m.notes, alloc), alloc);
	return obj;
      }

      Value theoryCandidates(const std::vector<modeling::TheoryCandidate>& candidates, json::Allocator& alloc)
      {
	Value arr(rapidjson::kArrayType);
	for (const auto& c : candidates)
	  {
	    Value obj(rapidjson::kObjectType);
	    json::add(obj, "feature", json::str(c.feature, alloc), alloc);
	    json::add(obj, "condition", json::str(c.condition, alloc), alloc);
	    json::add(obj, "operator", json::str(c.op, alloc), alloc);
	    json::add(obj, "threshold", json::num(c.threshold), alloc);
	    json::add(obj, "sample_size", json::count(c.sampleSize), alloc);
	    json::add(obj, "hit_rate", json::num(c.hitRate), alloc);
	    json::add(obj, "baseline_rate", json::num(c.baselineRate), alloc);
	    json::add(obj, "lift", json::num(c.lift), alloc);
	    json::add(obj, "framing_draft", json::str(c.framingDraft, alloc), alloc);
	    json::add(obj, "status", json::str(c.status, alloc), alloc);
	    arr.PushBack(obj, alloc);
	  }
	return arr;
      }

      Value suggestedTheories(const std::vector<modeling::SuggestedTheory>& theories, json::Allocator& alloc)
      {
	Value arr(rapidjson::kArrayType);
	for (const auto& t : theories)
	  {
	    Value obj(rapidjson::kObjectType);
	    json::add(obj, "text", json::str(t.text, alloc), alloc);
	    json::add(obj, "features_used", json::strings(t.featuresUsed, alloc), alloc);
	    json::add(obj, "historical_edge", json::num(t.historicalEdge), alloc);
	    json::add(obj, "confidence", json::str(t.confidence, alloc), alloc);
	    arr.PushBack(obj, alloc);
	  }
	return arr;
      }

      Value modelingStatus(const modeling::ModelingStatus& status, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "state", json::str(modeling::modelingStateToString(status.state()), alloc), alloc);
	switch (status.state())
	  {
	  case modeling::ModelingState::Complete:
	    json::add(obj, "metrics", modelMetrics(status.metrics(), alloc), alloc);
	    break;
	  case modeling::ModelingState::NotRun:
	    json::add(obj, "reason", json::str(status.reason(), alloc), alloc);
	    json::add(obj, "eligibility", json::str(status.detail(), alloc), alloc);
	    break;
	  case modeling::ModelingState::Unavailable:
	    json::add(obj, "reason", json::str(status.reason(), alloc), alloc);
	    json::add(obj, "detail", json::str(status.detail(), alloc), alloc);
	    break;
	  }
	return obj;
      }

      Value exposureSummary(const simulation::ExposureSummary& s, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "triggered", json::count(s.triggered), alloc);
	json::add(obj, "selected", json::count(s.selected), alloc);
	json::add(obj, "dropped_due_to_controls", json::count(s.droppedDueToControls), alloc);
	json::add(obj, "drop_reasons", countMap(s.dropReasons, alloc), alloc);
	json::add(obj, "unique_days", json::count(s.uniqueDays), alloc);
	json::add(obj, "avg_bets_per_day", json::num(s.avgBetsPerDay), alloc);
	json::add(obj, "by_side", countMap(s.bySide, alloc), alloc);
	json::add(obj, "warnings", json::strings(s.warnings, alloc), alloc);
	json::add(obj, "notes", json::strings(s.notes, alloc), alloc);
	return obj;
      }

      Value tapeRow(const simulation::BetTapeRow& row, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "sequence", json::count(row.sequence), alloc);
	json::add(obj, "game_id", Value(static_cast<int64_t>(row.gameId)), alloc);
	json::add(obj, "game_date", json::date(row.gameDate, alloc), alloc);
	json::add(obj, "matchup", json::str(row.matchup, alloc), alloc);
	json::add(obj, "side", json::str(row.side, alloc), alloc);
	json::add(obj, "line", json::num(row.line), alloc);
	json::add(obj, "price", json::num(row.price), alloc);
	json::add(obj, "model_prob", json::num(row.modelProb), alloc);
	json::add(obj, "implied_prob", json::num(row.impliedProb), alloc);
	json::add(obj, "edge", json::num(row.edge), alloc);
	json::add(obj, "outcome", json::str(row.won() ? "win" : "loss", alloc), alloc);
	json::add(obj, "stake", json::num(row.stake), alloc);
	json::add(obj, "pnl", json::num(row.pnl), alloc);
	json::add(obj, "cumulative_pnl", json::num(row.cumulativePnl), alloc);
	json::add(obj, "drawdown", json::num(row.drawdown), alloc);
	json::add(obj, "reason", json::str(row.reason, alloc), alloc);
	return obj;
      }

      Value tapeRows(const std::vector<simulation::BetTapeRow>& rows, json::Allocator& alloc)
      {
	Value arr(rapidjson::kArrayType);
	for (const auto& row : rows)
	  arr.PushBack(tapeRow(row, alloc), alloc);
	return arr;
      }

      Value sliceMetrics(const simulation::SliceMetrics& m, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "label", json::str(m.label, alloc), alloc);
	json::add(obj, "n", json::count(m.n), alloc);
	json::add(obj, "wins", json::count(m.wins), alloc);
	json::add(obj, "losses", json::count(m.losses), alloc);
	json::add(obj, "hit_rate", json::num(m.hitRate), alloc);
	json::add(obj, "pnl_units", json::num(m.pnlUnits), alloc);
	json::add(obj, "roi_per_bet", json::num(m.roiPerBet), alloc);
	json::add(obj, "avg_model_prob", json::num(m.avgModelProb), alloc);
	json::add(obj, "avg_implied_prob", json::num(m.avgImpliedProb), alloc);
	json::add(obj, "avg_edge", json::num(m.avgEdge), alloc);
	json::add(obj, "hit_minus_implied", json::num(m.hitMinusImplied), alloc);
	json::add(obj, "red_zone", Value(m.redZone), alloc);
	return obj;
      }

      Value sliceList(const std::vector<simulation::SliceMetrics>& slices, json::Allocator& alloc)
      {
	Value arr(rapidjson::kArrayType);
	for (const auto& s : slices)
	  arr.PushBack(sliceMetrics(s, alloc), alloc);
	return arr;
      }

      Value performanceSlices(const simulation::PerformanceSlices& p, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "overall", sliceMetrics(p.overall, alloc), alloc);
	json::add(obj, "confidence", sliceList(p.confidence, alloc), alloc);
	json::add(obj, "spread_buckets", sliceList(p.spreadBuckets, alloc), alloc);
	json::add(obj, "favorite_underdog", sliceList(p.favoriteUnderdog, alloc), alloc);
	json::add(obj, "pace_quartiles", sliceList(p.paceQuartiles, alloc), alloc);
	json::add(obj, "notes", json::strings(p.notes, alloc), alloc);
	return obj;
      }

      Value failureAnalysis(const simulation::FailureAnalysis& f, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	json::add(obj, "largest_losses", tapeRows(f.largestLosses, alloc), alloc);
	json::add(obj, "overconfident_losses", tapeRows(f.overconfidentLosses, alloc), alloc);
	json::add(obj, "edge_buckets", sliceList(f.edgeBuckets, alloc), alloc);
	json::add(obj, "notes", json::strings(f.notes, alloc), alloc);
	return obj;
      }

      Value monteCarlo(const montecarlo::MonteCarloStatus& status, json::Allocator& alloc)
      {
	Value obj(rapidjson::kObjectType);
	if (!status.available())
	  {
	    json::add(obj, "state", json::str("unavailable", alloc), alloc);
	    json::add(obj, "reason", json::str(status.reason(), alloc), alloc);
	    json::add(obj, "detail", json::str(status.detail(), alloc), alloc);
	    return obj;
	  }

	const auto& m = status.metrics();
	json::add(obj, "state", json::str("complete", alloc), alloc);
	json::add(obj, "runs", json::count(m.runs), alloc);
	json::add(obj, "bet_count", json::count(m.betCount), alloc);
	json::add(obj, "seed", Value(static_cast<uint64_t>(m.seed)), alloc);
	json::add(obj, "mean_pnl", json::num(m.meanPnl), alloc);
	json::add(obj, "std_pnl", json::num(m.stdPnl), alloc);
	json::add(obj, "p5_pnl", json::num(m.p5Pnl), alloc);
	json::add(obj, "p50_pnl", json::num(m.p50Pnl), alloc);
	json::add(obj, "p95_pnl", json::num(m.p95Pnl), alloc);
	json::add(obj, "p5_max_drawdown", json::num(m.p5MaxDrawdown), alloc);
	json::add(obj, "p50_max_drawdown", json::num(m.p50MaxDrawdown), alloc);
	json::add(obj, "p95_max_drawdown", json::num(m.p95MaxDrawdown), alloc);
	json::add(obj, "prob_negative", json::num(m.probNegative), alloc);
	json::add(obj, "actual_pnl", json::num(m.actualPnl), alloc);
	json::add(obj, "actual_max_drawdown", json::num(m.actualMaxDrawdown), alloc);
	json::add(obj, "actual_percentile", json::num(m.actualPercentile), alloc);
	json::add(obj, "luck_score", json::num(m.luckScore), alloc);

	const auto& a = m.assumptions;
	Value assumptions(rapidjson::kObjectType);
	json::add(assumptions, "bet_sizing", json::str(a.betSizing, alloc), alloc);
	json::add(assumptions, "kelly", json::str(a.kelly, alloc), alloc);
	json::add(assumptions, "odds_assumption", json::str(a.oddsAssumption, alloc), alloc);
	json::add(assumptions, "independence_assumption", Value(a.independenceAssumption), alloc);
	json::add(assumptions, "selection_policy", json::strings(a.selectionPolicy, alloc), alloc);
	json::add(obj, "assumptions", std::move(assumptions), alloc);
	json::add(obj, "interpretation", json::strings(m.interpretation, alloc), alloc);
	return obj;
      }

      Value parseEmbedded(const std::string& text, const std::string& source, json::Allocator& alloc)
      {
	rapidjson::Document parsed;
	parsed.Parse<rapidjson::kParseFullPrecisionFlag>(text.c_str());
	if (parsed.HasParseError())
	  throw RunStoreException("stored " + source + " is not valid JSON");
	return Value(parsed, alloc);
      }

      template <typename Writer>
      std::string write(const Value& value)
      {
	rapidjson::StringBuffer buffer;
	Writer writer(buffer);
	value.Accept(writer);
	return std::string(buffer.GetString(), buffer.GetSize());
      }
    }

    rapidjson::Document ResultSerializer::featureCatalog(const features::FeatureCatalog& catalog)
    {
      rapidjson::Document doc;
      doc.SetObject();
      auto& alloc = doc.GetAllocator();

      json::add(doc, "league", json::str(catalog.league, alloc), alloc);
      Value list(rapidjson::kArrayType);
      for (const auto& f : catalog.features)
	{
	  Value obj(rapidjson::kObjectType);
	  json::add(obj, "name", json::str(f.name, alloc), alloc);
	  json::add(obj, "formula", json::str(f.formula, alloc), alloc);
	  json::add(obj, "category", json::str(f.category, alloc), alloc);
	  json::add(obj, "group", json::str(f.group, alloc), alloc);
	  json::add(obj, "timing", json::str(features::featureTimingToString(f.timing), alloc), alloc);
	  json::add(obj, "source", json::str(f.source, alloc), alloc);
	  json::add(obj, "default_selected", Value(f.defaultSelected), alloc);
	  list.PushBack(obj, alloc);
	}
      json::add(doc, "features", std::move(list), alloc);
      json::add(doc, "stat_keys_used", json::strings(catalog.statKeysUsed, alloc), alloc);
      json::add(doc, "skipped_stat_keys", json::strings(catalog.skippedStatKeys, alloc), alloc);
      json::add(doc, "rolling_window", Value(catalog.rollingWindow), alloc);
      json::add(doc, "include_rest_days", Value(catalog.includeRestDays), alloc);
      json::add(doc, "include_rolling", Value(catalog.includeRolling), alloc);
      json::add(doc, "summary", json::str(catalog.summary, alloc), alloc);
      return doc;
    }

    rapidjson::Document ResultSerializer::analyzeResult(const AnalysisContext& ctx, const RunSnapshot& snapshot)
    {
      rapidjson::Document doc;
      doc.SetObject();
      auto& alloc = doc.GetAllocator();
      const auto& e = ctx.evaluation;

      addHeader(doc, RunType::Analyze, snapshot, alloc);
      addDatasetSection(doc, ctx, alloc);
      json::add(doc, "baseline_value", json::num(e.baselineValue), alloc);
      json::add(doc, "cohort_value", json::num(e.cohortValue), alloc);
      json::add(doc, "delta", json::num(e.delta), alloc);
      json::add(doc, "correlations", correlationsToJson(ctx.correlations, alloc), alloc);
      json::add(doc, "insights", json::strings(ctx.insights, alloc), alloc);
      json::add(doc, "evaluation", evaluationToJson(e, alloc), alloc);
      json::add(doc, "feature_quality", qualityToJson(ctx.featureQuality, alloc), alloc);
      json::add(doc, "notes", json::strings(e.notes, alloc), alloc);
      return doc;
    }

    rapidjson::Document ResultSerializer::buildResult(const AnalysisContext& ctx, const RunSnapshot& snapshot)
    {
      rapidjson::Document doc;
      doc.SetObject();
      auto& alloc = doc.GetAllocator();

      addHeader(doc, RunType::Build, snapshot, alloc);
      addDatasetSection(doc, ctx, alloc);

      if (ctx.model)
	{
	  json::add(doc, "modeling_status", modelingStatus(ctx.model->status, alloc), alloc);
	  json::add(doc, "model_summary", ctx.model->status.isComplete()
		    ? modelMetrics(ctx.model->status.metrics(), alloc) : nullValue(), alloc);
	}
      else
	{
	  json::add(doc, "modeling_status", nullValue(), alloc);
	  json::add(doc, "model_summary", nullValue(), alloc);
	}
      json::add(doc, "theory_candidates", theoryCandidates(ctx.theoryCandidates, alloc), alloc);
      json::add(doc, "suggested_theories", suggestedTheories(ctx.suggestedTheories, alloc), alloc);

      Value simStatus(rapidjson::kObjectType);
      if (ctx.simulation && ctx.simulation->isComplete())
	{
	  const auto& out = ctx.simulation->output();
	  json::add(simStatus, "state", json::str("complete", alloc), alloc);
	  json::add(doc, "simulation_status", std::move(simStatus), alloc);
	  json::add(doc, "exposure_summary", exposureSummary(out.exposure, alloc), alloc);
	  json::add(doc, "bet_tape", tapeRows(out.tape, alloc), alloc);
	  json::add(doc, "performance_slices", performanceSlices(out.slices, alloc), alloc);
	  json::add(doc, "failure_analysis", failureAnalysis(out.failures, alloc), alloc);
	}
      else
	{
	  json::add(simStatus, "state", json::str("not_run", alloc), alloc);
	  if (ctx.simulation)
	    {
	      json::add(simStatus, "reason", json::str(ctx.simulation->reason(), alloc), alloc);
	      json::add(simStatus, "eligibility", json::str(ctx.simulation->eligibility(), alloc), alloc);
	    }
	  json::add(doc, "simulation_status", std::move(simStatus), alloc);
	  json::add(doc, "exposure_summary", nullValue(), alloc);
	  json::add(doc, "bet_tape", Value(rapidjson::kArrayType), alloc);
	  json::add(doc, "performance_slices", nullValue(), alloc);
	  json::add(doc, "failure_analysis", nullValue(), alloc);
	}

      json::add(doc, "monte_carlo", ctx.monteCarlo ? monteCarlo(*ctx.monteCarlo, alloc) : nullValue(), alloc);

      Value snap(rapidjson::kObjectType);
      json::add(snap, "hash", json::str(snapshot.hash, alloc), alloc);
      json::add(snap, "run_id", json::str(snapshot.runId, alloc), alloc);
      json::add(doc, "model_snapshot", std::move(snap), alloc);

      std::vector<std::string> notes;
      notes.push_back("Bet tape and Monte Carlo are historical simulations scored in-sample, not forecasts.");
      json::add(doc, "notes", json::strings(notes, alloc), alloc);
      return doc;
    }

    rapidjson::Document ResultSerializer::walkforwardResult(const AnalysisContext& ctx,
							    const walkforward::WalkForwardResult& result,
							    const RunSnapshot& snapshot)
    {
      rapidjson::Document doc;
      doc.SetObject();
      auto& alloc = doc.GetAllocator();

      addHeader(doc, RunType::Walkforward, snapshot, alloc);
      addDatasetSection(doc, ctx, alloc);
      json::add(doc, "eligible", Value(result.eligible), alloc);
      json::add(doc, "reason_code", result.reasonCode.empty() ? nullValue() : json::str(result.reasonCode, alloc), alloc);

      Value window(rapidjson::kObjectType);
      json::add(window, "train_days", Value(result.window.trainDays), alloc);
      json::add(window, "test_days", Value(result.window.testDays), alloc);
      json::add(window, "step_days", Value(result.window.stepDays), alloc);
      json::add(doc, "window", std::move(window), alloc);

      Value slices(rapidjson::kArrayType);
      for (const auto& s : result.slices)
	{
	  Value obj(rapidjson::kObjectType);
	  json::add(obj, "start_date", json::date(s.startDate, alloc), alloc);
	  json::add(obj, "end_date", json::date(s.endDate, alloc), alloc);
	  json::add(obj, "train_rows", json::count(s.trainRows), alloc);
	  json::add(obj, "sample_size", json::count(s.sampleSize), alloc);
	  json::add(obj, "bet_count", json::count(s.betCount), alloc);
	  json::add(obj, "hit_rate", json::num(s.hitRate), alloc);
	  json::add(obj, "roi_units", json::num(s.roiUnits), alloc);
	  json::add(obj, "edge_avg", json::num(s.edgeAvg), alloc);
	  json::add(obj, "odds_coverage_pct", json::num(s.oddsCoveragePct), alloc);
	  slices.PushBack(obj, alloc);
	}
      json::add(doc, "slices", std::move(slices), alloc);
      json::add(doc, "skipped_slices", json::count(result.skippedSlices), alloc);
      json::add(doc, "edge_half_life_days", json::integer(result.edgeHalfLifeDays), alloc);
      json::add(doc, "notes", json::strings(result.notes, alloc), alloc);
      return doc;
    }

    rapidjson::Document ResultSerializer::storedRun(const runstore::StoredRun& run, bool includePayload)
    {
      rapidjson::Document doc;
      doc.SetObject();
      auto& alloc = doc.GetAllocator();

      json::add(doc, "run_id", json::str(run.id, alloc), alloc);
      json::add(doc, "created_at", json::str(run.createdAt, alloc), alloc);
      json::add(doc, "run_type", json::str(run.runType, alloc), alloc);
      json::add(doc, "target_name", json::str(run.targetName, alloc), alloc);
      json::add(doc, "target_class", json::str(run.targetClass, alloc), alloc);
      json::add(doc, "cohort_size", json::count(run.cohortSize), alloc);
      json::add(doc, "snapshot_hash", json::str(run.snapshotHash, alloc), alloc);
      if (includePayload)
	{
	  json::add(doc, "snapshot", parseEmbedded(run.snapshotJson, "snapshot of " + run.id, alloc), alloc);
	  json::add(doc, "result", parseEmbedded(run.resultJson, "result of " + run.id, alloc), alloc);
	}
      return doc;
    }

    rapidjson::Document ResultSerializer::runList(const std::vector<runstore::StoredRun>& runs)
    {
      rapidjson::Document doc;
      doc.SetObject();
      auto& alloc = doc.GetAllocator();

      Value arr(rapidjson::kArrayType);
      for (const auto& run : runs)
	{
	  auto entry = storedRun(run, false);
	  arr.PushBack(Value(entry, alloc), alloc);
	}
      json::add(doc, "runs", std::move(arr), alloc);
      return doc;
    }

    rapidjson::Document ResultSerializer::error(const std::string& reasonCode,
						const std::string& field,
						const std::string& message)
    {
      rapidjson::Document doc;
      doc.SetObject();
      auto& alloc = doc.GetAllocator();

      Value err(rapidjson::kObjectType);
      json::add(err, "reason_code", json::str(reasonCode, alloc), alloc);
      json::add(err, "field", field.empty() ? nullValue() : json::str(field, alloc), alloc);
      json::add(err, "message", json::str(message, alloc), alloc);
      json::add(doc, "error", std::move(err), alloc);
      return doc;
    }

    std::string ResultSerializer::compact(const rapidjson::Value& value)
    {
      return write<rapidjson::Writer<rapidjson::StringBuffer>>(value);
    }

    std::string ResultSerializer::pretty(const rapidjson::Value& value)
    {
      return write<rapidjson::PrettyWriter<rapidjson::StringBuffer>>(value);
    }
  }
}
