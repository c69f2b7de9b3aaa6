#include "RequestParser.h"
#include <boost/algorithm/string.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/lexical_cast.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include "LeagueCalendar.h"
#include "TheoryValidatorException.h"

using namespace rapidjson;

namespace theory_validator
{
  namespace pipeline
  {
    namespace
    {
      [[noreturn]] void typeError(const std::string& field, const std::string& expected)
      {
	throw ConfigurationException(field, "invalid_type", "expected " + expected);
      }

      Document parseDocument(const std::string& json)
      {
	Document doc;
	doc.Parse<kParseFullPrecisionFlag>(json.c_str());
	if (doc.HasParseError())
	  throw ConfigurationException("request", "invalid_json",
				       std::string(GetParseError_En(doc.GetParseError())) + " at offset " +
				       std::to_string(doc.GetErrorOffset()));
	if (!doc.IsObject())
	  typeError("request", "a JSON object");
	return doc;
      }

      const Value* member(const Value& obj, const char* key)
      {
	auto it = obj.FindMember(key);
	if (it == obj.MemberEnd() || it->value.IsNull())
	  return nullptr;
	return &it->value;
      }

      const Value* objectMember(const Value& obj, const char* key)
      {
	const Value* v = member(obj, key);
	if (v && !v->IsObject())
	  typeError(key, "an object");
	return v;
      }

      std::optional<std::string> stringField(const Value& obj, const char* key, const std::string& field)
      {
	const Value* v = member(obj, key);
	if (!v)
	  return std::nullopt;
	if (!v->IsString())
	  typeError(field, "a string");
	return std::string(v->GetString(), v->GetStringLength());
      }

      std::optional<double> doubleField(const Value& obj, const char* key, const std::string& field)
      {
	const Value* v = member(obj, key);
	if (!v)
	  return std::nullopt;
	if (!v->IsNumber())
	  typeError(field, "a number");
	return v->GetDouble();
      }

      std::optional<int> intField(const Value& obj, const char* key, const std::string& field)
      {
	const Value* v = member(obj, key);
	if (!v)
	  return std::nullopt;
	if (!v->IsInt())
	  typeError(field, "an integer");
	return v->GetInt();
      }

      std::optional<bool> boolField(const Value& obj, const char* key, const std::string& field)
      {
	const Value* v = member(obj, key);
	if (!v)
	  return std::nullopt;
	if (!v->IsBool())
	  typeError(field, "true or false");
	return v->GetBool();
      }

      std::vector<std::string> stringArray(const Value& obj, const char* key)
      {
	std::vector<std::string> values;
	const Value* v = member(obj, key);
	if (!v)
	  return values;
	if (!v->IsArray())
	  typeError(key, "an array of strings");
	for (const auto& item : v->GetArray())
	  {
	    if (!item.IsString())
	      typeError(key, "an array of strings");
	    values.emplace_back(item.GetString(), item.GetStringLength());
	  }
	return values;
      }

      std::optional<boost::gregorian::date> dateField(const Value& obj, const char* key)
      {
	const auto text = stringField(obj, key, key);
	if (!text)
	  return std::nullopt;
	try
	  {
	    const auto d = boost::gregorian::from_simple_string(*text);
	    if (d.is_special())
	      throw ConfigurationException(key, "invalid_date", "'" + *text + "' is not a date");
	    return d;
	  }
	catch (const std::out_of_range& e)
	  {
	    throw ConfigurationException(key, "invalid_date", "'" + *text + "' is not a date: " + e.what());
	  }
	catch (const boost::bad_lexical_cast&)
	  {
	    throw ConfigurationException(key, "invalid_date", "'" + *text + "' is not a YYYY-MM-DD date");
	  }
      }

      // Explicit null clears the cap, an absent key keeps the default.
      void capField(const Value& obj, const char* key, std::optional<int>& cap)
      {
	auto it = obj.FindMember(key);
	if (it == obj.MemberEnd())
	  return;
	if (it->value.IsNull())
	  {
	    cap.reset();
	    return;
	  }
	if (!it->value.IsInt())
	  typeError(key, "an integer or null");
	cap = it->value.GetInt();
      }

      cohort::FilterBundle parseFilters(const Value& doc)
      {
	cohort::FilterBundle filters;
	const auto league = stringField(doc, "league", "league");
	if (league)
	  filters.league = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(*league));

	const Value* f = objectMember(doc, "filters");
	if (!f)
	  return filters;

	if (const Value* seasons = member(*f, "seasons"))
	  {
	    if (!seasons->IsArray())
	      typeError("seasons", "an array of integers");
	    for (const auto& s : seasons->GetArray())
	      {
		if (!s.IsInt())
		  typeError("seasons", "an array of integers");
		filters.seasons.push_back(s.GetInt());
	      }
	  }

	if (const auto scope = stringField(*f, "season_scope", "season_scope"))
	  {
	    const auto parsed = cohort::parseSeasonScope(*scope);
	    if (!parsed)
	      throw ConfigurationException("season_scope", "invalid_value",
					   "season_scope must be full, current or recent, got '" + *scope + "'");
	    filters.seasonScope = *parsed;
	  }

	filters.recentDays = intField(*f, "recent_days", "recent_days");
	filters.dateStart = dateField(*f, "date_start");
	filters.dateEnd = dateField(*f, "date_end");

	if (const auto phase = stringField(*f, "phase", "phase"))
	  {
	    const auto parsed = sportsdata::parseSeasonPhase(*phase);
	    if (!parsed)
	      throw ConfigurationException("phase", "invalid_value",
					   "phase must be all, out_conf, conf or postseason, got '" + *phase + "'");
	    filters.phase = *parsed;
	  }

	filters.team = stringField(*f, "team", "team");
	filters.player = stringField(*f, "player", "player");
	if (filters.team && boost::algorithm::trim_copy(*filters.team).empty())
	  filters.team.reset();
	if (filters.player && boost::algorithm::trim_copy(*filters.player).empty())
	  filters.player.reset();

	filters.spreadAbsMin = doubleField(*f, "spread_abs_min", "spread_abs_min");
	filters.spreadAbsMax = doubleField(*f, "spread_abs_max", "spread_abs_max");
	filters.gamesLimit = intField(*f, "games_limit", "games_limit");
	return filters;
      }

      evaluation::TargetDefinition parseTarget(const Value& doc)
      {
	const Value* t = objectMember(doc, "target");
	if (!t)
	  return evaluation::TargetDefinitionFactory::defaultStatTarget();

	const std::string targetClass = boost::algorithm::to_lower_copy(
	  stringField(*t, "target_class", "target_class").value_or("stat"));

	if (targetClass == "stat")
	  return evaluation::TargetDefinitionFactory::statTarget(
	    stringField(*t, "target_name", "target_name").value_or("combined_score"));

	if (targetClass != "market")
	  throw ConfigurationException("target_class", "invalid_value",
				       "target_class must be stat or market, got '" + targetClass + "'");

	const auto marketType = stringField(*t, "market_type", "market_type");
	if (!marketType)
	  throw ConfigurationException("market_type", "invalid_value", "market targets need a market_type");
	const auto side = stringField(*t, "side", "side");
	if (!side)
	  throw ConfigurationException("side", "invalid_value", "market targets need a side");

	evaluation::OddsAssumption odds;
	const std::string assumption = stringField(*t, "odds_assumption", "odds_assumption").value_or("use_closing");
	if (assumption == "flat_reference")
	  {
	    odds.kind = evaluation::OddsAssumptionKind::FlatReference;
	    odds.referencePrice = doubleField(*t, "reference_price", "reference_price").value_or(-110.0);
	  }
	else if (assumption != "use_closing")
	  throw ConfigurationException("odds_assumption", "invalid_value",
				       "odds_assumption must be use_closing or flat_reference, got '" + assumption + "'");

	const bool oddsRequired = boolField(*t, "odds_required", "odds_required").value_or(true);
	return evaluation::TargetDefinitionFactory::marketTarget(*marketType, *side, odds, oddsRequired);
      }

      cohort::CleaningOptions parseCleaning(const Value& doc)
      {
	cohort::CleaningOptions cleaning;
	const Value* c = objectMember(doc, "cleaning");
	if (!c)
	  return cleaning;
	cleaning.dropIfAllNull = boolField(*c, "drop_if_all_null", "drop_if_all_null").value_or(false);
	cleaning.dropIfAnyNull = boolField(*c, "drop_if_any_null", "drop_if_any_null").value_or(false);
	cleaning.dropIfNonNumeric = boolField(*c, "drop_if_non_numeric", "drop_if_non_numeric").value_or(false);
	cleaning.minNonNullFeatures = intField(*c, "min_non_null_features", "min_non_null_features");
	return cleaning;
      }

      features::RunContext parseContext(const Value& doc)
      {
	const auto context = stringField(doc, "context", "context");
	if (!context || *context == "deployable")
	  return features::RunContext::Deployable;
	if (*context == "diagnostic")
	  return features::RunContext::Diagnostic;
	throw ConfigurationException("context", "invalid_value",
				     "context must be deployable or diagnostic, got '" + *context + "'");
      }

      simulation::TriggerDefinition parseTrigger(const Value& doc)
      {
	simulation::TriggerDefinition trigger;
	const Value* t = objectMember(doc, "trigger");
	if (!t)
	  return trigger;
	trigger.probThreshold = doubleField(*t, "prob_threshold", "prob_threshold").value_or(trigger.probThreshold);
	trigger.confidenceBand = doubleField(*t, "confidence_band", "confidence_band");
	trigger.minEdgeVsImplied = doubleField(*t, "min_edge_vs_implied", "min_edge_vs_implied");
	return trigger;
      }

      simulation::ExposureControls parseExposure(const Value& doc)
      {
	simulation::ExposureControls exposure;
	const Value* e = objectMember(doc, "exposure");
	if (!e)
	  return exposure;
	capField(*e, "max_bets_per_day", exposure.maxBetsPerDay);
	capField(*e, "max_bets_per_side_per_day", exposure.maxBetsPerSidePerDay);
	exposure.spreadAbsMin = doubleField(*e, "spread_abs_min", "exposure.spread_abs_min");
	exposure.spreadAbsMax = doubleField(*e, "spread_abs_max", "exposure.spread_abs_max");
	return exposure;
      }

      walkforward::WalkForwardWindow parseWindow(const Value& doc)
      {
	walkforward::WalkForwardWindow window;
	const Value* w = objectMember(doc, "window");
	if (!w)
	  return window;
	window.trainDays = intField(*w, "train_days", "window.train_days").value_or(window.trainDays);
	window.testDays = intField(*w, "test_days", "window.test_days").value_or(window.testDays);
	window.stepDays = intField(*w, "step_days", "window.step_days").value_or(window.stepDays);
	return window;
      }
    }

    AnalysisRequest RequestParser::parseAnalysisRequest(const std::string& json)
    {
      const Document doc = parseDocument(json);

      AnalysisRequest request;
      request.filters = parseFilters(doc);
      request.features = stringArray(doc, "features");
      request.target = parseTarget(doc);
      request.cleaning = parseCleaning(doc);
      request.context = parseContext(doc);
      request.trigger = parseTrigger(doc);
      request.exposure = parseExposure(doc);
      request.window = parseWindow(doc);
      return request;
    }

    features::FeatureGenerationRequest RequestParser::parseFeatureRequest(const std::string& json)
    {
      const Document doc = parseDocument(json);

      features::FeatureGenerationRequest request;
      request.league = boost::algorithm::to_upper_copy(
	boost::algorithm::trim_copy(stringField(doc, "league", "league").value_or("")));
      request.rawStatKeys = stringArray(doc, "raw_stat_keys");
      request.includeRestDays = boolField(doc, "include_rest_days", "include_rest_days").value_or(false);
      request.includeRolling = boolField(doc, "include_rolling", "include_rolling").value_or(false);
      request.rollingWindow = intField(doc, "rolling_window", "rolling_window").value_or(request.rollingWindow);
      return request;
    }
  }
}
