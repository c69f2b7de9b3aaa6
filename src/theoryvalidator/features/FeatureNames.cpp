#include "FeatureNames.h"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <map>
#include <set>
#include <vector>
#include <boost/algorithm/string.hpp>

namespace theory_validator
{
  namespace features
  {
    namespace
    {
      const std::map<std::string, FeatureKind>& engineeredNames()
      {
	static const std::map<std::string, FeatureKind> names = {
	  {"is_conference_game", FeatureKind::ConferenceGame},
	  {"closing_spread_home", FeatureKind::ClosingSpreadHome},
	  {"closing_total", FeatureKind::ClosingTotal},
	  {"ml_implied_edge", FeatureKind::MoneylineImpliedEdge},
	  {"pace_game", FeatureKind::PaceGame},
	  {"final_total_points", FeatureKind::FinalTotalPoints},
	  {"total_delta", FeatureKind::TotalDelta},
	  {"cover_margin", FeatureKind::CoverMargin},
	  {"player_minutes", FeatureKind::PlayerMinutes},
	  {"player_minutes_rolling", FeatureKind::PlayerMinutesRolling},
	  {"player_minutes_delta", FeatureKind::PlayerMinutesDelta}
	};
	return names;
      }

      bool startsWith(const std::string& s, const std::string& prefix)
      {
	return s.size() > prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
      }

      bool endsWith(const std::string& s, const std::string& suffix)
      {
	return s.size() > suffix.size() &&
	  s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
      }

      bool allDigits(const std::string& s)
      {
	return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
      }

      std::optional<FeatureSpec> parseRolling(const std::string& name)
      {
	const std::string body = name.substr(std::string("rolling_").size());
	const auto sidePos = body.rfind('_');
	if (sidePos == std::string::npos)
	  return std::nullopt;

	const std::string side = body.substr(sidePos + 1);
	const std::string rest = body.substr(0, sidePos);
	const auto windowPos = rest.rfind('_');
	if (windowPos == std::string::npos)
	  return std::nullopt;

	const std::string windowText = rest.substr(windowPos + 1);
	const std::string stat = rest.substr(0, windowPos);
	if (stat.empty() || !allDigits(windowText) || windowText.size() > 3)
	  return std::nullopt;

	FeatureSpec spec;
	spec.stat = stat;
	spec.window = std::stoi(windowText);
	if (side == "home")
	  spec.kind = FeatureKind::RollingHome;
	else if (side == "away")
	  spec.kind = FeatureKind::RollingAway;
	else if (side == "diff")
	  spec.kind = FeatureKind::RollingDiff;
	else
	  return std::nullopt;
	return spec;
      }
    }

    int clampRollingWindow(int window)
    {
      return std::max(kMinRollingWindow, std::min(kMaxRollingWindow, window));
    }

    std::optional<FeatureSpec> parseFeatureName(const std::string& name)
    {
      const auto engineered = engineeredNames().find(name);
      if (engineered != engineeredNames().end())
	return FeatureSpec{engineered->second, "", 0};

      if (name == "home_rest_days")
	return FeatureSpec{FeatureKind::HomeRestDays, "", 0};
      if (name == "away_rest_days")
	return FeatureSpec{FeatureKind::AwayRestDays, "", 0};
      if (name == "rest_advantage")
	return FeatureSpec{FeatureKind::RestAdvantage, "", 0};

      if (startsWith(name, "rolling_"))
	return parseRolling(name);

      if (startsWith(name, "home_"))
	return FeatureSpec{FeatureKind::HomeStat, name.substr(5), 0};
      if (startsWith(name, "away_"))
	return FeatureSpec{FeatureKind::AwayStat, name.substr(5), 0};
      if (startsWith(name, "total_"))
	return FeatureSpec{FeatureKind::StatTotal, name.substr(6), 0};
      if (endsWith(name, "_diff"))
	return FeatureSpec{FeatureKind::StatDiff, name.substr(0, name.size() - 5), 0};
      if (endsWith(name, "_ratio"))
	return FeatureSpec{FeatureKind::StatRatio, name.substr(0, name.size() - 6), 0};

      return std::nullopt;
    }

    std::string featureName(const FeatureSpec& spec)
    {
      for (const auto& kv : engineeredNames())
	{
	  if (kv.second == spec.kind)
	    return kv.first;
	}

      const std::string w = std::to_string(spec.window);
      switch (spec.kind)
	{
	case FeatureKind::HomeStat:      return "home_" + spec.stat;
	case FeatureKind::AwayStat:      return "away_" + spec.stat;
	case FeatureKind::StatDiff:      return spec.stat + "_diff";
	case FeatureKind::StatTotal:     return "total_" + spec.stat;
	case FeatureKind::StatRatio:     return spec.stat + "_ratio";
	case FeatureKind::HomeRestDays:  return "home_rest_days";
	case FeatureKind::AwayRestDays:  return "away_rest_days";
	case FeatureKind::RestAdvantage: return "rest_advantage";
	case FeatureKind::RollingHome:   return "rolling_" + spec.stat + "_" + w + "_home";
	case FeatureKind::RollingAway:   return "rolling_" + spec.stat + "_" + w + "_away";
	case FeatureKind::RollingDiff:   return "rolling_" + spec.stat + "_" + w + "_diff";
	default:
	  return "";
	}
    }

    std::string inferStatGroup(const std::string& statKey)
    {
      const std::string s = boost::algorithm::to_lower_copy(statKey);
      std::vector<std::string> tokens;
      boost::algorithm::split(tokens, s, boost::algorithm::is_any_of("_"));
      auto hasToken = [&tokens](std::initializer_list<const char*> wanted) {
	for (const char* w : wanted)
	  if (std::find(tokens.begin(), tokens.end(), w) != tokens.end())
	    return true;
	return false;
      };
      auto contains = [&s](std::initializer_list<const char*> wanted) {
	for (const char* w : wanted)
	  if (s.find(w) != std::string::npos)
	    return true;
	return false;
      };

      if (contains({"rebound", "orb", "drb"}) || hasToken({"reb", "oreb", "dreb"}))
	return "rebounding";
      if (contains({"assist", "turnover", "foul"}) || hasToken({"ast", "tov", "to", "pf"}))
	return "discipline";
      if (contains({"pace", "poss"}))
	return "pace";
      if (contains({"shoot", "fg", "3pt"}) || hasToken({"ts", "efg", "ft", "fta", "ftm", "3p", "3pa", "3pm"}))
	return "efficiency";
      if (contains({"point"}) || hasToken({"pts", "score"}))
	return "scoring";
      return "general";
    }

    bool isRestKind(FeatureKind kind)
    {
      return kind == FeatureKind::HomeRestDays || kind == FeatureKind::AwayRestDays ||
	kind == FeatureKind::RestAdvantage;
    }

    bool isRollingKind(FeatureKind kind)
    {
      return kind == FeatureKind::RollingHome || kind == FeatureKind::RollingAway ||
	kind == FeatureKind::RollingDiff;
    }

    bool isPlayerKind(FeatureKind kind)
    {
      return kind == FeatureKind::PlayerMinutes || kind == FeatureKind::PlayerMinutesRolling ||
	kind == FeatureKind::PlayerMinutesDelta;
    }

    GeneratedFeature describeFeature(const FeatureSpec& spec)
    {
      GeneratedFeature f;
      f.name = featureName(spec);
      const std::string& s = spec.stat;
      const std::string w = std::to_string(spec.window);

      switch (spec.kind)
	{
	case FeatureKind::HomeStat:
	case FeatureKind::AwayStat:
	  f.formula = std::string(spec.kind == FeatureKind::HomeStat ? "home" : "away") + " team " + s + " (final boxscore)";
	  f.category = "raw";
	  f.group = inferStatGroup(s);
	  f.timing = FeatureTiming::PostGame;
	  f.source = "boxscore";
	  f.defaultSelected = true;
	  break;
	case FeatureKind::StatDiff:
	  f.formula = "home " + s + " - away " + s;
	  f.category = "diff";
	  f.group = inferStatGroup(s);
	  f.timing = FeatureTiming::PostGame;
	  f.source = "boxscore";
	  f.defaultSelected = true;
	  break;
	case FeatureKind::StatTotal:
	  f.formula = "home " + s + " + away " + s;
	  f.category = "total";
	  f.group = inferStatGroup(s);
	  f.timing = FeatureTiming::PostGame;
	  f.source = "boxscore";
	  f.defaultSelected = true;
	  break;
	case FeatureKind::StatRatio:
	  f.formula = "home " + s + " / away " + s;
	  f.category = "ratio";
	  f.group = inferStatGroup(s);
	  f.timing = FeatureTiming::PostGame;
	  f.source = "boxscore";
	  f.defaultSelected = true;
	  break;
	case FeatureKind::HomeRestDays:
	case FeatureKind::AwayRestDays:
	  f.formula = std::string("days since the ") + (spec.kind == FeatureKind::HomeRestDays ? "home" : "away") +
	    " team's previous game in the same season";
	  f.category = "rest";
	  f.group = "rest";
	  f.timing = FeatureTiming::PreGame;
	  f.source = "schedule";
	  f.defaultSelected = true;
	  break;
	case FeatureKind::RestAdvantage:
	  f.formula = "home_rest_days - away_rest_days";
	  f.category = "rest";
	  f.group = "rest";
	  f.timing = FeatureTiming::PreGame;
	  f.source = "schedule";
	  f.defaultSelected = true;
	  break;
	case FeatureKind::RollingHome:
	case FeatureKind::RollingAway:
	  f.formula = std::string("mean ") + (spec.kind == FeatureKind::RollingHome ? "home" : "away") +
	    " team " + s + " over its previous " + w + " games";
	  f.category = "rolling";
	  f.group = inferStatGroup(s);
	  f.timing = FeatureTiming::PreGame;
	  f.source = "boxscore";
	  f.defaultSelected = true;
	  break;
	case FeatureKind::RollingDiff:
	  f.formula = "rolling_" + s + "_" + w + "_home - rolling_" + s + "_" + w + "_away";
	  f.category = "rolling";
	  f.group = inferStatGroup(s);
	  f.timing = FeatureTiming::PreGame;
	  f.source = "boxscore";
	  f.defaultSelected = true;
	  break;
	case FeatureKind::ConferenceGame:
	  f.formula = "1 if both teams share a conference, else 0";
	  f.category = "engineered";
	  f.group = "context";
	  f.timing = FeatureTiming::PreGame;
	  f.source = "schedule";
	  break;
	case FeatureKind::ClosingSpreadHome:
	  f.formula = "closing spread line for the home side";
	  f.category = "engineered";
	  f.group = "market";
	  f.timing = FeatureTiming::PreGame;
	  f.source = "market";
	  break;
	case FeatureKind::ClosingTotal:
	  f.formula = "closing total points line";
	  f.category = "engineered";
	  f.group = "market";
	  f.timing = FeatureTiming::PreGame;
	  f.source = "market";
	  break;
	case FeatureKind::MoneylineImpliedEdge:
	  f.formula = "implied(home moneyline) - implied(away moneyline)";
	  f.category = "engineered";
	  f.group = "market";
	  f.timing = FeatureTiming::PreGame;
	  f.source = "market";
	  break;
	case FeatureKind::PaceGame:
	  f.formula = "mean of home and away pace (or possessions)";
	  f.category = "engineered";
	  f.group = "pace";
	  f.timing = FeatureTiming::PostGame;
	  f.source = "boxscore";
	  break;
	case FeatureKind::FinalTotalPoints:
	  f.formula = "home score + away score";
	  f.category = "engineered";
	  f.group = "scoring";
	  f.timing = FeatureTiming::PostGame;
	  f.source = "derived";
	  break;
	case FeatureKind::TotalDelta:
	  f.formula = "final total points - closing total";
	  f.category = "engineered";
	  f.group = "market";
	  f.timing = FeatureTiming::PostGame;
	  f.source = "derived";
	  break;
	case FeatureKind::CoverMargin:
	  f.formula = "margin of victory + closing home spread";
	  f.category = "engineered";
	  f.group = "market";
	  f.timing = FeatureTiming::PostGame;
	  f.source = "derived";
	  break;
	case FeatureKind::PlayerMinutes:
	  f.formula = "minutes played by the filtered player";
	  f.category = "engineered";
	  f.group = "player";
	  f.timing = FeatureTiming::PostGame;
	  f.source = "boxscore";
	  break;
	case FeatureKind::PlayerMinutesRolling:
	  f.formula = "mean minutes of the filtered player over previous games";
	  f.category = "engineered";
	  f.group = "player";
	  f.timing = FeatureTiming::PreGame;
	  f.source = "boxscore";
	  break;
	case FeatureKind::PlayerMinutesDelta:
	  f.formula = "player_minutes - player_minutes_rolling";
	  f.category = "engineered";
	  f.group = "player";
	  f.timing = FeatureTiming::PostGame;
	  f.source = "boxscore";
	  break;
	}
      return f;
    }
  }
}
