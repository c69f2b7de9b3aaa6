#include "FeatureComputer.h"
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include "OddsMath.h"
#include "ParallelFor.h"

namespace theory_validator
{
  namespace features
  {
    using sportsdata::GameRecord;
    using sportsdata::Side;
    using sportsdata::StatValue;
    using sportsdata::StatValueKind;
    using sportsdata::DerivedMetrics;

    namespace
    {
      template <typename Op>
      StatValue combine(const StatValue& a, const StatValue& b, Op op)
      {
	if (a.kind() == StatValueKind::NonNumeric || b.kind() == StatValueKind::NonNumeric)
	  return StatValue::nonNumeric();
	if (a.isNull() || b.isNull())
	  return StatValue::null();
	return op(a.value(), b.value());
      }

      StatValue fromOptional(const std::optional<double>& v)
      {
	return v ? StatValue::numeric(*v) : StatValue::null();
      }

      StatValue minutesOf(const sportsdata::PlayerBoxscore& player)
      {
	for (const char* key : {"minutes", "min", "mp"})
	  {
	    auto it = player.stats.find(key);
	    if (it != player.stats.end())
	      return sportsdata::coerceStatValue(it->second);
	  }
	return StatValue::null();
      }
    }

    bool containsIgnoreCase(const std::string& haystack, const std::string& needle)
    {
      return boost::algorithm::icontains(haystack, needle);
    }

    const sportsdata::PlayerBoxscore* findPlayer(const GameRecord& game, const std::string& playerFilter)
    {
      for (const auto& player : game.players)
	{
	  if (containsIgnoreCase(player.playerName, playerFilter))
	    return &player;
	}
      return nullptr;
    }

    FeatureComputer::FeatureComputer(std::shared_ptr<const std::vector<GameRecord>> history,
				     std::optional<std::string> playerFilter,
				     int playerWindow)
      : mHistory(std::move(history)),
	mPlayerFilter(std::move(playerFilter)),
	mPlayerWindow(clampRollingWindow(playerWindow)),
	mTeamGames(),
	mPlayerGames()
    {
      if (!mHistory)
	mHistory = std::make_shared<const std::vector<GameRecord>>();

      for (const auto& game : *mHistory)
	{
	  mTeamGames[game.home.name].push_back(TeamAppearance{&game, Side::Home});
	  mTeamGames[game.away.name].push_back(TeamAppearance{&game, Side::Away});

	  if (mPlayerFilter)
	    {
	      if (const auto* player = findPlayer(game, *mPlayerFilter))
		mPlayerGames.push_back(PlayerAppearance{&game, minutesOf(*player)});
	    }
	}

      auto byDate = [](const auto& a, const auto& b) {
	return sportsdata::chronologicalLess(*a.game, *b.game);
      };
      for (auto& kv : mTeamGames)
	std::stable_sort(kv.second.begin(), kv.second.end(), byDate);
      std::stable_sort(mPlayerGames.begin(), mPlayerGames.end(), byDate);
    }

    std::vector<FeatureComputer::TeamAppearance>::const_iterator
    FeatureComputer::firstOnOrAfter(const std::vector<TeamAppearance>& appearances,
				    const boost::gregorian::date& d) const
    {
      return std::lower_bound(appearances.begin(), appearances.end(), d,
			      [](const TeamAppearance& a, const boost::gregorian::date& value) {
				return a.game->gameDate < value;
			      });
    }

    StatValue FeatureComputer::teamStat(const GameRecord& game, Side side, const std::string& stat) const
    {
      const auto& stats = game.boxscore(side).stats;
      auto it = stats.find(stat);
      if (it == stats.end())
	return StatValue::null();
      return sportsdata::coerceStatValue(it->second);
    }

    StatValue FeatureComputer::rollingMean(const GameRecord& game, Side side,
					   const std::string& stat, int window) const
    {
      auto teamIt = mTeamGames.find(game.team(side).name);
      if (teamIt == mTeamGames.end() || window <= 0)
	return StatValue::null();

      const auto& appearances = teamIt->second;
      auto end = firstOnOrAfter(appearances, game.gameDate);
      const auto available = std::distance(appearances.begin(), end);
      auto begin = end - std::min<std::ptrdiff_t>(available, window);

      double sum = 0.0;
      int count = 0;
      for (auto it = begin; it != end; ++it)
	{
	  StatValue v = teamStat(*it->game, it->side, stat);
	  if (v.isNumeric())
	    {
	      sum += v.value();
	      ++count;
	    }
	}
      if (count == 0)
	return StatValue::null();
      return StatValue::numeric(sum / count);
    }

    StatValue FeatureComputer::restDays(const GameRecord& game, Side side) const
    {
      auto teamIt = mTeamGames.find(game.team(side).name);
      if (teamIt == mTeamGames.end())
	return StatValue::null();

      const auto& appearances = teamIt->second;
      auto end = firstOnOrAfter(appearances, game.gameDate);
      if (end == appearances.begin())
	return StatValue::null();

      const GameRecord& previous = *(end - 1)->game;
      if (previous.season != game.season)
	return StatValue::null();
      return StatValue::numeric(static_cast<double>((game.gameDate - previous.gameDate).days()));
    }

    StatValue FeatureComputer::playerMinutes(const GameRecord& game) const
    {
      if (!mPlayerFilter)
	return StatValue::null();
      const auto* player = findPlayer(game, *mPlayerFilter);
      return player ? minutesOf(*player) : StatValue::null();
    }

    StatValue FeatureComputer::playerMinutesRolling(const GameRecord& game) const
    {
      if (!mPlayerFilter)
	return StatValue::null();

      auto end = std::lower_bound(mPlayerGames.begin(), mPlayerGames.end(), game.gameDate,
				  [](const PlayerAppearance& a, const boost::gregorian::date& value) {
				    return a.game->gameDate < value;
				  });
      const auto available = std::distance(mPlayerGames.begin(), end);
      auto begin = end - std::min<std::ptrdiff_t>(available, mPlayerWindow);

      double sum = 0.0;
      int count = 0;
      for (auto it = begin; it != end; ++it)
	{
	  if (it->minutes.isNumeric())
	    {
	      sum += it->minutes.value();
	      ++count;
	    }
	}
      if (count == 0)
	return StatValue::null();
      return StatValue::numeric(sum / count);
    }

    StatValue FeatureComputer::compute(const FeatureSpec& spec, const GameRecord& game) const
    {
      auto minus = [](double a, double b) { return StatValue::numeric(a - b); };

      switch (spec.kind)
	{
	case FeatureKind::HomeStat:
	  return teamStat(game, Side::Home, spec.stat);
	case FeatureKind::AwayStat:
	  return teamStat(game, Side::Away, spec.stat);
	case FeatureKind::StatDiff:
	  return combine(teamStat(game, Side::Home, spec.stat), teamStat(game, Side::Away, spec.stat), minus);
	case FeatureKind::StatTotal:
	  return combine(teamStat(game, Side::Home, spec.stat), teamStat(game, Side::Away, spec.stat),
			 [](double a, double b) { return StatValue::numeric(a + b); });
	case FeatureKind::StatRatio:
	  return combine(teamStat(game, Side::Home, spec.stat), teamStat(game, Side::Away, spec.stat),
			 [](double a, double b) { return b == 0.0 ? StatValue::null() : StatValue::numeric(a / b); });
	case FeatureKind::HomeRestDays:
	  return restDays(game, Side::Home);
	case FeatureKind::AwayRestDays:
	  return restDays(game, Side::Away);
	case FeatureKind::RestAdvantage:
	  return combine(restDays(game, Side::Home), restDays(game, Side::Away), minus);
	case FeatureKind::RollingHome:
	  return rollingMean(game, Side::Home, spec.stat, spec.window);
	case FeatureKind::RollingAway:
	  return rollingMean(game, Side::Away, spec.stat, spec.window);
	case FeatureKind::RollingDiff:
	  return combine(rollingMean(game, Side::Home, spec.stat, spec.window),
			 rollingMean(game, Side::Away, spec.stat, spec.window), minus);
	case FeatureKind::ConferenceGame:
	  if (!game.isConferenceGame)
	    return StatValue::null();
	  return StatValue::numeric(*game.isConferenceGame ? 1.0 : 0.0);
	case FeatureKind::ClosingSpreadHome:
	  return fromOptional(DerivedMetrics::closingSpread(game, Side::Home));
	case FeatureKind::ClosingTotal:
	  return fromOptional(DerivedMetrics::closingTotal(game));
	case FeatureKind::MoneylineImpliedEdge:
	  {
	    const auto* home = DerivedMetrics::closingQuote(game, "moneyline", "home");
	    const auto* away = DerivedMetrics::closingQuote(game, "moneyline", "away");
	    if (!home || !away || !home->price || !away->price)
	      return StatValue::null();
	    auto ph = sportsdata::OddsMath::impliedProbability(*home->price);
	    auto pa = sportsdata::OddsMath::impliedProbability(*away->price);
	    if (!ph || !pa)
	      return StatValue::null();
	    return StatValue::numeric(*ph - *pa);
	  }
	case FeatureKind::PaceGame:
	  {
	    StatValue home = teamStat(game, Side::Home, "pace");
	    StatValue away = teamStat(game, Side::Away, "pace");
	    if (home.isNull() && away.isNull())
	      {
		home = teamStat(game, Side::Home, "possessions");
		away = teamStat(game, Side::Away, "possessions");
	      }
	    return combine(home, away, [](double a, double b) { return StatValue::numeric((a + b) / 2.0); });
	  }
	case FeatureKind::FinalTotalPoints:
	  return fromOptional(DerivedMetrics::combinedScore(game));
	case FeatureKind::TotalDelta:
	  return combine(fromOptional(DerivedMetrics::combinedScore(game)),
			 fromOptional(DerivedMetrics::closingTotal(game)), minus);
	case FeatureKind::CoverMargin:
	  return combine(fromOptional(DerivedMetrics::marginOfVictory(game)),
			 fromOptional(DerivedMetrics::closingSpread(game, Side::Home)),
			 [](double a, double b) { return StatValue::numeric(a + b); });
	case FeatureKind::PlayerMinutes:
	  return playerMinutes(game);
	case FeatureKind::PlayerMinutesRolling:
	  return playerMinutesRolling(game);
	case FeatureKind::PlayerMinutesDelta:
	  return combine(playerMinutes(game), playerMinutesRolling(game), minus);
	}
      return StatValue::null();
    }

    std::vector<std::vector<StatValue>>
    FeatureComputer::computeMatrix(const std::vector<const GameRecord*>& games,
				   const std::vector<FeatureSpec>& specs,
				   concurrency::IParallelExecutor& executor,
				   const concurrency::CancellationToken& token) const
    {
      std::vector<std::vector<StatValue>> matrix(games.size());
      concurrency::parallel_for(static_cast<uint32_t>(games.size()), executor,
				[&](uint32_t i) {
				  if (i % 256 == 0)
				    token.throwIfCancelled("feature computation");
				  std::vector<StatValue> row;
				  row.reserve(specs.size());
				  for (const auto& spec : specs)
				    row.push_back(compute(spec, *games[i]));
				  matrix[i] = std::move(row);
				});
      return matrix;
    }
  }
}
