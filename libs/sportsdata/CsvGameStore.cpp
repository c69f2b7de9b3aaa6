#include "CsvGameStore.h"
#include <algorithm>
#include <map>
#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>
#include "csv.h"
#include "DerivedMetrics.h"
#include "TheoryValidatorException.h"

namespace fs = boost::filesystem;

namespace theory_validator
{
  namespace sportsdata
  {
    namespace
    {
      std::optional<double> optionalNumber(const std::string& text)
      {
	StatValue v = coerceStatValue(text);
	return v.asOptional();
      }

      std::optional<int> optionalInt(const std::string& text)
      {
	auto v = optionalNumber(text);
	if (!v)
	  return std::nullopt;
	return static_cast<int>(*v);
      }

      std::optional<bool> optionalBool(const std::string& text)
      {
	const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
	if (key == "1" || key == "true" || key == "yes")
	  return true;
	if (key == "0" || key == "false" || key == "no")
	  return false;
	return std::nullopt;
      }

      Side parseSide(const std::string& text, const std::string& fileName)
      {
	const std::string key = boost::algorithm::to_lower_copy(text);
	if (key == "home")
	  return Side::Home;
	if (key == "away")
	  return Side::Away;
	throw GameStoreUnavailableException(fileName + ": invalid side '" + text + "'");
      }
    }

    CsvGameStore::CsvGameStore(const std::string& dataDirectory)
      : mDataDirectory(dataDirectory),
	mLoadMutex(),
	mGames()
    {}

    const InMemoryGameStore& CsvGameStore::loaded() const
    {
      std::lock_guard<std::mutex> lock(mLoadMutex);
      if (!mGames)
	mGames = readDirectory();
      return *mGames;
    }

    std::unique_ptr<InMemoryGameStore> CsvGameStore::readDirectory() const
    {
      const fs::path dir(mDataDirectory);
      const fs::path gamesFile = dir / "games.csv";
      if (!fs::exists(gamesFile))
	throw GameStoreUnavailableException("CsvGameStore: missing " + gamesFile.string());

      std::map<int64_t, GameRecord> games;
      std::string currentFile;

      try
	{
	  currentFile = gamesFile.string();
	  io::CSVReader<13, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> gamesCsv(currentFile);
	  gamesCsv.read_header(io::ignore_extra_column,
			       "game_id", "league", "season", "game_date",
			       "home_team", "home_short", "home_abbr",
			       "away_team", "away_short", "away_abbr",
			       "home_score", "away_score", "is_conference_game");

	  int64_t gameId;
	  int season;
	  std::string league, gameDate, homeTeam, homeShort, homeAbbr;
	  std::string awayTeam, awayShort, awayAbbr, homeScore, awayScore, conference;
	  while (gamesCsv.read_row(gameId, league, season, gameDate, homeTeam, homeShort, homeAbbr,
				   awayTeam, awayShort, awayAbbr, homeScore, awayScore, conference))
	    {
	      GameRecord game;
	      game.gameId = gameId;
	      game.league = boost::algorithm::to_upper_copy(league);
	      game.season = season;
	      game.gameDate = boost::gregorian::from_simple_string(gameDate);
	      game.home = TeamInfo{homeTeam, homeShort, homeAbbr};
	      game.away = TeamInfo{awayTeam, awayShort, awayAbbr};
	      game.homeScore = optionalInt(homeScore);
	      game.awayScore = optionalInt(awayScore);
	      game.isConferenceGame = optionalBool(conference);
	      games[gameId] = std::move(game);
	    }

	  const fs::path teamFile = dir / "team_boxscores.csv";
	  if (fs::exists(teamFile))
	    {
	      currentFile = teamFile.string();
	      io::CSVReader<4, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> teamCsv(currentFile);
	      teamCsv.read_header(io::ignore_extra_column, "game_id", "side", "stat_key", "value");

	      std::string side, statKey, value;
	      while (teamCsv.read_row(gameId, side, statKey, value))
		{
		  auto it = games.find(gameId);
		  if (it == games.end())
		    continue;
		  TeamBoxscore& box = parseSide(side, currentFile) == Side::Home ? it->second.homeBox : it->second.awayBox;
		  box.stats[statKey] = value;
		}
	    }

	  const fs::path playerFile = dir / "player_boxscores.csv";
	  if (fs::exists(playerFile))
	    {
	      currentFile = playerFile.string();
	      io::CSVReader<5, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> playerCsv(currentFile);
	      playerCsv.read_header(io::ignore_extra_column, "game_id", "side", "player_name", "stat_key", "value");

	      std::string side, playerName, statKey, value;
	      while (playerCsv.read_row(gameId, side, playerName, statKey, value))
		{
		  auto it = games.find(gameId);
		  if (it == games.end())
		    continue;
		  const Side s = parseSide(side, currentFile);
		  auto& players = it->second.players;
		  auto player = std::find_if(players.begin(), players.end(), [&](const PlayerBoxscore& p) {
		    return p.side == s && p.playerName == playerName;
		  });
		  if (player == players.end())
		    {
		      players.push_back(PlayerBoxscore{s, playerName, {}});
		      player = players.end() - 1;
		    }
		  player->stats[statKey] = value;
		}
	    }

	  const fs::path oddsFile = dir / "odds.csv";
	  if (fs::exists(oddsFile))
	    {
	      currentFile = oddsFile.string();
	      io::CSVReader<6, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> oddsCsv(currentFile);
	      oddsCsv.read_header(io::ignore_extra_column, "game_id", "market_type", "side", "line", "price", "is_closing");

	      std::string marketType, side, line, price, closing;
	      while (oddsCsv.read_row(gameId, marketType, side, line, price, closing))
		{
		  auto it = games.find(gameId);
		  if (it == games.end())
		    continue;
		  OddsQuote quote;
		  quote.marketType = boost::algorithm::to_lower_copy(marketType);
		  quote.side = boost::algorithm::to_lower_copy(side);
		  quote.line = optionalNumber(line);
		  quote.price = optionalNumber(price);
		  quote.isClosing = optionalBool(closing).value_or(true);
		  it->second.odds.push_back(std::move(quote));
		}
	    }
	}
      catch (const GameStoreUnavailableException&)
	{
	  throw;
	}
      catch (const io::error::base& e)
	{
	  throw GameStoreUnavailableException("CsvGameStore: cannot read " + currentFile + ": " + e.what());
	}
      catch (const std::exception& e)
	{
	  // boost::gregorian reports malformed dates with its own exception types
	  throw GameStoreUnavailableException("CsvGameStore: invalid value in " + currentFile + ": " + e.what());
	}

      std::vector<GameRecord> records;
      records.reserve(games.size());
      for (auto& kv : games)
	records.push_back(std::move(kv.second));
      return std::make_unique<InMemoryGameStore>(std::move(records));
    }

    std::vector<int> CsvGameStore::leagueSeasons(const std::string& league) const
    {
      return loaded().leagueSeasons(league);
    }

    std::vector<GameRecord> CsvGameStore::fetchGames(const GameQuery& query) const
    {
      return loaded().fetchGames(query);
    }

    std::set<std::string> CsvGameStore::teamStatKeys(const std::string& league) const
    {
      return loaded().teamStatKeys(league);
    }

    std::set<std::string> CsvGameStore::playerStatKeys(const std::string& league) const
    {
      return loaded().playerStatKeys(league);
    }

    std::optional<boost::gregorian::date>
    CsvGameStore::latestGameDate(const std::string& league, const std::vector<int>& seasons) const
    {
      return loaded().latestGameDate(league, seasons);
    }
  }
}
