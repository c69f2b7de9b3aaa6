#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <vector>
#include <boost/filesystem.hpp>
#include "InMemoryGameStore.h"
#include "CsvGameStore.h"
#include "RetryingGameStore.h"
#include "TheoryValidatorException.h"

using namespace theory_validator;
using namespace theory_validator::sportsdata;
using boost::gregorian::date;
namespace fs = boost::filesystem;

namespace
{
  GameRecord makeGame(int64_t id, int season, date d, const std::string& league = "NBA")
  {
    GameRecord g;
    g.gameId = id;
    g.league = league;
    g.season = season;
    g.gameDate = d;
    g.home = TeamInfo{"Los Angeles Lakers", "Lakers", "LAL"};
    g.away = TeamInfo{"Boston Celtics", "Celtics", "BOS"};
    g.homeScore = 100;
    g.awayScore = 98;
    g.homeBox.stats["fg_pct"] = "0.48";
    return g;
  }

  // Fails a fixed number of times before delegating.
  class FlakyGameStore : public InMemoryGameStore
  {
  public:
    explicit FlakyGameStore(int failures) : mFailuresLeft(failures) {}

    std::vector<GameRecord> fetchGames(const GameQuery& query) const override
    {
      ++mCalls;
      if (mFailuresLeft > 0)
	{
	  --mFailuresLeft;
	  throw GameStoreUnavailableException("connection reset");
	}
      return InMemoryGameStore::fetchGames(query);
    }

    int calls() const { return mCalls; }

  private:
    mutable int mFailuresLeft;
    mutable int mCalls{0};
  };

  struct TempDir
  {
    TempDir() : path(fs::temp_directory_path() / fs::unique_path("tv-csv-%%%%-%%%%"))
    {
      fs::create_directories(path);
    }
    ~TempDir()
    {
      boost::system::error_code ec;
      fs::remove_all(path, ec);
    }
    void write(const std::string& name, const std::string& content) const
    {
      std::ofstream out((path / name).string());
      out << content;
    }
    fs::path path;
  };
}

TEST_CASE("InMemoryGameStore queries", "[GameStore]")
{
  InMemoryGameStore store;
  store.addGame(makeGame(3, 2023, date(2023, 12, 1)));
  store.addGame(makeGame(1, 2022, date(2023, 1, 5)));
  store.addGame(makeGame(2, 2023, date(2023, 11, 1)));
  store.addGame(makeGame(4, 2023, date(2023, 11, 1), "NHL"));

  SECTION("Seasons and ordering")
  {
    REQUIRE(store.leagueSeasons("nba") == std::vector<int>{2022, 2023});

    GameQuery q;
    q.league = "NBA";
    auto games = store.fetchGames(q);
    REQUIRE(games.size() == 3);
    REQUIRE(games[0].gameId == 1);
    REQUIRE(games[1].gameId == 2);
    REQUIRE(games[2].gameId == 3);
  }

  SECTION("Season and inclusive date filters")
  {
    GameQuery q;
    q.league = "NBA";
    q.seasons = {2023};
    q.dateTo = date(2023, 11, 1);
    auto games = store.fetchGames(q);
    REQUIRE(games.size() == 1);
    REQUIRE(games[0].gameId == 2);
  }

  SECTION("Latest date and stat keys")
  {
    REQUIRE(*store.latestGameDate("NBA", {}) == date(2023, 12, 1));
    REQUIRE(*store.latestGameDate("NBA", {2022}) == date(2023, 1, 5));
    REQUIRE_FALSE(store.latestGameDate("MLB", {}).has_value());
    REQUIRE(store.teamStatKeys("NBA").count("fg_pct") == 1);
  }
}

TEST_CASE("RetryingGameStore backoff", "[GameStore]")
{
  std::vector<std::chrono::milliseconds> sleeps;
  auto recorder = [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); };
  RetryPolicy policy{3, std::chrono::milliseconds(10), std::chrono::milliseconds(15)};

  SECTION("Recovers within the retry budget")
  {
    FlakyGameStore flaky(2);
    flaky.addGame(makeGame(1, 2023, date(2023, 11, 1)));
    RetryingGameStore store(flaky, policy, recorder);

    GameQuery q;
    q.league = "NBA";
    REQUIRE(store.fetchGames(q).size() == 1);
    REQUIRE(flaky.calls() == 3);
    REQUIRE(sleeps.size() == 2);
    REQUIRE(sleeps[0] == std::chrono::milliseconds(10));
    REQUIRE(sleeps[1] == std::chrono::milliseconds(15));
  }

  SECTION("Surfaces a transient failure once exhausted")
  {
    FlakyGameStore flaky(10);
    RetryingGameStore store(flaky, policy, recorder);

    GameQuery q;
    q.league = "NBA";
    try
      {
	store.fetchGames(q);
	FAIL("expected TransientStoreException");
      }
    catch (const TransientStoreException& e)
      {
	REQUIRE(e.reasonCode() == "store_unavailable");
	REQUIRE(e.attempts() == 3);
      }
    REQUIRE(flaky.calls() == 3);
  }
}

TEST_CASE("CsvGameStore reads a data directory", "[GameStore]")
{
  TempDir dir;
  dir.write("games.csv",
	    "game_id,league,season,game_date,home_team,home_short,home_abbr,away_team,away_short,away_abbr,home_score,away_score,is_conference_game\n"
	    "10,nba,2023,2023-11-01,Los Angeles Lakers,Lakers,LAL,Boston Celtics,Celtics,BOS,110,104,0\n"
	    "11,nba,2023,2023-11-03,Boston Celtics,Celtics,BOS,Miami Heat,Heat,MIA,,,\n");
  dir.write("team_boxscores.csv",
	    "game_id,side,stat_key,value\n"
	    "10,home,fg_pct,0.51\n"
	    "10,away,fg_pct,0.44\n");
  dir.write("player_boxscores.csv",
	    "game_id,side,player_name,stat_key,value\n"
	    "10,home,LeBron James,minutes,35:30\n"
	    "10,home,LeBron James,points,28\n");
  dir.write("odds.csv",
	    "game_id,market_type,side,line,price,is_closing\n"
	    "10,spread,home,-4.5,-110,1\n"
	    "10,moneyline,home,,-180,1\n");

  CsvGameStore store(dir.path.string());
  GameQuery q;
  q.league = "NBA";
  auto games = store.fetchGames(q);

  REQUIRE(games.size() == 2);
  REQUIRE(games[0].gameId == 10);
  REQUIRE(games[0].home.shortName == "Lakers");
  REQUIRE(*games[0].homeScore == 110);
  REQUIRE(games[0].isConferenceGame.has_value());
  REQUIRE_FALSE(*games[0].isConferenceGame);
  REQUIRE(games[0].homeBox.stats.at("fg_pct") == "0.51");
  REQUIRE(games[0].players.size() == 1);
  REQUIRE(games[0].players[0].stats.size() == 2);
  REQUIRE(games[0].odds.size() == 2);
  REQUIRE_FALSE(games[0].odds[1].line.has_value());
  REQUIRE_FALSE(games[1].homeScore.has_value());
  REQUIRE(store.playerStatKeys("NBA").count("minutes") == 1);
}

TEST_CASE("CsvGameStore reports a missing directory as unavailable", "[GameStore]")
{
  CsvGameStore store("/nonexistent/theory-validator-data");
  GameQuery q;
  q.league = "NBA";
  REQUIRE_THROWS_AS(store.fetchGames(q), GameStoreUnavailableException);
}
