#include "RetryingGameStore.h"
#include <algorithm>
#include <thread>
#include "TheoryValidatorException.h"

namespace theory_validator
{
  namespace sportsdata
  {
    std::chrono::milliseconds RetryPolicy::delayForRetry(unsigned int retry) const
    {
      long long delay = baseDelay.count();
      for (unsigned int i = 0; i < retry && delay < maxDelay.count(); ++i)
	delay *= 2;
      return std::chrono::milliseconds(std::min<long long>(delay, maxDelay.count()));
    }

    RetryingGameStore::RetryingGameStore(const HistoricalGameStore& inner, RetryPolicy policy)
      : RetryingGameStore(inner, policy, [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
    {}

    RetryingGameStore::RetryingGameStore(const HistoricalGameStore& inner, RetryPolicy policy, Sleeper sleeper)
      : mInner(inner),
	mPolicy(policy),
	mSleeper(std::move(sleeper))
    {
      if (mPolicy.maxAttempts == 0)
	mPolicy.maxAttempts = 1;
    }

    template <typename Call>
    auto RetryingGameStore::withRetry(const char* operation, Call call) const -> decltype(call())
    {
      std::string lastMessage;
      for (unsigned int attempt = 0; attempt < mPolicy.maxAttempts; ++attempt)
	{
	  try
	    {
	      return call();
	    }
	  catch (const GameStoreUnavailableException& e)
	    {
	      lastMessage = e.what();
	      if (attempt + 1 < mPolicy.maxAttempts)
		mSleeper(mPolicy.delayForRetry(attempt));
	    }
	}

      throw TransientStoreException(std::string("Historical game store unavailable during ") + operation +
				    " after " + std::to_string(mPolicy.maxAttempts) + " attempts: " + lastMessage,
				    mPolicy.maxAttempts);
    }

    std::vector<int> RetryingGameStore::leagueSeasons(const std::string& league) const
    {
      return withRetry("leagueSeasons", [&]() { return mInner.leagueSeasons(league); });
    }

    std::vector<GameRecord> RetryingGameStore::fetchGames(const GameQuery& query) const
    {
      return withRetry("fetchGames", [&]() { return mInner.fetchGames(query); });
    }

    std::set<std::string> RetryingGameStore::teamStatKeys(const std::string& league) const
    {
      return withRetry("teamStatKeys", [&]() { return mInner.teamStatKeys(league); });
    }

    std::set<std::string> RetryingGameStore::playerStatKeys(const std::string& league) const
    {
      return withRetry("playerStatKeys", [&]() { return mInner.playerStatKeys(league); });
    }

    std::optional<boost::gregorian::date>
    RetryingGameStore::latestGameDate(const std::string& league, const std::vector<int>& seasons) const
    {
      return withRetry("latestGameDate", [&]() { return mInner.latestGameDate(league, seasons); });
    }
  }
}
