#pragma once

#include <chrono>
#include <functional>
#include "HistoricalGameStore.h"

namespace theory_validator
{
  namespace sportsdata
  {
    struct RetryPolicy
    {
      unsigned int maxAttempts{3};
      std::chrono::milliseconds baseDelay{50};
      std::chrono::milliseconds maxDelay{1000};

      // Delay before retry number `retry` (0-based): base * 2^retry, capped at maxDelay.
      std::chrono::milliseconds delayForRetry(unsigned int retry) const;
    };

    /**
     * @brief Decorator that retries GameStoreUnavailableException with bounded backoff.
     *
     * Other exceptions pass through untouched. When every attempt fails the
     * last message is surfaced as a TransientStoreException.
     */
    class RetryingGameStore : public HistoricalGameStore
    {
    public:
      using Sleeper = std::function<void(std::chrono::milliseconds)>;

      RetryingGameStore(const HistoricalGameStore& inner, RetryPolicy policy);
      RetryingGameStore(const HistoricalGameStore& inner, RetryPolicy policy, Sleeper sleeper);

      std::vector<int> leagueSeasons(const std::string& league) const override;
      std::vector<GameRecord> fetchGames(const GameQuery& query) const override;
      std::set<std::string> teamStatKeys(const std::string& league) const override;
      std::set<std::string> playerStatKeys(const std::string& league) const override;
      std::optional<boost::gregorian::date> latestGameDate(const std::string& league,
							  const std::vector<int>& seasons) const override;

    private:
      template <typename Call>
      auto withRetry(const char* operation, Call call) const -> decltype(call());

    private:
      const HistoricalGameStore& mInner;
      RetryPolicy mPolicy;
      Sleeper mSleeper;
    };
  }
}
