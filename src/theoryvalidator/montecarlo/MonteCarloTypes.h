#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace theory_validator
{
  namespace montecarlo
  {
    struct MonteCarloPolicy
    {
      std::size_t resamples{2000};
      std::size_t minBets{10};
      uint64_t seed{20240601};
    };

    struct MonteCarloAssumptions
    {
      std::string betSizing{"1 unit flat risk (historical simulation artifact)"};
      std::string kelly{"not used"};
      std::string oddsAssumption;
      bool independenceAssumption{true};
      std::vector<std::string> selectionPolicy;
    };

    struct MonteCarloMetrics
    {
      std::size_t runs{0};
      std::size_t betCount{0};
      uint64_t seed{0};
      double meanPnl{0.0};
      double stdPnl{0.0};
      double p5Pnl{0.0};
      double p50Pnl{0.0};
      double p95Pnl{0.0};
      double p5MaxDrawdown{0.0};
      double p50MaxDrawdown{0.0};
      double p95MaxDrawdown{0.0};
      double probNegative{0.0};
      double actualPnl{0.0};
      double actualMaxDrawdown{0.0};
      // Share of trials whose final PnL is <= the actual final PnL.
      double actualPercentile{0.0};
      // (actual - mean) / std of the simulated final PnL; 0 when std is 0.
      double luckScore{0.0};
      MonteCarloAssumptions assumptions;
      std::vector<std::string> interpretation;
    };

    enum class MonteCarloState
    {
      Unavailable,
      Complete
    };

    class MonteCarloStatus
    {
    public:
      static MonteCarloStatus Unavailable(const std::string& reason, const std::string& detail)
      {
	return MonteCarloStatus(MonteCarloState::Unavailable, reason, detail, std::nullopt);
      }

      static MonteCarloStatus Complete(const MonteCarloMetrics& metrics)
      {
	return MonteCarloStatus(MonteCarloState::Complete, "", "", metrics);
      }

      MonteCarloState state() const
      {
	return mState;
      }

      bool available() const
      {
	return mState == MonteCarloState::Complete;
      }

      const std::string& reason() const
      {
	return mReason;
      }

      const std::string& detail() const
      {
	return mDetail;
      }

      const MonteCarloMetrics& metrics() const
      {
	if (!mMetrics)
	  throw std::logic_error("MonteCarloStatus::metrics - Monte Carlo result is not available");
	return *mMetrics;
      }

    private:
      MonteCarloStatus(MonteCarloState state,
		       const std::string& reason,
		       const std::string& detail,
		       const std::optional<MonteCarloMetrics>& metrics)
	: mState(state),
	  mReason(reason),
	  mDetail(detail),
	  mMetrics(metrics)
      {}

      MonteCarloState mState;
      std::string mReason;
      std::string mDetail;
      std::optional<MonteCarloMetrics> mMetrics;
    };
  }
}
