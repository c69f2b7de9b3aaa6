#include "EngineConfiguration.h"
#include <cstdint>
#include <fstream>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
#include "TheoryValidatorException.h"

namespace po = boost::program_options;

namespace theory_validator
{
  namespace pipeline
  {
    namespace
    {
      void configError(const std::string& msg)
      {
	throw ConfigurationException("config", "invalid_config", msg);
      }

      std::set<std::string> parseLeagues(const std::string& text)
      {
	std::vector<std::string> parts;
	boost::split(parts, text, boost::is_any_of(","));
	std::set<std::string> leagues;
	for (auto& part : parts)
	  {
	    boost::trim(part);
	    if (!part.empty())
	      leagues.insert(boost::to_upper_copy(part));
	  }
	return leagues;
      }
    }

    EngineConfiguration EngineConfigurationReader::read(std::istream& in)
    {
      EngineConfiguration config;
      std::string leagues = boost::join(config.leagues, ",");
      unsigned int resamples = static_cast<unsigned int>(config.monteCarlo.resamples);
      unsigned int minBets = static_cast<unsigned int>(config.monteCarlo.minBets);
      unsigned int largeSample = static_cast<unsigned int>(config.verdict.largeSample);
      unsigned int moderateSample = static_cast<unsigned int>(config.verdict.moderateSample);
      unsigned int minValues = static_cast<unsigned int>(config.model.pruning.minValues);
      unsigned int maxCollinearity = static_cast<unsigned int>(config.model.pruning.maxCollinearityFeatures);
      unsigned int minTrainingRows = static_cast<unsigned int>(config.model.minTrainingRows);
      unsigned int epochs = static_cast<unsigned int>(config.model.fit.epochs);
      unsigned int candidateMinSample = static_cast<unsigned int>(config.model.candidates.minSampleSize);
      unsigned int minTrainRows = static_cast<unsigned int>(config.walkForward.minTrainRows);
      unsigned int minTestRows = static_cast<unsigned int>(config.walkForward.minTestRows);
      long baseDelayMs = static_cast<long>(config.storeRetry.baseDelay.count());
      long maxDelayMs = static_cast<long>(config.storeRetry.maxDelay.count());

      po::options_description desc("Engine configuration");
      desc.add_options()
	("engine.leagues", po::value<std::string>(&leagues), "Accepted league codes")
	("engine.threads", po::value<unsigned int>(&config.threads), "Worker threads, 0 for hardware concurrency")
	("engine.timeout_seconds", po::value<unsigned int>(&config.timeoutSeconds), "Operation deadline, 0 for none")
	("cohort.games_limit_max", po::value<int>(&config.gamesLimitMax), "Cap on games_limit")
	("verdict.strong_lift", po::value<double>(&config.verdict.strongLift), "")
	("verdict.moderate_lift", po::value<double>(&config.verdict.moderateLift), "")
	("verdict.large_sample", po::value<unsigned int>(&largeSample), "")
	("verdict.moderate_sample", po::value<unsigned int>(&moderateSample), "")
	("model.learning_rate", po::value<double>(&config.model.fit.learningRate), "")
	("model.epochs", po::value<unsigned int>(&epochs), "")
	("model.l2_lambda", po::value<double>(&config.model.fit.l2Lambda), "")
	("model.max_missing_fraction", po::value<double>(&config.model.pruning.maxMissingFraction), "")
	("model.min_values", po::value<unsigned int>(&minValues), "")
	("model.collinearity_threshold", po::value<double>(&config.model.pruning.collinearityThreshold), "")
	("model.max_collinearity_features", po::value<unsigned int>(&maxCollinearity), "")
	("model.zero_weight_epsilon", po::value<double>(&config.model.zeroWeightEpsilon), "")
	("model.min_training_rows", po::value<unsigned int>(&minTrainingRows), "")
	("model.roi_proxy_threshold", po::value<double>(&config.model.roiProxyThreshold), "")
	("model.candidate_min_sample", po::value<unsigned int>(&candidateMinSample), "")
	("model.candidate_min_lift", po::value<double>(&config.model.candidates.minLift), "")
	("montecarlo.resamples", po::value<unsigned int>(&resamples), "")
	("montecarlo.min_bets", po::value<unsigned int>(&minBets), "")
	("montecarlo.seed", po::value<uint64_t>(&config.monteCarlo.seed), "")
	("walkforward.min_train_rows", po::value<unsigned int>(&minTrainRows), "")
	("walkforward.min_test_rows", po::value<unsigned int>(&minTestRows), "")
	("store.retry_attempts", po::value<unsigned int>(&config.storeRetry.maxAttempts), "")
	("store.retry_base_delay_ms", po::value<long>(&baseDelayMs), "")
	("store.retry_max_delay_ms", po::value<long>(&maxDelayMs), "");

      try
	{
	  po::variables_map vm;
	  po::store(po::parse_config_file(in, desc), vm);
	  po::notify(vm);
	}
      catch (const po::error& e)
	{
	  configError(e.what());
	}

      config.leagues = parseLeagues(leagues);
      config.verdict.largeSample = largeSample;
      config.verdict.moderateSample = moderateSample;
      config.model.pruning.minValues = minValues;
      config.model.pruning.maxCollinearityFeatures = maxCollinearity;
      config.model.minTrainingRows = minTrainingRows;
      config.model.fit.epochs = epochs;
      config.model.candidates.minSampleSize = candidateMinSample;
      config.monteCarlo.resamples = resamples;
      config.monteCarlo.minBets = minBets;
      config.walkForward.minTrainRows = minTrainRows;
      config.walkForward.minTestRows = minTestRows;
      config.storeRetry.baseDelay = std::chrono::milliseconds(baseDelayMs);
      config.storeRetry.maxDelay = std::chrono::milliseconds(maxDelayMs);

      validate(config);
      return config;
    }

    EngineConfiguration EngineConfigurationReader::readFile(const std::string& path)
    {
      std::ifstream in(path);
      if (!in)
	throw ConfigurationException("config", "file_not_found", "Cannot open configuration file " + path);
      return read(in);
    }

    void EngineConfigurationReader::validate(const EngineConfiguration& config)
    {
      if (config.leagues.empty())
	configError("engine.leagues must name at least one league");
      if (config.gamesLimitMax <= 0)
	configError("cohort.games_limit_max must be positive");
      if (config.verdict.moderateLift < 0.0 || config.verdict.strongLift < config.verdict.moderateLift)
	configError("verdict lift thresholds must satisfy 0 <= moderate_lift <= strong_lift");
      if (config.verdict.largeSample < config.verdict.moderateSample)
	configError("verdict.large_sample must be >= verdict.moderate_sample");
      if (config.model.fit.learningRate <= 0.0 || config.model.fit.epochs == 0 || config.model.fit.l2Lambda < 0.0)
	configError("model.learning_rate and model.epochs must be positive and model.l2_lambda non-negative");
      if (config.model.pruning.maxMissingFraction <= 0.0 || config.model.pruning.maxMissingFraction > 1.0)
	configError("model.max_missing_fraction must be within (0, 1]");
      if (config.model.pruning.collinearityThreshold <= 0.0 || config.model.pruning.collinearityThreshold > 1.0)
	configError("model.collinearity_threshold must be within (0, 1]");
      if (config.model.candidates.minSampleSize == 0 || config.model.candidates.minLift < 0.0)
	configError("model.candidate_min_sample must be positive and model.candidate_min_lift non-negative");
      if (config.monteCarlo.resamples == 0)
	configError("montecarlo.resamples must be positive");
      if (config.storeRetry.maxAttempts == 0)
	configError("store.retry_attempts must be positive");
      if (config.storeRetry.baseDelay.count() < 0 || config.storeRetry.maxDelay < config.storeRetry.baseDelay)
	configError("store retry delays must satisfy 0 <= base <= max");
    }
  }
}
