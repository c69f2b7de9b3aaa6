// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __THEORY_VALIDATOR_EXCEPTION_H
#define __THEORY_VALIDATOR_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace theory_validator
{
  // Every exception raised by the engine carries a stable machine-readable
  // reason code next to its human-readable message.
  class TheoryValidatorException : public std::runtime_error
  {
  public:
    TheoryValidatorException(const std::string& reasonCode, const std::string& msg)
      : std::runtime_error(msg),
	mReasonCode(reasonCode)
    {}

    virtual ~TheoryValidatorException() = default;

    const std::string& reasonCode() const
    {
      return mReasonCode;
    }

  private:
    std::string mReasonCode;
  };

  // Rejected request: unknown league, malformed filter, bad window bounds.
  // Raised before any store access.
  class ConfigurationException : public TheoryValidatorException
  {
  public:
    ConfigurationException(const std::string& field,
			   const std::string& reasonCode,
			   const std::string& msg)
      : TheoryValidatorException(reasonCode, field + ": " + msg),
	mField(field)
    {}

    const std::string& field() const
    {
      return mField;
    }

  private:
    std::string mField;
  };

  // Raised by a game store when its backing data cannot be read.
  class GameStoreUnavailableException : public TheoryValidatorException
  {
  public:
    explicit GameStoreUnavailableException(const std::string& msg)
      : TheoryValidatorException("store_unavailable", msg)
    {}
  };

  // Surfaced once the retry budget at the data-access boundary is spent.
  class TransientStoreException : public TheoryValidatorException
  {
  public:
    TransientStoreException(const std::string& msg, unsigned int attempts)
      : TheoryValidatorException("store_unavailable", msg),
	mAttempts(attempts)
    {}

    unsigned int attempts() const
    {
      return mAttempts;
    }

  private:
    unsigned int mAttempts;
  };

  class ModelFitException : public TheoryValidatorException
  {
  public:
    explicit ModelFitException(const std::string& msg)
      : TheoryValidatorException("model_fit_failed", msg)
    {}
  };

  class OperationCancelledException : public TheoryValidatorException
  {
  public:
    OperationCancelledException(const std::string& reasonCode, const std::string& msg)
      : TheoryValidatorException(reasonCode, msg)
    {}
  };

  class RunNotFoundException : public TheoryValidatorException
  {
  public:
    explicit RunNotFoundException(const std::string& runId)
      : TheoryValidatorException("run_not_found", "No stored run with id " + runId),
	mRunId(runId)
    {}

    const std::string& runId() const
    {
      return mRunId;
    }

  private:
    std::string mRunId;
  };

  // The run store could not write or read back a persisted run.
  class RunStoreException : public TheoryValidatorException
  {
  public:
    explicit RunStoreException(const std::string& msg)
      : TheoryValidatorException("run_store_error", msg)
    {}
  };
}

#endif // __THEORY_VALIDATOR_EXCEPTION_H
