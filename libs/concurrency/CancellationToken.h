#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <memory>
#include <string>
#include "TheoryValidatorException.h"

namespace theory_validator
{
  namespace concurrency
  {
    /**
     * @brief Caller-side cancellation and deadline for a long-running operation.
     *
     * Copies share the same flag, so a caller can keep one copy and cancel
     * while the engine polls another. Polling points call throwIfCancelled().
     */
    class CancellationToken
    {
    public:
      using Clock = std::chrono::steady_clock;

      CancellationToken()
	: mCancelled(std::make_shared<std::atomic<bool>>(false)),
	  mDeadline()
      {}

      static CancellationToken withTimeout(std::chrono::milliseconds timeout)
      {
	CancellationToken token;
	token.mDeadline = Clock::now() + timeout;
	return token;
      }

      void cancel()
      {
	mCancelled->store(true, std::memory_order_relaxed);
      }

      bool isCancelled() const
      {
	return mCancelled->load(std::memory_order_relaxed);
      }

      bool isExpired() const
      {
	return mDeadline.has_value() && Clock::now() >= *mDeadline;
      }

      /**
       * @brief Throws OperationCancelledException if cancelled or past the deadline.
       * @param where Name of the stage doing the check, used in the message.
       */
      void throwIfCancelled(const std::string& where) const
      {
	if (isCancelled())
	  throw OperationCancelledException("cancelled", "Operation cancelled during " + where);
	if (isExpired())
	  throw OperationCancelledException("deadline_exceeded", "Operation deadline exceeded during " + where);
      }

    private:
      std::shared_ptr<std::atomic<bool>> mCancelled;
      std::optional<Clock::time_point> mDeadline;
    };
  }
}
