#include "WalkForwardTypes.h"
#include "TheoryValidatorException.h"

namespace theory_validator
{
  namespace walkforward
  {
    namespace
    {
      void checkBounds(const std::string& field, int value, int lo, int hi)
      {
	if (value < lo || value > hi)
	  throw ConfigurationException(field, "out_of_range",
				       field + " must be within [" + std::to_string(lo) + ", " +
				       std::to_string(hi) + "], got " + std::to_string(value));
      }
    }

    void validateWindow(const WalkForwardWindow& window)
    {
      checkBounds("window.train_days", window.trainDays, 30, 730);
      checkBounds("window.test_days", window.testDays, 3, 90);
      checkBounds("window.step_days", window.stepDays, 3, 90);
    }
  }
}
