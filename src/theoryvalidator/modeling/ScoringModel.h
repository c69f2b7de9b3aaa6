#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace theory_validator
{
  namespace modeling
  {
    struct FitOptions
    {
      double learningRate{0.1};
      std::size_t epochs{200};
      double l2Lambda{0.01};
    };

    /**
     * @brief Linear scoring model over standardized features.
     *
     * The logistic form returns a probability, the ridge form a predicted
     * target value.
     */
    class ScoringModel
    {
    public:
      /**
       * @brief L2-regularized logistic regression by batch gradient descent.
       *
       * The intercept is not penalized. The sigmoid argument is clamped to
       * [-50, 50].
       */
      static ScoringModel fitLogistic(const std::vector<std::vector<double>>& x,
				      const std::vector<double>& y,
				      const FitOptions& options);

      /**
       * @brief Ridge regression solved from the normal equations.
       *
       * @throws ModelFitException when the system is singular or the solution
       *         is not finite.
       */
      static ScoringModel fitRidge(const std::vector<std::vector<double>>& x,
				   const std::vector<double>& y,
				   double l2Lambda);

      double predict(const std::vector<double>& x) const;

      bool isLogistic() const
      {
	return mLogistic;
      }

      double intercept() const
      {
	return mIntercept;
      }

      const std::vector<double>& weights() const
      {
	return mWeights;
      }

      static double sigmoid(double z);

    private:
      ScoringModel(bool logistic, std::vector<double> weights, double intercept);

      bool mLogistic;
      std::vector<double> mWeights;
      double mIntercept;
    };

    /**
     * @brief Solves a * x = b by Gaussian elimination with partial pivoting.
     *
     * @throws ModelFitException when a pivot is effectively zero relative to the
     *         largest entry of a.
     */
    std::vector<double> solveLinearSystem(std::vector<std::vector<double>> a, std::vector<double> b);
  }
}
