#include "ScoringModel.h"
#include <algorithm>
#include <cmath>
#include "TheoryValidatorException.h"

namespace theory_validator
{
  namespace modeling
  {
    ScoringModel::ScoringModel(bool logistic, std::vector<double> weights, double intercept)
      : mLogistic(logistic),
	mWeights(std::move(weights)),
	mIntercept(intercept)
    {}

    double ScoringModel::sigmoid(double z)
    {
      z = std::max(-50.0, std::min(50.0, z));
      return 1.0 / (1.0 + std::exp(-z));
    }

    double ScoringModel::predict(const std::vector<double>& x) const
    {
      double z = mIntercept;
      for (std::size_t j = 0; j < mWeights.size() && j < x.size(); ++j)
	z += mWeights[j] * x[j];
      return mLogistic ? sigmoid(z) : z;
    }

    ScoringModel ScoringModel::fitLogistic(const std::vector<std::vector<double>>& x,
					   const std::vector<double>& y,
					   const FitOptions& options)
    {
      const std::size_t n = x.size();
      const std::size_t k = n == 0 ? 0 : x.front().size();
      std::vector<double> w(k, 0.0);
      double b = 0.0;
      if (n == 0)
	throw ModelFitException("logistic fit requires at least one row");

      const double invN = 1.0 / static_cast<double>(n);
      std::vector<double> grad(k);
      for (std::size_t epoch = 0; epoch < options.epochs; ++epoch)
	{
	  std::fill(grad.begin(), grad.end(), 0.0);
	  double gradB = 0.0;
	  for (std::size_t i = 0; i < n; ++i)
	    {
	      double z = b;
	      for (std::size_t j = 0; j < k; ++j)
		z += w[j] * x[i][j];
	      const double err = sigmoid(z) - y[i];
	      for (std::size_t j = 0; j < k; ++j)
		grad[j] += err * x[i][j];
	      gradB += err;
	    }

	  for (std::size_t j = 0; j < k; ++j)
	    w[j] -= options.learningRate * (grad[j] * invN + options.l2Lambda * w[j]);
	  b -= options.learningRate * gradB * invN;
	}

      for (double v : w)
	if (!std::isfinite(v))
	  throw ModelFitException("logistic fit diverged");
      return ScoringModel(true, std::move(w), b);
    }

    ScoringModel ScoringModel::fitRidge(const std::vector<std::vector<double>>& x,
					const std::vector<double>& y,
					double l2Lambda)
    {
      const std::size_t n = x.size();
      if (n == 0)
	throw ModelFitException("ridge fit requires at least one row");
      const std::size_t k = x.front().size();

      double yMean = 0.0;
      for (double v : y)
	yMean += v;
      yMean /= static_cast<double>(n);

      std::vector<std::vector<double>> xtx(k, std::vector<double>(k, 0.0));
      std::vector<double> xty(k, 0.0);
      for (std::size_t i = 0; i < n; ++i)
	{
	  const double yc = y[i] - yMean;
	  for (std::size_t a = 0; a < k; ++a)
	    {
	      xty[a] += x[i][a] * yc;
	      for (std::size_t c = a; c < k; ++c)
		xtx[a][c] += x[i][a] * x[i][c];
	    }
	}
      for (std::size_t a = 0; a < k; ++a)
	{
	  for (std::size_t c = 0; c < a; ++c)
	    xtx[a][c] = xtx[c][a];
	  xtx[a][a] += l2Lambda * static_cast<double>(n);
	}

      auto w = solveLinearSystem(std::move(xtx), std::move(xty));
      return ScoringModel(false, std::move(w), yMean);
    }

    std::vector<double> solveLinearSystem(std::vector<std::vector<double>> a, std::vector<double> b)
    {
      const std::size_t n = b.size();
      double maxAbs = 1.0;
      for (const auto& row : a)
	for (double v : row)
	  maxAbs = std::max(maxAbs, std::fabs(v));
      const double tolerance = 1e-10 * maxAbs;

      for (std::size_t col = 0; col < n; ++col)
	{
	  std::size_t pivot = col;
	  for (std::size_t r = col + 1; r < n; ++r)
	    if (std::fabs(a[r][col]) > std::fabs(a[pivot][col]))
	      pivot = r;

	  if (std::fabs(a[pivot][col]) < tolerance)
	    throw ModelFitException("singular feature matrix");

	  std::swap(a[col], a[pivot]);
	  std::swap(b[col], b[pivot]);

	  for (std::size_t r = col + 1; r < n; ++r)
	    {
	      const double factor = a[r][col] / a[col][col];
	      if (factor == 0.0)
		continue;
	      for (std::size_t c = col; c < n; ++c)
		a[r][c] -= factor * a[col][c];
	      b[r] -= factor * b[col];
	    }
	}

      std::vector<double> x(n, 0.0);
      for (std::size_t i = n; i-- > 0;)
	{
	  double sum = b[i];
	  for (std::size_t c = i + 1; c < n; ++c)
	    sum -= a[i][c] * x[c];
	  x[i] = sum / a[i][i];
	  if (!std::isfinite(x[i]))
	    throw ModelFitException("non-finite ridge solution");
	}
      return x;
    }
  }
}
