// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __BLEND_MODEL_H
#define __BLEND_MODEL_H 1

#include <array>
#include <cmath>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <Eigen/Dense>
#include "LatentSourceException.h"
#include "LatentSourceTypes.h"
#include "MultiScalePredictor.h"
#include "PriceSeries.h"

namespace mkc_latentsource
{
  /**
   * @brief Linear blend of the per-scale kernel estimates:
   * delta = w0 + w1*d1 + w2*d2 + w3*d3.
   */
  template <class Num>
  class BlendModel
  {
  public:
    BlendModel(Num intercept, const ScalePredictions<Num>& weights)
      : mIntercept(intercept),
	mWeights(weights)
    {}

    Num getIntercept() const
    {
      return mIntercept;
    }

    const ScalePredictions<Num>& getWeights() const
    {
      return mWeights;
    }

    Num getWeight(std::size_t scale) const
    {
      return mWeights.at(scale);
    }

    /// (w0, w1, w2, w3)
    std::array<Num, kNumScales + 1> getCoefficients() const
    {
      std::array<Num, kNumScales + 1> coefficients;
      coefficients[0] = mIntercept;
      for (std::size_t s = 0; s < kNumScales; ++s)
	coefficients[s + 1] = mWeights[s];

      return coefficients;
    }

    Num predict(const ScalePredictions<Num>& predictions) const
    {
      Num blended = mIntercept;
      for (std::size_t s = 0; s < kNumScales; ++s)
	blended += mWeights[s] * predictions[s];

      return blended;
    }

    inline friend std::ostream& operator<< (std::ostream& strng, const BlendModel<Num>& obj)
    {
      strng << "w0 = " << obj.mIntercept;
      for (std::size_t s = 0; s < kNumScales; ++s)
	strng << ", w" << (s + 1) << " = " << obj.mWeights[s];

      return strng;
    }

  private:
    Num mIntercept;
    ScalePredictions<Num> mWeights;
  };

  /**
   * @brief Regression rows: kernel estimates of each scale with the realized change.
   */
  template <class Num>
  class BlendTrainingSet
  {
  public:
    BlendTrainingSet()
      : mPredictors(),
	mLabels()
    {}

    void addRow(const ScalePredictions<Num>& predictors, Num label)
    {
      mPredictors.push_back(predictors);
      mLabels.push_back(label);
    }

    void reserve(std::size_t numRows)
    {
      mPredictors.reserve(numRows);
      mLabels.reserve(numRows);
    }

    std::size_t getNumRows() const
    {
      return mLabels.size();
    }

    const ScalePredictions<Num>& getPredictors(std::size_t row) const
    {
      return mPredictors.at(row);
    }

    Num getLabel(std::size_t row) const
    {
      return mLabels.at(row);
    }

  private:
    std::vector<ScalePredictions<Num>> mPredictors;
    std::vector<Num> mLabels;
  };

  template <class Num>
  struct BlendFitDiagnostics
  {
    std::size_t numRows;
    std::size_t rank;             // numerical rank of the [1, d1, d2, d3] design matrix
    Num rSquared;
    Num residualStdDev;           // population standard deviation of the residuals
    std::size_t numNearestCenterFallbacks;
  };

  template <class Num>
  struct BlendFit
  {
    BlendModel<Num> model;
    BlendFitDiagnostics<Num> diagnostics;
  };

  /**
   * @brief Ordinary least squares fit of the blend weights.
   *
   * The solve uses a column-pivoting Householder QR factorization of the design
   * matrix rather than the normal equations, so strongly correlated scale
   * estimates do not square the condition number. A numerical rank below the
   * number of coefficients is reported as a FitErrorException instead of
   * returning an arbitrary minimum-norm solution.
   */
  template <class Num>
  class BlendModelTrainer
  {
  public:
    typedef Eigen::Matrix<Num, Eigen::Dynamic, Eigen::Dynamic> DesignMatrix;
    typedef Eigen::Matrix<Num, Eigen::Dynamic, 1> ColumnVector;

    static constexpr std::size_t kNumCoefficients = kNumScales + 1;

    /**
     * @param rankTolerance Relative threshold below which a pivot of the QR
     * factorization counts as zero.
     */
    explicit BlendModelTrainer(Num rankTolerance = Num(1e-10))
      : mRankTolerance(rankTolerance)
    {
      if (!(mRankTolerance > Num(0)))
	throw InvalidParameterException("BlendModelTrainer::BlendModelTrainer - rank tolerance must be positive");
    }

    /**
     * @brief Pair every eligible timestep of the period with its realized change.
     *
     * Row k holds the kernel estimates at timestep first + k and the label
     * price[first+k+1] - price[first+k].
     */
    BlendTrainingSet<Num> buildTrainingSet(const PriceSeries<Num>& period,
					   const MultiScalePredictor<Num>& predictor,
					   std::size_t* numFallbacks = nullptr) const
    {
      ScalePredictionSeries<Num> series = predictor.predictPeriod(period);

      BlendTrainingSet<Num> trainingSet;
      trainingSet.reserve(series.predictions.size());

      for (std::size_t k = 0; k < series.predictions.size(); ++k)
	trainingSet.addRow(series.predictions[k], period.getChange(series.firstTimestep + k));

      if (numFallbacks)
	*numFallbacks = series.numNearestCenterFallbacks;

      return trainingSet;
    }

    BlendFit<Num> train(const PriceSeries<Num>& period,
			const MultiScalePredictor<Num>& predictor) const
    {
      std::size_t fallbacks = 0;
      BlendFit<Num> fitted = fit(buildTrainingSet(period, predictor, &fallbacks));
      fitted.diagnostics.numNearestCenterFallbacks = fallbacks;
      return fitted;
    }

    /**
     * @throws FitErrorException if there are fewer rows than coefficients, a
     * row is not finite, or the design matrix is rank deficient.
     */
    BlendFit<Num> fit(const BlendTrainingSet<Num>& trainingSet) const
    {
      using namespace boost::accumulators;

      const std::size_t numRows = trainingSet.getNumRows();
      if (numRows < kNumCoefficients)
	throw FitErrorException("BlendModelTrainer::fit - " + std::to_string(numRows)
				+ " rows cannot determine " + std::to_string(kNumCoefficients)
				+ " coefficients");

      DesignMatrix design(numRows, kNumCoefficients);
      ColumnVector target(numRows);

      for (std::size_t r = 0; r < numRows; ++r)
	{
	  const ScalePredictions<Num>& d = trainingSet.getPredictors(r);
	  design(r, 0) = Num(1);
	  for (std::size_t s = 0; s < kNumScales; ++s)
	    design(r, s + 1) = d[s];

	  target(r) = trainingSet.getLabel(r);
	}

      if (!design.allFinite() || !target.allFinite())
	throw FitErrorException("BlendModelTrainer::fit - training rows contain non-finite values");

      Eigen::ColPivHouseholderQR<DesignMatrix> qr(design);
      qr.setThreshold(mRankTolerance);

      const std::size_t rank = static_cast<std::size_t>(qr.rank());
      if (rank < kNumCoefficients)
	throw FitErrorException("BlendModelTrainer::fit - design matrix is rank deficient (rank "
				+ std::to_string(rank) + " of " + std::to_string(kNumCoefficients)
				+ "); scale estimates are collinear");

      const ColumnVector w = qr.solve(target);
      if (!w.allFinite())
	throw FitErrorException("BlendModelTrainer::fit - least squares solution is not finite");

      const ColumnVector residuals = target - design * w;

      accumulator_set<Num, stats<tag::mean, tag::variance>> residualStats;
      accumulator_set<Num, stats<tag::mean, tag::variance>> targetStats;
      for (std::size_t r = 0; r < numRows; ++r)
	{
	  residualStats(residuals(r));
	  targetStats(target(r));
	}

      const Num ssResidual = residuals.squaredNorm();
      const Num ssTotal = variance(targetStats) * static_cast<Num>(numRows);
      Num rSquared;
      if (ssTotal > Num(0))
	rSquared = Num(1) - ssResidual / ssTotal;
      else
	rSquared = (ssResidual > Num(0)) ? Num(0) : Num(1);

      ScalePredictions<Num> weights;
      for (std::size_t s = 0; s < kNumScales; ++s)
	weights[s] = w(s + 1);

      BlendFitDiagnostics<Num> diagnostics{numRows,
	  rank,
	  rSquared,
	  std::sqrt(variance(residualStats)),
	  0};

      return BlendFit<Num>{BlendModel<Num>(w(0), weights), diagnostics};
    }

  private:
    Num mRankTolerance;
  };
}

#endif
