// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ENSEMBLE_PREDICTOR_H
#define __ENSEMBLE_PREDICTOR_H 1

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>
#include "BlendModel.h"
#include "LatentSourceException.h"
#include "MultiScalePredictor.h"
#include "PriceSeries.h"

namespace mkc_latentsource
{
  /**
   * @brief Blended next-step change estimates over a test period.
   *
   * Index 0 corresponds to the first eligible timestep of the period, which is
   * returned by getFirstTimestep(); entry k predicts
   * price[first+k+1] - price[first+k].
   */
  template <class Num>
  class Signal
  {
  public:
    typedef typename std::vector<Num>::const_iterator ConstIterator;

    Signal(std::size_t firstTimestep, std::vector<Num> values)
      : mFirstTimestep(firstTimestep),
	mValues(std::move(values))
    {}

    std::size_t getFirstTimestep() const
    {
      return mFirstTimestep;
    }

    std::size_t getNumValues() const
    {
      return mValues.size();
    }

    bool empty() const
    {
      return mValues.empty();
    }

    const Num& operator[](std::size_t k) const
    {
      return mValues[k];
    }

    const Num& at(std::size_t k) const
    {
      if (k >= mValues.size())
	throw InsufficientDataException("Signal::at - index " + std::to_string(k)
					+ " is beyond signal of length "
					+ std::to_string(mValues.size()));
      return mValues[k];
    }

    const std::vector<Num>& getValues() const
    {
      return mValues;
    }

    ConstIterator begin() const
    {
      return mValues.begin();
    }

    ConstIterator end() const
    {
      return mValues.end();
    }

  private:
    std::size_t mFirstTimestep;
    std::vector<Num> mValues;
  };

  /**
   * @brief Applies a fitted blend model to the multi-scale kernel estimates of
   * every eligible timestep of a period.
   */
  template <class Num>
  class EnsemblePredictor
  {
  public:
    EnsemblePredictor(const MultiScalePredictor<Num>& scalePredictor,
		      const BlendModel<Num>& model)
      : mScalePredictor(scalePredictor),
	mModel(model)
    {}

    const BlendModel<Num>& getModel() const
    {
      return mModel;
    }

    /**
     * @throws InsufficientDataException if the period is too short for the
     * longest scale.
     * @throws InvalidParameterException if the blend model overflows on a
     * timestep's kernel estimates.
     */
    Signal<Num> predict(const PriceSeries<Num>& period) const
    {
      std::size_t unused = 0;
      return predict(period, unused);
    }

    Signal<Num> predict(const PriceSeries<Num>& period, std::size_t& numFallbacks) const
    {
      ScalePredictionSeries<Num> series = mScalePredictor.predictPeriod(period);

      std::vector<Num> values;
      values.reserve(series.predictions.size());
      for (std::size_t k = 0; k < series.predictions.size(); ++k)
	{
	  const Num blended = mModel.predict(series.predictions[k]);
	  if (!std::isfinite(blended))
	    throw InvalidParameterException("EnsemblePredictor::predict - blended value at timestep "
					    + std::to_string(series.firstTimestep + k)
					    + " is not finite");

	  values.push_back(blended);
	}

      numFallbacks = series.numNearestCenterFallbacks;
      return Signal<Num>(series.firstTimestep, std::move(values));
    }

  private:
    MultiScalePredictor<Num> mScalePredictor;
    BlendModel<Num> mModel;
  };
}

#endif
