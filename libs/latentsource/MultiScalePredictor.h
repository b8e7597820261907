// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __MULTI_SCALE_PREDICTOR_H
#define __MULTI_SCALE_PREDICTOR_H 1

#include <algorithm>
#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "IParallelExecutor.h"
#include "KernelPredictor.h"
#include "LatentSourceException.h"
#include "LatentSourceTypes.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "PatternLibrary.h"
#include "PriceSeries.h"

namespace mkc_latentsource
{
  /**
   * @brief The pattern libraries of the three time scales, shortest first by convention.
   */
  template <class Num>
  class LibrarySet
  {
  public:
    typedef std::array<std::shared_ptr<const PatternLibrary<Num>>, kNumScales> Libraries;

    explicit LibrarySet(const Libraries& libraries)
      : mLibraries(libraries),
	mMaxWindowLength(0)
    {
      for (std::size_t s = 0; s < kNumScales; ++s)
	{
	  if (!mLibraries[s])
	    throw EmptyLibraryException("LibrarySet::LibrarySet - library for scale "
					+ std::to_string(s) + " is null");

	  mMaxWindowLength = std::max(mMaxWindowLength, mLibraries[s]->getWindowLength());
	}
    }

    const PatternLibrary<Num>& getLibrary(std::size_t scale) const
    {
      return *mLibraries.at(scale);
    }

    std::shared_ptr<const PatternLibrary<Num>> getLibraryPtr(std::size_t scale) const
    {
      return mLibraries.at(scale);
    }

    std::size_t getMaxWindowLength() const
    {
      return mMaxWindowLength;
    }

  private:
    Libraries mLibraries;
    std::size_t mMaxWindowLength;
  };

  /**
   * @brief Per-timestep kernel estimates of one period, aligned to its first
   * eligible timestep.
   */
  template <class Num>
  struct ScalePredictionSeries
  {
    std::size_t firstTimestep;
    std::vector<ScalePredictions<Num>> predictions;
    std::size_t numNearestCenterFallbacks;
  };

  /**
   * @brief Evaluates the three kernel predictors at every eligible timestep of a period.
   *
   * Timestep i is eligible when maxWindowLength <= i <= L - 2. The window of
   * scale n used at timestep i is price[i-n .. i-1], the n prices preceding i,
   * so nothing at or after i enters the estimate for price[i+1] - price[i].
   *
   * Timesteps are independent and are dispatched through the executor; each
   * result is written by index, so the output does not depend on scheduling.
   */
  template <class Num>
  class MultiScalePredictor
  {
  public:
    MultiScalePredictor(const LibrarySet<Num>& libraries,
			DegenerateWeightPolicy policy = DegenerateWeightPolicy::Fail,
			std::shared_ptr<concurrency::IParallelExecutor> executor = nullptr)
      : mLibraries(libraries),
	mPredictors(makePredictors(libraries)),
	mPolicy(policy),
	mExecutor(executor ? executor : std::make_shared<concurrency::SingleThreadExecutor>())
    {}

    const LibrarySet<Num>& getLibraries() const
    {
      return mLibraries;
    }

    DegenerateWeightPolicy getDegenerateWeightPolicy() const
    {
      return mPolicy;
    }

    std::size_t getFirstEligibleTimestep() const
    {
      return mLibraries.getMaxWindowLength();
    }

    /**
     * @brief L - maxWindowLength - 1 for a period of length L.
     *
     * @throws InsufficientDataException if the period has no eligible timestep.
     */
    std::size_t getNumEligibleTimesteps(const PriceSeries<Num>& period) const
    {
      const std::size_t first = getFirstEligibleTimestep();
      if (period.getNumEntries() < first + 2)
	throw InsufficientDataException("MultiScalePredictor::getNumEligibleTimesteps - period of length "
					+ std::to_string(period.getNumEntries())
					+ " is too short for the longest scale "
					+ std::to_string(first) + " (need at least "
					+ std::to_string(first + 2) + " prices)");

      return period.getNumEntries() - first - 1;
    }

    /**
     * @brief Kernel estimates of all scales at one eligible timestep.
     *
     * @throws InsufficientDataException if timestep is not eligible.
     */
    ScalePredictions<Num> predictAt(const PriceSeries<Num>& period, std::size_t timestep) const
    {
      std::size_t fallbacks = 0;
      return predictAt(period, timestep, fallbacks);
    }

    ScalePredictionSeries<Num> predictPeriod(const PriceSeries<Num>& period) const
    {
      const std::size_t numTimesteps = getNumEligibleTimesteps(period);
      const std::size_t first = getFirstEligibleTimestep();

      std::vector<ScalePredictions<Num>> predictions(numTimesteps);
      std::atomic<std::size_t> fallbacks(0);

      concurrency::parallel_for(numTimesteps, *mExecutor, [&](std::size_t k) {
	  std::size_t localFallbacks = 0;
	  predictions[k] = predictAt(period, first + k, localFallbacks);
	  if (localFallbacks)
	    fallbacks.fetch_add(localFallbacks, std::memory_order_relaxed);
	});

      return ScalePredictionSeries<Num>{first, std::move(predictions), fallbacks.load()};
    }

  private:
    static std::array<KernelPredictor<Num>, kNumScales> makePredictors(const LibrarySet<Num>& libraries)
    {
      return {{KernelPredictor<Num>(libraries.getLibraryPtr(0)),
	    KernelPredictor<Num>(libraries.getLibraryPtr(1)),
	    KernelPredictor<Num>(libraries.getLibraryPtr(2))}};
    }

    ScalePredictions<Num> predictAt(const PriceSeries<Num>& period,
				    std::size_t timestep,
				    std::size_t& fallbacks) const
    {
      if (timestep < getFirstEligibleTimestep() || timestep + 2 > period.getNumEntries())
	throw InsufficientDataException("MultiScalePredictor::predictAt - timestep "
					+ std::to_string(timestep)
					+ " is outside the eligible range of a period of length "
					+ std::to_string(period.getNumEntries()));

      ScalePredictions<Num> result;
      for (std::size_t s = 0; s < kNumScales; ++s)
	{
	  const KernelPredictor<Num>& predictor = mPredictors[s];
	  const std::size_t n = predictor.getWindowLength();
	  const Num* window = period.data() + (timestep - n);

	  try
	    {
	      result[s] = predictor.predict(window, n);
	    }
	  catch (const DegenerateKernelWeightsException&)
	    {
	      if (mPolicy != DegenerateWeightPolicy::NearestCenter)
		throw;

	      result[s] = predictor.nearestCenterLabel(window, n);
	      ++fallbacks;
	    }
	}

      return result;
    }

  private:
    LibrarySet<Num> mLibraries;
    std::array<KernelPredictor<Num>, kNumScales> mPredictors;
    DegenerateWeightPolicy mPolicy;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
  };
}

#endif
