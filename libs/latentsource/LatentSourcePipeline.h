// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __LATENT_SOURCE_PIPELINE_H
#define __LATENT_SOURCE_PIPELINE_H 1

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "BlendModel.h"
#include "EnsemblePredictor.h"
#include "IParallelExecutor.h"
#include "KMeansClusterer.h"
#include "KernelPredictor.h"
#include "LatentSourceException.h"
#include "MultiScalePredictor.h"
#include "ParallelExecutors.h"
#include "PatternLibraryBuilder.h"
#include "PipelineObserver.h"
#include "PriceSeries.h"
#include "RngUtils.h"
#include "ScaleConfiguration.h"
#include "TradingSimulator.h"

namespace mkc_latentsource
{
  /**
   * @brief Every parameter of one backtest run.
   *
   * The three scales are used in the order given. threshold and stride have no
   * defaults and must always be supplied.
   */
  template <class Num>
  class PipelineConfiguration
  {
  public:
    typedef std::array<ScaleConfiguration, kNumScales> Scales;

    /**
     * @throws InvalidParameterException if threshold is negative or not finite,
     * stride is zero, or the k-means options are out of range.
     */
    PipelineConfiguration(const Scales& scales,
			  Num threshold,
			  std::size_t stride,
			  uint64_t seed,
			  const KMeansOptions& kmeansOptions = KMeansOptions(),
			  DegenerateWeightPolicy policy = DegenerateWeightPolicy::Fail)
      : mScales(scales),
	mThreshold(threshold),
	mStride(stride),
	mSeed(seed),
	mKMeansOptions(kmeansOptions),
	mPolicy(policy)
    {
      if (!std::isfinite(mThreshold) || mThreshold < Num(0))
	throw InvalidParameterException("PipelineConfiguration::PipelineConfiguration - threshold must be finite and non-negative");

      if (mStride == 0)
	throw InvalidParameterException("PipelineConfiguration::PipelineConfiguration - stride must be positive");

      if (mKMeansOptions.maxIterations == 0 || mKMeansOptions.numRestarts == 0)
	throw InvalidParameterException("PipelineConfiguration::PipelineConfiguration - k-means iterations and restarts must be positive");

      if (!(mKMeansOptions.tolerance >= 0.0))
	throw InvalidParameterException("PipelineConfiguration::PipelineConfiguration - k-means tolerance must be non-negative");
    }

    const Scales& getScales() const
    {
      return mScales;
    }

    const ScaleConfiguration& getScale(std::size_t scaleIndex) const
    {
      return mScales.at(scaleIndex);
    }

    std::size_t getMaxWindowLength() const
    {
      std::size_t longest = 0;
      for (const ScaleConfiguration& scale : mScales)
	longest = std::max(longest, scale.getWindowLength());

      return longest;
    }

    Num getThreshold() const
    {
      return mThreshold;
    }

    std::size_t getStride() const
    {
      return mStride;
    }

    uint64_t getSeed() const
    {
      return mSeed;
    }

    /// Seed of the clustering of one scale, derived from the master seed.
    uint64_t getScaleSeed(std::size_t scaleIndex) const
    {
      return rng_utils::derive_seed(mSeed, {static_cast<uint64_t>(scaleIndex)});
    }

    const KMeansOptions& getKMeansOptions() const
    {
      return mKMeansOptions;
    }

    DegenerateWeightPolicy getDegenerateWeightPolicy() const
    {
      return mPolicy;
    }

    inline friend std::ostream& operator<< (std::ostream& strng, const PipelineConfiguration<Num>& obj)
    {
      for (std::size_t s = 0; s < kNumScales; ++s)
	strng << "scale " << s << ": " << obj.mScales[s] << std::endl;

      strng << "threshold = " << obj.mThreshold << ", stride = " << obj.mStride
	    << ", seed = " << obj.mSeed
	    << ", k-means (iterations = " << obj.mKMeansOptions.maxIterations
	    << ", tolerance = " << obj.mKMeansOptions.tolerance
	    << ", restarts = " << obj.mKMeansOptions.numRestarts << ")"
	    << ", degenerate weights = "
	    << (obj.mPolicy == DegenerateWeightPolicy::NearestCenter ? "NearestCenter" : "Fail");

      return strng;
    }

  private:
    Scales mScales;
    Num mThreshold;
    std::size_t mStride;
    uint64_t mSeed;
    KMeansOptions mKMeansOptions;
    DegenerateWeightPolicy mPolicy;
  };

  /**
   * @brief The three ordered, contiguous periods of a backtest.
   */
  template <class Num>
  struct BacktestPeriods
  {
    PriceSeries<Num> clusterPeriod;   // pattern libraries are clustered from this period
    PriceSeries<Num> blendPeriod;     // blend weights are fitted on this period
    PriceSeries<Num> testPeriod;      // signal and simulations are evaluated on this period
  };

  template <class Num>
  struct PipelineResult
  {
    std::vector<LibraryBuildResult<Num>> libraries;   // one per scale, in configuration order
    BlendFit<Num> blendFit;
    Signal<Num> signal;
    SimulationResult<Num> boundedResult;
    SimulationResult<Num> unboundedResult;
  };

  /**
   * @brief Runs the complete latent source backtest:
   *
   *   cluster period -> three pattern libraries
   *   blend period   -> blend weights
   *   test period    -> signal -> bounded and unbounded simulations
   *
   * The scales are built one after the other; each build spreads its own
   * distance computations over the executor.
   */
  template <class Num>
  class LatentSourcePipeline
  {
  public:
    LatentSourcePipeline(const PipelineConfiguration<Num>& config,
			 std::shared_ptr<concurrency::IParallelExecutor> executor = nullptr,
			 std::shared_ptr<PipelineObserver<Num>> observer = nullptr)
      : mConfig(config),
	mExecutor(executor ? executor : std::make_shared<concurrency::SingleThreadExecutor>()),
	mObserver(observer ? observer : std::make_shared<NullPipelineObserver<Num>>())
    {}

    const PipelineConfiguration<Num>& getConfiguration() const
    {
      return mConfig;
    }

    /**
     * @brief Check every period against the configured scales before any work is done.
     *
     * @throws InvalidWindowLengthException if a window is not shorter than the cluster period.
     * @throws InsufficientDataException if a scale has fewer windows than clusters, or the
     * blend or test period has no eligible timestep.
     */
    void validatePeriods(const BacktestPeriods<Num>& periods) const
    {
      const std::size_t clusterLength = periods.clusterPeriod.getNumEntries();

      for (std::size_t s = 0; s < kNumScales; ++s)
	{
	  const ScaleConfiguration& scale = mConfig.getScale(s);
	  if (scale.getWindowLength() >= clusterLength)
	    throw InvalidWindowLengthException("LatentSourcePipeline::validatePeriods - window length "
					       + std::to_string(scale.getWindowLength()) + " of scale "
					       + std::to_string(s) + " must be less than cluster period length "
					       + std::to_string(clusterLength));
	}

      for (std::size_t s = 0; s < kNumScales; ++s)
	{
	  const ScaleConfiguration& scale = mConfig.getScale(s);
	  if (clusterLength - scale.getWindowLength() < scale.getNumClusters())
	    throw InsufficientDataException("LatentSourcePipeline::validatePeriods - cluster period yields "
					    + std::to_string(clusterLength - scale.getWindowLength())
					    + " windows for scale " + std::to_string(s) + " but "
					    + std::to_string(scale.getNumClusters()) + " clusters are requested");
	}

      const std::size_t minLength = mConfig.getMaxWindowLength() + 2;
      if (periods.blendPeriod.getNumEntries() < minLength)
	throw InsufficientDataException("LatentSourcePipeline::validatePeriods - blend period of length "
					+ std::to_string(periods.blendPeriod.getNumEntries())
					+ " needs at least " + std::to_string(minLength) + " prices");

      if (periods.testPeriod.getNumEntries() < minLength)
	throw InsufficientDataException("LatentSourcePipeline::validatePeriods - test period of length "
					+ std::to_string(periods.testPeriod.getNumEntries())
					+ " needs at least " + std::to_string(minLength) + " prices");
    }

    /**
     * @brief Build the pattern library of every scale, in configuration order.
     *
     * Scales are built one at a time on the calling thread; the clustering of
     * each scale runs its per-point passes on the executor.
     */
    std::vector<LibraryBuildResult<Num>> buildLibraries(const PriceSeries<Num>& clusterPeriod) const
    {
      std::vector<LibraryBuildResult<Num>> results;
      results.reserve(kNumScales);

      for (std::size_t s = 0; s < kNumScales; ++s)
	{
	  PatternLibraryBuilder<Num> builder(mConfig.getScale(s),
					     mConfig.getScaleSeed(s),
					     mConfig.getKMeansOptions(),
					     mExecutor);
	  results.push_back(builder.build(clusterPeriod));
	  mObserver->libraryBuilt(s, mConfig.getScale(s), results.back());
	}

      return results;
    }

    MultiScalePredictor<Num> makeScalePredictor(const std::vector<LibraryBuildResult<Num>>& libraries) const
    {
      if (libraries.size() != kNumScales)
	throw InvalidParameterException("LatentSourcePipeline::makeScalePredictor - expected "
					+ std::to_string(kNumScales) + " libraries, got "
					+ std::to_string(libraries.size()));

      typename LibrarySet<Num>::Libraries set;
      for (std::size_t s = 0; s < kNumScales; ++s)
	set[s] = std::make_shared<const PatternLibrary<Num>>(libraries[s].library);

      return MultiScalePredictor<Num>(LibrarySet<Num>(set),
				      mConfig.getDegenerateWeightPolicy(),
				      mExecutor);
    }

    BlendFit<Num> fitBlend(const PriceSeries<Num>& blendPeriod,
			   const MultiScalePredictor<Num>& scalePredictor) const
    {
      BlendModelTrainer<Num> trainer;
      BlendFit<Num> fit = trainer.train(blendPeriod, scalePredictor);
      mObserver->blendModelFitted(fit);
      return fit;
    }

    Signal<Num> generateSignal(const PriceSeries<Num>& testPeriod,
			       const MultiScalePredictor<Num>& scalePredictor,
			       const BlendModel<Num>& model) const
    {
      EnsemblePredictor<Num> ensemble(scalePredictor, model);
      Signal<Num> signal = ensemble.predict(testPeriod);
      mObserver->signalGenerated(signal);
      return signal;
    }

    PipelineResult<Num> run(const BacktestPeriods<Num>& periods) const
    {
      validatePeriods(periods);

      std::vector<LibraryBuildResult<Num>> libraries = buildLibraries(periods.clusterPeriod);
      const MultiScalePredictor<Num> scalePredictor = makeScalePredictor(libraries);

      BlendFit<Num> blendFit = fitBlend(periods.blendPeriod, scalePredictor);
      Signal<Num> signal = generateSignal(periods.testPeriod, scalePredictor, blendFit.model);

      TradingSimulator<Num, BoundedPositionPolicy> bounded(mConfig.getThreshold(), mConfig.getStride());
      SimulationResult<Num> boundedResult = bounded.run(signal, periods.testPeriod);
      mObserver->simulationFinished(BoundedPositionPolicy::getName(), boundedResult);

      TradingSimulator<Num, UnboundedPositionPolicy> unbounded(mConfig.getThreshold(), mConfig.getStride());
      SimulationResult<Num> unboundedResult = unbounded.run(signal, periods.testPeriod);
      mObserver->simulationFinished(UnboundedPositionPolicy::getName(), unboundedResult);

      return PipelineResult<Num>{std::move(libraries),
	  std::move(blendFit),
	  std::move(signal),
	  boundedResult,
	  unboundedResult};
    }

  private:
    PipelineConfiguration<Num> mConfig;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
    std::shared_ptr<PipelineObserver<Num>> mObserver;
  };
}

#endif
