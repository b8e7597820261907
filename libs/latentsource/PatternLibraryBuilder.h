// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PATTERN_LIBRARY_BUILDER_H
#define __PATTERN_LIBRARY_BUILDER_H 1

#include <cstddef>
#include <cstdint>
#include <memory>
#include "IParallelExecutor.h"
#include "KMeansClusterer.h"
#include "LatentSourceTypes.h"
#include "PatternLibrary.h"
#include "PriceSeries.h"
#include "PriceWindow.h"
#include "ScaleConfiguration.h"

namespace mkc_latentsource
{
  template <class Num>
  struct LibraryBuildResult
  {
    PatternLibrary<Num> library;     // the effective centers
    PointMatrix<Num> centroids;      // all k centroids in clusterer output order
    std::size_t numWindows;
    Num inertia;
    unsigned int iterations;
    bool converged;
  };

  /**
   * @brief Builds the pattern library of one time scale from a clustering period:
   * extract windows, cluster them into k centroids, keep the m effective ones.
   */
  template <class Num>
  class PatternLibraryBuilder
  {
  public:
    PatternLibraryBuilder(const ScaleConfiguration& scale,
			  uint64_t seed,
			  const KMeansOptions& options = KMeansOptions(),
			  std::shared_ptr<concurrency::IParallelExecutor> executor = nullptr)
      : mScale(scale),
	mSeed(seed),
	mOptions(options),
	mExecutor(executor)
    {}

    const ScaleConfiguration& getScale() const
    {
      return mScale;
    }

    /**
     * @throws InvalidWindowLengthException if the period is not longer than the window.
     * @throws InsufficientDataException if the period yields fewer windows than clusters.
     */
    LibraryBuildResult<Num> build(const PriceSeries<Num>& period) const
    {
      WindowExtractor<Num> extractor(mScale.getWindowLength());
      const PointMatrix<Num> points = extractor.extractPoints(period);

      KMeansClusterer<Num> clusterer(mScale.getNumClusters(), mSeed, mOptions, mExecutor);
      KMeansResult<Num> clustering = clusterer.cluster(points);

      EffectiveCenterSelector<Num> selector(mScale.getNumEffectiveCenters());
      PatternLibrary<Num> library = selector.select(clustering.centers);

      return LibraryBuildResult<Num>{std::move(library),
	  std::move(clustering.centers),
	  static_cast<std::size_t>(points.rows()),
	  clustering.inertia,
	  clustering.iterations,
	  clustering.converged};
    }

  private:
    ScaleConfiguration mScale;
    uint64_t mSeed;
    KMeansOptions mOptions;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
  };
}

#endif
