// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PATTERN_LIBRARY_H
#define __PATTERN_LIBRARY_H 1

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <string>
#include <vector>
#include "LatentSourceException.h"
#include "LatentSourceTypes.h"

namespace mkc_latentsource
{
  /**
   * @brief A centroid in feature+label space: n feature prices plus the
   * expected next step change attached to that price shape.
   */
  template <class Num>
  class ClusterCenter
  {
  public:
    ClusterCenter(std::vector<Num> feature, Num label)
      : mFeature(std::move(feature)),
	mLabel(label)
    {}

    const std::vector<Num>& getFeature() const
    {
      return mFeature;
    }

    Num getLabel() const
    {
      return mLabel;
    }

    std::size_t getWindowLength() const
    {
      return mFeature.size();
    }

    /// Peak-to-peak range of the feature coordinates (label excluded).
    Num getFeatureRange() const
    {
      if (mFeature.empty())
	return Num(0);

      const auto minmax = std::minmax_element(mFeature.begin(), mFeature.end());
      return *minmax.second - *minmax.first;
    }

  private:
    std::vector<Num> mFeature;
    Num mLabel;
  };

  /**
   * @brief The effective centers kept for one time scale.
   *
   * Besides the centers themselves the library caches their features as an
   * m x n matrix and their labels as a vector, the layout the kernel
   * predictor evaluates against.
   */
  template <class Num>
  class PatternLibrary
  {
  public:
    typedef typename std::vector<ClusterCenter<Num>>::const_iterator ConstCenterIterator;

    /**
     * @throws InvalidWindowLengthException if a center's feature length
     * differs from windowLength.
     */
    PatternLibrary(std::size_t windowLength, std::vector<ClusterCenter<Num>> centers)
      : mWindowLength(windowLength),
	mCenters(std::move(centers)),
	mFeatures(mCenters.size(), windowLength),
	mLabels(mCenters.size())
    {
      for (std::size_t j = 0; j < mCenters.size(); ++j)
	{
	  const ClusterCenter<Num>& center = mCenters[j];
	  if (center.getWindowLength() != mWindowLength)
	    throw InvalidWindowLengthException("PatternLibrary::PatternLibrary - center "
					       + std::to_string(j) + " has length "
					       + std::to_string(center.getWindowLength())
					       + ", library window length is "
					       + std::to_string(mWindowLength));

	  for (std::size_t i = 0; i < mWindowLength; ++i)
	    mFeatures(j, i) = center.getFeature()[i];

	  mLabels(j) = center.getLabel();
	}
    }

    std::size_t getWindowLength() const
    {
      return mWindowLength;
    }

    std::size_t getNumCenters() const
    {
      return mCenters.size();
    }

    bool empty() const
    {
      return mCenters.empty();
    }

    const ClusterCenter<Num>& getCenter(std::size_t j) const
    {
      return mCenters.at(j);
    }

    ConstCenterIterator beginCenters() const
    {
      return mCenters.begin();
    }

    ConstCenterIterator endCenters() const
    {
      return mCenters.end();
    }

    const PointMatrix<Num>& getFeatureMatrix() const
    {
      return mFeatures;
    }

    const PointVector<Num>& getLabels() const
    {
      return mLabels;
    }

  private:
    std::size_t mWindowLength;
    std::vector<ClusterCenter<Num>> mCenters;
    PointMatrix<Num> mFeatures;
    PointVector<Num> mLabels;
  };

  /**
   * @brief Keeps the m centroids whose price shape swings the most.
   *
   * Centroids are stably sorted by ascending peak-to-peak range of their
   * feature coordinates and the last m are kept, in that ascending order.
   * Equal ranges keep the clusterer's output order.
   */
  template <class Num>
  class EffectiveCenterSelector
  {
  public:
    explicit EffectiveCenterSelector(std::size_t numEffectiveCenters)
      : mNumEffectiveCenters(numEffectiveCenters)
    {
      if (mNumEffectiveCenters == 0)
	throw InvalidParameterException("EffectiveCenterSelector::EffectiveCenterSelector - number of effective centers must be positive");
    }

    std::size_t getNumEffectiveCenters() const
    {
      return mNumEffectiveCenters;
    }

    /**
     * @param centroids k rows of n + 1 coordinates (features then label).
     * @throws InvalidParameterException if m exceeds k.
     */
    PatternLibrary<Num> select(const PointMatrix<Num>& centroids) const
    {
      const std::size_t numCentroids = static_cast<std::size_t>(centroids.rows());
      if (mNumEffectiveCenters > numCentroids)
	throw InvalidParameterException("EffectiveCenterSelector::select - cannot keep "
					+ std::to_string(mNumEffectiveCenters) + " of "
					+ std::to_string(numCentroids) + " centroids");

      if (centroids.cols() < 2)
	throw InvalidWindowLengthException("EffectiveCenterSelector::select - centroids need at least one feature and a label");

      const std::size_t windowLength = static_cast<std::size_t>(centroids.cols()) - 1;

      std::vector<Num> ranges(numCentroids);
      for (std::size_t j = 0; j < numCentroids; ++j)
	{
	  const auto feature = centroids.row(j).head(windowLength);
	  ranges[j] = feature.maxCoeff() - feature.minCoeff();
	}

      std::vector<std::size_t> order(numCentroids);
      std::iota(order.begin(), order.end(), 0);
      std::stable_sort(order.begin(), order.end(),
		       [&ranges](std::size_t a, std::size_t b) { return ranges[a] < ranges[b]; });

      std::vector<ClusterCenter<Num>> kept;
      kept.reserve(mNumEffectiveCenters);

      for (std::size_t pos = numCentroids - mNumEffectiveCenters; pos < numCentroids; ++pos)
	{
	  const std::size_t j = order[pos];
	  std::vector<Num> feature(windowLength);
	  for (std::size_t i = 0; i < windowLength; ++i)
	    feature[i] = centroids(j, i);

	  kept.emplace_back(std::move(feature), centroids(j, windowLength));
	}

      return PatternLibrary<Num>(windowLength, std::move(kept));
    }

  private:
    std::size_t mNumEffectiveCenters;
  };
}

#endif
