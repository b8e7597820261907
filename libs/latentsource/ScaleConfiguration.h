// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __SCALE_CONFIGURATION_H
#define __SCALE_CONFIGURATION_H 1

#include <cstddef>
#include <ostream>
#include <string>
#include "LatentSourceException.h"

namespace mkc_latentsource
{
  /**
   * @brief Sizing of one time scale: window length n, centroid count k and
   * effective-center count m, with 0 < m <= k.
   */
  class ScaleConfiguration
  {
  public:
    ScaleConfiguration(std::size_t windowLength,
		       std::size_t numClusters,
		       std::size_t numEffectiveCenters)
      : mWindowLength(windowLength),
	mNumClusters(numClusters),
	mNumEffectiveCenters(numEffectiveCenters)
    {
      if (mWindowLength == 0)
	throw InvalidWindowLengthException("ScaleConfiguration::ScaleConfiguration - window length must be positive");

      if (mNumClusters == 0)
	throw InvalidParameterException("ScaleConfiguration::ScaleConfiguration - number of clusters must be positive");

      if (mNumEffectiveCenters == 0 || mNumEffectiveCenters > mNumClusters)
	throw InvalidParameterException("ScaleConfiguration::ScaleConfiguration - number of effective centers "
					+ std::to_string(mNumEffectiveCenters)
					+ " must be in [1, " + std::to_string(mNumClusters) + "]");
    }

    std::size_t getWindowLength() const
    {
      return mWindowLength;
    }

    std::size_t getNumClusters() const
    {
      return mNumClusters;
    }

    std::size_t getNumEffectiveCenters() const
    {
      return mNumEffectiveCenters;
    }

    inline friend std::ostream& operator<< (std::ostream& strng, const ScaleConfiguration& obj)
    {
      return strng << "window=" << obj.mWindowLength << ", clusters=" << obj.mNumClusters
		   << ", effective=" << obj.mNumEffectiveCenters;
    }

  private:
    std::size_t mWindowLength;
    std::size_t mNumClusters;
    std::size_t mNumEffectiveCenters;
  };
}

#endif
