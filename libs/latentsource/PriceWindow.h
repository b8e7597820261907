// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PRICE_WINDOW_H
#define __PRICE_WINDOW_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "LatentSourceException.h"
#include "LatentSourceTypes.h"
#include "PriceSeries.h"

namespace mkc_latentsource
{
  /**
   * @brief A contiguous slice of prices (the feature) and the price change
   * realized immediately after it (the label).
   */
  template <class Num>
  class PriceWindow
  {
  public:
    PriceWindow(std::vector<Num> feature, Num label)
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

    std::size_t getLength() const
    {
      return mFeature.size();
    }

  private:
    std::vector<Num> mFeature;
    Num mLabel;
  };

  /**
   * @brief Slices a price series into overlapping, labeled windows of one length.
   *
   * For a series of length L and window length n the extractor produces L - n
   * windows. Window i covers price[i .. i+n-1] and is labeled with
   * price[i+n] - price[i+n-1].
   */
  template <class Num>
  class WindowExtractor
  {
  public:
    /**
     * @throws InvalidWindowLengthException if windowLength is zero.
     */
    explicit WindowExtractor(std::size_t windowLength)
      : mWindowLength(windowLength)
    {
      if (mWindowLength == 0)
	throw InvalidWindowLengthException("WindowExtractor::WindowExtractor - window length must be positive");
    }

    std::size_t getWindowLength() const
    {
      return mWindowLength;
    }

    /**
     * @brief Number of windows the series yields.
     *
     * @throws InvalidWindowLengthException if the window length is not shorter
     * than the series.
     */
    std::size_t getNumWindows(const PriceSeries<Num>& series) const
    {
      if (mWindowLength >= series.getNumEntries())
	throw InvalidWindowLengthException("WindowExtractor::getNumWindows - window length "
					   + std::to_string(mWindowLength)
					   + " must be less than series length "
					   + std::to_string(series.getNumEntries()));

      return series.getNumEntries() - mWindowLength;
    }

    std::vector<PriceWindow<Num>> extract(const PriceSeries<Num>& series) const
    {
      const std::size_t numWindows = getNumWindows(series);

      std::vector<PriceWindow<Num>> windows;
      windows.reserve(numWindows);

      for (std::size_t i = 0; i < numWindows; ++i)
	{
	  std::vector<Num> feature(series.beginPrices() + i,
				   series.beginPrices() + i + mWindowLength);
	  const std::size_t end = i + mWindowLength;
	  windows.emplace_back(std::move(feature), series[end] - series[end - 1]);
	}

      return windows;
    }

    /**
     * @brief Same windows flattened into clustering points.
     *
     * Row i holds the n feature prices of window i followed by its label, so the
     * matrix has L - n rows and n + 1 columns.
     */
    PointMatrix<Num> extractPoints(const PriceSeries<Num>& series) const
    {
      const std::size_t numWindows = getNumWindows(series);
      PointMatrix<Num> points(numWindows, mWindowLength + 1);

      for (std::size_t i = 0; i < numWindows; ++i)
	{
	  for (std::size_t j = 0; j < mWindowLength; ++j)
	    points(i, j) = series[i + j];

	  const std::size_t end = i + mWindowLength;
	  points(i, mWindowLength) = series[end] - series[end - 1];
	}

      return points;
    }

  private:
    std::size_t mWindowLength;
  };
}

#endif
