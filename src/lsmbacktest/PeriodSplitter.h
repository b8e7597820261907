// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#pragma once

#include <cstddef>
#include <string>
#include "LatentSourceException.h"
#include "LatentSourcePipeline.h"
#include "PriceSeries.h"

namespace lsmbacktest
{
  /**
   * @brief Splits one price feed into the cluster, blend and test periods.
   *
   * The periods are contiguous and in time order with nearly equal lengths:
   * for a feed of length L each gets L / 3 prices and the first L % 3 periods
   * get one more.
   */
  template <class Num>
  class PeriodSplitter
  {
  public:
    static constexpr std::size_t kNumPeriods = 3;

    static mkc_latentsource::BacktestPeriods<Num> split(const mkc_latentsource::PriceSeries<Num>& prices)
    {
      const std::size_t length = prices.getNumEntries();
      if (length < kNumPeriods)
	throw mkc_latentsource::InsufficientDataException("PeriodSplitter::split - need at least "
							  + std::to_string(kNumPeriods)
							  + " prices, got " + std::to_string(length));

      std::size_t sizes[kNumPeriods];
      for (std::size_t p = 0; p < kNumPeriods; ++p)
	sizes[p] = length / kNumPeriods + (p < length % kNumPeriods ? 1 : 0);

      return mkc_latentsource::BacktestPeriods<Num>{prices.slice(0, sizes[0]),
	  prices.slice(sizes[0], sizes[1]),
	  prices.slice(sizes[0] + sizes[1], sizes[2])};
    }
  };
}
