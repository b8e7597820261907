// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PRICE_SERIES_H
#define __PRICE_SERIES_H 1

#include <cmath>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "LatentSourceException.h"

namespace mkc_latentsource
{
  /**
   * @brief Immutable, position-indexed sequence of prices.
   *
   * The prices are held behind a shared pointer to const, so copies of a
   * PriceSeries are cheap and can be read from several threads at once.
   *
   * @tparam Num Floating point type of the prices (e.g. double).
   */
  template <class Num>
  class PriceSeries
  {
  public:
    typedef typename std::vector<Num>::const_iterator ConstIterator;

    /**
     * @brief Take ownership of a price vector.
     *
     * @throws InvalidPriceException if any price is NaN or infinite.
     */
    explicit PriceSeries(std::vector<Num> prices)
      : mPrices()
    {
      for (std::size_t i = 0; i < prices.size(); ++i)
	{
	  if (!std::isfinite(prices[i]))
	    throw InvalidPriceException("PriceSeries::PriceSeries - price at position "
					+ std::to_string(i) + " is not finite");
	}

      mPrices = std::make_shared<const std::vector<Num>>(std::move(prices));
    }

    PriceSeries()
      : mPrices(std::make_shared<const std::vector<Num>>())
    {}

    std::size_t getNumEntries() const
    {
      return mPrices->size();
    }

    bool empty() const
    {
      return mPrices->empty();
    }

    // Unchecked access
    const Num& operator[](std::size_t i) const
    {
      return (*mPrices)[i];
    }

    /**
     * @brief Checked access.
     *
     * @throws InsufficientDataException if i is past the end of the series.
     */
    const Num& getPrice(std::size_t i) const
    {
      if (i >= mPrices->size())
	throw InsufficientDataException("PriceSeries::getPrice - position " + std::to_string(i)
					+ " is beyond series of length "
					+ std::to_string(mPrices->size()));
      return (*mPrices)[i];
    }

    const Num& getLastPrice() const
    {
      if (mPrices->empty())
	throw InsufficientDataException("PriceSeries::getLastPrice - series is empty");

      return mPrices->back();
    }

    /// Realized one step change price[i+1] - price[i].
    Num getChange(std::size_t i) const
    {
      return getPrice(i + 1) - getPrice(i);
    }

    ConstIterator beginPrices() const
    {
      return mPrices->begin();
    }

    ConstIterator endPrices() const
    {
      return mPrices->end();
    }

    const Num* data() const
    {
      return mPrices->data();
    }

    const std::vector<Num>& getPrices() const
    {
      return *mPrices;
    }

    /**
     * @brief Copy count prices starting at first into a new series.
     *
     * @throws InsufficientDataException if the range runs past the end.
     */
    PriceSeries<Num> slice(std::size_t first, std::size_t count) const
    {
      if (first > mPrices->size() || count > mPrices->size() - first)
	throw InsufficientDataException("PriceSeries::slice - range [" + std::to_string(first) + ", "
					+ std::to_string(first + count) + ") exceeds series of length "
					+ std::to_string(mPrices->size()));

      return PriceSeries<Num>(std::vector<Num>(mPrices->begin() + first,
					       mPrices->begin() + first + count));
    }

  private:
    std::shared_ptr<const std::vector<Num>> mPrices;
  };
}

#endif
