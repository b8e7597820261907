// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#pragma once

#include <stdexcept>
#include <string>
#include "BacktestConfiguration.h"
#include "PriceSeries.h"

namespace lsmbacktest
{
  class PriceSeriesCsvReaderException : public std::runtime_error
  {
  public:
    explicit PriceSeriesCsvReaderException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~PriceSeriesCsvReaderException() noexcept = default;
  };

  /**
   * @brief Reads one named price column of a CSV file with a header row.
   *
   * Other columns (dates, volume, ...) are ignored. Rows are taken in file order.
   */
  class PriceSeriesCsvReader
  {
  public:
    PriceSeriesCsvReader(const std::string& fileName, const std::string& columnName);

    /**
     * @throws PriceSeriesCsvReaderException if the file or column is missing,
     * or a cell is empty, unparseable or not finite
     */
    void readFile();

    const mkc_latentsource::PriceSeries<Num>& getPriceSeries() const
    {
      return mPriceSeries;
    }

  private:
    std::string mFileName;
    std::string mColumnName;
    mkc_latentsource::PriceSeries<Num> mPriceSeries;
  };
}
