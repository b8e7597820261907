// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include "LatentSourcePipeline.h"

namespace lsmbacktest
{
  using Num = double;

  class BacktestConfigurationException : public std::runtime_error
  {
  public:
    explicit BacktestConfigurationException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~BacktestConfigurationException() noexcept = default;
  };

  /**
   * @brief Everything a backtest run needs: where the prices come from and
   * the pipeline parameters.
   */
  class BacktestConfiguration
  {
  public:
    BacktestConfiguration(const std::string& priceFilePath,
			  const std::string& priceColumn,
			  const mkc_latentsource::PipelineConfiguration<Num>& pipelineConfig);

    const std::string& getPriceFilePath() const
    {
      return mPriceFilePath;
    }

    const std::string& getPriceColumn() const
    {
      return mPriceColumn;
    }

    const mkc_latentsource::PipelineConfiguration<Num>& getPipelineConfiguration() const
    {
      return mPipelineConfig;
    }

    /// Copy of this configuration reading prices from another file
    BacktestConfiguration withPriceFile(const std::string& priceFilePath) const;

    /// Copy of this configuration with another master seed
    BacktestConfiguration withSeed(uint64_t seed) const;

    /// Copy of this configuration trading at another threshold
    BacktestConfiguration withThreshold(Num threshold) const;

  private:
    std::string mPriceFilePath;
    std::string mPriceColumn;
    mkc_latentsource::PipelineConfiguration<Num> mPipelineConfig;
  };

  /**
   * @brief Reads a backtest configuration from a CSV file with a header row.
   *
   * Required columns: PriceFile, PriceColumn, WindowLengths, NumClusters,
   * NumEffectiveCenters, Seed, Threshold, Stride. Optional columns:
   * MaxIterations, Tolerance, NumRestarts, DegeneratePolicy.
   *
   * WindowLengths, NumClusters and NumEffectiveCenters hold either one value,
   * used for all three scales, or three values separated by '|'.
   * The first data row is the configuration.
   */
  class BacktestConfigurationFileReader
  {
  public:
    explicit BacktestConfigurationFileReader(const std::string& configurationFileName);

    /**
     * @param checkPriceFile when true the price file named in the
     * configuration must exist
     * @throws BacktestConfigurationException on a missing column, an
     * unparseable value or a missing price file
     */
    std::shared_ptr<BacktestConfiguration> readConfigurationFile(bool checkPriceFile = true) const;

  private:
    std::string mConfigurationFileName;
  };
}
