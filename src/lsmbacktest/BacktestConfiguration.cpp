// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "BacktestConfiguration.h"
#include <array>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"

using namespace mkc_latentsource;

namespace lsmbacktest
{
  namespace
  {
    const char* const kRequiredColumns[] = {"PriceFile", "PriceColumn", "WindowLengths", "NumClusters",
					    "NumEffectiveCenters", "Seed", "Threshold", "Stride"};

    template <class T>
    T tryCast(const std::string& value, const std::string& columnName)
    {
      try
	{
	  return boost::lexical_cast<T>(boost::algorithm::trim_copy(value));
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - column "
					       + columnName + " has unparseable value '" + value + "'");
	}
    }

    // lexical_cast to an unsigned type wraps negative input, so count as signed first
    std::size_t parseCount(const std::string& value, const std::string& columnName)
    {
      const long long count = tryCast<long long>(value, columnName);
      if (count <= 0)
	throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - column "
					     + columnName + " must be positive, got " + value);

      return static_cast<std::size_t>(count);
    }

    std::array<std::size_t, kNumScales> parseScaleList(const std::string& cell, const std::string& columnName)
    {
      std::vector<std::string> parts;
      boost::algorithm::split(parts, cell, boost::algorithm::is_any_of("|"));

      std::array<std::size_t, kNumScales> values;
      if (parts.size() == 1)
	{
	  values.fill(parseCount(parts[0], columnName));
	}
      else if (parts.size() == kNumScales)
	{
	  for (std::size_t s = 0; s < kNumScales; ++s)
	    values[s] = parseCount(parts[s], columnName);
	}
      else
	throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - column "
					     + columnName + " must hold 1 or " + std::to_string(kNumScales)
					     + " values, got '" + cell + "'");

      return values;
    }

    DegenerateWeightPolicy parsePolicy(const std::string& value)
    {
      const std::string policy = boost::algorithm::trim_copy(value);

      if (policy.empty() || boost::algorithm::iequals(policy, "Fail"))
	return DegenerateWeightPolicy::Fail;

      if (boost::algorithm::iequals(policy, "NearestCenter"))
	return DegenerateWeightPolicy::NearestCenter;

      throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - unknown DegeneratePolicy '"
					   + value + "', expected Fail or NearestCenter");
    }
  }

  BacktestConfiguration::BacktestConfiguration(const std::string& priceFilePath,
					       const std::string& priceColumn,
					       const PipelineConfiguration<Num>& pipelineConfig)
    : mPriceFilePath(priceFilePath),
      mPriceColumn(priceColumn),
      mPipelineConfig(pipelineConfig)
  {}

  BacktestConfiguration BacktestConfiguration::withPriceFile(const std::string& priceFilePath) const
  {
    return BacktestConfiguration(priceFilePath, mPriceColumn, mPipelineConfig);
  }

  BacktestConfiguration BacktestConfiguration::withSeed(uint64_t seed) const
  {
    return BacktestConfiguration(mPriceFilePath, mPriceColumn,
				 PipelineConfiguration<Num>(mPipelineConfig.getScales(),
							    mPipelineConfig.getThreshold(),
							    mPipelineConfig.getStride(),
							    seed,
							    mPipelineConfig.getKMeansOptions(),
							    mPipelineConfig.getDegenerateWeightPolicy()));
  }

  BacktestConfiguration BacktestConfiguration::withThreshold(Num threshold) const
  {
    return BacktestConfiguration(mPriceFilePath, mPriceColumn,
				 PipelineConfiguration<Num>(mPipelineConfig.getScales(),
							    threshold,
							    mPipelineConfig.getStride(),
							    mPipelineConfig.getSeed(),
							    mPipelineConfig.getKMeansOptions(),
							    mPipelineConfig.getDegenerateWeightPolicy()));
  }

  BacktestConfigurationFileReader::BacktestConfigurationFileReader(const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  std::shared_ptr<BacktestConfiguration>
  BacktestConfigurationFileReader::readConfigurationFile(bool checkPriceFile) const
  {
    if (!boost::filesystem::exists(mConfigurationFileName))
      throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - configuration file "
					   + mConfigurationFileName + " does not exist");

    io::CSVReader<12> csvConfigFile(mConfigurationFileName.c_str());
    csvConfigFile.read_header(io::ignore_missing_column | io::ignore_extra_column,
			      "PriceFile", "PriceColumn", "WindowLengths", "NumClusters",
			      "NumEffectiveCenters", "Seed", "Threshold", "Stride",
			      "MaxIterations", "Tolerance", "NumRestarts", "DegeneratePolicy");

    for (const char* column : kRequiredColumns)
      if (!csvConfigFile.has_column(column))
	throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - required column "
					     + std::string(column) + " missing from " + mConfigurationFileName);

    std::string priceFileStr, priceColumnStr, windowLengthsStr, numClustersStr, numEffectiveStr;
    std::string seedStr, thresholdStr, strideStr;
    std::string maxIterationsStr, toleranceStr, numRestartsStr, policyStr;

    if (!csvConfigFile.read_row(priceFileStr, priceColumnStr, windowLengthsStr, numClustersStr,
				numEffectiveStr, seedStr, thresholdStr, strideStr,
				maxIterationsStr, toleranceStr, numRestartsStr, policyStr))
      throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - "
					   + mConfigurationFileName + " has no configuration row");

    boost::algorithm::trim(priceFileStr);
    boost::algorithm::trim(priceColumnStr);

    if (priceColumnStr.empty())
      throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - PriceColumn is empty");

    if (checkPriceFile && !boost::filesystem::exists(priceFileStr))
      throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - price file "
					   + priceFileStr + " does not exist");

    const std::array<std::size_t, kNumScales> windowLengths = parseScaleList(windowLengthsStr, "WindowLengths");
    const std::array<std::size_t, kNumScales> numClusters = parseScaleList(numClustersStr, "NumClusters");
    const std::array<std::size_t, kNumScales> numEffective = parseScaleList(numEffectiveStr, "NumEffectiveCenters");

    if (boost::algorithm::starts_with(boost::algorithm::trim_copy(seedStr), "-"))
      throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - Seed must be non-negative, got "
					   + seedStr);

    const uint64_t seed = tryCast<uint64_t>(seedStr, "Seed");
    const Num threshold = tryCast<Num>(thresholdStr, "Threshold");
    const std::size_t stride = parseCount(strideStr, "Stride");

    KMeansOptions kmeansOptions;
    if (!boost::algorithm::trim_copy(maxIterationsStr).empty())
      kmeansOptions.maxIterations = static_cast<unsigned int>(parseCount(maxIterationsStr, "MaxIterations"));

    if (!boost::algorithm::trim_copy(toleranceStr).empty())
      kmeansOptions.tolerance = tryCast<double>(toleranceStr, "Tolerance");

    if (!boost::algorithm::trim_copy(numRestartsStr).empty())
      kmeansOptions.numRestarts = static_cast<unsigned int>(parseCount(numRestartsStr, "NumRestarts"));

    const DegenerateWeightPolicy policy = parsePolicy(policyStr);

    try
      {
	PipelineConfiguration<Num>::Scales scales{{ScaleConfiguration(windowLengths[0], numClusters[0], numEffective[0]),
						   ScaleConfiguration(windowLengths[1], numClusters[1], numEffective[1]),
						   ScaleConfiguration(windowLengths[2], numClusters[2], numEffective[2])}};

	return std::make_shared<BacktestConfiguration>(priceFileStr, priceColumnStr,
						       PipelineConfiguration<Num>(scales, threshold, stride, seed,
										  kmeansOptions, policy));
      }
    catch (const LatentSourceException& e)
      {
	throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - invalid configuration in "
					     + mConfigurationFileName + ": " + e.what());
      }
  }
}
