// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "BacktestConfiguration.h"
#include "BacktestReporter.h"
#include "LatentSourcePipeline.h"
#include "OutputUtils.h"
#include "ParallelExecutors.h"
#include "PeriodSplitter.h"
#include "PriceSeriesCsvReader.h"
#include "StreamPipelineObserver.h"

namespace po = boost::program_options;

using namespace mkc_latentsource;
using lsmbacktest::Num;

void printUsage(const po::options_description& desc)
{
  std::cout << "Latent source model backtest\n\n";
  std::cout << "Usage: lsmbacktest --config <file> [options]\n\n";
  std::cout << desc << std::endl;

  std::cout << "\nExamples:\n";
  std::cout << "  # Run the backtest described by a configuration file\n";
  std::cout << "  lsmbacktest --config btc.csv\n\n";
  std::cout << "  # Same configuration on another price feed, single threaded\n";
  std::cout << "  lsmbacktest --config btc.csv --prices eth.csv --threads 1\n\n";
  std::cout << "  # Sweep several trading thresholds over one signal\n";
  std::cout << "  lsmbacktest --config btc.csv --threshold 0 --threshold 0.5 --threshold 1\n";
}

int main(int argc, char* argv[])
{
  try
    {
      po::options_description desc("Options");
      desc.add_options()
	("help,h", "Show help message")
	("config,c", po::value<std::string>(), "Backtest configuration CSV file")
	("prices,p", po::value<std::string>(), "Price CSV file, overrides PriceFile of the configuration")
	("output-dir,o", po::value<std::string>()->default_value("."), "Directory for the log file")
	("threads,t", po::value<std::size_t>()->default_value(0),
	 "Worker threads (0 = hardware concurrency, 1 = single threaded)")
	("seed,s", po::value<uint64_t>(), "Master random seed, overrides Seed of the configuration")
	("threshold", po::value<std::vector<Num>>()->composing(),
	 "Trading threshold, overrides Threshold of the configuration; repeat to sweep thresholds");

      po::variables_map vm;
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);

      if (vm.count("help"))
	{
	  printUsage(desc);
	  return 0;
	}

      if (!vm.count("config"))
	{
	  std::cerr << "Error: --config is required" << std::endl;
	  printUsage(desc);
	  return 1;
	}

      const bool pricesOverridden = vm.count("prices") > 0;
      lsmbacktest::BacktestConfigurationFileReader reader(vm["config"].as<std::string>());
      lsmbacktest::BacktestConfiguration config = *reader.readConfigurationFile(!pricesOverridden);

      if (pricesOverridden)
	config = config.withPriceFile(vm["prices"].as<std::string>());

      if (vm.count("seed"))
	config = config.withSeed(vm["seed"].as<uint64_t>());

      std::vector<Num> thresholds;
      if (vm.count("threshold"))
	{
	  thresholds = vm["threshold"].as<std::vector<Num>>();
	  config = config.withThreshold(thresholds.front());
	}

      const std::string logFileName =
	lsmbacktest::utils::createLogFileName(vm["output-dir"].as<std::string>());
      std::ofstream logFile(logFileName);
      if (!logFile)
	{
	  std::cerr << "Error: unable to open log file " << logFileName << std::endl;
	  return 1;
	}

      lsmbacktest::utils::TeeStream out(std::cout, logFile);
      out << "Log file: " << logFileName << std::endl;

      lsmbacktest::PriceSeriesCsvReader priceReader(config.getPriceFilePath(), config.getPriceColumn());
      priceReader.readFile();
      const PriceSeries<Num>& prices = priceReader.getPriceSeries();
      out << "Read " << prices.getNumEntries() << " prices from " << config.getPriceFilePath()
	  << " (column " << config.getPriceColumn() << ")" << std::endl;

      const BacktestPeriods<Num> periods = lsmbacktest::PeriodSplitter<Num>::split(prices);
      out << "Periods: cluster = " << periods.clusterPeriod.getNumEntries()
	  << ", blend = " << periods.blendPeriod.getNumEntries()
	  << ", test = " << periods.testPeriod.getNumEntries() << std::endl;

      std::shared_ptr<concurrency::IParallelExecutor> executor =
	concurrency::makeExecutor(vm["threads"].as<std::size_t>());
      auto observer = std::make_shared<lsmbacktest::StreamPipelineObserver<Num>>(out);

      LatentSourcePipeline<Num> pipeline(config.getPipelineConfiguration(), executor, observer);
      const PipelineResult<Num> result = pipeline.run(periods);

      out << std::endl;
      lsmbacktest::reporting::BacktestReporter::writeBacktestReport(out, config.getPipelineConfiguration(), result);

      if (thresholds.size() > 1)
	{
	  ThresholdSweep<Num> sweep(thresholds, config.getPipelineConfiguration().getStride(), executor);
	  lsmbacktest::reporting::BacktestReporter::writeThresholdSweep(out,
									sweep.run(result.signal, periods.testPeriod));
	}

      out.flush();
      return 0;
    }
  catch (const std::exception& e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }
}
