// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <memory>
#include <sstream>
#include <vector>
#include "ParallelExecutors.h"
#include "TradingSimulator.h"
#include "TestUtils.h"

using namespace mkc_latentsource;

typedef TradingSimulator<NumType, BoundedPositionPolicy> BoundedSimulator;
typedef TradingSimulator<NumType, UnboundedPositionPolicy> UnboundedSimulator;

TEST_CASE("Ledger bookkeeping", "[Ledger]")
{
  Ledger<NumType> ledger;

  ledger.buy(10.0);
  ledger.buy(12.0);
  ledger.sell(15.0);

  REQUIRE(ledger.getBalance() == Catch::Approx(-7.0));
  REQUIRE(ledger.getPosition() == 1);
  REQUIRE(ledger.getNumBuys() == 2);
  REQUIRE(ledger.getNumSells() == 1);

  ledger.settle(20.0);
  REQUIRE(ledger.getBalance() == Catch::Approx(13.0));
  REQUIRE(ledger.getPosition() == 0);
  REQUIRE(ledger.getNumBuys() == 2);
}

TEST_CASE("Bounded policy swings from long to short and closes out", "[TradingSimulator]")
{
  // Signal starts at timestep 2 of a six price period
  SeriesType prices(std::vector<NumType>{0.0, 0.0, 10.0, 12.0, 15.0, 20.0});
  Signal<NumType> signal(2, std::vector<NumType>{1.0, -1.0, -1.0});

  SimulationResult<NumType> result = BoundedSimulator(0.5, 1).run(signal, prices);

  // buy 10, sell 12 (flat), sell 15 (short), cover at the final price 20
  REQUIRE(result.numBuys == 1);
  REQUIRE(result.numSells == 2);
  REQUIRE(result.numDecisions == 3);
  REQUIRE(result.closedOut);
  REQUIRE(result.position == 0);
  REQUIRE(result.balance == Catch::Approx(-10.0 + 12.0 + 15.0 - 20.0));
}

TEST_CASE("Bounded policy closes out a long position", "[TradingSimulator]")
{
  SeriesType prices(std::vector<NumType>{5.0, 6.0, 9.0});
  Signal<NumType> signal(0, std::vector<NumType>{0.8, 0.0});

  SimulationResult<NumType> result = BoundedSimulator(0.1, 1).run(signal, prices);

  REQUIRE(result.numBuys == 1);
  REQUIRE(result.closedOut);
  REQUIRE(result.balance == Catch::Approx(-5.0 + 9.0));
}

TEST_CASE("Unbounded policy accumulates inventory", "[TradingSimulator]")
{
  SeriesType prices(std::vector<NumType>{10.0, 11.0, 12.0, 13.0, 14.0});
  Signal<NumType> signal(0, std::vector<NumType>{1.0, 1.0, 1.0, -1.0});

  SECTION("Every qualifying signal trades")
  {
    SimulationResult<NumType> result = UnboundedSimulator(0.5, 1).run(signal, prices);

    REQUIRE(result.numBuys == 3);
    REQUIRE(result.numSells == 1);
    REQUIRE(result.position == 2);
    REQUIRE_FALSE(result.closedOut);
    REQUIRE(result.balance == Catch::Approx(-10.0 - 11.0 - 12.0 + 13.0));
  }

  SECTION("The bounded policy caps the same run at one unit")
  {
    SimulationResult<NumType> result = BoundedSimulator(0.5, 1).run(signal, prices);

    REQUIRE(result.numBuys == 1);
    REQUIRE(result.numSells == 1);
    REQUIRE(result.position == 0);
    REQUIRE_FALSE(result.closedOut);
    REQUIRE(result.balance == Catch::Approx(3.0));
  }
}

TEST_CASE("Unbounded policy can go net short", "[TradingSimulator]")
{
  SeriesType prices(std::vector<NumType>{4.0, 5.0, 6.0, 7.0});
  Signal<NumType> signal(0, std::vector<NumType>{-2.0, -2.0, -2.0});

  SimulationResult<NumType> result = UnboundedSimulator(1.0, 1).run(signal, prices);

  REQUIRE(result.position == -3);
  REQUIRE(result.balance == Catch::Approx(15.0));
}

TEST_CASE("Stride selects the decision timesteps", "[TradingSimulator]")
{
  SeriesType prices(std::vector<NumType>{1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
  Signal<NumType> signal(0, std::vector<NumType>{1.0, 1.0, 1.0, 1.0, 1.0});

  SimulationResult<NumType> result = UnboundedSimulator(0.0, 2).run(signal, prices);

  // Decisions at timesteps 0, 2 and 4
  REQUIRE(result.numDecisions == 3);
  REQUIRE(result.numBuys == 3);
  REQUIRE(result.balance == Catch::Approx(-(1.0 + 3.0 + 5.0)));

  REQUIRE(UnboundedSimulator(0.0, 10).run(signal, prices).numDecisions == 1);
}

TEST_CASE("Signal equal to the threshold does not trade", "[TradingSimulator]")
{
  SeriesType prices(std::vector<NumType>{1.0, 2.0, 3.0});
  Signal<NumType> signal(0, std::vector<NumType>{0.5, -0.5});

  SimulationResult<NumType> result = BoundedSimulator(0.5, 1).run(signal, prices);

  REQUIRE(result.numBuys == 0);
  REQUIRE(result.numSells == 0);
  REQUIRE(result.balance == 0.0);
  REQUIRE_FALSE(result.closedOut);
}

TEST_CASE("TradingSimulator parameter contracts", "[TradingSimulator]")
{
  REQUIRE_THROWS_AS(BoundedSimulator(0.5, 0), InvalidParameterException);
  REQUIRE_THROWS_AS(BoundedSimulator(-0.1, 1), InvalidParameterException);
  REQUIRE_THROWS_AS(UnboundedSimulator(std::numeric_limits<NumType>::quiet_NaN(), 1), InvalidParameterException);
  REQUIRE_THROWS_AS(UnboundedSimulator(std::numeric_limits<NumType>::infinity(), 1), InvalidParameterException);

  SECTION("Prices not aligned with the signal")
  {
    Signal<NumType> signal(1, std::vector<NumType>{1.0, 1.0});
    SeriesType tooShort(std::vector<NumType>{1.0, 2.0, 3.0});
    SeriesType tooLong(std::vector<NumType>{1.0, 2.0, 3.0, 4.0, 5.0});

    REQUIRE_THROWS_AS(BoundedSimulator(0.0, 1).run(signal, tooShort), InvalidParameterException);
    REQUIRE_THROWS_AS(BoundedSimulator(0.0, 1).run(signal, tooLong), InvalidParameterException);
    REQUIRE_NOTHROW(BoundedSimulator(0.0, 1).run(signal, SeriesType(std::vector<NumType>{1.0, 2.0, 3.0, 4.0})));
  }

  SECTION("Empty signal")
  {
    Signal<NumType> empty(0, std::vector<NumType>());
    REQUIRE_THROWS_AS(BoundedSimulator(0.0, 1).run(empty, SeriesType(std::vector<NumType>{1.0})),
		      InsufficientDataException);
  }
}

TEST_CASE("SimulationResult formatting", "[TradingSimulator]")
{
  SimulationResult<NumType> result{-3.0, 0, 1, 2, 3, true};

  std::ostringstream out;
  out << result;
  REQUIRE(out.str() == "balance = -3, position = 0, buys = 1, sells = 2, decisions = 3 (closed out)");
}

TEST_CASE("ThresholdSweep runs each threshold independently", "[ThresholdSweep]")
{
  SeriesType prices(std::vector<NumType>{0.0, 0.0, 10.0, 12.0, 15.0, 20.0});
  Signal<NumType> signal(2, std::vector<NumType>{1.0, -1.0, -1.0});

  ThresholdSweep<NumType> sweep(std::vector<NumType>{0.0, 0.5, 2.0}, 1,
				std::make_shared<concurrency::ThreadPoolExecutor>(3));
  std::vector<ThresholdSweepEntry<NumType>> entries = sweep.run(signal, prices);

  REQUIRE(entries.size() == 3);
  REQUIRE(entries[0].threshold == 0.0);
  REQUIRE(entries[2].threshold == 2.0);

  REQUIRE(entries[0].bounded.balance == Catch::Approx(-3.0));
  REQUIRE(entries[1].bounded.balance == Catch::Approx(-3.0));
  REQUIRE(entries[2].bounded.balance == 0.0);
  REQUIRE(entries[2].bounded.numBuys == 0);

  // Unbounded: buy 10, sell 12, sell 15, no close-out
  REQUIRE(entries[1].unbounded.balance == Catch::Approx(17.0));
  REQUIRE(entries[1].unbounded.position == -1);

  SECTION("Matches single runs")
  {
    SimulationResult<NumType> single = BoundedSimulator(0.5, 1).run(signal, prices);
    REQUIRE(entries[1].bounded.balance == single.balance);
    REQUIRE(entries[1].bounded.numSells == single.numSells);
  }

  SECTION("Invalid sweeps")
  {
    REQUIRE_THROWS_AS(ThresholdSweep<NumType>(std::vector<NumType>(), 1), InvalidParameterException);
    REQUIRE_THROWS_AS(ThresholdSweep<NumType>(std::vector<NumType>{0.1, -1.0}, 1), InvalidParameterException);
    REQUIRE_THROWS_AS(ThresholdSweep<NumType>(std::vector<NumType>{0.1}, 0), InvalidParameterException);
  }
}

TEST_CASE("ThresholdSweep keeps threshold order on a thread pool", "[ThresholdSweep]")
{
  SeriesType prices(std::vector<NumType>{10.0, 11.0, 12.0, 13.0, 14.0, 15.0});
  Signal<NumType> signal(0, std::vector<NumType>{0.5, 1.5, -2.5, 3.5, -0.25});

  std::vector<NumType> thresholds;
  for (int j = 0; j < 40; ++j)
    thresholds.push_back(0.1 * j);

  ThresholdSweep<NumType> sweep(thresholds, 1, std::make_shared<concurrency::ThreadPoolExecutor>(4));
  std::vector<ThresholdSweepEntry<NumType>> entries = sweep.run(signal, prices);

  REQUIRE(entries.size() == thresholds.size());
  for (std::size_t j = 0; j < entries.size(); ++j)
    {
      REQUIRE(entries[j].threshold == thresholds[j]);

      SimulationResult<NumType> bounded = BoundedSimulator(thresholds[j], 1).run(signal, prices);
      SimulationResult<NumType> unbounded = UnboundedSimulator(thresholds[j], 1).run(signal, prices);
      REQUIRE(entries[j].bounded.balance == bounded.balance);
      REQUIRE(entries[j].bounded.numBuys == bounded.numBuys);
      REQUIRE(entries[j].unbounded.position == unbounded.position);
      REQUIRE(entries[j].unbounded.balance == unbounded.balance);
    }

  // Above every signal magnitude nothing trades
  REQUIRE(entries.back().unbounded.numBuys + entries.back().unbounded.numSells == 0);
}
