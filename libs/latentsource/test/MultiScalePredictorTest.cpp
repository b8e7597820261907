// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <memory>
#include <vector>
#include "MultiScalePredictor.h"
#include "ParallelExecutors.h"
#include "TestUtils.h"

using namespace mkc_latentsource;

namespace
{
  std::shared_ptr<const PatternLibrary<NumType>> makeConstantLibrary(std::size_t windowLength, NumType label)
  {
    std::vector<ClusterCenter<NumType>> centers;
    centers.emplace_back(std::vector<NumType>(windowLength, 0.0), label);
    return std::make_shared<const PatternLibrary<NumType>>(windowLength, std::move(centers));
  }

  LibrarySet<NumType> makeLibrarySet(std::shared_ptr<const PatternLibrary<NumType>> first,
				     std::shared_ptr<const PatternLibrary<NumType>> second,
				     std::shared_ptr<const PatternLibrary<NumType>> third)
  {
    LibrarySet<NumType>::Libraries set{{first, second, third}};
    return LibrarySet<NumType>(set);
  }

  // One center per scale: each scale always predicts its own label
  LibrarySet<NumType> makeConstantLibraries()
  {
    return makeLibrarySet(makeConstantLibrary(2, 1.0),
			  makeConstantLibrary(3, 2.0),
			  makeConstantLibrary(5, 3.0));
  }
}

TEST_CASE("MultiScalePredictor eligible range", "[MultiScalePredictor]")
{
  MultiScalePredictor<NumType> predictor(makeConstantLibraries());

  REQUIRE(predictor.getLibraries().getMaxWindowLength() == 5);
  REQUIRE(predictor.getFirstEligibleTimestep() == 5);

  // Eligible timesteps 5..L-2
  REQUIRE(predictor.getNumEligibleTimesteps(makeRampSeries(7)) == 1);
  REQUIRE(predictor.getNumEligibleTimesteps(makeRampSeries(20)) == 14);
  REQUIRE_THROWS_AS(predictor.getNumEligibleTimesteps(makeRampSeries(6)), InsufficientDataException);
}

TEST_CASE("MultiScalePredictor evaluates every scale per timestep", "[MultiScalePredictor]")
{
  MultiScalePredictor<NumType> predictor(makeConstantLibraries());
  SeriesType period = makeRampSeries(12);

  ScalePredictionSeries<NumType> series = predictor.predictPeriod(period);

  REQUIRE(series.firstTimestep == 5);
  REQUIRE(series.predictions.size() == 6);
  REQUIRE(series.numNearestCenterFallbacks == 0);

  for (const ScalePredictions<NumType>& d : series.predictions)
    {
      REQUIRE(d[0] == Catch::Approx(1.0));
      REQUIRE(d[1] == Catch::Approx(2.0));
      REQUIRE(d[2] == Catch::Approx(3.0));
    }

  REQUIRE_THROWS_AS(predictor.predictAt(period, 4), InsufficientDataException);
  REQUIRE_THROWS_AS(predictor.predictAt(period, 11), InsufficientDataException);
  REQUIRE_NOTHROW(predictor.predictAt(period, 10));
}

TEST_CASE("MultiScalePredictor uses the window ending just before the timestep", "[MultiScalePredictor]")
{
  // Scale 0 has one center matching the window [10, 11] and one far from every window
  std::vector<ClusterCenter<NumType>> centers;
  centers.emplace_back(std::vector<NumType>{10.0, 11.0}, -1.0);
  centers.emplace_back(std::vector<NumType>{30.0, 31.0}, 1.0);
  auto shortLibrary = std::make_shared<const PatternLibrary<NumType>>(2, std::move(centers));

  LibrarySet<NumType> libraries = makeLibrarySet(shortLibrary,
						 makeConstantLibrary(2, 0.0),
						 makeConstantLibrary(2, 0.0));
  MultiScalePredictor<NumType> predictor(libraries);

  // price[i] = 8 + i, so timestep 4 (price 12) sees the window price[2..3] = [10, 11]
  SeriesType period = makeRampSeries(8, 8.0);
  ScalePredictions<NumType> d = predictor.predictAt(period, 4);

  REQUIRE(d[0] == Catch::Approx(-1.0).margin(1e-6));
}

TEST_CASE("MultiScalePredictor degenerate weight policy", "[MultiScalePredictor]")
{
  const NumType huge = std::numeric_limits<NumType>::max();

  std::vector<ClusterCenter<NumType>> centers;
  centers.emplace_back(std::vector<NumType>{huge, huge}, 4.0);
  centers.emplace_back(std::vector<NumType>{-huge, -huge}, -4.0);
  auto extreme = std::make_shared<const PatternLibrary<NumType>>(2, std::move(centers));

  LibrarySet<NumType> libraries = makeLibrarySet(extreme,
						 makeConstantLibrary(2, 0.0),
						 makeConstantLibrary(2, 0.0));

  SeriesType period = makeRampSeries(6, 1.0);

  SECTION("Fail propagates the condition")
  {
    MultiScalePredictor<NumType> predictor(libraries, DegenerateWeightPolicy::Fail);
    REQUIRE_THROWS_AS(predictor.predictPeriod(period), DegenerateKernelWeightsException);
  }

  SECTION("NearestCenter substitutes and counts the fallback")
  {
    MultiScalePredictor<NumType> predictor(libraries, DegenerateWeightPolicy::NearestCenter);
    ScalePredictionSeries<NumType> series = predictor.predictPeriod(period);

    REQUIRE(series.predictions.size() == 3);
    REQUIRE(series.numNearestCenterFallbacks == 3);
    for (const ScalePredictions<NumType>& d : series.predictions)
      REQUIRE(d[0] == 4.0);
  }
}

TEST_CASE("MultiScalePredictor gives identical output on a thread pool", "[MultiScalePredictor]")
{
  std::vector<ClusterCenter<NumType>> shortCenters;
  shortCenters.emplace_back(std::vector<NumType>{100.0, 100.5, 101.0}, 0.3);
  shortCenters.emplace_back(std::vector<NumType>{100.0, 99.5, 99.0}, -0.2);

  LibrarySet<NumType> libraries = makeLibrarySet(std::make_shared<const PatternLibrary<NumType>>(3, shortCenters),
						 makeConstantLibrary(4, 0.1),
						 makeConstantLibrary(6, -0.1));

  SeriesType period = makeRandomWalkSeries(500, 11);

  MultiScalePredictor<NumType> serial(libraries);
  MultiScalePredictor<NumType> pooled(libraries, DegenerateWeightPolicy::Fail,
				      std::make_shared<concurrency::ThreadPoolExecutor>(4));

  ScalePredictionSeries<NumType> a = serial.predictPeriod(period);
  ScalePredictionSeries<NumType> b = pooled.predictPeriod(period);

  REQUIRE(a.predictions.size() == 493);
  REQUIRE(a.predictions == b.predictions);
}

TEST_CASE("LibrarySet rejects a missing library", "[LibrarySet]")
{
  LibrarySet<NumType>::Libraries set{{makeConstantLibrary(2, 0.0), nullptr, makeConstantLibrary(2, 0.0)}};
  REQUIRE_THROWS_AS(LibrarySet<NumType>(set), EmptyLibraryException);
}
