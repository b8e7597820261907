// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <memory>
#include <sstream>
#include <vector>
#include "PatternLibrary.h"
#include "PatternLibraryBuilder.h"
#include "ParallelExecutors.h"
#include "ScaleConfiguration.h"
#include "TestUtils.h"

using namespace mkc_latentsource;

TEST_CASE("ClusterCenter feature range ignores the label", "[PatternLibrary]")
{
  ClusterCenter<NumType> center(std::vector<NumType>{3.0, 9.0, 4.0}, 100.0);

  REQUIRE(center.getWindowLength() == 3);
  REQUIRE(center.getLabel() == 100.0);
  REQUIRE(center.getFeatureRange() == Catch::Approx(6.0));
}

TEST_CASE("PatternLibrary caches features and labels", "[PatternLibrary]")
{
  std::vector<ClusterCenter<NumType>> centers;
  centers.emplace_back(std::vector<NumType>{1.0, 2.0}, 0.5);
  centers.emplace_back(std::vector<NumType>{3.0, 5.0}, -1.5);

  PatternLibrary<NumType> library(2, centers);

  REQUIRE(library.getNumCenters() == 2);
  REQUIRE(library.getWindowLength() == 2);
  REQUIRE_FALSE(library.empty());

  REQUIRE(library.getFeatureMatrix().rows() == 2);
  REQUIRE(library.getFeatureMatrix().cols() == 2);
  REQUIRE(library.getFeatureMatrix()(1, 1) == 5.0);
  REQUIRE(library.getLabels()(0) == 0.5);
  REQUIRE(library.getLabels()(1) == -1.5);
  REQUIRE(library.getCenter(1).getFeature() == std::vector<NumType>{3.0, 5.0});

  SECTION("Center of the wrong length")
  {
    centers.emplace_back(std::vector<NumType>{1.0, 2.0, 3.0}, 0.0);
    REQUIRE_THROWS_AS(PatternLibrary<NumType>(2, centers), InvalidWindowLengthException);
  }
}

TEST_CASE("EffectiveCenterSelector keeps the widest swings in ascending order", "[EffectiveCenterSelector]")
{
  // Ranges: 1, 8, 3, 10, 5; the last column is the label
  PointMatrix<NumType> centroids(5, 3);
  centroids << 1.0, 2.0,  10.0,
               0.0, 8.0,  20.0,
               5.0, 2.0,  30.0,
              -5.0, 5.0,  40.0,
               4.0, 9.0,  50.0;

  EffectiveCenterSelector<NumType> selector(3);
  PatternLibrary<NumType> library = selector.select(centroids);

  REQUIRE(library.getNumCenters() == 3);
  REQUIRE(library.getWindowLength() == 2);

  // Ascending range: 5 (row 4), 8 (row 1), 10 (row 3)
  REQUIRE(library.getCenter(0).getLabel() == 50.0);
  REQUIRE(library.getCenter(1).getLabel() == 20.0);
  REQUIRE(library.getCenter(2).getLabel() == 40.0);
  REQUIRE(library.getCenter(2).getFeature() == std::vector<NumType>{-5.0, 5.0});
}

TEST_CASE("EffectiveCenterSelector ranks by features only", "[EffectiveCenterSelector]")
{
  // Row 0 has a huge label but a flat shape
  PointMatrix<NumType> centroids(2, 3);
  centroids << 1.0, 1.0, 1000.0,
               0.0, 2.0,    0.1;

  PatternLibrary<NumType> library = EffectiveCenterSelector<NumType>(1).select(centroids);

  REQUIRE(library.getNumCenters() == 1);
  REQUIRE(library.getCenter(0).getLabel() == Catch::Approx(0.1));
}

TEST_CASE("EffectiveCenterSelector breaks ties by clusterer order", "[EffectiveCenterSelector]")
{
  PointMatrix<NumType> centroids(3, 3);
  centroids << 0.0, 1.0, 1.0,
               2.0, 3.0, 2.0,
               7.0, 8.0, 3.0;

  PatternLibrary<NumType> library = EffectiveCenterSelector<NumType>(2).select(centroids);

  REQUIRE(library.getCenter(0).getLabel() == 2.0);
  REQUIRE(library.getCenter(1).getLabel() == 3.0);
}

TEST_CASE("EffectiveCenterSelector contracts", "[EffectiveCenterSelector]")
{
  PointMatrix<NumType> centroids(2, 3);
  centroids.setZero();

  REQUIRE_THROWS_AS(EffectiveCenterSelector<NumType>(0), InvalidParameterException);
  REQUIRE_THROWS_AS(EffectiveCenterSelector<NumType>(3).select(centroids), InvalidParameterException);
  REQUIRE(EffectiveCenterSelector<NumType>(2).select(centroids).getNumCenters() == 2);
}

TEST_CASE("ScaleConfiguration validation", "[ScaleConfiguration]")
{
  ScaleConfiguration scale(180, 100, 20);
  REQUIRE(scale.getWindowLength() == 180);
  REQUIRE(scale.getNumClusters() == 100);
  REQUIRE(scale.getNumEffectiveCenters() == 20);

  std::ostringstream out;
  out << scale;
  REQUIRE(out.str() == "window=180, clusters=100, effective=20");

  REQUIRE_THROWS_AS(ScaleConfiguration(0, 10, 5), InvalidWindowLengthException);
  REQUIRE_THROWS_AS(ScaleConfiguration(10, 0, 0), InvalidParameterException);
  REQUIRE_THROWS_AS(ScaleConfiguration(10, 5, 6), InvalidParameterException);
  REQUIRE_THROWS_AS(ScaleConfiguration(10, 5, 0), InvalidParameterException);
}

TEST_CASE("PatternLibraryBuilder builds a library from a period", "[PatternLibraryBuilder]")
{
  SeriesType period = makeRandomWalkSeries(300, 4242);
  ScaleConfiguration scale(10, 12, 4);

  PatternLibraryBuilder<NumType> builder(scale, 17);
  LibraryBuildResult<NumType> result = builder.build(period);

  REQUIRE(result.numWindows == 290);
  REQUIRE(result.centroids.rows() == 12);
  REQUIRE(result.centroids.cols() == 11);
  REQUIRE(result.library.getNumCenters() == 4);
  REQUIRE(result.library.getWindowLength() == 10);
  REQUIRE(result.inertia >= 0.0);

  // The kept centers are the four widest, in ascending order
  for (std::size_t j = 1; j < 4; ++j)
    REQUIRE(result.library.getCenter(j - 1).getFeatureRange()
	    <= result.library.getCenter(j).getFeatureRange());

  SECTION("Same seed, same library with a thread pool")
  {
    PatternLibraryBuilder<NumType> pooled(scale, 17, KMeansOptions(),
					  std::make_shared<concurrency::ThreadPoolExecutor>(3));
    LibraryBuildResult<NumType> other = pooled.build(period);

    REQUIRE((other.library.getFeatureMatrix() == result.library.getFeatureMatrix()));
    REQUIRE((other.library.getLabels() == result.library.getLabels()));
  }
}

TEST_CASE("PatternLibraryBuilder period contracts", "[PatternLibraryBuilder]")
{
  SECTION("Window not shorter than the period")
  {
    PatternLibraryBuilder<NumType> builder(ScaleConfiguration(20, 2, 1), 1);
    REQUIRE_THROWS_AS(builder.build(makeRampSeries(20)), InvalidWindowLengthException);
  }

  SECTION("Fewer windows than clusters")
  {
    PatternLibraryBuilder<NumType> builder(ScaleConfiguration(5, 10, 2), 1);
    REQUIRE_THROWS_AS(builder.build(makeRampSeries(12)), InsufficientDataException);
  }
}
