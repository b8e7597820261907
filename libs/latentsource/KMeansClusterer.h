// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __KMEANS_CLUSTERER_H
#define __KMEANS_CLUSTERER_H 1

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "IParallelExecutor.h"
#include "LatentSourceException.h"
#include "LatentSourceTypes.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "RngUtils.h"

namespace mkc_latentsource
{
  /**
   * @brief Tuning knobs of the Lloyd relocation heuristic.
   *
   * tolerance is relative: the run stops once the total squared centroid
   * shift of one iteration falls below tolerance times the mean per-column
   * variance of the data.
   */
  struct KMeansOptions
  {
    unsigned int maxIterations = 300;
    double tolerance = 1e-4;
    unsigned int numRestarts = 10;
  };

  template <class Num>
  struct KMeansResult
  {
    PointMatrix<Num> centers;               // k rows, one centroid per row
    std::vector<std::size_t> assignments;   // cluster index of every input point
    Num inertia;                            // total within-cluster squared distance
    unsigned int iterations;                // Lloyd iterations of the winning restart
    unsigned int restartIndex;              // which restart produced the result
    bool converged;
  };

  /**
   * @brief k-means clustering with k-means++ seeding and several restarts.
   *
   * All randomness comes from the caller supplied seed: restart r draws from
   * an engine seeded with derive_seed(seed, {r}), so two clusterers built with
   * the same arguments return identical centroids for identical input,
   * independently of the executor used for the distance computations.
   *
   * @tparam Num Floating point type of the points.
   */
  template <class Num>
  class KMeansClusterer
  {
  public:
    typedef std::mt19937_64 Engine;

    /**
     * @param numClusters Number of centroids k (must be positive).
     * @param seed Master seed of the random initialization.
     * @param options Iteration limits and restart count.
     * @param executor Executor for the per-point distance loop; a
     * SingleThreadExecutor is used when null.
     */
    KMeansClusterer(std::size_t numClusters,
		    uint64_t seed,
		    const KMeansOptions& options = KMeansOptions(),
		    std::shared_ptr<concurrency::IParallelExecutor> executor = nullptr)
      : mNumClusters(numClusters),
	mSeed(seed),
	mOptions(options),
	mExecutor(executor ? executor : std::make_shared<concurrency::SingleThreadExecutor>())
    {
      if (mNumClusters == 0)
	throw InvalidParameterException("KMeansClusterer::KMeansClusterer - number of clusters must be positive");

      if (mOptions.maxIterations == 0)
	throw InvalidParameterException("KMeansClusterer::KMeansClusterer - maximum iterations must be positive");

      if (mOptions.numRestarts == 0)
	throw InvalidParameterException("KMeansClusterer::KMeansClusterer - number of restarts must be positive");

      if (!(mOptions.tolerance >= 0.0))
	throw InvalidParameterException("KMeansClusterer::KMeansClusterer - tolerance must be non-negative");
    }

    std::size_t getNumClusters() const
    {
      return mNumClusters;
    }

    uint64_t getSeed() const
    {
      return mSeed;
    }

    const KMeansOptions& getOptions() const
    {
      return mOptions;
    }

    /**
     * @brief Partition the rows of points into k clusters.
     *
     * @throws InsufficientDataException if k exceeds the number of points.
     */
    KMeansResult<Num> cluster(const PointMatrix<Num>& points) const
    {
      const std::size_t numPoints = static_cast<std::size_t>(points.rows());

      if (mNumClusters > numPoints)
	throw InsufficientDataException("KMeansClusterer::cluster - requested "
					+ std::to_string(mNumClusters) + " clusters but only "
					+ std::to_string(numPoints) + " windows are available");

      const Num shiftTolerance = scaledTolerance(points);

      KMeansResult<Num> best;
      bool haveBest = false;

      for (unsigned int r = 0; r < mOptions.numRestarts; ++r)
	{
	  Engine rng = rng_utils::make_engine<Engine>(rng_utils::derive_seed(mSeed, {static_cast<uint64_t>(r)}));
	  KMeansResult<Num> candidate = runLloyd(points, seedCenters(points, rng), shiftTolerance);
	  candidate.restartIndex = r;

	  // Strict comparison keeps the earliest restart on ties
	  if (!haveBest || candidate.inertia < best.inertia)
	    {
	      best = std::move(candidate);
	      haveBest = true;
	    }
	}

      return best;
    }

  private:
    static Num squaredDistance(const PointMatrix<Num>& a, std::size_t rowA,
			       const PointMatrix<Num>& b, std::size_t rowB)
    {
      return (a.row(rowA) - b.row(rowB)).squaredNorm();
    }

    Num scaledTolerance(const PointMatrix<Num>& points) const
    {
      if (points.rows() < 2)
	return Num(0);

      const Eigen::Matrix<Num, 1, Eigen::Dynamic> mean = points.colwise().mean();
      const Num meanVariance = ((points.rowwise() - mean).array().square().colwise().sum()
				/ static_cast<Num>(points.rows())).mean();

      return meanVariance * static_cast<Num>(mOptions.tolerance);
    }

    // k-means++: each new center is drawn with probability proportional to its
    // squared distance from the nearest center chosen so far
    PointMatrix<Num> seedCenters(const PointMatrix<Num>& points, Engine& rng) const
    {
      const std::size_t numPoints = static_cast<std::size_t>(points.rows());
      PointMatrix<Num> centers(mNumClusters, points.cols());

      std::size_t chosen = rng_utils::get_random_index(rng, numPoints);
      centers.row(0) = points.row(chosen);

      std::vector<Num> minDist(numPoints);
      concurrency::parallel_for(numPoints, *mExecutor, [&](std::size_t i) {
	  minDist[i] = squaredDistance(points, i, centers, 0);
	});

      for (std::size_t c = 1; c < mNumClusters; ++c)
	{
	  Num total(0);
	  for (const Num& d : minDist)
	    total += d;

	  if (total > Num(0))
	    {
	      const Num target = static_cast<Num>(rng_utils::get_random_uniform_01(rng)) * total;
	      Num running(0);
	      chosen = numPoints - 1;
	      for (std::size_t i = 0; i < numPoints; ++i)
		{
		  running += minDist[i];
		  if (running > target)
		    {
		      chosen = i;
		      break;
		    }
		}
	    }
	  else
	    chosen = rng_utils::get_random_index(rng, numPoints);

	  centers.row(c) = points.row(chosen);

	  concurrency::parallel_for(numPoints, *mExecutor, [&](std::size_t i) {
	      const Num d = squaredDistance(points, i, centers, c);
	      if (d < minDist[i])
		minDist[i] = d;
	    });
	}

      return centers;
    }

    // Assign every point to its nearest center; ties go to the lower index
    void assignPoints(const PointMatrix<Num>& points,
		      const PointMatrix<Num>& centers,
		      std::vector<std::size_t>& assignments,
		      std::vector<Num>& distances) const
    {
      const std::size_t numPoints = static_cast<std::size_t>(points.rows());

      concurrency::parallel_for(numPoints, *mExecutor, [&](std::size_t i) {
	  std::size_t bestCenter = 0;
	  Num bestDist = std::numeric_limits<Num>::max();

	  for (std::size_t c = 0; c < mNumClusters; ++c)
	    {
	      const Num d = squaredDistance(points, i, centers, c);
	      if (d < bestDist)
		{
		  bestDist = d;
		  bestCenter = c;
		}
	    }

	  assignments[i] = bestCenter;
	  distances[i] = bestDist;
	});
    }

    KMeansResult<Num> runLloyd(const PointMatrix<Num>& points,
			       PointMatrix<Num> centers,
			       Num shiftTolerance) const
    {
      const std::size_t numPoints = static_cast<std::size_t>(points.rows());
      std::vector<std::size_t> assignments(numPoints, 0);
      std::vector<Num> distances(numPoints, Num(0));

      assignPoints(points, centers, assignments, distances);

      unsigned int iteration = 0;
      bool converged = false;

      while (iteration < mOptions.maxIterations)
	{
	  ++iteration;

	  PointMatrix<Num> updated = PointMatrix<Num>::Zero(centers.rows(), centers.cols());
	  std::vector<std::size_t> counts(mNumClusters, 0);

	  for (std::size_t i = 0; i < numPoints; ++i)
	    {
	      updated.row(assignments[i]) += points.row(i);
	      ++counts[assignments[i]];
	    }

	  for (std::size_t c = 0; c < mNumClusters; ++c)
	    {
	      if (counts[c] > 0)
		updated.row(c) /= static_cast<Num>(counts[c]);
	      else
		relocateEmptyCluster(points, distances, updated, c);
	    }

	  const Num shift = (updated - centers).squaredNorm();
	  centers = std::move(updated);

	  std::vector<std::size_t> previous(assignments);
	  assignPoints(points, centers, assignments, distances);

	  if (assignments == previous || shift <= shiftTolerance)
	    {
	      converged = true;
	      break;
	    }
	}

      Num inertia(0);
      for (const Num& d : distances)
	inertia += d;

      KMeansResult<Num> result;
      result.centers = std::move(centers);
      result.assignments = std::move(assignments);
      result.inertia = inertia;
      result.iterations = iteration;
      result.restartIndex = 0;
      result.converged = converged;
      return result;
    }

    // An empty cluster takes over the point currently farthest from its centroid
    static void relocateEmptyCluster(const PointMatrix<Num>& points,
				     std::vector<Num>& distances,
				     PointMatrix<Num>& centers,
				     std::size_t cluster)
    {
      std::size_t farthest = 0;
      for (std::size_t i = 1; i < distances.size(); ++i)
	{
	  if (distances[i] > distances[farthest])
	    farthest = i;
	}

      centers.row(cluster) = points.row(farthest);
      distances[farthest] = Num(0);
    }

  private:
    std::size_t mNumClusters;
    uint64_t mSeed;
    KMeansOptions mOptions;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
  };
}

#endif
