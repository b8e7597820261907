// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __KERNEL_PREDICTOR_H
#define __KERNEL_PREDICTOR_H 1

#include <cmath>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "LatentSourceException.h"
#include "LatentSourceTypes.h"
#include "PatternLibrary.h"

namespace mkc_latentsource
{
  /**
   * @brief What a caller does when every kernel weight of a query vanishes.
   *
   * Fail propagates DegenerateKernelWeightsException. NearestCenter answers
   * with the label of the library center closest to the query.
   */
  enum class DegenerateWeightPolicy
  {
    Fail,
    NearestCenter
  };

  /**
   * @brief Nadaraya-Watson estimate of the next price change from a library of
   * effective centers.
   *
   * weight_j   = exp(-0.25 * |x - feature_j|^2)
   * estimate   = sum_j label_j * weight_j / sum_j weight_j
   *
   * For price windows the squared distances are large and every weight
   * underflows in double precision. The sum is therefore evaluated in the log
   * domain: all exponents are shifted by the largest one before exponentiating,
   * which leaves the ratio unchanged and makes the largest term exactly 1.
   */
  template <class Num>
  class KernelPredictor
  {
  public:
    static constexpr double kDistanceScale = 0.25;

    explicit KernelPredictor(std::shared_ptr<const PatternLibrary<Num>> library)
      : mLibrary(library)
    {
      if (!mLibrary)
	throw EmptyLibraryException("KernelPredictor::KernelPredictor - library is null");
    }

    const PatternLibrary<Num>& getLibrary() const
    {
      return *mLibrary;
    }

    std::size_t getWindowLength() const
    {
      return mLibrary->getWindowLength();
    }

    /**
     * @param query Pointer to the first of length prices of the query window.
     *
     * @throws EmptyLibraryException if the library holds no centers.
     * @throws InvalidWindowLengthException if length differs from the library window length.
     * @throws DegenerateKernelWeightsException if the weight sum is not positive
     * after normalization (non-finite distances).
     */
    Num predict(const Num* query, std::size_t length) const
    {
      const PointVector<Num> exponents = computeExponents(query, length, "predict");

      if (exponents.hasNaN())
	throw DegenerateKernelWeightsException("KernelPredictor::predict - kernel exponent is NaN");

      const Num maxExponent = exponents.maxCoeff();
      if (!std::isfinite(maxExponent))
	throw DegenerateKernelWeightsException("KernelPredictor::predict - all "
					       + std::to_string(exponents.size())
					       + " kernel weights vanish (largest exponent is not finite)");

      const PointVector<Num> weights = (exponents.array() - maxExponent).exp().matrix();
      const Num denominator = weights.sum();

      if (!(denominator > Num(0)) || !std::isfinite(denominator))
	throw DegenerateKernelWeightsException("KernelPredictor::predict - kernel weight sum is zero after normalization");

      const Num estimate = weights.dot(mLibrary->getLabels()) / denominator;
      if (!std::isfinite(estimate))
	throw DegenerateKernelWeightsException("KernelPredictor::predict - weighted label average is not finite");

      return estimate;
    }

    Num predict(const std::vector<Num>& query) const
    {
      return predict(query.data(), query.size());
    }

    /**
     * @brief Label of the library center closest to the query (ties: lowest index).
     *
     * Callers use this as the fallback for a DegenerateKernelWeightsException.
     */
    Num nearestCenterLabel(const Num* query, std::size_t length) const
    {
      checkQuery(length, "nearestCenterLabel");

      // Halved differences of finite values cannot overflow; dividing by the
      // largest of them keeps every norm finite and preserves the ordering.
      const Eigen::Map<const PointVector<Num>> x(query, static_cast<Eigen::Index>(length));
      PointMatrix<Num> halfDiffs = (mLibrary->getFeatureMatrix() * Num(0.5)).rowwise()
	- (x * Num(0.5)).transpose();

      const Num largest = halfDiffs.cwiseAbs().maxCoeff();
      if (largest > Num(0))
	halfDiffs /= largest;

      Eigen::Index best = 0;
      halfDiffs.rowwise().squaredNorm().minCoeff(&best);
      return mLibrary->getLabels()(best);
    }

    Num nearestCenterLabel(const std::vector<Num>& query) const
    {
      return nearestCenterLabel(query.data(), query.size());
    }

  private:
    void checkQuery(std::size_t length, const char* method) const
    {
      if (mLibrary->empty())
	throw EmptyLibraryException(std::string("KernelPredictor::") + method
				    + " - library for window length "
				    + std::to_string(mLibrary->getWindowLength()) + " has no centers");

      if (length != mLibrary->getWindowLength())
	throw InvalidWindowLengthException(std::string("KernelPredictor::") + method
					   + " - query length " + std::to_string(length)
					   + " does not match library window length "
					   + std::to_string(mLibrary->getWindowLength()));
    }

    PointVector<Num> computeExponents(const Num* query, std::size_t length, const char* method) const
    {
      checkQuery(length, method);

      const Eigen::Map<const PointVector<Num>> x(query, static_cast<Eigen::Index>(length));
      const PointVector<Num> squaredDistances =
	(mLibrary->getFeatureMatrix().rowwise() - x.transpose()).rowwise().squaredNorm();

      return squaredDistances * static_cast<Num>(-kDistanceScale);
    }

  private:
    std::shared_ptr<const PatternLibrary<Num>> mLibrary;
  };
}

#endif
