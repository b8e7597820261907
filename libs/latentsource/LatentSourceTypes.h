// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __LATENT_SOURCE_TYPES_H
#define __LATENT_SOURCE_TYPES_H 1

#include <array>
#include <cstddef>
#include <Eigen/Dense>

namespace mkc_latentsource
{
  /// Number of time scales blended by the ensemble (short, medium, long).
  constexpr std::size_t kNumScales = 3;

  /// One point per row: n feature coordinates followed by the label coordinate.
  template <class Num>
  using PointMatrix = Eigen::Matrix<Num, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

  template <class Num>
  using PointVector = Eigen::Matrix<Num, Eigen::Dynamic, 1>;

  /// One kernel estimate per time scale for a single timestep.
  template <class Num>
  using ScalePredictions = std::array<Num, kNumScales>;
}

#endif
