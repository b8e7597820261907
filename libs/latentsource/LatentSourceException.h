// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __LATENT_SOURCE_EXCEPTION_H
#define __LATENT_SOURCE_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_latentsource
{
  // Base class for every failure raised by the latent source model
  class LatentSourceException : public std::runtime_error
  {
  public:
    explicit LatentSourceException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~LatentSourceException() = default;
  };

  // Window length is zero or not shorter than the series it is cut from
  class InvalidWindowLengthException : public LatentSourceException
  {
  public:
    explicit InvalidWindowLengthException(const std::string& msg)
      : LatentSourceException(msg)
    {}
  };

  // Too few windows for the requested clusters, or a period too short for the longest scale
  class InsufficientDataException : public LatentSourceException
  {
  public:
    explicit InsufficientDataException(const std::string& msg)
      : LatentSourceException(msg)
    {}
  };

  class EmptyLibraryException : public LatentSourceException
  {
  public:
    explicit EmptyLibraryException(const std::string& msg)
      : LatentSourceException(msg)
    {}
  };

  // Every kernel weight vanished even after log-domain normalization
  class DegenerateKernelWeightsException : public LatentSourceException
  {
  public:
    explicit DegenerateKernelWeightsException(const std::string& msg)
      : LatentSourceException(msg)
    {}
  };

  // Under-determined or rank deficient least squares problem
  class FitErrorException : public LatentSourceException
  {
  public:
    explicit FitErrorException(const std::string& msg)
      : LatentSourceException(msg)
    {}
  };

  class InvalidParameterException : public LatentSourceException
  {
  public:
    explicit InvalidParameterException(const std::string& msg)
      : LatentSourceException(msg)
    {}
  };

  class InvalidPriceException : public LatentSourceException
  {
  public:
    explicit InvalidPriceException(const std::string& msg)
      : LatentSourceException(msg)
    {}
  };
}

#endif
