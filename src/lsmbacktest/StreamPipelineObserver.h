// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#pragma once

#include <cstddef>
#include <ostream>
#include "PipelineObserver.h"
#include "LatentSourcePipeline.h"

namespace lsmbacktest
{
  /**
   * @brief Writes one progress line per pipeline stage to an output stream.
   */
  template <class Num>
  class StreamPipelineObserver : public mkc_latentsource::PipelineObserver<Num>
  {
  public:
    explicit StreamPipelineObserver(std::ostream& out)
      : mOut(out)
    {}

    void libraryBuilt(std::size_t scaleIndex,
		      const mkc_latentsource::ScaleConfiguration& scale,
		      const mkc_latentsource::LibraryBuildResult<Num>& result) override
    {
      mOut << "Scale " << scaleIndex << " (" << scale << "): clustered "
	   << result.numWindows << " windows, kept "
	   << result.library.getNumCenters() << " centers, inertia = " << result.inertia
	   << ", iterations = " << result.iterations
	   << (result.converged ? "" : " (not converged)") << std::endl;
    }

    void blendModelFitted(const mkc_latentsource::BlendFit<Num>& fit) override
    {
      mOut << "Blend model fitted on " << fit.diagnostics.numRows << " rows: "
	   << fit.model << ", R^2 = " << fit.diagnostics.rSquared << std::endl;
    }

    void signalGenerated(const mkc_latentsource::Signal<Num>& signal) override
    {
      mOut << "Signal generated: " << signal.getNumValues() << " values from timestep "
	   << signal.getFirstTimestep() << std::endl;
    }

    void simulationFinished(const char* policyName,
			    const mkc_latentsource::SimulationResult<Num>& result) override
    {
      mOut << policyName << " simulation: " << result << std::endl;
    }

  private:
    std::ostream& mOut;
  };
}
