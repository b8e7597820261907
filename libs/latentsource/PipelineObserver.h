// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PIPELINE_OBSERVER_H
#define __PIPELINE_OBSERVER_H 1

#include <cstddef>

namespace mkc_latentsource
{
  // Forward declarations
  class ScaleConfiguration;
  template <class Num> struct LibraryBuildResult;
  template <class Num> struct BlendFit;
  template <class Num> class Signal;
  template <class Num> struct SimulationResult;

  /**
   * @class PipelineObserver
   * @brief Observer interface for the stages of a latent source backtest.
   *
   * The pipeline itself prints nothing. Progress and intermediate results are
   * pushed to an observer, which decides how (or whether) to present them.
   * Notifications arrive on the thread that called LatentSourcePipeline::run,
   * in stage order.
   *
   * @tparam Num Numeric type of the pipeline
   */
  template <class Num>
  class PipelineObserver
  {
  public:
    virtual ~PipelineObserver() = default;

    /**
     * @brief Called after the pattern library of one scale has been built
     * @param scaleIndex 0 for the first configured scale
     */
    virtual void libraryBuilt(std::size_t scaleIndex,
			      const ScaleConfiguration& scale,
			      const LibraryBuildResult<Num>& result) = 0;

    virtual void blendModelFitted(const BlendFit<Num>& fit) = 0;

    virtual void signalGenerated(const Signal<Num>& signal) = 0;

    /**
     * @param policyName "Bounded" or "Unbounded"
     */
    virtual void simulationFinished(const char* policyName,
				    const SimulationResult<Num>& result) = 0;
  };

  template <class Num>
  class NullPipelineObserver : public PipelineObserver<Num>
  {
  public:
    void libraryBuilt(std::size_t, const ScaleConfiguration&, const LibraryBuildResult<Num>&) override
    {}

    void blendModelFitted(const BlendFit<Num>&) override
    {}

    void signalGenerated(const Signal<Num>&) override
    {}

    void simulationFinished(const char*, const SimulationResult<Num>&) override
    {}
  };
}

#endif
