// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>
#include "BacktestConfiguration.h"

namespace lsmbacktest
{
namespace reporting
{

/**
 * @brief Length and first moments of a trading signal
 */
struct SignalSummary
{
    std::size_t length;
    Num mean;
    Num min;
    Num max;
};

/**
 * @brief Writes the final report of a backtest run
 *
 * Sections: configuration, pattern libraries, blend model, signal,
 * simulations and, when more than one threshold was run, the threshold sweep.
 */
class BacktestReporter
{
public:
    /**
     * @brief Write the full report of one pipeline run
     * @param out Stream to write the report to
     * @param config Configuration the pipeline was run with
     * @param result Output of LatentSourcePipeline::run
     */
    static void writeBacktestReport(std::ostream& out,
                                    const mkc_latentsource::PipelineConfiguration<Num>& config,
                                    const mkc_latentsource::PipelineResult<Num>& result);

    /**
     * @brief Write one row per threshold with the results of both policies
     */
    static void writeThresholdSweep(std::ostream& out,
                                    const std::vector<mkc_latentsource::ThresholdSweepEntry<Num>>& entries);

    /**
     * @throws mkc_latentsource::InsufficientDataException if the signal is empty
     */
    static SignalSummary summarizeSignal(const mkc_latentsource::Signal<Num>& signal);

private:
    static void writeSectionHeader(std::ostream& out, const std::string& title);

    static void writeSectionFooter(std::ostream& out);
};

} // namespace reporting
} // namespace lsmbacktest
