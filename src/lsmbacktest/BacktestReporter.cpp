// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "BacktestReporter.h"
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>

namespace lsmbacktest
{
namespace reporting
{

using namespace mkc_latentsource;

void BacktestReporter::writeBacktestReport(std::ostream& out,
                                           const PipelineConfiguration<Num>& config,
                                           const PipelineResult<Num>& result)
{
    writeSectionHeader(out, "Configuration");
    out << config << std::endl;
    writeSectionFooter(out);
    out << std::endl;

    writeSectionHeader(out, "Pattern Libraries");
    for (std::size_t s = 0; s < result.libraries.size(); ++s)
    {
        const LibraryBuildResult<Num>& library = result.libraries[s];
        out << "Scale " << s << ": window length = " << library.library.getWindowLength()
            << ", windows = " << library.numWindows
            << ", centroids = " << library.centroids.rows()
            << ", effective centers = " << library.library.getNumCenters()
            << ", inertia = " << library.inertia
            << ", iterations = " << library.iterations
            << ", converged = " << (library.converged ? "yes" : "no") << std::endl;
    }
    writeSectionFooter(out);
    out << std::endl;

    const BlendFitDiagnostics<Num>& diagnostics = result.blendFit.diagnostics;
    writeSectionHeader(out, "Blend Model");
    out << "Coefficients: " << result.blendFit.model << std::endl;
    out << "Rows: " << diagnostics.numRows << std::endl;
    out << "Rank: " << diagnostics.rank << std::endl;
    out << "R^2: " << diagnostics.rSquared << std::endl;
    out << "Residual Std Dev: " << diagnostics.residualStdDev << std::endl;
    out << "Nearest Center Fallbacks: " << diagnostics.numNearestCenterFallbacks << std::endl;
    writeSectionFooter(out);
    out << std::endl;

    const SignalSummary summary = summarizeSignal(result.signal);
    writeSectionHeader(out, "Signal");
    out << "First Timestep: " << result.signal.getFirstTimestep() << std::endl;
    out << "Length: " << summary.length << std::endl;
    out << "Mean: " << summary.mean << std::endl;
    out << "Min: " << summary.min << std::endl;
    out << "Max: " << summary.max << std::endl;
    writeSectionFooter(out);
    out << std::endl;

    writeSectionHeader(out, "Simulations");
    out << BoundedPositionPolicy::getName() << ": " << result.boundedResult << std::endl;
    out << UnboundedPositionPolicy::getName() << ": " << result.unboundedResult << std::endl;
    writeSectionFooter(out);
    out << std::endl;
}

void BacktestReporter::writeThresholdSweep(std::ostream& out,
                                           const std::vector<ThresholdSweepEntry<Num>>& entries)
{
    writeSectionHeader(out, "Threshold Sweep");
    out << "Threshold,BoundedBalance,BoundedTrades,UnboundedBalance,UnboundedPosition,UnboundedTrades"
        << std::endl;

    for (const ThresholdSweepEntry<Num>& entry : entries)
    {
        out << entry.threshold << ","
            << entry.bounded.balance << ","
            << (entry.bounded.numBuys + entry.bounded.numSells) << ","
            << entry.unbounded.balance << ","
            << entry.unbounded.position << ","
            << (entry.unbounded.numBuys + entry.unbounded.numSells) << std::endl;
    }
    writeSectionFooter(out);
    out << std::endl;
}

SignalSummary BacktestReporter::summarizeSignal(const Signal<Num>& signal)
{
    using namespace boost::accumulators;

    if (signal.empty())
        throw InsufficientDataException("BacktestReporter::summarizeSignal - signal is empty");

    accumulator_set<Num, stats<tag::mean, tag::min, tag::max>> acc;
    for (Num value : signal)
        acc(value);

    return SignalSummary{signal.getNumValues(),
                         boost::accumulators::mean(acc),
                         boost::accumulators::min(acc),
                         boost::accumulators::max(acc)};
}

void BacktestReporter::writeSectionHeader(std::ostream& out, const std::string& title)
{
    out << "=== " << title << " ===" << std::endl;
}

void BacktestReporter::writeSectionFooter(std::ostream& out)
{
    out << "===================================" << std::endl;
}

} // namespace reporting
} // namespace lsmbacktest
