// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRADING_SIMULATOR_H
#define __TRADING_SIMULATOR_H 1

#include <cmath>
#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "EnsemblePredictor.h"
#include "IParallelExecutor.h"
#include "LatentSourceException.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "PriceSeries.h"

namespace mkc_latentsource
{
  /**
   * @brief Cash balance and net unit inventory of one simulation run.
   *
   * Buying one unit debits the price, selling one unit credits it. The
   * position is signed: negative means short.
   */
  template <class Num>
  class Ledger
  {
  public:
    Ledger()
      : mBalance(0),
	mPosition(0),
	mNumBuys(0),
	mNumSells(0)
    {}

    void buy(Num price)
    {
      mBalance -= price;
      ++mPosition;
      ++mNumBuys;
    }

    void sell(Num price)
    {
      mBalance += price;
      --mPosition;
      ++mNumSells;
    }

    /// Close out the whole position at price; not counted as a trade.
    void settle(Num price)
    {
      mBalance += static_cast<Num>(mPosition) * price;
      mPosition = 0;
    }

    Num getBalance() const
    {
      return mBalance;
    }

    long long getPosition() const
    {
      return mPosition;
    }

    std::size_t getNumBuys() const
    {
      return mNumBuys;
    }

    std::size_t getNumSells() const
    {
      return mNumSells;
    }

  private:
    Num mBalance;
    long long mPosition;
    std::size_t mNumBuys;
    std::size_t mNumSells;
  };

  /**
   * @brief Single-unit policy: the position stays within {-1, 0, +1} and is
   * closed out at the final price of the period.
   */
  class BoundedPositionPolicy
  {
  public:
    static bool canBuy(long long position)
    {
      return position <= 0;
    }

    static bool canSell(long long position)
    {
      return position >= 0;
    }

    static bool closeOutAtEnd()
    {
      return true;
    }

    static const char* getName()
    {
      return "Bounded";
    }
  };

  /**
   * @brief Every qualifying signal trades one more unit; the inventory is left open.
   */
  class UnboundedPositionPolicy
  {
  public:
    static bool canBuy(long long)
    {
      return true;
    }

    static bool canSell(long long)
    {
      return true;
    }

    static bool closeOutAtEnd()
    {
      return false;
    }

    static const char* getName()
    {
      return "Unbounded";
    }
  };

  template <class Num>
  struct SimulationResult
  {
    Num balance;                // final cash balance (after close-out when the policy closes out)
    long long position;         // net inventory left open at the end of the run
    std::size_t numBuys;
    std::size_t numSells;
    std::size_t numDecisions;   // timesteps at which the signal was consulted
    bool closedOut;             // a non-zero position was settled at the final price

    inline friend std::ostream& operator<< (std::ostream& strng, const SimulationResult<Num>& obj)
    {
      strng << "balance = " << obj.balance << ", position = " << obj.position
	    << ", buys = " << obj.numBuys << ", sells = " << obj.numSells
	    << ", decisions = " << obj.numDecisions;
      if (obj.closedOut)
	strng << " (closed out)";

      return strng;
    }
  };

  /**
   * @brief Replays a signal against the prices of the period it was produced from.
   *
   * Decisions are taken at timesteps first, first + stride, first + 2*stride, ...
   * up to L - 2, where first is the signal's first timestep. At timestep t with
   * s = signal[t - first]:
   *
   *   s >  threshold and Policy::canBuy(position)   -> buy one unit at price[t]
   *   s < -threshold and Policy::canSell(position)  -> sell one unit at price[t]
   *
   * A run is sequential: the ledger carries state from one timestep to the next.
   *
   * @tparam Policy BoundedPositionPolicy or UnboundedPositionPolicy.
   */
  template <class Num, class Policy>
  class TradingSimulator
  {
  public:
    /**
     * @throws InvalidParameterException if threshold is negative or not finite,
     * or stride is zero.
     */
    TradingSimulator(Num threshold, std::size_t stride)
      : mThreshold(threshold),
	mStride(stride)
    {
      if (!std::isfinite(mThreshold) || mThreshold < Num(0))
	throw InvalidParameterException("TradingSimulator::TradingSimulator - threshold must be finite and non-negative");

      if (mStride == 0)
	throw InvalidParameterException("TradingSimulator::TradingSimulator - stride must be positive");
    }

    Num getThreshold() const
    {
      return mThreshold;
    }

    std::size_t getStride() const
    {
      return mStride;
    }

    /**
     * @param prices The period the signal was generated from; its length must be
     * signal.getFirstTimestep() + signal.getNumValues() + 1.
     */
    SimulationResult<Num> run(const Signal<Num>& signal, const PriceSeries<Num>& prices) const
    {
      const std::size_t first = signal.getFirstTimestep();
      const std::size_t expected = first + signal.getNumValues() + 1;

      if (signal.empty())
	throw InsufficientDataException("TradingSimulator::run - signal is empty");

      if (prices.getNumEntries() != expected)
	throw InvalidParameterException("TradingSimulator::run - price series of length "
					+ std::to_string(prices.getNumEntries())
					+ " is not aligned with a signal of length "
					+ std::to_string(signal.getNumValues())
					+ " starting at timestep " + std::to_string(first)
					+ " (expected " + std::to_string(expected) + " prices)");

      Ledger<Num> ledger;
      std::size_t numDecisions = 0;

      for (std::size_t k = 0; k < signal.getNumValues(); k += mStride)
	{
	  const Num s = signal[k];
	  const Num price = prices[first + k];
	  ++numDecisions;

	  if (s > mThreshold && Policy::canBuy(ledger.getPosition()))
	    ledger.buy(price);

	  if (s < -mThreshold && Policy::canSell(ledger.getPosition()))
	    ledger.sell(price);
	}

      bool closedOut = false;
      if (Policy::closeOutAtEnd() && ledger.getPosition() != 0)
	{
	  ledger.settle(prices.getLastPrice());
	  closedOut = true;
	}

      return SimulationResult<Num>{ledger.getBalance(),
	  ledger.getPosition(),
	  ledger.getNumBuys(),
	  ledger.getNumSells(),
	  numDecisions,
	  closedOut};
    }

  private:
    Num mThreshold;
    std::size_t mStride;
  };

  template <class Num>
  struct ThresholdSweepEntry
  {
    Num threshold;
    SimulationResult<Num> bounded;
    SimulationResult<Num> unbounded;
  };

  /**
   * @brief Runs both policies for several thresholds over one signal.
   *
   * Each threshold is an independent run with its own ledgers, so the runs are
   * dispatched through the executor; results keep the order of the thresholds.
   */
  template <class Num>
  class ThresholdSweep
  {
  public:
    ThresholdSweep(const std::vector<Num>& thresholds,
		   std::size_t stride,
		   std::shared_ptr<concurrency::IParallelExecutor> executor = nullptr)
      : mThresholds(thresholds),
	mStride(stride),
	mExecutor(executor ? executor : std::make_shared<concurrency::SingleThreadExecutor>())
    {
      if (mThresholds.empty())
	throw InvalidParameterException("ThresholdSweep::ThresholdSweep - no thresholds given");

      // Validate every threshold before any run starts
      for (const Num& t : mThresholds)
	TradingSimulator<Num, BoundedPositionPolicy> check(t, mStride);
    }

    const std::vector<Num>& getThresholds() const
    {
      return mThresholds;
    }

    std::vector<ThresholdSweepEntry<Num>> run(const Signal<Num>& signal,
					      const PriceSeries<Num>& prices) const
    {
      std::vector<std::unique_ptr<ThresholdSweepEntry<Num>>> slots(mThresholds.size());

      concurrency::parallel_for(mThresholds.size(), *mExecutor, [&](std::size_t j) {
	  TradingSimulator<Num, BoundedPositionPolicy> bounded(mThresholds[j], mStride);
	  TradingSimulator<Num, UnboundedPositionPolicy> unbounded(mThresholds[j], mStride);

	  slots[j] = std::make_unique<ThresholdSweepEntry<Num>>(ThresholdSweepEntry<Num>{mThresholds[j],
		bounded.run(signal, prices),
		unbounded.run(signal, prices)});
	});

      std::vector<ThresholdSweepEntry<Num>> entries;
      entries.reserve(slots.size());
      for (const auto& slot : slots)
	entries.push_back(*slot);

      return entries;
    }

  private:
    std::vector<Num> mThresholds;
    std::size_t mStride;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
  };
}

#endif
