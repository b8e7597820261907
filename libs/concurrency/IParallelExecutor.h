// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __IPARALLEL_EXECUTOR_H
#define __IPARALLEL_EXECUTOR_H 1

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace concurrency
{
  /**
   * @brief Abstract task executor used by the latent source model for its
   * independent per-timestep and per-scale computations.
   *
   * Implementations decide where a task runs (calling thread, worker pool).
   * Callers only rely on the returned future to learn about completion or
   * failure of the task.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    /// Schedule a void() task; the future carries any exception the task throws.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /// Number of tasks that may make progress at the same time.
    virtual std::size_t getConcurrency() const = 0;

    /**
     * @brief Wait for every future, then rethrow the first failure (if any).
     *
     * All futures are drained before rethrowing so that no task is still
     * running against caller-owned state when the exception escapes.
     */
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      std::exception_ptr firstFailure;

      for (auto& f : futures)
	{
	  try
	    {
	      f.get();
	    }
	  catch (...)
	    {
	      if (!firstFailure)
		firstFailure = std::current_exception();
	    }
	}

      if (firstFailure)
	std::rethrow_exception(firstFailure);
    }
  };
}

#endif
