// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PARALLEL_FOR_H
#define __PARALLEL_FOR_H 1

#include <algorithm>
#include <cstddef>
#include <future>
#include <vector>
#include "IParallelExecutor.h"

namespace concurrency
{
  /**
   * @brief Run body(i) for every i in [0, total) in contiguous chunks.
   *
   * [0, total) is split into chunks of chunkSize indices (or, when chunkSize is
   * zero, into one chunk per unit of executor concurrency). Each chunk becomes one
   * task. The call returns after every chunk has finished; the first exception
   * thrown by body is rethrown afterwards.
   *
   * body must only write state owned by index i.
   */
  template <typename Body>
  void parallel_for_chunked(std::size_t total,
			    IParallelExecutor& exec,
			    Body body,
			    std::size_t chunkSize)
  {
    if (total == 0)
      return;

    if (chunkSize == 0)
      {
	const std::size_t numTasks = std::max<std::size_t>(exec.getConcurrency(), 1);
	chunkSize = (total + numTasks - 1) / numTasks;
      }

    std::vector<std::future<void>> futures;
    futures.reserve((total + chunkSize - 1) / chunkSize);

    try
      {
	for (std::size_t start = 0; start < total; start += chunkSize)
	  {
	    const std::size_t end = std::min(total, start + chunkSize);
	    futures.emplace_back(exec.submit([&body, start, end]() {
		  for (std::size_t i = start; i < end; ++i)
		    body(i);
		}));
	  }
      }
    catch (...)
      {
	// Tasks already queued still reference body
	for (auto& f : futures)
	  f.wait();
	throw;
      }

    exec.waitAll(futures);
  }

  template <typename Body>
  void parallel_for(std::size_t total, IParallelExecutor& exec, Body body)
  {
    parallel_for_chunked(total, exec, body, 0);
  }
}

#endif
