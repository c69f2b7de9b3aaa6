#pragma once

#include <cstdint>    // for uint32_t
#include <vector>     // for std::vector
#include <future>     // for std::future
#include <algorithm>  // for std::min
#include "IParallelExecutor.h"

namespace theory_validator
{
  namespace concurrency
  {
    // Split [0…total) into at most exec.concurrency() chunks, submit each
    // chunk to exec.submit, waitAll, and internally loop p from chunk.start
    // to chunk.end calling body(p). Exceptions thrown by body propagate to
    // the caller after every chunk has finished.
    template<typename Body>
    void parallel_for(uint32_t total, IParallelExecutor& exec, Body body)
    {
      if (total == 0) return;

      const std::size_t workers = exec.concurrency();
      const uint32_t numTasks = static_cast<uint32_t>(workers ? workers : 1);
      const uint32_t chunkSize = (total + numTasks - 1) / numTasks; // ceil-divide

      std::vector<std::future<void>> futures;
      for (uint32_t start = 0; start < total; start += chunkSize)
	{
	  uint32_t end = std::min(total, start + chunkSize);
	  futures.emplace_back(exec.submit([=]() {
	    for (uint32_t p = start; p < end; ++p) {
	      body(p);
	    }
	  }));
	}
      exec.waitAll(futures);
    }
  }
}
