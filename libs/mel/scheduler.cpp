/***************************************************************************
 * MIT License                                                             *
 *                                                                         *
 * Copyright (C) by ETHZ/SED                                               *
 *                                                                         *
 * Permission is hereby granted, free of charge, to any person obtaining a *
 * copy of this software and associated documentation files (the           *
 * “Software”), to deal in the Software without restriction, including     *
 * without limitation the rights to use, copy, modify, merge, publish,     *
 * distribute, sublicense, and/or sell copies of the Software, and to      *
 * permit persons to whom the Software is furnished to do so, subject to   *
 * the following conditions:                                               *
 *                                                                         *
 * The above copyright notice and this permission notice shall be          *
 * included in all copies or substantial portions of the Software.         *
 *                                                                         *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND,         *
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF      *
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.  *
 * IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY    *
 * CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,    *
 * TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE       *
 * SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.                  *
 *                                                                         *
 *   Developed by Luca Scarabello <luca.scarabello@sed.ethz.ch>            *
 ***************************************************************************/

#include "scheduler.h"
#include "log.h"
#include "utils.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

using namespace std;

namespace MEL {

unsigned resolveNumWorkers(int numThreads)
{
  if (numThreads == -1)
  {
    const unsigned cores = std::thread::hardware_concurrency();
    return std::max(1u, cores);
  }
  if (numThreads < 1)
  {
    throw ConfigurationError(strf("Invalid number of threads %d", numThreads));
  }
  return static_cast<unsigned>(numThreads);
}

void runParallel(size_t numTasks,
                 unsigned numWorkers,
                 const std::function<void(size_t)> &task,
                 const ProgressCallback &progress)
{
  if (numTasks == 0) return;

  std::atomic<size_t> nextTask(0);
  std::atomic<bool> stop(false);
  std::mutex progressMutex;
  unsigned completed = 0;
  std::exception_ptr error;

  auto worker = [&]() {
    while (!stop)
    {
      const size_t idx = nextTask.fetch_add(1);
      if (idx >= numTasks) break;

      try
      {
        task(idx);
      }
      catch (...)
      {
        std::lock_guard<std::mutex> lock(progressMutex);
        if (!error) error = std::current_exception();
        stop = true;
        break;
      }

      std::lock_guard<std::mutex> lock(progressMutex);
      ++completed;
      if (!progress) continue;
      try
      {
        progress(completed, numTasks);
      }
      catch (...)
      {
        if (!error) error = std::current_exception();
        stop = true;
        break;
      }
    }
  };

  const unsigned poolSize =
      static_cast<unsigned>(std::min<size_t>(std::max(1u, numWorkers), numTasks));

  if (poolSize == 1)
  {
    worker();
  }
  else
  {
    std::vector<std::thread> workers;
    workers.reserve(poolSize);
    for (unsigned i = 0; i < poolSize; ++i) workers.emplace_back(worker);
    for (std::thread &t : workers) t.join();
  }

  if (error) std::rethrow_exception(error);
}

std::map<std::string, RelocationResult>
relocateAll(Locator &locator,
            const std::vector<Event> &events,
            const TermProvider &terms,
            unsigned minPicks,
            unsigned numWorkers,
            const ProgressCallback &progress)
{
  // one slot per task: workers never write the same element
  vector<RelocationResult> results(events.size());

  runParallel(
      events.size(), numWorkers,
      [&](size_t idx) {
        const Event &event = events[idx];
        results[idx] = relocateEvent(locator, event, terms.termsFor(event.id),
                                     minPicks);
      },
      progress);

  std::map<std::string, RelocationResult> byId;
  unsigned failed = 0;
  for (RelocationResult &res : results)
  {
    if (!res.success())
    {
      failed++;
      logWarningF("Event %s not located: %s", res.event.id.c_str(),
                  res.event.failureReason.c_str());
    }
    const string id = res.event.id;
    byId.emplace(id, std::move(res));
  }

  logInfoF("Relocated %zu events (%u failed)", events.size(), failed);
  return byId;
}

} // namespace MEL
