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

#ifndef __MEL_SCHEDULER_H__
#define __MEL_SCHEDULER_H__

#include "locator.h"
#include "stationterms.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace MEL {

/*
 * Called after each completed task with the number of completed tasks and
 * the total. Calls are serialized and `completed` is increasing.
 */
using ProgressCallback =
    std::function<void(unsigned completed, unsigned total)>;

/*
 * -1 -> all available processing units, otherwise the value itself.
 * Throws ConfigurationError for 0 and values below -1
 */
unsigned resolveNumWorkers(int numThreads);

/*
 * Run task(0) ... task(numTasks-1) on a pool of `numWorkers` threads (the
 * calling thread only when numWorkers <= 1). Tasks are picked in index
 * order but may complete in any order. An exception thrown by a task or by
 * `progress` is rethrown here after all workers have stopped; the remaining
 * tasks are not started.
 */
void runParallel(size_t numTasks,
                 unsigned numWorkers,
                 const std::function<void(size_t)> &task,
                 const ProgressCallback &progress = nullptr);

/*
 * Relocate all `events` in parallel, each with the terms `terms` provides
 * for it. Every event gets a terminal result (located or failed), keyed by
 * event id; failures never propagate.
 */
std::map<std::string, RelocationResult>
relocateAll(Locator &locator,
            const std::vector<Event> &events,
            const TermProvider &terms,
            unsigned minPicks,
            unsigned numWorkers,
            const ProgressCallback &progress = nullptr);

} // namespace MEL

#endif
