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

#ifndef __MEL_PIPELINE_H__
#define __MEL_PIPELINE_H__

#include "catalog.h"
#include "config.h"
#include "locator.h"
#include "rundir.h"
#include "scheduler.h"

#include <string>
#include <vector>

namespace MEL {

struct StepReport
{
  Step step;
  bool skipped = false; // complete on disk already, nothing done
  bool resumed = false; // continued from previously committed iterations
  Termination termination = Termination::aborted;
  unsigned numIterations  = 0;
  std::vector<IterationStatistics> statistics; // one per iteration
};

/*
 * Relative change of the dispersion below `tolerance`. An undefined value
 * is never converged, a zero `previous` only when `current` is zero too.
 */
bool isConverged(double previous, double current, double tolerance);

/*
 * Runs the requested steps in order, storing every iteration in the run
 * directory:
 *  A: one location pass without station terms
 *  B: iterative location with static station terms
 *  C: iterative location with source-specific station terms
 *
 * A step complete on disk is skipped unless forced, in which case it is
 * removed and computed again. A step interrupted between iterations is
 * resumed.
 */
class Pipeline
{
public:
  // throws ConfigurationError
  Pipeline(const Config &config,
           Locator &locator,
           RunDirectory &runDir,
           const ProgressCallback &progress = nullptr);

  Pipeline(const Pipeline &)        = delete;
  void operator=(const Pipeline &) = delete;

  /*
   * Store `input` in the run directory (when not stored already or when
   * forced) and run the steps
   */
  std::vector<StepReport> run(const Catalog &input, bool force = false);

  // run the steps on the input already stored in the run directory
  std::vector<StepReport> run(bool force = false);

  unsigned numWorkers() const { return _numWorkers; }

private:
  StepReport runStep(Step step, const Step *previous, bool force);

  StepReport runSingleEventStep(const std::vector<Event> &events);

  StepReport runIterativeStep(Step step,
                              const std::vector<Event> &startEvents,
                              bool resume);

  // events to relocate at the first iteration of `step`
  std::vector<Event> startingEvents(Step step, const Step *previous) const;

  // fallback and first iteration terms of step C
  StationTermSet staticBaseline() const;

  Iteration relocate(unsigned index,
                     const std::vector<Event> &events,
                     const TermProvider &terms);

  const Config _config;
  Locator &_locator;
  RunDirectory &_runDir;
  const ProgressCallback _progress;
  const unsigned _numWorkers;
  Catalog _input;
};

} // namespace MEL

#endif
