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

#ifndef __MEL_HARVEST_H__
#define __MEL_HARVEST_H__

#include "rundir.h"
#include "scheduler.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace MEL {

struct HarvestOptions
{
  // per event and step keep only the last iteration the event was located
  // in (its last state when never located)
  bool weed = false;
  // keep only the last iteration of each step
  bool lastIter = false;
  // replace an existing harvest
  bool force = false;
  // -1 -> all processing units
  int numThreads = 1;
  // steps to harvest, all the computed ones when empty
  std::vector<Step> steps;
};

struct HarvestSummary
{
  unsigned numEventEntries   = 0;
  unsigned numArrivalEntries = 0;
  // per-event files that could not be read, with the reason
  std::vector<std::pair<std::string, std::string>> failedFiles;
};

/*
 * Collect the committed iterations of a run directory into a compact cache
 * in <run>/harvest:
 *
 *  events.csv        step,iteration,id,isotime,latitude,longitude,depth,
 *                    rms,status,failureReason
 *  arrivals.csv      step,iteration,eventId,networkCode,stationLabel,phase,
 *                    residual,correction,distance,weight
 *  static-terms.csv  step,iteration,station,phase,correction,count
 *  source-terms.csv  step,iteration,eventId,station,phase,correction,count
 *  convergence.csv   step,iteration,events,located,failed,residuals,median,
 *                    mad,smad,rms
 *  failures.csv      file,reason
 *
 * Per-event files are read in parallel. A file that cannot be read is
 * reported in the summary and doesn't stop the harvest. Throws
 * PathAlreadyExists when a harvest exists and !force.
 */
HarvestSummary harvest(const RunDirectory &runDir,
                       const HarvestOptions &options,
                       const ProgressCallback &progress = nullptr);

/*
 * Read-only access to a harvest
 */
class HarvestCache
{
public:
  struct EventEntry
  {
    Step step;
    unsigned iteration;
    Event event; // with arrivals
  };

  struct ArrivalEntry
  {
    Step step;
    unsigned iteration;
    std::string eventId;
    Arrival arrival;
  };

  struct SourceTermEntry
  {
    Step step;
    unsigned iteration;
    std::string eventId;
    std::string station;
    std::string phase;
    StationTerm term;
  };

  struct ConvergenceEntry
  {
    Step step;
    unsigned iteration;
    IterationStatistics statistics;
  };

  struct ResidualHistogram
  {
    std::vector<double> distanceEdges; // km
    std::vector<double> residualEdges; // secs
    // counts[i][j]: distance bin i, residual bin j
    std::vector<std::vector<unsigned>> counts;
  };

  // throws FileNotFound when the harvest doesn't exist
  explicit HarvestCache(const std::string &harvestDir);

  std::vector<Step> steps() const;

  std::vector<unsigned> iterations(Step step) const;

  // events stored for an iteration, sorted by id
  std::vector<Event> events(Step step, unsigned iteration) const;

  // latest stored state of each event of a step, sorted by id
  std::vector<Event> events(Step step) const;

  // arrivals of the latest stored state of each event
  std::vector<ArrivalEntry> arrivals(Step step,
                                     const std::string &station,
                                     const std::string &phase) const;

  // static terms of the last stored iteration
  StationTermSet staticTerms(Step step) const;

  // source-specific terms of the last stored iteration, one per event
  std::vector<SourceTermEntry> sourceTerms(Step step,
                                           const std::string &station,
                                           const std::string &phase) const;

  // sorted by iteration
  std::vector<ConvergenceEntry> convergence(Step step) const;

  /*
   * Residuals (weight > 0) of the latest stored state of each located
   * event, binned by distance and value: bin i covers
   * [edges[i], edges[i+1])
   */
  ResidualHistogram residualHistogram(Step step,
                                      const std::vector<double> &distanceEdges,
                                      const std::vector<double> &residualEdges) const;

  const std::vector<std::pair<std::string, std::string>> &failedFiles() const
  {
    return _failedFiles;
  }

private:
  std::vector<EventEntry> _events;
  std::map<std::pair<Step, unsigned>, StationTermSet> _staticTerms;
  std::vector<SourceTermEntry> _sourceTerms;
  std::vector<ConvergenceEntry> _convergence;
  std::vector<std::pair<std::string, std::string>> _failedFiles;
};

} // namespace MEL

#endif
