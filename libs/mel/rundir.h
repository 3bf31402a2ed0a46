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

#ifndef __MEL_RUNDIR_H__
#define __MEL_RUNDIR_H__

#include "catalog.h"
#include "config.h"
#include "stationterms.h"

#include <string>
#include <vector>

namespace MEL {

enum class Termination
{
  converged,
  maxIterationsReached,
  aborted
};

std::string toString(Termination termination);

Termination terminationFromString(const std::string &str);

struct TerminationRecord
{
  Termination termination = Termination::aborted;
  unsigned numIterations  = 0;
  std::string reason;
};

struct IterationStatistics
{
  unsigned numEvents  = 0;
  unsigned numLocated = 0;
  unsigned numFailed  = 0;
  Dispersion dispersion; // of the residuals of the located events
};

/*
 * Snapshot of a committed iteration
 */
struct Iteration
{
  unsigned index = 0; // 1-based
  std::vector<Event> events;
  StationTermSet staticTerms; // terms produced by the iteration
  SourceTermSet sourceTerms;
  IterationStatistics statistics;
};

struct StepRecord
{
  Step step;
  std::vector<Iteration> iterations; // sorted by index
  bool terminated = false;
  TerminationRecord termination;
};

/*
 * Persistent state of a run:
 *
 * <path>/input/events.csv, picks.csv
 * <path>/<step>/iteration-NNN/events/<eventId>.csv
 *                            /static-terms.csv
 *                            /source-terms.csv
 *                            /statistics.csv
 * <path>/<step>/termination.csv
 * <path>/<step>/processing.log
 * <path>/harvest/
 *
 * The store has a single writer. An iteration is written in a staging
 * directory and renamed when complete, so readers never see a partial
 * iteration.
 */
class RunDirectory
{
public:
  explicit RunDirectory(const std::string &path);

  const std::string &path() const { return _path; }

  std::string inputPath() const;
  std::string stepPath(Step step) const;
  std::string iterationPath(Step step, unsigned index) const;
  std::string terminationFile(Step step) const;
  std::string logFile(Step step) const;
  std::string harvestPath() const;

  bool hasInput() const;

  // throws PathAlreadyExists when the input exists and !force
  void writeInput(const Catalog &catalog, bool force = false);

  // throws FileNotFound
  Catalog readInput() const;

  /*
   * Commit an iteration. The index must follow the last committed one
   * (1 for the first). Throws PathAlreadyExists if the index is already
   * committed.
   */
  void writeIteration(Step step, const Iteration &iteration);

  void writeTermination(Step step, const TerminationRecord &record);

  // the step completed (termination record committed)
  bool exists(Step step) const;

  // at least one iteration committed
  bool hasIterations(Step step) const;

  // sorted committed iteration indices
  std::vector<unsigned> iterationIndices(Step step) const;

  /*
   * Load a committed iteration. Event picks are filled from the input
   * catalog when available. Throws FileNotFound.
   */
  Iteration readIteration(Step step, unsigned index, bool withEvents = true) const;

  // throws FileNotFound for a step never computed
  StepRecord readStep(Step step) const;

  // throws FileNotFound
  TerminationRecord readTermination(Step step) const;

  // per-event files of an iteration, sorted
  std::vector<std::string> listEventFiles(Step step, unsigned index) const;

  // remove all data of a step
  void purge(Step step);

  //
  // File formats
  //
  static void writeEventFile(const Event &event, const std::string &filename);
  static Event readEventFile(const std::string &filename);

  static void writeStaticTerms(const StationTermSet &terms,
                               const std::string &filename);
  static StationTermSet readStaticTerms(const std::string &filename);

  static void writeSourceTerms(const SourceTermSet &terms,
                               const std::string &filename);
  static SourceTermSet readSourceTerms(const std::string &filename);

  static void writeStatistics(unsigned index,
                              const IterationStatistics &stats,
                              const std::string &filename);
  static IterationStatistics readStatistics(const std::string &filename);

  // event id to a file name safe string
  static std::string eventFileName(const std::string &eventId);

private:
  void removeStaleStaging(Step step) const;

  const std::string _path;
};

} // namespace MEL

#endif
