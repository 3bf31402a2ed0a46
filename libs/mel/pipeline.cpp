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

#include "pipeline.h"
#include "log.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <memory>

using namespace std;

namespace {

const MEL::Config &validated(const MEL::Config &config)
{
  config.validate();
  return config;
}

} // namespace

namespace MEL {

bool isConverged(double previous, double current, double tolerance)
{
  if (!std::isfinite(previous) || !std::isfinite(current)) return false;
  if (previous == 0) return current == 0;
  return std::abs(current - previous) / previous < tolerance;
}

Pipeline::Pipeline(const Config &config,
                   Locator &locator,
                   RunDirectory &runDir,
                   const ProgressCallback &progress)
    : _config(validated(config)), _locator(locator), _runDir(runDir),
      _progress(progress), _numWorkers(resolveNumWorkers(config.numThreads))
{
  logDebugF("Pipeline: %u relocation workers", _numWorkers);
}

std::vector<StepReport> Pipeline::run(const Catalog &input, bool force)
{
  if (_runDir.hasInput() && !force)
  {
    logInfoF("Using the input catalog stored in %s", _runDir.path().c_str());
  }
  else
  {
    if (!createDirectories(_runDir.path()))
    {
      throw Exception("Unable to create run directory " + _runDir.path());
    }
    _runDir.writeInput(input, true);
  }
  return run(force);
}

std::vector<StepReport> Pipeline::run(bool force)
{
  _input = _runDir.readInput();
  if (_input.empty())
  {
    throw Exception("The input catalog is empty");
  }

  string steps;
  for (Step step : _config.steps) steps += " " + toString(step);
  logInfoF("Processing %zu events, steps:%s", _input.size(), steps.c_str());

  vector<StepReport> reports;
  const Step *previous = nullptr;
  for (const Step &step : _config.steps)
  {
    reports.push_back(runStep(step, previous, force));
    previous = &step;
  }
  return reports;
}

StepReport Pipeline::runStep(Step step, const Step *previous, bool force)
{
  if (_runDir.exists(step))
  {
    if (!force)
    {
      StepReport report;
      report.step      = step;
      report.skipped   = true;
      const TerminationRecord rec = _runDir.readTermination(step);
      report.termination   = rec.termination;
      report.numIterations = rec.numIterations;
      logInfoF("Step %s already computed (%s), skipping it",
               toString(step).c_str(), toString(rec.termination).c_str());
      return report;
    }
  }

  if (force)
  {
    _runDir.purge(step);
  }

  if (!createDirectories(_runDir.stepPath(step)))
  {
    throw Exception("Unable to create directory " + _runDir.stepPath(step));
  }

  // processing log of the step
  std::unique_ptr<Logger::File> processingLog = Logger::toFile(
      _runDir.logFile(step),
      {Logger::Level::info, Logger::Level::warning, Logger::Level::error});

  const bool resume = _runDir.hasIterations(step);

  logInfoF("Step %s: %s", toString(step).c_str(),
           resume ? "resuming" : "starting");

  StepReport report;
  if (step == Step::A)
  {
    if (resume)
    {
      // the single iteration is there, only the termination is missing
      const Iteration it = _runDir.readIteration(step, 1, false);
      report.step          = step;
      report.resumed       = true;
      report.numIterations = 1;
      report.statistics.push_back(it.statistics);
      report.termination = it.statistics.numLocated > 0
                               ? Termination::converged
                               : Termination::aborted;
      _runDir.writeTermination(
          step, {report.termination, 1,
                 report.termination == Termination::aborted
                     ? "No event located"
                     : ""});
    }
    else
    {
      report = runSingleEventStep(startingEvents(step, previous));
    }
  }
  else
  {
    report = runIterativeStep(step, startingEvents(step, previous), resume);
  }

  logInfoF("Step %s: %s after %u iteration(s)", toString(step).c_str(),
           toString(report.termination).c_str(), report.numIterations);
  return report;
}

std::vector<Event> Pipeline::startingEvents(Step step,
                                            const Step *previous) const
{
  vector<Event> events;
  for (const auto &kv : _input.getEvents())
  {
    Event ev          = kv.second;
    ev.status         = Event::Status::pending;
    ev.failureReason  = "";
    ev.arrivals.clear();
    ev.rms = 0;
    events.push_back(ev);
  }

  if (step != Step::C || !previous || !_runDir.hasIterations(*previous))
  {
    return events;
  }

  // start from the last locations of the preceding step
  const unsigned last = _runDir.iterationIndices(*previous).back();
  const Iteration it  = _runDir.readIteration(*previous, last);
  map<string, Hypocenter> located;
  for (const Event &ev : it.events)
  {
    if (ev.status == Event::Status::located) located[ev.id] = ev.hypocenter;
  }
  for (Event &ev : events)
  {
    const auto found = located.find(ev.id);
    if (found != located.end()) ev.hypocenter = found->second;
  }
  logInfoF("Step C: starting from %zu locations of step %s iteration %u",
           located.size(), toString(*previous).c_str(), last);
  return events;
}

StationTermSet Pipeline::staticBaseline() const
{
  if (!_config.ssst.useStaticBaseline || !_runDir.hasIterations(Step::B))
  {
    logInfo("Step C: no static baseline, using identity terms");
    return StationTermSet();
  }

  const unsigned last = _runDir.iterationIndices(Step::B).back();
  StationTermSet baseline =
      _runDir.readIteration(Step::B, last, false).staticTerms;
  logInfoF("Step C: static baseline from step B iteration %u (%zu terms)",
           last, baseline.size());
  return baseline;
}

Iteration Pipeline::relocate(unsigned index,
                             const std::vector<Event> &events,
                             const TermProvider &terms)
{
  const map<string, RelocationResult> results = relocateAll(
      _locator, events, terms, _config.minPicks, _numWorkers, _progress);

  Iteration iteration;
  iteration.index = index;
  for (const Event &ev : events)
  {
    Event relocated = results.at(ev.id).event;
    if (relocated.status == Event::Status::located)
      iteration.statistics.numLocated++;
    else
      iteration.statistics.numFailed++;
    iteration.events.push_back(std::move(relocated));
  }
  iteration.statistics.numEvents = iteration.events.size();
  iteration.statistics.dispersion =
      computeDispersion(collectResiduals(iteration.events));
  return iteration;
}

StepReport Pipeline::runSingleEventStep(const std::vector<Event> &events)
{
  Iteration iteration = relocate(1, events, TermProvider());
  _runDir.writeIteration(Step::A, iteration);

  StepReport report;
  report.step          = Step::A;
  report.numIterations = 1;
  report.statistics.push_back(iteration.statistics);

  TerminationRecord rec;
  rec.numIterations = 1;
  if (iteration.statistics.numLocated > 0)
  {
    rec.termination = Termination::converged;
  }
  else
  {
    rec.termination = Termination::aborted;
    rec.reason      = "No event located";
  }
  _runDir.writeTermination(Step::A, rec);
  report.termination = rec.termination;
  return report;
}

StepReport Pipeline::runIterativeStep(Step step,
                                      const std::vector<Event> &startEvents,
                                      bool resume)
{
  const bool isStatic = step == Step::B;
  const unsigned maxIterations = isStatic ? _config.staticTerms.maxIterations
                                          : _config.ssst.maxIterations;
  const double tolerance =
      isStatic ? _config.staticTerms.tolerance : _config.ssst.tolerance;

  StepReport report;
  report.step    = step;
  report.resumed = resume;

  const StationTermSet baseline =
      isStatic ? StationTermSet() : staticBaseline();

  // terms applied in the next iteration
  StationTermSet staticTerms = baseline;
  SourceTermSet sourceTerms;

  vector<Event> current = startEvents;
  double previous       = std::numeric_limits<double>::quiet_NaN();
  unsigned index        = 1;

  if (resume)
  {
    const vector<unsigned> indices = _runDir.iterationIndices(step);
    for (unsigned idx : indices)
    {
      const Iteration it = _runDir.readIteration(step, idx, false);
      report.statistics.push_back(it.statistics);
      const double value = it.statistics.dispersion.value(_config.dispersion);

      // the run stopped after a terminating iteration but before recording
      // the termination
      Termination termination = Termination::maxIterationsReached;
      bool done = false;
      if (isConverged(previous, value, tolerance))
      {
        termination = Termination::converged;
        done        = true;
      }
      else if (idx >= maxIterations)
      {
        termination = Termination::maxIterationsReached;
        done        = true;
      }
      previous = value;

      if (done && idx == indices.back())
      {
        report.termination   = termination;
        report.numIterations = idx;
        _runDir.writeTermination(step, {termination, idx, ""});
        return report;
      }
    }

    const Iteration last = _runDir.readIteration(step, indices.back());
    staticTerms          = isStatic ? last.staticTerms : baseline;
    sourceTerms          = last.sourceTerms;
    for (Event &ev : current)
    {
      const auto found =
          std::find_if(last.events.begin(), last.events.end(),
                       [&ev](const Event &e) { return e.id == ev.id; });
      if (found != last.events.end() &&
          found->status == Event::Status::located)
      {
        ev.hypocenter = found->hypocenter;
      }
    }
    index = indices.back() + 1;
    logInfoF("Step %s: resuming at iteration %u", toString(step).c_str(),
             index);
  }

  for (;; index++)
  {
    logInfoF("Step %s: iteration %u", toString(step).c_str(), index);

    const TermProvider terms = isStatic
                                   ? TermProvider(staticTerms)
                                   : TermProvider(baseline, sourceTerms);

    Iteration iteration = relocate(index, current, terms);

    if (isStatic)
    {
      staticTerms = computeStaticTerms(iteration.events, staticTerms,
                                       _config.staticTerms.minResiduals);
    }
    else
    {
      SsstParameters params;
      params.maxNeighbours = _config.ssst.maxNeighbours;
      params.minNeighbours = _config.ssst.minNeighbours;
      params.minDistance   = _config.ssst.minDistance;
      params.distancePower = _config.ssst.distancePower;
      params.maxDistance   = shrinkingDistance(_config.ssst.maxDistanceStart,
                                             _config.ssst.maxDistanceEnd,
                                             index, maxIterations);
      sourceTerms =
          computeSourceSpecificTerms(iteration.events, sourceTerms, params);
    }
    iteration.staticTerms = staticTerms;
    iteration.sourceTerms = sourceTerms;

    _runDir.writeIteration(step, iteration);
    report.statistics.push_back(iteration.statistics);
    report.numIterations = index;

    const Dispersion &d = iteration.statistics.dispersion;
    const double value  = d.value(_config.dispersion);
    logInfoF("Step %s iteration %u: located %u failed %u, %s %.6f "
             "(median %.6f rms %.6f over %u residuals)",
             toString(step).c_str(), index, iteration.statistics.numLocated,
             iteration.statistics.numFailed,
             toString(_config.dispersion).c_str(), value, d.median, d.rms,
             d.numResiduals);
    if (!d.isDefined())
    {
      logWarningF("Step %s iteration %u: no residuals, convergence cannot "
                  "be assessed",
                  toString(step).c_str(), index);
    }

    TerminationRecord rec;
    rec.numIterations = index;
    bool done         = true;
    if (isConverged(previous, value, tolerance))
    {
      rec.termination = Termination::converged;
    }
    else if (index >= maxIterations)
    {
      rec.termination = Termination::maxIterationsReached;
    }
    else
    {
      done = false;
    }

    if (done)
    {
      _runDir.writeTermination(step, rec);
      report.termination = rec.termination;
      break;
    }

    previous = value;

    // located events move to their new position
    for (size_t i = 0; i < current.size(); i++)
    {
      if (iteration.events[i].status == Event::Status::located)
        current[i].hypocenter = iteration.events[i].hypocenter;
    }
  }

  return report;
}

} // namespace MEL
