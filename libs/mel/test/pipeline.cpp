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

#define BOOST_TEST_MODULE libmel
#include <boost/test/included/unit_test.hpp>
#include <boost/test/data/monomorphic.hpp>
#include <boost/test/data/test_case.hpp>

#include "mel/log.h"
#include "mel/pipeline.h"
#include "common.ipp"

#include <fstream>
#include <limits>
#include <memory>
#include <sstream>

using namespace std;
using namespace MEL;
namespace bdata = boost::unit_test::data;

namespace {

Config buildConfig(const vector<Step> &steps, int numThreads = 1)
{
  Config cfg;
  cfg.steps                     = steps;
  cfg.numThreads                = numThreads;
  cfg.minPicks                  = 4;
  cfg.staticTerms.maxIterations = 5;
  cfg.staticTerms.tolerance     = 0.01;
  cfg.ssst.maxIterations        = 5;
  cfg.ssst.tolerance            = 0.01;
  cfg.ssst.minNeighbours        = 3;
  cfg.ssst.maxNeighbours        = 10;
  cfg.ssst.maxDistanceStart     = 50;
  cfg.ssst.maxDistanceEnd       = 20;
  return cfg;
}

// dispersion never settles
double alternating(unsigned call) { return call % 2 ? 1.0 : 2.0; }

void checkStepOnDisk(const RunDirectory &runDir,
                     Step step,
                     unsigned numEvents,
                     unsigned numIterations)
{
  const StepRecord rec = runDir.readStep(step);
  BOOST_CHECK(rec.terminated);
  BOOST_CHECK_EQUAL(rec.termination.numIterations, numIterations);
  BOOST_REQUIRE_EQUAL(rec.iterations.size(), numIterations);
  for (unsigned i = 0; i < numIterations; i++)
  {
    const Iteration &it = rec.iterations[i];
    BOOST_CHECK_EQUAL(it.index, i + 1);
    BOOST_CHECK_EQUAL(it.events.size(), numEvents);
    BOOST_CHECK_EQUAL(it.statistics.numEvents, numEvents);
    BOOST_CHECK_EQUAL(it.statistics.numLocated + it.statistics.numFailed,
                      numEvents);
    for (const Event &ev : it.events) BOOST_CHECK(ev.isTerminal());
  }
}

} // namespace

BOOST_AUTO_TEST_CASE(test_is_converged)
{
  BOOST_CHECK(isConverged(1.0, 1.005, 0.01));
  BOOST_CHECK(isConverged(1.0, 0.995, 0.01));
  BOOST_CHECK(!isConverged(1.0, 1.5, 0.01));
  BOOST_CHECK(!isConverged(std::numeric_limits<double>::quiet_NaN(), 1.0,
                           0.01));
  BOOST_CHECK(!isConverged(1.0, std::numeric_limits<double>::quiet_NaN(),
                           0.01));
  // perfect fit
  BOOST_CHECK(isConverged(0, 0, 0.01));
  BOOST_CHECK(!isConverged(0, 0.1, 0.01));
}

BOOST_AUTO_TEST_CASE(test_invalid_configuration)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;

  Config cfg = buildConfig({Step::B});
  cfg.numThreads = 0;
  BOOST_CHECK_THROW(Pipeline(cfg, locator, runDir), ConfigurationError);

  cfg       = buildConfig({Step::B, Step::B});
  BOOST_CHECK_THROW(Pipeline(cfg, locator, runDir), ConfigurationError);

  cfg       = buildConfig({});
  BOOST_CHECK_THROW(Pipeline(cfg, locator, runDir), ConfigurationError);

  // nothing was done
  BOOST_CHECK(!runDir.hasInput());
  BOOST_CHECK_EQUAL(locator.totalCalls(), 0);
}

BOOST_AUTO_TEST_CASE(test_missing_input)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;
  Pipeline pipeline(buildConfig({Step::A}), locator, runDir);
  BOOST_CHECK_THROW(pipeline.run(), FileNotFound);
  BOOST_CHECK_THROW(pipeline.run(Catalog()), Exception);
}

BOOST_DATA_TEST_CASE(test_all_steps, bdata::make({1, 4}), numThreads)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;
  const Catalog cat = buildCatalog(9);

  Pipeline pipeline(buildConfig({Step::A, Step::B, Step::C}, numThreads),
                    locator, runDir);
  const vector<StepReport> reports = pipeline.run(cat);

  BOOST_REQUIRE_EQUAL(reports.size(), 3);
  BOOST_CHECK(reports[0].step == Step::A);
  BOOST_CHECK(reports[0].termination == Termination::converged);
  BOOST_CHECK_EQUAL(reports[0].numIterations, 1);

  unsigned totalIterations = 0;
  for (const StepReport &report : reports)
  {
    BOOST_CHECK(!report.skipped);
    BOOST_CHECK(!report.resumed);
    BOOST_CHECK(report.termination != Termination::aborted);
    BOOST_CHECK_EQUAL(report.statistics.size(), report.numIterations);
    BOOST_CHECK(runDir.exists(report.step));
    checkStepOnDisk(runDir, report.step, 9, report.numIterations);
    totalIterations += report.numIterations;
  }

  // every event located once per iteration
  BOOST_CHECK_EQUAL(locator.totalCalls(), 9 * totalIterations);
  for (unsigned i = 0; i < 9; i++)
    BOOST_CHECK_EQUAL(locator.calls(eventId(i)), totalIterations);
}

BOOST_DATA_TEST_CASE(test_convergence, bdata::make({1, 3}), numThreads)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;
  locator.amplitude = [](unsigned call) { return call == 1 ? 1.0 : 1.005; };

  Pipeline pipeline(buildConfig({Step::B}, numThreads), locator, runDir);
  const vector<StepReport> reports = pipeline.run(buildCatalog(9));

  BOOST_REQUIRE_EQUAL(reports.size(), 1);
  BOOST_CHECK(reports[0].termination == Termination::converged);
  BOOST_CHECK_EQUAL(reports[0].numIterations, 2);
  BOOST_REQUIRE_EQUAL(reports[0].statistics.size(), 2);

  // MAD of the scripted residuals is the amplitude
  BOOST_CHECK_CLOSE(reports[0].statistics[0].dispersion.mad, 1.0, 1e-6);
  BOOST_CHECK_CLOSE(reports[0].statistics[1].dispersion.mad, 1.005, 1e-6);
  BOOST_CHECK_CLOSE(reports[0].statistics[1].dispersion.smad,
                    1.005 * Dispersion::SMAD_SCALE, 1e-6);

  const TerminationRecord rec = runDir.readTermination(Step::B);
  BOOST_CHECK(rec.termination == Termination::converged);
  BOOST_CHECK_EQUAL(rec.numIterations, 2);
  checkStepOnDisk(runDir, Step::B, 9, 2);

  // balanced residuals: zero static terms
  const Iteration last = runDir.readIteration(Step::B, 2);
  for (const string &sta : stationList)
  {
    BOOST_CHECK_SMALL(last.staticTerms.get(sta, "P").correction, 1e-9);
    BOOST_CHECK_EQUAL(last.staticTerms.get(sta, "P").count, 9);
  }
}

BOOST_AUTO_TEST_CASE(test_max_iterations)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;
  locator.amplitude = alternating;

  Pipeline pipeline(buildConfig({Step::B}, 2), locator, runDir);
  const vector<StepReport> reports = pipeline.run(buildCatalog(9));

  BOOST_REQUIRE_EQUAL(reports.size(), 1);
  BOOST_CHECK(reports[0].termination == Termination::maxIterationsReached);
  BOOST_CHECK_EQUAL(reports[0].numIterations, 5);
  checkStepOnDisk(runDir, Step::B, 9, 5);
  BOOST_CHECK_EQUAL(locator.totalCalls(), 9 * 5);
}

BOOST_AUTO_TEST_CASE(test_no_event_located)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;
  const Catalog cat = buildCatalog(6);
  for (const auto &kv : cat.getEvents()) locator.failingEvents.insert(kv.first);

  Pipeline pipeline(buildConfig({Step::A, Step::B}), locator, runDir);
  const vector<StepReport> reports = pipeline.run(cat);
  BOOST_REQUIRE_EQUAL(reports.size(), 2);

  // nothing to iterate on
  BOOST_CHECK(reports[0].termination == Termination::aborted);
  BOOST_CHECK_EQUAL(reports[0].numIterations, 1);
  BOOST_CHECK(!runDir.readTermination(Step::A).reason.empty());

  // undefined dispersion: keep iterating
  BOOST_CHECK(reports[1].termination == Termination::maxIterationsReached);
  BOOST_CHECK_EQUAL(reports[1].numIterations, 5);
  BOOST_REQUIRE_EQUAL(reports[1].statistics.size(), 5);
  for (const IterationStatistics &stats : reports[1].statistics)
  {
    BOOST_CHECK_EQUAL(stats.numFailed, 6);
    BOOST_CHECK(!stats.dispersion.isDefined());
  }
  checkStepOnDisk(runDir, Step::B, 6, 5);
}

BOOST_DATA_TEST_CASE(test_undefined_dispersion_continues,
                     bdata::make({1, 3}),
                     numThreads)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;
  for (unsigned i = 0; i < 6; i++) locator.failingCalls.insert({eventId(i), 1});

  Pipeline pipeline(buildConfig({Step::B}, numThreads), locator, runDir);
  const vector<StepReport> reports = pipeline.run(buildCatalog(6));
  BOOST_REQUIRE_EQUAL(reports.size(), 1);

  // 1: nobody located, 2: first defined value, 3: unchanged
  BOOST_CHECK(reports[0].termination == Termination::converged);
  BOOST_CHECK_EQUAL(reports[0].numIterations, 3);
  BOOST_REQUIRE_EQUAL(reports[0].statistics.size(), 3);
  BOOST_CHECK(!reports[0].statistics[0].dispersion.isDefined());
  BOOST_CHECK_EQUAL(reports[0].statistics[1].numLocated, 6);
  BOOST_CHECK(reports[0].statistics[1].dispersion.isDefined());
  checkStepOnDisk(runDir, Step::B, 6, 3);
  BOOST_CHECK_EQUAL(locator.totalCalls(), 6 * 3);
}

BOOST_AUTO_TEST_CASE(test_failure_isolation)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;
  locator.failingEvents = {eventId(4)};
  // transient errors
  locator.throwingCalls = {{eventId(7), 2}};
  locator.failingCalls  = {{eventId(2), 1}};

  Pipeline pipeline(buildConfig({Step::A, Step::B, Step::C}, 4), locator,
                    runDir);
  const vector<StepReport> reports = pipeline.run(buildCatalog(10));

  BOOST_REQUIRE_EQUAL(reports.size(), 3);
  for (const StepReport &report : reports)
  {
    BOOST_CHECK(report.termination != Termination::aborted);
    checkStepOnDisk(runDir, report.step, 10, report.numIterations);
  }

  // step A: ev02 failed its first location, ev04 always fails
  BOOST_CHECK_EQUAL(reports[0].statistics[0].numLocated, 8);
  BOOST_CHECK_EQUAL(reports[0].statistics[0].numFailed, 2);

  // step B iteration 1: ev07 threw
  BOOST_CHECK_EQUAL(reports[1].statistics[0].numLocated, 8);
  const Iteration it = runDir.readIteration(Step::B, 1);
  for (const Event &ev : it.events)
  {
    if (ev.id == eventId(4) || ev.id == eventId(7))
    {
      BOOST_CHECK(ev.status == Event::Status::failed);
      BOOST_CHECK(!ev.failureReason.empty());
    }
    else
    {
      BOOST_CHECK(ev.status == Event::Status::located);
    }
  }

  // later iterations: only ev04
  for (size_t i = 1; i < reports[1].statistics.size(); i++)
  {
    BOOST_CHECK_EQUAL(reports[1].statistics[i].numFailed, 1);
  }
}

BOOST_AUTO_TEST_CASE(test_rerun_skips_completed_steps)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;
  const Catalog cat = buildCatalog(9);
  const Config cfg  = buildConfig({Step::A, Step::B});

  {
    Pipeline pipeline(cfg, locator, runDir);
    pipeline.run(cat);
  }
  const unsigned calls = locator.totalCalls();
  const vector<unsigned> indices = runDir.iterationIndices(Step::B);

  Pipeline pipeline(cfg, locator, runDir);
  const vector<StepReport> reports = pipeline.run(cat);
  BOOST_REQUIRE_EQUAL(reports.size(), 2);
  for (const StepReport &report : reports)
  {
    BOOST_CHECK(report.skipped);
    BOOST_CHECK(report.termination != Termination::aborted);
  }
  BOOST_CHECK_EQUAL(reports[1].numIterations, indices.size());
  BOOST_CHECK_EQUAL(locator.totalCalls(), calls);

  // the stored input is kept
  pipeline.run(buildCatalog(3));
  BOOST_CHECK_EQUAL(runDir.readInput().size(), 9);
  BOOST_CHECK_EQUAL(locator.totalCalls(), calls);
}

BOOST_AUTO_TEST_CASE(test_force_recomputes)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;
  locator.amplitude = alternating;
  const Config cfg  = buildConfig({Step::B});

  {
    Pipeline pipeline(cfg, locator, runDir);
    pipeline.run(buildCatalog(9));
  }
  BOOST_CHECK_EQUAL(runDir.iterationIndices(Step::B).size(), 5);

  // fewer events, fewer iterations
  ScriptedLocator locator2;
  Config cfg2                    = cfg;
  cfg2.staticTerms.maxIterations = 2;
  Pipeline pipeline(cfg2, locator2, runDir);
  const vector<StepReport> reports = pipeline.run(buildCatalog(6), true);

  BOOST_REQUIRE_EQUAL(reports.size(), 1);
  BOOST_CHECK(!reports[0].skipped);
  BOOST_CHECK(!reports[0].resumed);
  BOOST_CHECK_EQUAL(reports[0].numIterations, 2);
  BOOST_CHECK_EQUAL(locator2.totalCalls(), 6 * 2);
  BOOST_CHECK_EQUAL(runDir.readInput().size(), 6);

  // no leftovers of the previous computation
  BOOST_CHECK_EQUAL(runDir.iterationIndices(Step::B).size(), 2);
  checkStepOnDisk(runDir, Step::B, 6, 2);
}

BOOST_AUTO_TEST_CASE(test_resume_interrupted_step)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  const Config cfg = buildConfig({Step::B});

  {
    ScriptedLocator locator;
    locator.amplitude = alternating;
    Pipeline pipeline(cfg, locator, runDir);
    pipeline.run(buildCatalog(9));
  }

  // interrupted after iteration 4
  BOOST_REQUIRE(removePath(runDir.terminationFile(Step::B)));
  BOOST_REQUIRE(removePath(runDir.iterationPath(Step::B, 5)));
  BOOST_CHECK(!runDir.exists(Step::B));

  ScriptedLocator locator;
  locator.amplitude = alternating;
  Pipeline pipeline(cfg, locator, runDir);
  const vector<StepReport> reports = pipeline.run();

  BOOST_REQUIRE_EQUAL(reports.size(), 1);
  BOOST_CHECK(reports[0].resumed);
  BOOST_CHECK(reports[0].termination == Termination::maxIterationsReached);
  BOOST_CHECK_EQUAL(reports[0].numIterations, 5);
  BOOST_CHECK_EQUAL(reports[0].statistics.size(), 5);
  // only the missing iteration was computed
  BOOST_CHECK_EQUAL(locator.totalCalls(), 9);
  checkStepOnDisk(runDir, Step::B, 9, 5);
}

BOOST_AUTO_TEST_CASE(test_resume_missing_termination)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  const Config cfg = buildConfig({Step::B});

  {
    ScriptedLocator locator;
    locator.amplitude = [](unsigned call) { return call == 1 ? 1.0 : 1.005; };
    Pipeline pipeline(cfg, locator, runDir);
    pipeline.run(buildCatalog(9));
  }

  // the last iteration is complete, only the record is missing
  BOOST_REQUIRE(removePath(runDir.terminationFile(Step::B)));

  ScriptedLocator locator;
  Pipeline pipeline(cfg, locator, runDir);
  const vector<StepReport> reports = pipeline.run();

  BOOST_REQUIRE_EQUAL(reports.size(), 1);
  BOOST_CHECK(reports[0].resumed);
  BOOST_CHECK(reports[0].termination == Termination::converged);
  BOOST_CHECK_EQUAL(reports[0].numIterations, 2);
  BOOST_CHECK_EQUAL(locator.totalCalls(), 0);
  BOOST_CHECK(runDir.exists(Step::B));
  BOOST_CHECK(runDir.readTermination(Step::B).termination ==
              Termination::converged);
}

BOOST_AUTO_TEST_CASE(test_source_terms_step)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;
  locator.bias = {{"ST01", 0.5}};

  Config cfg = buildConfig({Step::B, Step::C});
  // never enough neighbours: the static baseline applies everywhere
  cfg.ssst.minNeighbours = 10;
  cfg.ssst.maxNeighbours = 10;

  Pipeline pipeline(cfg, locator, runDir);
  const vector<StepReport> reports = pipeline.run(buildCatalog(9));
  BOOST_REQUIRE_EQUAL(reports.size(), 2);

  const unsigned lastB = reports[0].numIterations;
  const Iteration itB  = runDir.readIteration(Step::B, lastB);
  BOOST_CHECK_CLOSE(itB.staticTerms.get("ST01", "P").correction, 0.5, 1e-6);

  // step C starts from the locations and the terms of step B
  const Iteration itC = runDir.readIteration(Step::C, 1);
  BOOST_REQUIRE_EQUAL(itC.events.size(), itB.events.size());
  for (size_t i = 0; i < itC.events.size(); i++)
  {
    BOOST_CHECK_CLOSE(itC.events[i].hypocenter.latitude,
                      itB.events[i].hypocenter.latitude + 0.001, 1e-9);
    for (const Arrival &arr : itC.events[i].arrivals)
    {
      const double expected = arr.stationLabel == "ST01" ? 0.5 : 0.;
      BOOST_CHECK_CLOSE(arr.correction + 1, expected + 1, 1e-6);
    }
  }
  BOOST_CHECK(itC.sourceTerms.get(eventId(0)).empty());
}

BOOST_AUTO_TEST_CASE(test_source_terms_without_baseline)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;
  locator.bias      = {{"ST01", 0.5}};
  locator.amplitude = [](unsigned) { return 0.; };

  Config cfg = buildConfig({Step::B, Step::C});
  cfg.ssst.useStaticBaseline = false;
  cfg.ssst.minNeighbours     = 3;

  Pipeline pipeline(cfg, locator, runDir);
  const vector<StepReport> reports = pipeline.run(buildCatalog(9));
  BOOST_REQUIRE_EQUAL(reports.size(), 2);

  // first iteration without terms
  const Iteration first = runDir.readIteration(Step::C, 1);
  for (const Event &ev : first.events)
  {
    for (const Arrival &arr : ev.arrivals)
      BOOST_CHECK_EQUAL(arr.correction, 0);
  }

  // then the neighbours' bias
  BOOST_REQUIRE(reports[1].numIterations >= 2);
  const Iteration second = runDir.readIteration(Step::C, 2);
  for (const Event &ev : second.events)
  {
    BOOST_CHECK_CLOSE(first.sourceTerms.get(ev.id).correction("ST01", "P"),
                      0.5, 1e-6);
    for (const Arrival &arr : ev.arrivals)
    {
      if (arr.stationLabel == "ST01")
        BOOST_CHECK_CLOSE(arr.correction, 0.5, 1e-6);
    }
  }
}

BOOST_AUTO_TEST_CASE(test_processing_log)
{
  TempDir tmp;
  RunDirectory runDir(tmp.path);
  ScriptedLocator locator;

  // route info messages to the currently open processing log
  auto current = std::make_shared<std::ofstream>();
  Logger::registerLoggers(
      [](const string &) {}, [](const string &) {},
      [current](const string &msg) {
        if (current->is_open()) *current << msg << "\n";
      },
      [](const string &) {},
      [current](const string &filename,
                const vector<Logger::Level> &) -> void * {
        current->open(filename);
        return current.get();
      },
      [current](void *) { current->close(); });

  Pipeline pipeline(buildConfig({Step::A}), locator, runDir);
  pipeline.run(buildCatalog(6));
  Logger::resetLoggers();

  ifstream in(runDir.logFile(Step::A));
  BOOST_REQUIRE(in.is_open());
  stringstream content;
  content << in.rdbuf();
  BOOST_CHECK(content.str().find("Step A") != string::npos);
}
