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

#include "harvest.h"
#include "csvreader.h"
#include "log.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <tuple>

using namespace std;

namespace MEL {

namespace {

struct ReadTask
{
  Step step;
  unsigned iteration;
  string file;
};

string formatDouble(double value, const char *fmt = "%.6f")
{
  return std::isfinite(value) ? strf(fmt, value) : "";
}

double parseDouble(const string &s)
{
  if (s.empty()) return numeric_limits<double>::quiet_NaN();
  return std::stod(s);
}

unsigned parseUnsigned(const string &s)
{
  return static_cast<unsigned>(std::stoul(s));
}

class CsvFile
{
public:
  CsvFile(const string &filename, const vector<string> &header)
      : _filename(filename), _out(filename)
  {
    if (!_out.is_open())
    {
      throw Exception("Cannot write file " + filename);
    }
    CSV::writeRow(_out, header);
  }

  void write(const vector<string> &fields) { CSV::writeRow(_out, fields); }

  void close()
  {
    _out.close();
    if (_out.fail())
    {
      throw Exception("Error while writing " + _filename);
    }
  }

private:
  const string _filename;
  ofstream _out;
};

/*
 * Per event: the last iteration the event was located in, or its last
 * iteration when never located
 */
vector<size_t> weedEvents(const vector<ReadTask> &tasks,
                          const vector<Event> &events,
                          const vector<bool> &valid)
{
  map<pair<Step, string>, size_t> selected;
  for (size_t i = 0; i < tasks.size(); i++)
  {
    if (!valid[i]) continue;
    const auto key = make_pair(tasks[i].step, events[i].id);
    auto it        = selected.find(key);
    if (it == selected.end())
    {
      selected.emplace(key, i);
      continue;
    }

    const size_t j            = it->second;
    const bool candidateFound = events[i].status == Event::Status::located;
    const bool currentFound   = events[j].status == Event::Status::located;
    if ((candidateFound && !currentFound) ||
        (candidateFound == currentFound &&
         tasks[i].iteration > tasks[j].iteration))
    {
      it->second = i;
    }
  }

  vector<size_t> kept;
  for (const auto &kv : selected) kept.push_back(kv.second);
  std::sort(kept.begin(), kept.end());
  return kept;
}

} // namespace

HarvestSummary harvest(const RunDirectory &runDir,
                       const HarvestOptions &options,
                       const ProgressCallback &progress)
{
  const string harvestDir = runDir.harvestPath();
  if (pathExists(harvestDir) && !options.force)
  {
    throw PathAlreadyExists(harvestDir);
  }

  vector<Step> steps = options.steps;
  if (steps.empty())
  {
    for (Step step : {Step::A, Step::B, Step::C})
    {
      if (runDir.hasIterations(step)) steps.push_back(step);
    }
  }
  else
  {
    for (Step step : steps)
    {
      if (!runDir.hasIterations(step))
      {
        throw FileNotFound(runDir.stepPath(step));
      }
    }
  }

  //
  // collect terms and statistics, list the per-event files to read
  //
  vector<ReadTask> tasks;
  vector<pair<Step, Iteration>> statistics;

  for (Step step : steps)
  {
    vector<unsigned> indices = runDir.iterationIndices(step);
    for (unsigned idx : indices)
    {
      Iteration it = runDir.readIteration(step, idx, false);
      statistics.emplace_back(step, it);
    }

    if (options.lastIter)
    {
      indices = {indices.back()};
    }

    for (unsigned idx : indices)
    {
      for (const string &file : runDir.listEventFiles(step, idx))
      {
        tasks.push_back({step, idx, file});
      }
    }
  }

  logInfoF("Harvesting %zu event files of %zu step(s)", tasks.size(),
           steps.size());

  //
  // read the per-event files
  //
  vector<Event> events(tasks.size());
  vector<string> errors(tasks.size());
  vector<bool> valid(tasks.size(), false);

  runParallel(
      tasks.size(), resolveNumWorkers(options.numThreads),
      [&](size_t i) {
        try
        {
          events[i] = RunDirectory::readEventFile(tasks[i].file);
        }
        catch (std::exception &e)
        {
          errors[i] = e.what();
        }
      },
      progress);

  HarvestSummary summary;
  for (size_t i = 0; i < tasks.size(); i++)
  {
    valid[i] = errors[i].empty();
    if (!valid[i])
    {
      logWarningF("Cannot harvest %s: %s", tasks[i].file.c_str(),
                  errors[i].c_str());
      summary.failedFiles.emplace_back(tasks[i].file, errors[i]);
    }
  }

  vector<size_t> kept;
  if (options.weed)
  {
    kept = weedEvents(tasks, events, valid);
  }
  else
  {
    for (size_t i = 0; i < tasks.size(); i++)
      if (valid[i]) kept.push_back(i);
  }

  //
  // write the cache in a staging directory then swap it in
  //
  const string staging = uniqueTempPath(runDir.path(), ".staging-harvest");
  if (!createDirectories(staging))
  {
    throw Exception("Unable to create directory " + staging);
  }

  CsvFile evFile(joinPath(staging, "events.csv"),
                 {"step", "iteration", "id", "isotime", "latitude",
                  "longitude", "depth", "rms", "status", "failureReason"});
  CsvFile arrFile(joinPath(staging, "arrivals.csv"),
                  {"step", "iteration", "eventId", "networkCode",
                   "stationLabel", "phase", "residual", "correction",
                   "distance", "weight"});

  for (size_t i : kept)
  {
    const Event &ev      = events[i];
    const string step    = toString(tasks[i].step);
    const string iterStr = std::to_string(tasks[i].iteration);
    evFile.write({step, iterStr, ev.id, UTCClock::toString(ev.hypocenter.time),
                  strf("%.12f", ev.hypocenter.latitude),
                  strf("%.12f", ev.hypocenter.longitude),
                  strf("%.6f", ev.hypocenter.depth), formatDouble(ev.rms),
                  toString(ev.status), ev.failureReason});
    summary.numEventEntries++;

    for (const Arrival &arr : ev.arrivals)
    {
      arrFile.write({step, iterStr, ev.id, arr.networkCode, arr.stationLabel,
                     arr.phase, formatDouble(arr.residual),
                     formatDouble(arr.correction),
                     formatDouble(arr.distance, "%.4f"),
                     formatDouble(arr.weight, "%.4f")});
      summary.numArrivalEntries++;
    }
  }
  evFile.close();
  arrFile.close();

  CsvFile staticFile(joinPath(staging, "static-terms.csv"),
                     {"step", "iteration", "station", "phase", "correction",
                      "count"});
  CsvFile sourceFile(joinPath(staging, "source-terms.csv"),
                     {"step", "iteration", "eventId", "station", "phase",
                      "correction", "count"});
  CsvFile convFile(joinPath(staging, "convergence.csv"),
                   {"step", "iteration", "events", "located", "failed",
                    "residuals", "median", "mad", "smad", "rms"});

  map<Step, unsigned> lastIndex;
  for (const auto &kv : statistics)
  {
    unsigned &last = lastIndex[kv.first];
    last           = std::max(last, kv.second.index);
  }

  for (const auto &kv : statistics)
  {
    const string step      = toString(kv.first);
    const Iteration &it    = kv.second;
    const string iterStr   = std::to_string(it.index);
    const Dispersion &disp = it.statistics.dispersion;

    convFile.write({step, iterStr, std::to_string(it.statistics.numEvents),
                    std::to_string(it.statistics.numLocated),
                    std::to_string(it.statistics.numFailed),
                    std::to_string(disp.numResiduals), formatDouble(disp.median),
                    formatDouble(disp.mad), formatDouble(disp.smad),
                    formatDouble(disp.rms)});

    if (options.lastIter && it.index != lastIndex[kv.first]) continue;

    for (const auto &term : it.staticTerms.terms())
    {
      staticFile.write({step, iterStr, term.first.first, term.first.second,
                        strf("%.6f", term.second.correction),
                        std::to_string(term.second.count)});
    }
    for (const auto &evTerms : it.sourceTerms.terms())
    {
      for (const auto &term : evTerms.second.terms())
      {
        sourceFile.write({step, iterStr, evTerms.first, term.first.first,
                          term.first.second,
                          strf("%.6f", term.second.correction),
                          std::to_string(term.second.count)});
      }
    }
  }
  staticFile.close();
  sourceFile.close();
  convFile.close();

  CsvFile failFile(joinPath(staging, "failures.csv"), {"file", "reason"});
  for (const auto &f : summary.failedFiles) failFile.write({f.first, f.second});
  failFile.close();

  if (pathExists(harvestDir))
  {
    if (!removePath(harvestDir))
    {
      removePath(staging);
      throw Exception("Unable to remove previous harvest " + harvestDir);
    }
  }
  if (!renamePath(staging, harvestDir))
  {
    removePath(staging);
    throw Exception("Unable to move " + staging + " to " + harvestDir);
  }

  logInfoF("Harvest complete: %u events, %u arrivals, %zu unreadable files",
           summary.numEventEntries, summary.numArrivalEntries,
           summary.failedFiles.size());
  return summary;
}

HarvestCache::HarvestCache(const std::string &harvestDir)
{
  if (!isDirectory(harvestDir))
  {
    throw FileNotFound(harvestDir);
  }

  const string eventFile  = joinPath(harvestDir, "events.csv");
  const string arrFile    = joinPath(harvestDir, "arrivals.csv");
  const string staticFile = joinPath(harvestDir, "static-terms.csv");
  const string sourceFile = joinPath(harvestDir, "source-terms.csv");
  const string convFile   = joinPath(harvestDir, "convergence.csv");
  const string failFile   = joinPath(harvestDir, "failures.csv");

  string current;
  unsigned row_count = 0;
  try
  {
    current   = eventFile;
    row_count = 0;
    map<tuple<Step, unsigned, string>, size_t> index;
    for (const CSV::Row &row : CSV::readWithHeader(eventFile))
    {
      row_count++;
      EventEntry entry;
      entry.step              = stepFromString(row.at("step"));
      entry.iteration         = parseUnsigned(row.at("iteration"));
      Event &ev               = entry.event;
      ev.id                   = row.at("id");
      ev.hypocenter.time      = UTCClock::fromString(row.at("isotime"));
      ev.hypocenter.latitude  = std::stod(row.at("latitude"));
      ev.hypocenter.longitude = std::stod(row.at("longitude"));
      ev.hypocenter.depth     = std::stod(row.at("depth"));
      const double rms        = parseDouble(row.at("rms"));
      ev.rms                  = std::isfinite(rms) ? rms : 0;
      ev.status               = statusFromString(row.at("status"));
      ev.failureReason        = row.at("failureReason");
      index[make_tuple(entry.step, entry.iteration, ev.id)] = _events.size();
      _events.push_back(std::move(entry));
    }

    current   = arrFile;
    row_count = 0;
    for (const CSV::Row &row : CSV::readWithHeader(arrFile))
    {
      row_count++;
      const auto key = make_tuple(stepFromString(row.at("step")),
                                  parseUnsigned(row.at("iteration")),
                                  row.at("eventId"));
      const auto it  = index.find(key);
      if (it == index.end())
      {
        throw Exception("arrival of unknown event " + row.at("eventId"));
      }
      Arrival arr;
      arr.networkCode  = row.at("networkCode");
      arr.stationLabel = row.at("stationLabel");
      arr.phase        = row.at("phase");
      arr.residual     = parseDouble(row.at("residual"));
      arr.correction   = parseDouble(row.at("correction"));
      arr.distance     = parseDouble(row.at("distance"));
      arr.weight       = parseDouble(row.at("weight"));
      _events[it->second].event.arrivals.push_back(arr);
    }

    current   = staticFile;
    row_count = 0;
    for (const CSV::Row &row : CSV::readWithHeader(staticFile))
    {
      row_count++;
      StationTerm term;
      term.correction = std::stod(row.at("correction"));
      term.count      = parseUnsigned(row.at("count"));
      _staticTerms[make_pair(stepFromString(row.at("step")),
                             parseUnsigned(row.at("iteration")))]
          .set(row.at("station"), row.at("phase"), term);
    }

    current   = sourceFile;
    row_count = 0;
    for (const CSV::Row &row : CSV::readWithHeader(sourceFile))
    {
      row_count++;
      SourceTermEntry entry;
      entry.step            = stepFromString(row.at("step"));
      entry.iteration       = parseUnsigned(row.at("iteration"));
      entry.eventId         = row.at("eventId");
      entry.station         = row.at("station");
      entry.phase           = row.at("phase");
      entry.term.correction = std::stod(row.at("correction"));
      entry.term.count      = parseUnsigned(row.at("count"));
      _sourceTerms.push_back(entry);
    }

    current   = convFile;
    row_count = 0;
    for (const CSV::Row &row : CSV::readWithHeader(convFile))
    {
      row_count++;
      ConvergenceEntry entry;
      entry.step      = stepFromString(row.at("step"));
      entry.iteration = parseUnsigned(row.at("iteration"));
      IterationStatistics &s    = entry.statistics;
      s.numEvents               = parseUnsigned(row.at("events"));
      s.numLocated              = parseUnsigned(row.at("located"));
      s.numFailed               = parseUnsigned(row.at("failed"));
      s.dispersion.numResiduals = parseUnsigned(row.at("residuals"));
      s.dispersion.median       = parseDouble(row.at("median"));
      s.dispersion.mad          = parseDouble(row.at("mad"));
      s.dispersion.smad         = parseDouble(row.at("smad"));
      s.dispersion.rms          = parseDouble(row.at("rms"));
      _convergence.push_back(entry);
    }

    current   = failFile;
    row_count = 0;
    if (pathExists(failFile))
    {
      for (const CSV::Row &row : CSV::readWithHeader(failFile))
      {
        row_count++;
        _failedFiles.emplace_back(row.at("file"), row.at("reason"));
      }
    }
  }
  catch (FileNotFound &)
  {
    throw;
  }
  catch (std::exception &e)
  {
    throw Exception(strf("Error while parsing file '%s' at row %u: %s",
                         current.c_str(), row_count, e.what()));
  }

  std::stable_sort(_convergence.begin(), _convergence.end(),
                   [](const ConvergenceEntry &a, const ConvergenceEntry &b) {
                     return std::make_pair(a.step, a.iteration) <
                            std::make_pair(b.step, b.iteration);
                   });
}

std::vector<Step> HarvestCache::steps() const
{
  set<Step> steps;
  for (const ConvergenceEntry &c : _convergence) steps.insert(c.step);
  for (const EventEntry &e : _events) steps.insert(e.step);
  return vector<Step>(steps.begin(), steps.end());
}

std::vector<unsigned> HarvestCache::iterations(Step step) const
{
  set<unsigned> iterations;
  for (const EventEntry &e : _events)
  {
    if (e.step == step) iterations.insert(e.iteration);
  }
  return vector<unsigned>(iterations.begin(), iterations.end());
}

std::vector<Event> HarvestCache::events(Step step, unsigned iteration) const
{
  vector<Event> events;
  for (const EventEntry &e : _events)
  {
    if (e.step == step && e.iteration == iteration) events.push_back(e.event);
  }
  std::sort(events.begin(), events.end(),
            [](const Event &a, const Event &b) { return a.id < b.id; });
  return events;
}

std::vector<Event> HarvestCache::events(Step step) const
{
  map<string, const EventEntry *> latest;
  for (const EventEntry &e : _events)
  {
    if (e.step != step) continue;
    const EventEntry *&current = latest[e.event.id];
    if (!current || e.iteration > current->iteration) current = &e;
  }

  vector<Event> events;
  for (const auto &kv : latest) events.push_back(kv.second->event);
  return events;
}

std::vector<HarvestCache::ArrivalEntry>
HarvestCache::arrivals(Step step,
                       const std::string &station,
                       const std::string &phase) const
{
  map<string, const EventEntry *> latest;
  for (const EventEntry &e : _events)
  {
    if (e.step != step) continue;
    const EventEntry *&current = latest[e.event.id];
    if (!current || e.iteration > current->iteration) current = &e;
  }

  vector<ArrivalEntry> arrivals;
  for (const auto &kv : latest)
  {
    const EventEntry &e = *kv.second;
    for (const Arrival &arr : e.event.arrivals)
    {
      if (arr.stationLabel == station && arr.phase == phase)
      {
        arrivals.push_back({e.step, e.iteration, e.event.id, arr});
      }
    }
  }
  return arrivals;
}

StationTermSet HarvestCache::staticTerms(Step step) const
{
  const StationTermSet *last = nullptr;
  for (const auto &kv : _staticTerms)
  {
    // sorted by (step, iteration)
    if (kv.first.first == step) last = &kv.second;
  }
  return last ? *last : StationTermSet();
}

std::vector<HarvestCache::SourceTermEntry>
HarvestCache::sourceTerms(Step step,
                          const std::string &station,
                          const std::string &phase) const
{
  unsigned last = 0;
  for (const SourceTermEntry &t : _sourceTerms)
  {
    if (t.step == step) last = std::max(last, t.iteration);
  }

  vector<SourceTermEntry> terms;
  for (const SourceTermEntry &t : _sourceTerms)
  {
    if (t.step == step && t.iteration == last && t.station == station &&
        t.phase == phase)
    {
      terms.push_back(t);
    }
  }
  return terms;
}

std::vector<HarvestCache::ConvergenceEntry>
HarvestCache::convergence(Step step) const
{
  vector<ConvergenceEntry> entries;
  for (const ConvergenceEntry &c : _convergence)
  {
    if (c.step == step) entries.push_back(c);
  }
  return entries;
}

HarvestCache::ResidualHistogram
HarvestCache::residualHistogram(Step step,
                                const std::vector<double> &distanceEdges,
                                const std::vector<double> &residualEdges) const
{
  if (distanceEdges.size() < 2 || residualEdges.size() < 2 ||
      !std::is_sorted(distanceEdges.begin(), distanceEdges.end()) ||
      !std::is_sorted(residualEdges.begin(), residualEdges.end()))
  {
    throw Exception("Histogram edges must be at least 2 and sorted");
  }

  ResidualHistogram hist;
  hist.distanceEdges = distanceEdges;
  hist.residualEdges = residualEdges;
  hist.counts.assign(distanceEdges.size() - 1,
                     vector<unsigned>(residualEdges.size() - 1, 0));

  // index of the bin containing `value`, -1 when outside
  auto binOf = [](const vector<double> &edges, double value) -> long {
    if (!(value >= edges.front()) || !(value < edges.back())) return -1;
    const auto it = std::upper_bound(edges.begin(), edges.end(), value);
    return static_cast<long>(it - edges.begin()) - 1;
  };

  for (const Event &ev : events(step))
  {
    if (ev.status != Event::Status::located) continue;
    for (const Arrival &arr : ev.arrivals)
    {
      if (!(arr.weight > 0)) continue;
      const long di = binOf(distanceEdges, arr.distance);
      const long ri = binOf(residualEdges, arr.residual);
      if (di < 0 || ri < 0) continue;
      hist.counts[di][ri]++;
    }
  }
  return hist;
}

} // namespace MEL
