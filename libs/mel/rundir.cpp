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

#include "rundir.h"
#include "csvreader.h"
#include "log.h"
#include "utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <regex>

using namespace std;

namespace {

const string STAGING_PREFIX = ".staging";

double parseDouble(const string &s)
{
  if (s.empty()) return numeric_limits<double>::quiet_NaN();
  return std::stod(s);
}

unsigned parseUnsigned(const string &s)
{
  const unsigned long value = std::stoul(s);
  return static_cast<unsigned>(value);
}

string formatDouble(double value, const char *fmt = "%.17g")
{
  return std::isfinite(value) ? MEL::strf(fmt, value) : "";
}

} // namespace

namespace MEL {

std::string toString(Termination termination)
{
  switch (termination)
  {
  case Termination::converged: return "converged";
  case Termination::maxIterationsReached: return "max-iterations-reached";
  case Termination::aborted: return "aborted";
  }
  return "";
}

Termination terminationFromString(const std::string &str)
{
  if (str == "converged") return Termination::converged;
  if (str == "max-iterations-reached") return Termination::maxIterationsReached;
  if (str == "aborted") return Termination::aborted;
  throw Exception("Unknown termination: " + str);
}

RunDirectory::RunDirectory(const std::string &path) : _path(path)
{
  if (_path.empty())
  {
    throw Exception("Empty run directory path");
  }
}

std::string RunDirectory::inputPath() const { return joinPath(_path, "input"); }

std::string RunDirectory::stepPath(Step step) const
{
  return joinPath(_path, toString(step));
}

std::string RunDirectory::iterationPath(Step step, unsigned index) const
{
  return joinPath(stepPath(step), strf("iteration-%03u", index));
}

std::string RunDirectory::terminationFile(Step step) const
{
  return joinPath(stepPath(step), "termination.csv");
}

std::string RunDirectory::logFile(Step step) const
{
  return joinPath(stepPath(step), "processing.log");
}

std::string RunDirectory::harvestPath() const
{
  return joinPath(_path, "harvest");
}

bool RunDirectory::hasInput() const
{
  return pathExists(joinPath(inputPath(), "events.csv")) &&
         pathExists(joinPath(inputPath(), "picks.csv"));
}

void RunDirectory::writeInput(const Catalog &catalog, bool force)
{
  const string dir = inputPath();
  if (pathExists(dir))
  {
    if (!force) throw PathAlreadyExists(dir);
    if (!removePath(dir)) throw Exception("Cannot remove " + dir);
  }

  const string staging = uniqueTempPath(_path, STAGING_PREFIX + "-input");
  if (!createDirectories(staging))
  {
    throw Exception("Unable to create directory " + staging);
  }
  catalog.writeToFile(joinPath(staging, "events.csv"),
                      joinPath(staging, "picks.csv"));
  if (!renamePath(staging, dir))
  {
    throw Exception("Unable to move " + staging + " to " + dir);
  }
}

Catalog RunDirectory::readInput() const
{
  return Catalog(joinPath(inputPath(), "events.csv"),
                 joinPath(inputPath(), "picks.csv"));
}

std::vector<unsigned> RunDirectory::iterationIndices(Step step) const
{
  static const std::regex re(R"(iteration-(\d+))", std::regex::optimize);

  vector<unsigned> indices;
  if (!isDirectory(stepPath(step))) return indices;

  for (const string &name : listDirectory(stepPath(step)))
  {
    std::smatch m;
    if (std::regex_match(name, m, re))
    {
      indices.push_back(parseUnsigned(m.str(1)));
    }
  }
  std::sort(indices.begin(), indices.end());
  return indices;
}

bool RunDirectory::exists(Step step) const
{
  return pathExists(terminationFile(step));
}

bool RunDirectory::hasIterations(Step step) const
{
  return !iterationIndices(step).empty();
}

void RunDirectory::removeStaleStaging(Step step) const
{
  for (const string &name : listDirectory(stepPath(step)))
  {
    if (name.compare(0, STAGING_PREFIX.size(), STAGING_PREFIX) == 0)
    {
      logDebugF("Removing stale staging directory %s", name.c_str());
      removePath(joinPath(stepPath(step), name));
    }
  }
}

void RunDirectory::writeIteration(Step step, const Iteration &iteration)
{
  const string dest = iterationPath(step, iteration.index);
  if (pathExists(dest))
  {
    throw PathAlreadyExists(dest);
  }

  const vector<unsigned> indices = iterationIndices(step);
  const unsigned expected        = indices.empty() ? 1 : indices.back() + 1;
  if (iteration.index != expected)
  {
    throw Exception(strf("Step %s: cannot write iteration %u, the next "
                         "iteration is %u",
                         toString(step).c_str(), iteration.index, expected));
  }

  if (!createDirectories(stepPath(step)))
  {
    throw Exception("Unable to create directory " + stepPath(step));
  }
  removeStaleStaging(step);

  const string staging = uniqueTempPath(
      stepPath(step), STAGING_PREFIX + strf("-%03u", iteration.index));
  const string eventsDir = joinPath(staging, "events");
  if (!createDirectories(eventsDir))
  {
    throw Exception("Unable to create directory " + eventsDir);
  }

  for (const Event &ev : iteration.events)
  {
    writeEventFile(ev, joinPath(eventsDir, eventFileName(ev.id) + ".csv"));
  }
  writeStaticTerms(iteration.staticTerms,
                   joinPath(staging, "static-terms.csv"));
  writeSourceTerms(iteration.sourceTerms,
                   joinPath(staging, "source-terms.csv"));
  writeStatistics(iteration.index, iteration.statistics,
                  joinPath(staging, "statistics.csv"));

  if (!renamePath(staging, dest))
  {
    removePath(staging);
    throw Exception("Unable to move " + staging + " to " + dest);
  }

  logDebugF("Step %s: committed iteration %u (%zu events)",
            toString(step).c_str(), iteration.index, iteration.events.size());
}

void RunDirectory::writeTermination(Step step, const TerminationRecord &record)
{
  if (!createDirectories(stepPath(step)))
  {
    throw Exception("Unable to create directory " + stepPath(step));
  }

  const string filename = terminationFile(step);
  const string tmpFile  = filename + ".tmp";
  {
    ofstream out(tmpFile);
    if (!out.is_open())
    {
      throw Exception("Cannot write file " + tmpFile);
    }
    CSV::writeRow(out, {"termination", "iterations", "reason"});
    CSV::writeRow(out, {toString(record.termination),
                        std::to_string(record.numIterations), record.reason});
    if (!out.good())
    {
      throw Exception("Error while writing " + tmpFile);
    }
  }
  if (!renamePath(tmpFile, filename))
  {
    throw Exception("Unable to move " + tmpFile + " to " + filename);
  }
}

TerminationRecord RunDirectory::readTermination(Step step) const
{
  const string filename = terminationFile(step);
  const vector<CSV::Row> rows = CSV::readWithHeader(filename);
  if (rows.size() != 1)
  {
    throw Exception("Malformed termination record " + filename);
  }

  TerminationRecord record;
  try
  {
    record.termination   = terminationFromString(rows[0].at("termination"));
    record.numIterations = parseUnsigned(rows[0].at("iterations"));
    record.reason        = rows[0].at("reason");
  }
  catch (std::exception &e)
  {
    throw Exception(strf("Error while parsing file '%s': %s", filename.c_str(),
                         e.what()));
  }
  return record;
}

std::vector<std::string> RunDirectory::listEventFiles(Step step,
                                                      unsigned index) const
{
  const string eventsDir = joinPath(iterationPath(step, index), "events");
  if (!isDirectory(eventsDir))
  {
    throw FileNotFound(eventsDir);
  }

  vector<string> files;
  for (const string &name : listDirectory(eventsDir))
  {
    if (name.size() > 4 && name.compare(name.size() - 4, 4, ".csv") == 0)
    {
      files.push_back(joinPath(eventsDir, name));
    }
  }
  return files;
}

Iteration
RunDirectory::readIteration(Step step, unsigned index, bool withEvents) const
{
  const string dir = iterationPath(step, index);
  if (!isDirectory(dir))
  {
    throw FileNotFound(dir);
  }

  Iteration iteration;
  iteration.index       = index;
  iteration.staticTerms = readStaticTerms(joinPath(dir, "static-terms.csv"));
  iteration.sourceTerms = readSourceTerms(joinPath(dir, "source-terms.csv"));
  iteration.statistics  = readStatistics(joinPath(dir, "statistics.csv"));

  if (!withEvents) return iteration;

  for (const string &file : listEventFiles(step, index))
  {
    iteration.events.push_back(readEventFile(file));
  }
  std::sort(iteration.events.begin(), iteration.events.end(),
            [](const Event &a, const Event &b) { return a.id < b.id; });

  if (hasInput())
  {
    const Catalog input = readInput();
    for (Event &ev : iteration.events)
    {
      if (input.hasEvent(ev.id)) ev.picks = input.getEvent(ev.id).picks;
    }
  }

  return iteration;
}

StepRecord RunDirectory::readStep(Step step) const
{
  const vector<unsigned> indices = iterationIndices(step);
  if (indices.empty() && !exists(step))
  {
    throw FileNotFound(stepPath(step));
  }

  StepRecord record;
  record.step = step;
  for (unsigned idx : indices)
  {
    record.iterations.push_back(readIteration(step, idx));
  }
  if (exists(step))
  {
    record.terminated  = true;
    record.termination = readTermination(step);
  }
  return record;
}

void RunDirectory::purge(Step step)
{
  const string dir = stepPath(step);
  if (!pathExists(dir)) return;
  if (!removePath(dir))
  {
    throw Exception("Unable to remove " + dir);
  }
  logInfoF("Removed data of step %s", toString(step).c_str());
}

std::string RunDirectory::eventFileName(const std::string &eventId)
{
  string name;
  for (const char c : eventId)
  {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || c == '-' || c == '_' || c == '.')
      name += c;
    else
      name += strf("%%%02X", uc);
  }
  // no hidden files
  if (!name.empty() && name[0] == '.') name = "%2E" + name.substr(1);
  return name;
}

/*
 * id,isotime,latitude,longitude,depth,rms,status,failureReason
 * <event values>
 * networkCode,stationLabel,phase,residual,correction,distance,weight
 * <one row per arrival>
 */
void RunDirectory::writeEventFile(const Event &event,
                                  const std::string &filename)
{
  ofstream out(filename);
  if (!out.is_open())
  {
    throw Exception("Cannot write file " + filename);
  }

  CSV::writeRow(out, {"id", "isotime", "latitude", "longitude", "depth", "rms",
                      "status", "failureReason"});
  CSV::writeRow(out, {event.id, UTCClock::toString(event.hypocenter.time),
                      formatDouble(event.hypocenter.latitude),
                      formatDouble(event.hypocenter.longitude),
                      formatDouble(event.hypocenter.depth),
                      formatDouble(event.rms), toString(event.status),
                      event.failureReason});

  CSV::writeRow(out, {"networkCode", "stationLabel", "phase", "residual",
                      "correction", "distance", "weight"});
  for (const Arrival &arr : event.arrivals)
  {
    CSV::writeRow(out, {arr.networkCode, arr.stationLabel, arr.phase,
                        formatDouble(arr.residual),
                        formatDouble(arr.correction),
                        formatDouble(arr.distance),
                        formatDouble(arr.weight)});
  }

  if (!out.good())
  {
    throw Exception("Error while writing " + filename);
  }
}

Event RunDirectory::readEventFile(const std::string &filename)
{
  const vector<vector<string>> rows = CSV::read(filename);
  if (rows.size() < 2)
  {
    throw Exception("Malformed event file " + filename);
  }

  Event ev;
  try
  {
    const vector<CSV::Row> evRows =
        CSV::format(rows[0], rows.begin() + 1, rows.begin() + 2);
    const CSV::Row &row     = evRows.at(0);
    ev.id                   = row.at("id");
    ev.hypocenter.time      = UTCClock::fromString(row.at("isotime"));
    ev.hypocenter.latitude  = std::stod(row.at("latitude"));
    ev.hypocenter.longitude = std::stod(row.at("longitude"));
    ev.hypocenter.depth     = std::stod(row.at("depth"));
    const double rms        = parseDouble(row.at("rms"));
    ev.rms                  = std::isfinite(rms) ? rms : 0;
    ev.status               = statusFromString(row.at("status"));
    ev.failureReason        = row.at("failureReason");

    if (rows.size() > 2)
    {
      for (const CSV::Row &arow :
           CSV::format(rows[2], rows.begin() + 3, rows.end()))
      {
        Arrival arr;
        arr.networkCode  = arow.at("networkCode");
        arr.stationLabel = arow.at("stationLabel");
        arr.phase        = arow.at("phase");
        arr.residual     = parseDouble(arow.at("residual"));
        arr.correction   = parseDouble(arow.at("correction"));
        arr.distance     = parseDouble(arow.at("distance"));
        arr.weight       = parseDouble(arow.at("weight"));
        ev.arrivals.push_back(arr);
      }
    }
  }
  catch (std::exception &e)
  {
    throw Exception(strf("Error while parsing file '%s': %s", filename.c_str(),
                         e.what()));
  }

  if (ev.id.empty())
  {
    throw Exception("Event without id in " + filename);
  }
  return ev;
}

void RunDirectory::writeStaticTerms(const StationTermSet &terms,
                                    const std::string &filename)
{
  ofstream out(filename);
  if (!out.is_open())
  {
    throw Exception("Cannot write file " + filename);
  }
  CSV::writeRow(out, {"station", "phase", "correction", "count"});
  for (const auto &kv : terms.terms())
  {
    CSV::writeRow(out, {kv.first.first, kv.first.second,
                        formatDouble(kv.second.correction),
                        std::to_string(kv.second.count)});
  }
  if (!out.good())
  {
    throw Exception("Error while writing " + filename);
  }
}

StationTermSet RunDirectory::readStaticTerms(const std::string &filename)
{
  StationTermSet terms;
  unsigned row_count = 0;
  try
  {
    for (const CSV::Row &row : CSV::readWithHeader(filename))
    {
      row_count++;
      StationTerm term;
      term.correction = std::stod(row.at("correction"));
      term.count      = parseUnsigned(row.at("count"));
      terms.set(row.at("station"), row.at("phase"), term);
    }
  }
  catch (FileNotFound &)
  {
    throw;
  }
  catch (std::exception &e)
  {
    throw Exception(strf("Error while parsing file '%s' at row %u: %s",
                         filename.c_str(), row_count, e.what()));
  }
  return terms;
}

void RunDirectory::writeSourceTerms(const SourceTermSet &terms,
                                    const std::string &filename)
{
  ofstream out(filename);
  if (!out.is_open())
  {
    throw Exception("Cannot write file " + filename);
  }
  CSV::writeRow(out, {"eventId", "station", "phase", "correction", "count"});
  for (const auto &ev : terms.terms())
  {
    for (const auto &kv : ev.second.terms())
    {
      CSV::writeRow(out, {ev.first, kv.first.first, kv.first.second,
                          formatDouble(kv.second.correction),
                          std::to_string(kv.second.count)});
    }
  }
  if (!out.good())
  {
    throw Exception("Error while writing " + filename);
  }
}

SourceTermSet RunDirectory::readSourceTerms(const std::string &filename)
{
  SourceTermSet terms;
  unsigned row_count = 0;
  try
  {
    for (const CSV::Row &row : CSV::readWithHeader(filename))
    {
      row_count++;
      StationTerm term;
      term.correction = std::stod(row.at("correction"));
      term.count      = parseUnsigned(row.at("count"));
      terms.at(row.at("eventId")).set(row.at("station"), row.at("phase"), term);
    }
  }
  catch (FileNotFound &)
  {
    throw;
  }
  catch (std::exception &e)
  {
    throw Exception(strf("Error while parsing file '%s' at row %u: %s",
                         filename.c_str(), row_count, e.what()));
  }
  return terms;
}

void RunDirectory::writeStatistics(unsigned index,
                                   const IterationStatistics &stats,
                                   const std::string &filename)
{
  ofstream out(filename);
  if (!out.is_open())
  {
    throw Exception("Cannot write file " + filename);
  }
  const Dispersion &d = stats.dispersion;
  CSV::writeRow(out, {"iteration", "events", "located", "failed", "residuals",
                      "median", "mad", "smad", "rms"});
  CSV::writeRow(out, {std::to_string(index), std::to_string(stats.numEvents),
                      std::to_string(stats.numLocated),
                      std::to_string(stats.numFailed),
                      std::to_string(d.numResiduals), formatDouble(d.median),
                      formatDouble(d.mad), formatDouble(d.smad),
                      formatDouble(d.rms)});
  if (!out.good())
  {
    throw Exception("Error while writing " + filename);
  }
}

IterationStatistics RunDirectory::readStatistics(const std::string &filename)
{
  const vector<CSV::Row> rows = CSV::readWithHeader(filename);
  if (rows.size() != 1)
  {
    throw Exception("Malformed statistics file " + filename);
  }

  IterationStatistics stats;
  try
  {
    const CSV::Row &row           = rows[0];
    stats.numEvents               = parseUnsigned(row.at("events"));
    stats.numLocated              = parseUnsigned(row.at("located"));
    stats.numFailed               = parseUnsigned(row.at("failed"));
    stats.dispersion.numResiduals = parseUnsigned(row.at("residuals"));
    stats.dispersion.median       = parseDouble(row.at("median"));
    stats.dispersion.mad          = parseDouble(row.at("mad"));
    stats.dispersion.smad         = parseDouble(row.at("smad"));
    stats.dispersion.rms          = parseDouble(row.at("rms"));
  }
  catch (std::exception &e)
  {
    throw Exception(strf("Error while parsing file '%s': %s", filename.c_str(),
                         e.what()));
  }
  return stats;
}

} // namespace MEL
