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

#include "nlloc.h"
#include "log.h"
#include "utils.h"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <fstream>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

using namespace std;

namespace MEL {
namespace NLLoc {

namespace {

vector<string> tokenize(const string &line)
{
  vector<string> tokens;
  istringstream iss(line);
  string tok;
  while (iss >> tok) tokens.push_back(tok);
  return tokens;
}

double toDouble(const string &str, const string &filename)
{
  size_t idx = 0;
  double value;
  try
  {
    value = std::stod(str, &idx);
  }
  catch (exception &e)
  {
    throw Exception(strf("Invalid number '%s' in %s (%s)", str.c_str(),
                         filename.c_str(), e.what()));
  }
  if (idx != str.size())
  {
    throw Exception(
        strf("Invalid number '%s' in %s", str.c_str(), filename.c_str()));
  }
  return value;
}

int toInt(const string &str, const string &filename)
{
  const double value = toDouble(str, filename);
  if (value != std::floor(value))
  {
    throw Exception(
        strf("Invalid integer '%s' in %s", str.c_str(), filename.c_str()));
  }
  return static_cast<int>(value);
}

bool startsWith(const string &line, const string &prefix)
{
  return line.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string stationLabel(const std::string &networkCode,
                         const std::string &stationCode,
                         const std::string &delimiter)
{
  if (networkCode.empty()) return stationCode;
  return networkCode + delimiter + stationCode;
}

void splitStationLabel(const std::string &label,
                       const std::string &delimiter,
                       std::string &networkCode,
                       std::string &stationCode)
{
  const size_t pos = delimiter.empty() ? string::npos : label.find(delimiter);
  if (pos == string::npos)
  {
    networkCode = "";
    stationCode = label;
  }
  else
  {
    networkCode = label.substr(0, pos);
    stationCode = label.substr(pos + delimiter.size());
  }
}

void writeObsFile(const Event &event,
                  const std::string &filename,
                  const std::string &delimiter)
{
  ofstream out(filename);
  if (!out.is_open())
  {
    throw Exception("Cannot write file " + filename);
  }

  vector<const Pick *> picks;
  for (const Pick &pick : event.picks) picks.push_back(&pick);
  std::stable_sort(picks.begin(), picks.end(),
                   [](const Pick *a, const Pick *b) { return a->time < b->time; });

  out << "PHASE ID Ins Cmp On Pha FM Date HrMn Sec Err ErrMag Coda Amp Per"
      << std::endl;

  for (const Pick *pick : picks)
  {
    const string label =
        stationLabel(pick->networkCode, pick->stationLabel, delimiter);
    const string comp =
        pick->channelCode.empty()
            ? "?"
            : string(1, static_cast<char>(std::toupper(
                  static_cast<unsigned char>(pick->channelCode.back()))));
    const double err =
        std::isfinite(pick->uncertainty) && pick->uncertainty > 0
            ? pick->uncertainty
            : -1.0;

    out << strf("%-8s %-4s %-4s %1s %-6s %1s %s GAU %9.2e %9.2e %9.2e %9.2e",
                label.c_str(), "?", comp.c_str(), "?",
                pick->phase.empty() ? "?" : pick->phase.c_str(), "?",
                UTCClock::toNLLocString(pick->time).c_str(), err, -1.0, -1.0,
                -1.0)
        << std::endl;
  }

  out << "END_PHASE" << std::endl;
}

void writeStationFile(const std::vector<Station> &stations,
                      const std::string &filename,
                      const std::string &delimiter,
                      const std::string &keyword)
{
  if (keyword != "LOCSRCE" && keyword != "GTSRCE")
  {
    throw Exception("Invalid station keyword " + keyword +
                    " (valid: LOCSRCE, GTSRCE)");
  }

  ofstream out(filename);
  if (!out.is_open())
  {
    throw Exception("Cannot write file " + filename);
  }

  map<string, const Station *> sorted;
  for (const Station &sta : stations)
  {
    sorted[stationLabel(sta.networkCode, sta.stationCode, delimiter)] = &sta;
  }

  for (const auto &kv : sorted)
  {
    const Station &sta = *kv.second;
    out << strf("%s %-8s LATLON %8.4f %9.4f %8.4f %8.4f", keyword.c_str(),
                kv.first.c_str(), sta.latitude, sta.longitude, sta.depth,
                sta.elevation)
        << std::endl;
  }
}

Event readObsFile(const std::string &filename,
                  const std::string &eventId,
                  const std::string &delimiter)
{
  ifstream in(filename);
  if (!in.is_open())
  {
    throw FileNotFound(filename);
  }

  vector<string> lines;
  string line;
  bool hasBlock = false;
  while (std::getline(in, line))
  {
    if (trimString(line).empty()) continue;
    if (startsWith(line, "PHASE "))
    {
      hasBlock = true;
      lines.clear();
      continue;
    }
    if (startsWith(line, "END_PHASE")) break;
    lines.push_back(line);
  }

  if (!hasBlock)
  {
    static const std::regex errorType(R"(\s(GAU|BOX|FIX|NONE)\s)",
                                      std::regex::icase);
    lines.erase(std::remove_if(lines.begin(), lines.end(),
                               [](const string &l) {
                                 return !std::regex_search(l, errorType);
                               }),
                lines.end());
  }

  Event event;
  event.id = eventId;

  for (const string &pl : lines)
  {
    // label ins cmp onset phase fm date hrmn sec errtype err ...
    const vector<string> items = tokenize(pl);
    if (items.size() < 9)
    {
      throw Exception("Malformed phase line in " + filename);
    }

    Pick pick;
    splitStationLabel(items[0], delimiter, pick.networkCode,
                      pick.stationLabel);
    pick.channelCode = items[2] != "?" ? items[2] : "";
    pick.phase       = items[4];
    try
    {
      pick.time = UTCClock::fromNLLocString(items[6], items[7],
                                            toDouble(items[8], filename));
    }
    catch (exception &e)
    {
      throw Exception(strf("Invalid pick time in %s (%s)", filename.c_str(),
                           e.what()));
    }
    if (items.size() > 10)
    {
      const double err = toDouble(items[10], filename);
      if (err > 0) pick.uncertainty = err;
    }
    event.picks.push_back(pick);
  }

  if (event.picks.empty())
  {
    throw Exception("Phase file seems corrupt: " + filename);
  }

  logDebugF("Read %zu picks for event %s from %s", event.picks.size(),
            eventId.c_str(), filename.c_str());
  return event;
}

std::vector<Station> readStationFile(const std::string &filename,
                                     const std::string &delimiter)
{
  ifstream in(filename);
  if (!in.is_open())
  {
    throw FileNotFound(filename);
  }

  vector<Station> stations;
  string line;
  while (std::getline(in, line))
  {
    if (!startsWith(line, "LOCSRCE") && !startsWith(line, "GTSRCE")) continue;

    // LOCSRCE label LATLON lat lon depth elev
    const vector<string> items = tokenize(line);
    if (items.size() < 7)
    {
      throw Exception("Malformed station line in " + filename);
    }
    if (items[2] != "LATLON")
    {
      throw Exception(strf("Unsupported station format %s in %s",
                           items[2].c_str(), filename.c_str()));
    }

    Station sta;
    splitStationLabel(items[1], delimiter, sta.networkCode, sta.stationCode);
    sta.latitude  = toDouble(items[3], filename);
    sta.longitude = toDouble(items[4], filename);
    sta.depth     = toDouble(items[5], filename);
    sta.elevation = toDouble(items[6], filename);
    stations.push_back(sta);
  }
  return stations;
}

/*
 * NLLOC "./loc/event.20100102.030405.grid0" "LOCATED" "Location completed."
 * ...
 * GEOGRAPHIC  OT 2010 01 02  03 04  5.123  Lat 46.1 Long 7.5 Depth 8.2
 * QUALITY  Pmax 1.2e+03 MFmin 2.3 MFmax 2.5 RMS 0.123 Nphs 12 Gap 123 ...
 * ...
 * TRANSFORM  SIMPLE LatOrig 46.0 LongOrig 7.0 RotCW 0.0
 * PHASE ID Ins Cmp On Pha FM Date HrMn Sec Err ErrMag Coda Amp Per PriorWt
 *     > TTpred Res Weight StaLoc(X Y Z) SDist SAzim RAz RDip RQual Tcorr
 * STA1 ? Z ? P ? 20100102 0304 7.1234 GAU 1.0e-01 ... > 2.0 0.01 1.2 ...
 * END_PHASE
 * END_NLLOC
 *
 * Only the first NLLOC block is read
 */
LocatorOutput readHypFile(const std::string &filename,
                          const std::string &delimiter)
{
  ifstream in(filename);
  if (!in.is_open())
  {
    throw FileNotFound(filename);
  }

  LocatorOutput out;

  bool inBlock = false, inPhases = false, hasGeographic = false;
  bool hasStatus = false, isGlobal = false;
  vector<vector<string>> phaseLines;

  static const std::regex statusRe(R"(\"(LOCATED|REJECTED|ABORTED)\")",
                                   std::regex::optimize);
  static const std::regex quotedRe(R"(\"([^\"]*)\")", std::regex::optimize);

  string line;
  while (std::getline(in, line))
  {
    if (!inBlock)
    {
      if (!startsWith(line, "NLLOC ")) continue;
      inBlock = true;

      std::smatch m;
      if (std::regex_search(line, m, statusRe))
      {
        hasStatus   = true;
        out.located = m.str(1) == "LOCATED";
        out.message = m.str(1);
      }
      // the last quoted string explains the status
      string reason;
      for (auto it = sregex_iterator(line.begin(), line.end(), quotedRe);
           it != sregex_iterator(); ++it)
      {
        reason = it->str(1);
      }
      if (hasStatus && !reason.empty() && reason != out.message)
      {
        out.message += ": " + reason;
      }
      continue;
    }

    if (startsWith(line, "END_NLLOC")) break;

    if (inPhases)
    {
      if (startsWith(line, "END_PHASE"))
        inPhases = false;
      else if (!trimString(line).empty())
        phaseLines.push_back(tokenize(line));
      continue;
    }

    const vector<string> items = tokenize(line);
    if (items.empty()) continue;

    if (items[0] == "PHASE")
    {
      inPhases = true;
    }
    else if (items[0] == "GEOGRAPHIC")
    {
      // GEOGRAPHIC OT yyyy mm dd hh mm ss.ssss Lat x Long x Depth x
      if (items.size() < 14)
        throw Exception("Malformed GEOGRAPHIC line in " + filename);

      // seconds are negative for events occurring just before midnight
      out.hypocenter.time = UTCClock::fromDate(
          toInt(items[2], filename), toInt(items[3], filename),
          toInt(items[4], filename), toInt(items[5], filename),
          toInt(items[6], filename));
      out.hypocenter.time += secToDur(toDouble(items[7], filename));

      const size_t n           = items.size();
      out.hypocenter.latitude  = toDouble(items[n - 5], filename);
      out.hypocenter.longitude = toDouble(items[n - 3], filename);
      out.hypocenter.depth     = toDouble(items[n - 1], filename);
      hasGeographic            = true;
    }
    else if (items[0] == "QUALITY")
    {
      for (size_t i = 1; i + 1 < items.size(); i++)
      {
        if (items[i] == "RMS")
        {
          out.rms = toDouble(items[i + 1], filename);
          break;
        }
      }
    }
    else if (items[0] == "TRANSFORM")
    {
      isGlobal = items.size() > 1 && items[1] == "GLOBAL";
    }
  }

  if (!inBlock || !hasStatus)
  {
    throw Exception("Hypocenter-phase file seems corrupt: " + filename);
  }

  if (!out.located)
  {
    return out;
  }

  if (!hasGeographic)
  {
    throw Exception("Missing GEOGRAPHIC line in " + filename);
  }

  for (const vector<string> &items : phaseLines)
  {
    // the location values follow the '>' separator
    const auto gt = std::find(items.begin(), items.end(), ">");
    if (gt == items.end() || items.end() - gt < 13 || gt - items.begin() < 9)
    {
      throw Exception("Malformed PHASE line in " + filename);
    }
    const size_t g = gt - items.begin();

    const double ttpred = toDouble(items[g + 1], filename);
    const double res    = toDouble(items[g + 2], filename);
    const double weight = toDouble(items[g + 3], filename);

    // not used in the location
    if (ttpred == 0 || weight == 0) continue;

    Arrival arr;
    splitStationLabel(items[0], delimiter, arr.networkCode, arr.stationLabel);
    arr.phase      = items[4];
    arr.residual   = res;
    arr.weight     = weight;
    arr.distance   = toDouble(items[g + 7], filename);
    arr.correction = toDouble(items[g + 12], filename);
    if (isGlobal) arr.distance = deg2km(arr.distance);

    out.arrivals.push_back(arr);
  }

  return out;
}

void copyControlFile(const std::string &srcFilename,
                     const std::string &destFilename,
                     const std::string &locfiles,
                     const std::vector<std::string> &locdelays)
{
  ifstream srcFile(srcFilename);
  ofstream destFile(destFilename);
  if (!srcFile.is_open() || !destFile.is_open())
  {
    throw Exception(strf("Cannot copy %s to %s", srcFilename.c_str(),
                         destFilename.c_str()));
  }

  bool replaced = false;
  string line;
  while (std::getline(srcFile, line))
  {
    const vector<string> items = tokenize(line);
    const string keyword       = items.empty() ? "" : items[0];

    if (keyword == "LOCDELAY") continue;

    if (keyword == "LOCFILES")
    {
      if (replaced) continue;
      destFile << locfiles << std::endl;
      for (const string &delay : locdelays) destFile << delay << std::endl;
      replaced = true;
      continue;
    }

    destFile << line << std::endl;
  }

  if (!replaced)
  {
    destFile << locfiles << std::endl;
    for (const string &delay : locdelays) destFile << delay << std::endl;
  }
}

} // namespace NLLoc

namespace {

/*
 * Run a command and wait for it: returns the exit status
 */
int runExternalProcess(const vector<string> &cmdparams,
                       const string &workingDir = "")
{
  string cmdline;
  vector<char *> params(cmdparams.size());
  for (size_t i = 0; i < cmdparams.size(); ++i)
  {
    params[i] = const_cast<char *>(cmdparams[i].c_str());
    if (i > 0) cmdline += " ";
    cmdline += cmdparams[i];
  }
  params.push_back(nullptr);

  logDebugF("Executing command: %s (working directory %s)", cmdline.c_str(),
            workingDir.c_str());

  pid_t pid = fork();

  if (pid < 0) // fork error
  {
    throw Exception(strf("Error (%d) in fork()", errno));
  }

  if (pid == 0) // child
  {
    if (!workingDir.empty())
    {
      if (chdir(workingDir.c_str()) != 0)
      {
        _exit(127);
      }
    }

    execv(params[0], &params[0]);
    _exit(127);
  }

  // parent: wait for the child to complete
  int status;
  pid_t ret;
  do
  {
    ret = waitpid(pid, &status, 0);
  } while (ret == -1 && errno == EINTR);

  if (ret == -1)
  {
    throw Exception(strf("Error (%d) in waitpid()", errno));
  }

  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

/*
 * Output of a single run in the loc directory: the per-event file is
 * preferred over the summary one
 */
string findHypFile(const string &locDir)
{
  string summary;
  for (const string &name : listDirectory(locDir))
  {
    if (name.size() < 4 || name.compare(name.size() - 4, 4, ".hyp") != 0)
      continue;
    if (name.find(".sum.") != string::npos)
    {
      if (summary.empty()) summary = joinPath(locDir, name);
      continue;
    }
    return joinPath(locDir, name);
  }
  if (summary.empty())
  {
    throw Exception("NonLinLoc produced no output in " + locDir);
  }
  return summary;
}

/*
 * Removes the working directory when going out of scope
 */
class WorkingDir
{
public:
  WorkingDir(const string &path, bool keep) : _path(path), _keep(keep) {}
  ~WorkingDir()
  {
    if (!_keep) removePath(_path);
  }
  WorkingDir(const WorkingDir &)     = delete;
  void operator=(const WorkingDir &) = delete;

  const string &path() const { return _path; }

private:
  const string _path;
  const bool _keep;
};

} // namespace

NLLocLocator::NLLocLocator(const NLLocOptions &options) : _options(options)
{
  if (_options.controlFile.empty())
  {
    throw ConfigurationError("NonLinLoc control file not set");
  }
  if (!pathExists(_options.controlFile))
  {
    throw ConfigurationError("NonLinLoc control file doesn't exist: " +
                             _options.controlFile);
  }
}

LocatorOutput NLLocLocator::locate(const Event &event,
                                   const StationTermSet &terms)
{
  namespace fs = boost::filesystem;

  const string parent = _options.workingDir.empty()
                            ? fs::temp_directory_path().string()
                            : _options.workingDir;

  WorkingDir workingDir(uniqueTempPath(parent, "nlloc"),
                        _options.keepWorkingFiles);
  const string locDir = joinPath(workingDir.path(), "loc");
  if (!createDirectories(locDir))
  {
    throw Exception("Unable to create working directory " + locDir);
  }

  const string obsFile = joinPath(workingDir.path(), "obs.nll");
  NLLoc::writeObsFile(event, obsFile, _options.delimiter);

  // map NonLinLoc labels back to network and station codes
  map<string, pair<string, string>> labels;
  set<pair<string, string>> delayKeys;
  vector<string> delays;
  for (const Pick &pick : event.picks)
  {
    const string label = NLLoc::stationLabel(
        pick.networkCode, pick.stationLabel, _options.delimiter);
    labels[label] = {pick.networkCode, pick.stationLabel};

    const StationTerm term = terms.get(pick.stationLabel, pick.phase);
    if (term.isIdentity()) continue;
    if (!delayKeys.insert({label, pick.phase}).second) continue;
    delays.push_back(strf("LOCDELAY %s %s %u %.6f", label.c_str(),
                          pick.phase.c_str(), term.count, term.correction));
  }

  string gridRoot = _options.timeGridRoot;
  if (gridRoot.empty())
  {
    // keep the one of the control file
    ifstream ctrl(_options.controlFile);
    string line;
    while (std::getline(ctrl, line))
    {
      istringstream iss(line);
      string keyword, obs, type, root;
      if ((iss >> keyword >> obs >> type >> root) && keyword == "LOCFILES")
      {
        gridRoot = root;
        break;
      }
    }
    if (gridRoot.empty())
    {
      throw Exception("No travel-time grid root configured nor found in " +
                      _options.controlFile);
    }
  }

  const string ctrlFile = joinPath(workingDir.path(), "nlloc.in");
  NLLoc::copyControlFile(
      _options.controlFile, ctrlFile,
      strf("LOCFILES %s NLLOC_OBS %s %s", obsFile.c_str(), gridRoot.c_str(),
           joinPath(locDir, "event").c_str()),
      delays);

  // use /bin/sh to get stdout/strerr redirection
  const string cmd =
      strf("%s %s >nlloc.out 2>&1", _options.exec.c_str(), "nlloc.in");
  const int status =
      runExternalProcess({"/bin/sh", "-c", cmd}, workingDir.path());
  if (status != 0)
  {
    throw Exception(strf("NonLinLoc exited with non zero value (%d) for "
                         "event %s",
                         status, event.id.c_str()));
  }

  LocatorOutput out =
      NLLoc::readHypFile(findHypFile(locDir), _options.delimiter);

  for (Arrival &arr : out.arrivals)
  {
    const auto it = labels.find(NLLoc::stationLabel(
        arr.networkCode, arr.stationLabel, _options.delimiter));
    if (it != labels.end())
    {
      arr.networkCode  = it->second.first;
      arr.stationLabel = it->second.second;
    }
  }

  return out;
}

} // namespace MEL
