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

#include "mel/catalog.h"
#include "mel/locator.h"
#include "mel/utils.h"

#include <boost/filesystem.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace {

/*
 * Scratch directory removed at the end of the test
 */
struct TempDir
{
  TempDir()
      : path(MEL::uniqueTempPath(
            boost::filesystem::temp_directory_path().string(), "mel-test"))
  {
    MEL::createDirectories(path);
  }
  ~TempDir() { MEL::removePath(path); }

  TempDir(const TempDir &)        = delete;
  void operator=(const TempDir &) = delete;

  const std::string path;
};

const std::vector<std::string> stationList = {"ST01", "ST02", "ST03",
                                              "ST04", "ST05", "ST06"};

std::string eventId(unsigned i) { return MEL::strf("ev%02u", i); }

/*
 * `numEvents` events on a small grid, each one picked (P) at every station
 * of `stationList`
 */
MEL::Catalog buildCatalog(unsigned numEvents, unsigned picksPerEvent = 6)
{
  MEL::Catalog cat;
  const MEL::UTCTime start = MEL::UTCClock::fromDate(2020, 3, 1, 12, 0, 0);

  for (unsigned i = 0; i < numEvents; i++)
  {
    MEL::Event ev;
    ev.id                   = eventId(i);
    ev.hypocenter.latitude  = 46.0 + 0.01 * (i % 5);
    ev.hypocenter.longitude = 7.0 + 0.01 * (i / 5);
    ev.hypocenter.depth     = 5.0 + (i % 3);
    ev.hypocenter.time      = start + MEL::secToDur(60. * i);

    for (unsigned j = 0; j < picksPerEvent && j < stationList.size(); j++)
    {
      MEL::Pick pick;
      pick.networkCode  = "CH";
      pick.stationLabel = stationList[j];
      pick.channelCode  = "HHZ";
      pick.phase        = "P";
      pick.time         = ev.hypocenter.time + MEL::secToDur(2. + j);
      pick.uncertainty  = 0.05;
      ev.picks.push_back(pick);
    }
    cat.addEvent(ev);
  }
  return cat;
}

/*
 * In-memory locator producing scripted residuals:
 *
 *   residual = bias(station) - correction + amplitude(call) * pattern
 *
 * where `call` is the number of times the event has been located so far
 * (1-based) and pattern is -1, 0 or 1 depending on event and station, so
 * that each station sees the three values equally often when the number
 * of events is a multiple of 3. With zero biases the MAD of an iteration
 * is then amplitude(call).
 */
class ScriptedLocator : public MEL::Locator
{
public:
  std::map<std::string, double> bias; // by station
  std::function<double(unsigned call)> amplitude = [](unsigned) {
    return 0.1;
  };
  // events always failing
  std::set<std::string> failingEvents;
  // (event, call) failing
  std::set<std::pair<std::string, unsigned>> failingCalls;
  // (event, call) throwing
  std::set<std::pair<std::string, unsigned>> throwingCalls;

  MEL::LocatorOutput locate(const MEL::Event &event,
                            const MEL::StationTermSet &terms) override
  {
    _totalCalls++;

    unsigned call;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      call = ++_calls[event.id];
    }

    if (throwingCalls.count({event.id, call}))
    {
      throw MEL::Exception("scripted locator error");
    }

    MEL::LocatorOutput out;
    if (failingEvents.count(event.id) || failingCalls.count({event.id, call}))
    {
      out.located = false;
      out.message = "REJECTED";
      return out;
    }

    const unsigned evIdx = std::stoul(event.id.substr(2));

    out.located               = true;
    out.hypocenter            = event.hypocenter;
    out.hypocenter.latitude  += 0.001;

    std::vector<double> residuals;
    for (size_t j = 0; j < event.picks.size(); j++)
    {
      const MEL::Pick &pick = event.picks[j];
      MEL::Arrival arr;
      arr.networkCode  = pick.networkCode;
      arr.stationLabel = pick.stationLabel;
      arr.phase        = pick.phase;
      arr.correction   = terms.correction(pick.stationLabel, pick.phase);
      arr.distance     = 10. * (j + 1);
      arr.weight       = 1;

      const double pattern = static_cast<int>((evIdx + j) % 3) - 1;
      const auto b         = bias.find(pick.stationLabel);
      arr.residual = (b != bias.end() ? b->second : 0.) - arr.correction +
                     amplitude(call) * pattern;
      residuals.push_back(arr.residual);
      out.arrivals.push_back(arr);
    }
    out.rms = MEL::computeRms(residuals);
    return out;
  }

  unsigned totalCalls() const { return _totalCalls; }

  unsigned calls(const std::string &eventId) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    const auto it = _calls.find(eventId);
    return it != _calls.end() ? it->second : 0;
  }

private:
  mutable std::mutex _mutex;
  std::map<std::string, unsigned> _calls;
  std::atomic<unsigned> _totalCalls{0};
};

/*
 * Located event with the given total residuals (correction 0) at
 * `stationList` stations
 */
MEL::Event locatedEvent(const std::string &id,
                        double lat,
                        double lon,
                        double depth,
                        const std::map<std::string, double> &residuals)
{
  MEL::Event ev;
  ev.id                   = id;
  ev.hypocenter.latitude  = lat;
  ev.hypocenter.longitude = lon;
  ev.hypocenter.depth     = depth;
  ev.status               = MEL::Event::Status::located;
  for (const auto &kv : residuals)
  {
    MEL::Arrival arr;
    arr.networkCode  = "CH";
    arr.stationLabel = kv.first;
    arr.phase        = "P";
    arr.residual     = kv.second;
    ev.arrivals.push_back(arr);
  }
  return ev;
}

} // namespace
