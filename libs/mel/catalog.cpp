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

#include "catalog.h"
#include "csvreader.h"
#include "log.h"
#include "utils.h"

#include <cmath>
#include <fstream>
#include <limits>

using namespace std;

namespace {

double parseOptionalDouble(const string &s)
{
  if (s.empty()) return numeric_limits<double>::quiet_NaN();
  return std::stod(s);
}

} // namespace

namespace MEL {

std::string toString(Event::Status status)
{
  switch (status)
  {
  case Event::Status::pending: return "pending";
  case Event::Status::located: return "located";
  case Event::Status::failed: return "failed";
  }
  return "";
}

Event::Status statusFromString(const std::string &str)
{
  if (str == "pending") return Event::Status::pending;
  if (str == "located") return Event::Status::located;
  if (str == "failed") return Event::Status::failed;
  throw Exception("Unknown event status: " + str);
}

Catalog::Catalog(const string &eventFile, const string &pickFile)
{
  if (!pathExists(eventFile))
  {
    throw FileNotFound(eventFile);
  }

  if (!pathExists(pickFile))
  {
    throw FileNotFound(pickFile);
  }

  unsigned row_count = 0;
  try
  {
    for (const auto &row : CSV::readWithHeader(eventFile))
    {
      row_count++;
      Event ev;
      ev.id                   = row.at("id");
      ev.hypocenter.time      = UTCClock::fromString(row.at("isotime"));
      ev.hypocenter.latitude  = std::stod(row.at("latitude"));
      ev.hypocenter.longitude = std::stod(row.at("longitude"));
      ev.hypocenter.depth     = std::stod(row.at("depth"));
      addEvent(ev);
    }
  }
  catch (std::exception &e)
  {
    string msg = strf("Error while parsing file '%s' at row %u: %s",
                      eventFile.c_str(), row_count, e.what());
    throw Exception(msg);
  }

  row_count = 0;
  try
  {
    for (const auto &row : CSV::readWithHeader(pickFile))
    {
      row_count++;
      Pick pick;
      const string eventId = row.at("eventId");
      pick.time            = UTCClock::fromString(row.at("isotime"));
      pick.uncertainty     = parseOptionalDouble(row.at("uncertainty"));
      pick.phase           = row.at("phase");
      pick.networkCode     = row.at("networkCode");
      pick.stationLabel    = row.at("stationLabel");
      pick.channelCode     = row.at("channelCode");

      auto it = _events.find(eventId);
      if (it == _events.end())
      {
        throw Exception("unknown event " + eventId);
      }
      it->second.picks.push_back(pick);
    }
  }
  catch (std::exception &e)
  {
    string msg = strf("Error while parsing file '%s' at row %u: %s",
                      pickFile.c_str(), row_count, e.what());
    throw Exception(msg);
  }

  logDebugF("Loaded %zu events from %s", _events.size(), eventFile.c_str());
}

void Catalog::addEvent(const Event &event)
{
  if (event.id.empty())
  {
    throw Exception("Cannot add event without id");
  }
  if (!_events.emplace(event.id, event).second)
  {
    throw Exception("Cannot add event, the same id exists already: " +
                    event.id);
  }
}

const Event &Catalog::getEvent(const std::string &eventId) const
{
  auto it = _events.find(eventId);
  if (it == _events.end())
  {
    throw Exception("Cannot find event id " + eventId + " in the catalog");
  }
  return it->second;
}

void Catalog::writeToFile(const string &eventFile, const string &pickFile) const
{
  ofstream evStream(eventFile);
  if (!evStream.is_open())
  {
    throw Exception("Cannot write file " + eventFile);
  }
  CSV::writeRow(evStream, {"id", "isotime", "latitude", "longitude", "depth"});
  for (const auto &kv : _events)
  {
    const Event &ev = kv.second;
    CSV::writeRow(evStream, {ev.id, UTCClock::toString(ev.hypocenter.time),
                             strf("%.12f", ev.hypocenter.latitude),
                             strf("%.12f", ev.hypocenter.longitude),
                             strf("%.6f", ev.hypocenter.depth)});
  }

  ofstream pkStream(pickFile);
  if (!pkStream.is_open())
  {
    throw Exception("Cannot write file " + pickFile);
  }
  CSV::writeRow(pkStream, {"eventId", "isotime", "uncertainty", "phase",
                           "networkCode", "stationLabel", "channelCode"});
  for (const auto &kv : _events)
  {
    const Event &ev = kv.second;
    for (const Pick &pick : ev.picks)
    {
      CSV::writeRow(pkStream,
                    {ev.id, UTCClock::toString(pick.time),
                     std::isfinite(pick.uncertainty)
                         ? strf("%g", pick.uncertainty)
                         : "",
                     pick.phase, pick.networkCode, pick.stationLabel,
                     pick.channelCode});
    }
  }

  if (!evStream.good() || !pkStream.good())
  {
    throw Exception("Error while writing catalog to " + eventFile);
  }
}

} // namespace MEL
