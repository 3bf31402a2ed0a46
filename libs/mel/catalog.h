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

#ifndef __MEL_CATALOG_H__
#define __MEL_CATALOG_H__

#include <limits>
#include <map>
#include <string>
#include <vector>

#include "utctime.h"

namespace MEL {

struct Hypocenter
{
  double latitude  = 0;
  double longitude = 0;
  double depth     = 0; // km
  UTCTime time;
};

// Observed arrival, immutable once ingested
struct Pick
{
  std::string networkCode;
  std::string stationLabel;
  std::string channelCode;
  std::string phase;
  UTCTime time;
  double uncertainty = std::numeric_limits<double>::quiet_NaN(); // secs
};

// Location output for a single pick
struct Arrival
{
  std::string networkCode;
  std::string stationLabel;
  std::string phase;
  double residual   = 0; // observed - (predicted + correction) [sec]
  double correction = 0; // station term applied by the locator [sec]
  double distance   = 0; // epicentral distance [km]
  double weight     = 1; // 0 -> not used by the locator

  // misfit with respect to the uncorrected prediction
  double totalResidual() const { return residual + correction; }
};

struct Event
{
  enum class Status
  {
    pending,
    located,
    failed
  };

  std::string id; // unique in the catalog
  Hypocenter hypocenter;
  std::vector<Pick> picks;

  // output of the last relocation
  std::vector<Arrival> arrivals;
  double rms = 0;
  Status status = Status::pending;
  std::string failureReason;

  bool isTerminal() const { return status != Status::pending; }
};

std::string toString(Event::Status status);

Event::Status statusFromString(const std::string &str);

/*
 * The set of events handled by a run, indexed by event id
 */
class Catalog
{
public:
  Catalog()  = default;
  ~Catalog() = default;

  Catalog(const Catalog &other)            = default;
  Catalog &operator=(const Catalog &other) = default;

  Catalog(Catalog &&other)            = default;
  Catalog &operator=(Catalog &&other) = default;

  /*
   * events file columns: id,isotime,latitude,longitude,depth
   * picks file columns:
   *   eventId,isotime,uncertainty,phase,networkCode,stationLabel,channelCode
   */
  Catalog(const std::string &eventFile, const std::string &pickFile);

  bool empty() const { return _events.empty(); }
  size_t size() const { return _events.size(); }

  // throws if an event with the same id exists already
  void addEvent(const Event &event);

  bool hasEvent(const std::string &eventId) const
  {
    return _events.find(eventId) != _events.end();
  }

  const Event &getEvent(const std::string &eventId) const;

  const std::map<std::string, Event> &getEvents() const { return _events; }

  void writeToFile(const std::string &eventFile,
                   const std::string &pickFile) const;

private:
  std::map<std::string, Event> _events;
};

} // namespace MEL

#endif
