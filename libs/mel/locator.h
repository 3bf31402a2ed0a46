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

#ifndef __MEL_LOCATOR_H__
#define __MEL_LOCATOR_H__

#include "catalog.h"
#include "stationterms.h"

#include <string>
#include <vector>

namespace MEL {

struct LocatorOutput
{
  bool located = false;
  std::string message; // why the location was not successful
  Hypocenter hypocenter;
  double rms = 0;
  std::vector<Arrival> arrivals;
};

/*
 * Single-event location backend. The velocity model belongs to the
 * concrete implementation. `locate` is called concurrently from the
 * relocation workers and must not share mutable state between calls.
 *
 * The terms are additive corrections to the predicted travel times of the
 * matching station/phase; identity terms are not applied.
 */
class Locator
{
public:
  virtual ~Locator() = default;

  virtual LocatorOutput locate(const Event &event,
                               const StationTermSet &terms) = 0;
};

struct RelocationResult
{
  Event event; // the relocated event, status located or failed

  bool success() const { return event.status == Event::Status::located; }
};

/*
 * Relocate a private copy of `event`. Never throws: every problem is
 * reported as a failed event with a reason
 * - fewer than `minPicks` picks: the locator is not called
 * - the locator does not locate the event or throws
 * - fewer than `minPicks` arrivals with non-zero weight
 */
RelocationResult relocateEvent(Locator &locator,
                               const Event &event,
                               const StationTermSet &terms,
                               unsigned minPicks);

} // namespace MEL

#endif
