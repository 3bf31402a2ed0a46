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

#include "locator.h"
#include "log.h"
#include "utils.h"

#include <algorithm>

using namespace std;

namespace MEL {

namespace {

RelocationResult failure(const Event &event, const string &reason)
{
  RelocationResult result;
  result.event               = event;
  result.event.status        = Event::Status::failed;
  result.event.failureReason = reason;
  result.event.arrivals.clear();
  result.event.rms = 0;
  logDebugF("Event %s: relocation failed (%s)", event.id.c_str(),
            reason.c_str());
  return result;
}

} // namespace

RelocationResult relocateEvent(Locator &locator,
                               const Event &event,
                               const StationTermSet &terms,
                               unsigned minPicks)
{
  if (event.picks.size() < minPicks)
  {
    return failure(event, strf("Not enough picks (%zu, required %u)",
                               event.picks.size(), minPicks));
  }

  LocatorOutput out;
  try
  {
    out = locator.locate(event, terms);
  }
  catch (exception &e)
  {
    return failure(event, string("Locator error: ") + e.what());
  }
  catch (...)
  {
    return failure(event, "Unknown locator error");
  }

  if (!out.located)
  {
    return failure(event, out.message.empty()
                              ? string("Location did not converge")
                              : out.message);
  }

  const size_t usedArrivals =
      std::count_if(out.arrivals.begin(), out.arrivals.end(),
                    [](const Arrival &arr) { return arr.weight > 0; });
  if (usedArrivals < minPicks)
  {
    return failure(event, strf("Not enough usable arrivals (%zu, required %u)",
                               usedArrivals, minPicks));
  }

  RelocationResult result;
  result.event               = event;
  result.event.hypocenter    = out.hypocenter;
  result.event.arrivals      = out.arrivals;
  result.event.rms           = out.rms;
  result.event.status        = Event::Status::located;
  result.event.failureReason = "";
  return result;
}

} // namespace MEL
