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

#ifndef __MEL_NLLOC_H__
#define __MEL_NLLOC_H__

#include "config.h"
#include "locator.h"

#include <string>
#include <vector>

namespace MEL {
namespace NLLoc {

struct Station
{
  std::string networkCode;
  std::string stationCode;
  double latitude;
  double longitude;
  double depth;     // km
  double elevation; // km
};

/*
 * Station label as written in NonLinLoc files: network and station codes
 * joined by `delimiter` (plain concatenation when empty)
 */
std::string stationLabel(const std::string &networkCode,
                         const std::string &stationCode,
                         const std::string &delimiter);

/*
 * Split a NonLinLoc station label. Without a delimiter, or when the label
 * doesn't contain it, the whole label is the station code.
 */
void splitStationLabel(const std::string &label,
                       const std::string &delimiter,
                       std::string &networkCode,
                       std::string &stationCode);

/*
 * Write the picks of `event` as NonLinLoc phase file (NLLOC_OBS), sorted
 * by time
 */
void writeObsFile(const Event &event,
                  const std::string &filename,
                  const std::string &delimiter);

/*
 * Read a NonLinLoc phase file (NLLOC_OBS) into an event without hypocenter.
 * The picks are those of the PHASE ... END_PHASE block or, without one, of
 * the lines with a GAU, BOX, FIX or NONE error type. Throws FileNotFound for
 * a missing file and Exception when no pick can be read.
 */
Event readObsFile(const std::string &filename,
                  const std::string &eventId,
                  const std::string &delimiter);

/*
 * Read the LOCSRCE/GTSRCE statements of a station file. Only the LATLON
 * format is supported.
 */
std::vector<Station> readStationFile(const std::string &filename,
                                     const std::string &delimiter);

/*
 * Write a station file, one line per station:
 * LOCSRCE label LATLON lat lon depth elev
 */
void writeStationFile(const std::vector<Station> &stations,
                      const std::string &filename,
                      const std::string &delimiter,
                      const std::string &keyword = "LOCSRCE");

/*
 * Parse a NonLinLoc hypocenter-phase file (.hyp). The output is located
 * only for status LOCATED. Arrivals with zero predicted travel time or
 * zero weight, i.e. not used in the location, are skipped. Distances are
 * converted to km. Throws Exception on malformed files.
 */
LocatorOutput readHypFile(const std::string &filename,
                          const std::string &delimiter);

/*
 * Copy a NonLinLoc control file replacing the LOCFILES statement and any
 * LOCDELAY statement with the given lines
 */
void copyControlFile(const std::string &srcFilename,
                     const std::string &destFilename,
                     const std::string &locfiles,
                     const std::vector<std::string> &locdelays);

} // namespace NLLoc

/*
 * Locator running the NonLinLoc executable. Each call works in its own
 * directory, so concurrent calls are safe.
 */
class NLLocLocator : public Locator
{
public:
  explicit NLLocLocator(const NLLocOptions &options);

  LocatorOutput locate(const Event &event,
                       const StationTermSet &terms) override;

private:
  const NLLocOptions _options;
};

} // namespace MEL

#endif
