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

#ifndef __MEL_STATIONTERMS_H__
#define __MEL_STATIONTERMS_H__

#include "catalog.h"
#include "config.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace MEL {

/*
 * Travel time correction for a station/phase pair. A term computed from
 * zero residuals is the identity (no correction), never a zero correction
 * with confidence.
 */
struct StationTerm
{
  double correction = 0; // secs, added to the predicted travel time
  unsigned count    = 0; // number of residuals the term was computed from

  bool isIdentity() const { return count == 0; }
};

class StationTermSet
{
public:
  using Key = std::pair<std::string, std::string>; // station label, phase

  void set(const std::string &station,
           const std::string &phase,
           const StationTerm &term)
  {
    _terms[Key(station, phase)] = term;
  }

  bool has(const std::string &station, const std::string &phase) const
  {
    return _terms.find(Key(station, phase)) != _terms.end();
  }

  // identity when the pair is unknown
  StationTerm get(const std::string &station, const std::string &phase) const
  {
    const auto it = _terms.find(Key(station, phase));
    return it != _terms.end() ? it->second : StationTerm();
  }

  // 0 for identity terms
  double correction(const std::string &station, const std::string &phase) const
  {
    const StationTerm term = get(station, phase);
    return term.isIdentity() ? 0. : term.correction;
  }

  const std::map<Key, StationTerm> &terms() const { return _terms; }

  bool empty() const { return _terms.empty(); }
  size_t size() const { return _terms.size(); }

  bool operator==(const StationTermSet &other) const;
  bool operator!=(const StationTermSet &other) const
  {
    return !operator==(other);
  }

private:
  std::map<Key, StationTerm> _terms;
};

/*
 * Source-specific station terms: one term set per event
 */
class SourceTermSet
{
public:
  void set(const std::string &eventId, const StationTermSet &terms)
  {
    _terms[eventId] = terms;
  }

  StationTermSet &at(const std::string &eventId) { return _terms[eventId]; }

  bool has(const std::string &eventId) const
  {
    return _terms.find(eventId) != _terms.end();
  }

  // empty set when the event is unknown
  const StationTermSet &get(const std::string &eventId) const
  {
    static const StationTermSet empty;
    const auto it = _terms.find(eventId);
    return it != _terms.end() ? it->second : empty;
  }

  const std::map<std::string, StationTermSet> &terms() const { return _terms; }

  bool empty() const { return _terms.empty(); }
  size_t size() const { return _terms.size(); }

private:
  std::map<std::string, StationTermSet> _terms;
};

/*
 * Read-only view of the corrections in effect during an iteration, shared
 * by all relocation workers. Source-specific terms, when present, take
 * precedence over the static ones.
 */
class TermProvider
{
public:
  TermProvider() = default; // identity everywhere

  explicit TermProvider(const StationTermSet &staticTerms)
      : _static(staticTerms)
  {}

  TermProvider(const StationTermSet &staticTerms,
               const SourceTermSet &sourceTerms)
      : _static(staticTerms), _source(sourceTerms)
  {}

  // the terms to apply when locating `eventId`
  StationTermSet termsFor(const std::string &eventId) const;

  const StationTermSet &staticTerms() const { return _static; }
  const SourceTermSet &sourceTerms() const { return _source; }

private:
  StationTermSet _static;
  SourceTermSet _source;
};

/*
 * Residual dispersion of an iteration, the convergence signal
 */
struct Dispersion
{
  static constexpr double SMAD_SCALE = 1.4826;

  unsigned numResiduals = 0;
  double median;
  double mad;
  double smad;
  double rms;

  Dispersion();

  // an empty residual set has no dispersion
  bool isDefined() const;

  double value(DispersionType type) const
  {
    return type == DispersionType::MAD ? mad : smad;
  }
};

Dispersion computeDispersion(const std::vector<double> &residuals);

/*
 * Residuals of the arrivals used (weight > 0) by the located events
 */
std::vector<double> collectResiduals(const std::vector<Event> &events);

/*
 * Static terms: for each station/phase the median of the total residuals
 * (residual + applied correction) of all located events. Pairs with fewer
 * than `minResiduals` observations keep the prior term.
 */
StationTermSet computeStaticTerms(const std::vector<Event> &events,
                                  const StationTermSet &prior,
                                  unsigned minResiduals = 1);

struct SsstParameters
{
  unsigned maxNeighbours = 50;
  unsigned minNeighbours = 5;
  double maxDistance     = 50;  // km
  double minDistance     = 0.1; // km
  double distancePower   = 1;
};

/*
 * Source-specific station terms: for each located event and each
 * station/phase it observed, the inverse-distance weighted median of the
 * total residuals of the same station/phase observed by the nearest
 * (at most `maxNeighbours`, within `maxDistance`) other located events.
 * Pairs with fewer than `minNeighbours` neighbours get no source-specific
 * term, so the static one applies. Events that failed keep their `prior`
 * terms.
 */
SourceTermSet computeSourceSpecificTerms(const std::vector<Event> &events,
                                         const SourceTermSet &prior,
                                         const SsstParameters &params);

/*
 * Neighbour cutoff distance at `iteration` (1-based) when shrinking
 * linearly from `start` to `end` over `maxIterations`
 */
double shrinkingDistance(double start,
                         double end,
                         unsigned iteration,
                         unsigned maxIterations);

} // namespace MEL

#endif
