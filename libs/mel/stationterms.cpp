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

#include "stationterms.h"
#include "kdtree.h"
#include "log.h"
#include "utils.h"

#include <cmath>
#include <limits>
#include <unordered_map>

using namespace std;

namespace MEL {

bool StationTermSet::operator==(const StationTermSet &other) const
{
  if (_terms.size() != other._terms.size()) return false;
  for (auto it1 = _terms.begin(), it2 = other._terms.begin();
       it1 != _terms.end(); ++it1, ++it2)
  {
    if (it1->first != it2->first ||
        it1->second.count != it2->second.count ||
        it1->second.correction != it2->second.correction)
    {
      return false;
    }
  }
  return true;
}

StationTermSet TermProvider::termsFor(const std::string &eventId) const
{
  StationTermSet terms(_static);
  for (const auto &kv : _source.get(eventId).terms())
  {
    if (!kv.second.isIdentity())
    {
      terms.set(kv.first.first, kv.first.second, kv.second);
    }
  }
  return terms;
}

Dispersion::Dispersion()
    : median(std::numeric_limits<double>::quiet_NaN()),
      mad(std::numeric_limits<double>::quiet_NaN()),
      smad(std::numeric_limits<double>::quiet_NaN()),
      rms(std::numeric_limits<double>::quiet_NaN())
{}

bool Dispersion::isDefined() const
{
  return numResiduals > 0 && std::isfinite(mad);
}

Dispersion computeDispersion(const std::vector<double> &residuals)
{
  Dispersion d;
  if (residuals.empty()) return d;

  d.numResiduals = residuals.size();
  d.median       = computeMedian(residuals);
  d.mad          = computeMedianAbsoluteDeviation(residuals, d.median);
  d.smad         = Dispersion::SMAD_SCALE * d.mad;
  d.rms          = computeRms(residuals);
  return d;
}

std::vector<double> collectResiduals(const std::vector<Event> &events)
{
  vector<double> residuals;
  for (const Event &ev : events)
  {
    if (ev.status != Event::Status::located) continue;
    for (const Arrival &arr : ev.arrivals)
    {
      if (arr.weight > 0 && std::isfinite(arr.residual))
        residuals.push_back(arr.residual);
    }
  }
  return residuals;
}

namespace {

using Key = StationTermSet::Key;

/*
 * Total residuals by station/phase of a single event. Multiple arrivals
 * of the same station/phase are averaged.
 */
map<Key, double> totalResidualsOf(const Event &ev)
{
  map<Key, vector<double>> values;
  for (const Arrival &arr : ev.arrivals)
  {
    if (arr.weight <= 0 || !std::isfinite(arr.residual)) continue;
    values[Key(arr.stationLabel, arr.phase)].push_back(arr.totalResidual());
  }

  map<Key, double> result;
  for (const auto &kv : values) result[kv.first] = computeMean(kv.second);
  return result;
}

} // namespace

StationTermSet computeStaticTerms(const std::vector<Event> &events,
                                  const StationTermSet &prior,
                                  unsigned minResiduals)
{
  map<Key, vector<double>> residuals;
  for (const Event &ev : events)
  {
    if (ev.status != Event::Status::located) continue;
    for (const auto &kv : totalResidualsOf(ev))
    {
      residuals[kv.first].push_back(kv.second);
    }
  }

  StationTermSet terms(prior);
  unsigned updated = 0;
  for (const auto &kv : residuals)
  {
    const vector<double> &values = kv.second;
    if (values.size() < std::max(minResiduals, 1u))
    {
      logDebugF("Station %s phase %s: %zu residuals, keeping previous term",
                kv.first.first.c_str(), kv.first.second.c_str(),
                values.size());
      continue;
    }
    StationTerm term;
    term.correction = computeMedian(values);
    term.count      = values.size();
    terms.set(kv.first.first, kv.first.second, term);
    updated++;
  }

  logDebugF("Updated %u static station terms (%zu total)", updated,
            terms.size());
  return terms;
}

SourceTermSet computeSourceSpecificTerms(const std::vector<Event> &events,
                                         const SourceTermSet &prior,
                                         const SsstParameters &params)
{
  //
  // index the located events
  //
  vector<const Event *> located;
  vector<map<Key, double>> observations;
  for (const Event &ev : events)
  {
    if (ev.status != Event::Status::located) continue;
    located.push_back(&ev);
    observations.push_back(totalResidualsOf(ev));
  }

  using Tree = KDTree<size_t>;
  vector<Tree::Point> points;
  points.reserve(located.size());
  for (size_t i = 0; i < located.size(); i++)
  {
    const Hypocenter &h = located[i]->hypocenter;
    points.push_back({h.latitude, h.longitude, h.depth, i});
  }
  const Tree tree(points);

  SourceTermSet terms;
  unsigned fallbacks = 0, computed = 0;

  for (size_t i = 0; i < located.size(); i++)
  {
    const Event &ev     = *located[i];
    const Hypocenter &h = ev.hypocenter;
    StationTermSet &evTerms = terms.at(ev.id);

    for (const auto &obs : observations[i])
    {
      const Key &key = obs.first;

      const auto neighbours = tree.knnSearch(
          h.latitude, h.longitude, h.depth, params.maxNeighbours,
          params.maxDistance, [&](const Tree::Point &p) {
            return p.data != i &&
                   observations[p.data].find(key) != observations[p.data].end();
          });

      if (neighbours.size() < std::max(params.minNeighbours, 1u))
      {
        fallbacks++;
        continue;
      }

      vector<double> values, weights;
      values.reserve(neighbours.size());
      weights.reserve(neighbours.size());
      for (const auto &n : neighbours)
      {
        values.push_back(observations[n.point->data].at(key));
        const double dist = std::max(n.distance, params.minDistance);
        weights.push_back(1. / std::pow(dist, params.distancePower));
      }

      StationTerm term;
      term.correction = computeWeightedMedian(values, weights);
      term.count      = neighbours.size();
      evTerms.set(key.first, key.second, term);
      computed++;
    }
  }

  // events not located in this round keep what they had
  for (const Event &ev : events)
  {
    if (ev.status != Event::Status::located && prior.has(ev.id))
    {
      terms.set(ev.id, prior.get(ev.id));
    }
  }

  logDebugF("Computed %u source-specific terms, %u station/phase pairs "
            "without enough neighbours (cutoff %.2f km)",
            computed, fallbacks, params.maxDistance);
  return terms;
}

double shrinkingDistance(double start,
                         double end,
                         unsigned iteration,
                         unsigned maxIterations)
{
  if (maxIterations <= 1 || iteration <= 1) return start;
  if (iteration >= maxIterations) return end;
  return start +
         (end - start) * double(iteration - 1) / double(maxIterations - 1);
}

} // namespace MEL
