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

#define BOOST_TEST_MODULE libmel
#include <boost/test/included/unit_test.hpp>

#include "mel/stationterms.h"
#include "common.ipp"

using namespace std;
using namespace MEL;

namespace {

// km to latitude degrees
double northOf(double lat, double km) { return lat + km / deg2km(1); }

} // namespace

BOOST_AUTO_TEST_CASE(test_static_terms_median)
{
  vector<Event> events;
  const vector<double> residuals = {0.1, 0.2, 0.9, -0.1};
  for (size_t i = 0; i < residuals.size(); i++)
  {
    events.push_back(locatedEvent(eventId(i), 46, 7, 5,
                                  {{"ST01", residuals[i]}}));
  }

  StationTermSet prior;
  prior.set("ST02", "P", {0.3, 7});

  const StationTermSet terms = computeStaticTerms(events, prior, 1);

  BOOST_CHECK_CLOSE(terms.get("ST01", "P").correction, 0.15, 1e-9);
  BOOST_CHECK_EQUAL(terms.get("ST01", "P").count, 4);

  // no residuals: prior term unchanged
  BOOST_CHECK_EQUAL(terms.get("ST02", "P").correction, 0.3);
  BOOST_CHECK_EQUAL(terms.get("ST02", "P").count, 7);

  // never observed: identity
  BOOST_CHECK(terms.get("ST03", "P").isIdentity());
  BOOST_CHECK_EQUAL(terms.correction("ST03", "P"), 0);
  BOOST_CHECK(!terms.has("ST01", "S"));
}

BOOST_AUTO_TEST_CASE(test_static_terms_total_residual)
{
  // the applied correction is part of the station misfit
  vector<Event> events;
  for (unsigned i = 0; i < 3; i++)
  {
    Event ev = locatedEvent(eventId(i), 46, 7, 5, {{"ST01", 0.05}});
    ev.arrivals[0].correction = 0.1;
    events.push_back(ev);
  }

  // failed events and unused arrivals are ignored
  Event failed = locatedEvent("failed", 46, 7, 5, {{"ST01", 9.}});
  failed.status = Event::Status::failed;
  events.push_back(failed);

  Event unused = locatedEvent("unused", 46, 7, 5, {{"ST01", -9.}});
  unused.arrivals[0].weight = 0;
  events.push_back(unused);

  const StationTermSet terms = computeStaticTerms(events, StationTermSet(), 1);
  BOOST_CHECK_CLOSE(terms.get("ST01", "P").correction, 0.15, 1e-9);
  BOOST_CHECK_EQUAL(terms.get("ST01", "P").count, 3);
}

BOOST_AUTO_TEST_CASE(test_static_terms_min_residuals)
{
  vector<Event> events;
  for (unsigned i = 0; i < 3; i++)
  {
    events.push_back(locatedEvent(eventId(i), 46, 7, 5, {{"ST01", 1.0}}));
  }

  StationTermSet prior;
  prior.set("ST01", "P", {0.5, 10});

  StationTermSet terms = computeStaticTerms(events, prior, 4);
  BOOST_CHECK_EQUAL(terms.get("ST01", "P").correction, 0.5);
  BOOST_CHECK_EQUAL(terms.get("ST01", "P").count, 10);

  terms = computeStaticTerms(events, prior, 3);
  BOOST_CHECK_EQUAL(terms.get("ST01", "P").correction, 1.0);
  BOOST_CHECK_EQUAL(terms.get("ST01", "P").count, 3);

  // no located events at all: identity everywhere
  terms = computeStaticTerms({}, StationTermSet(), 1);
  BOOST_CHECK(terms.empty());
}

BOOST_AUTO_TEST_CASE(test_ssst_fallback_to_static)
{
  vector<Event> events = {
      locatedEvent("e1", 46, 7, 5, {{"ST01", 0.2}}),
      locatedEvent("e2", northOf(46, 1), 7, 5, {{"ST01", 0.4}}),
      locatedEvent("e3", northOf(46, 2), 7, 5, {{"ST01", 0.6}}),
  };

  SsstParameters params;
  params.minNeighbours = 5;
  params.maxNeighbours = 10;
  params.maxDistance   = 100;

  const SourceTermSet ssst =
      computeSourceSpecificTerms(events, SourceTermSet(), params);
  BOOST_CHECK(!ssst.get("e1").has("ST01", "P"));

  StationTermSet baseline;
  baseline.set("ST01", "P", {0.33, 3});
  const TermProvider provider(baseline, ssst);
  BOOST_CHECK_EQUAL(provider.termsFor("e1").correction("ST01", "P"), 0.33);

  // enough neighbours: median of the other two
  params.minNeighbours = 2;
  params.distancePower = 0;
  const SourceTermSet ssst2 =
      computeSourceSpecificTerms(events, SourceTermSet(), params);
  BOOST_CHECK_CLOSE(ssst2.get("e1").get("ST01", "P").correction, 0.5, 1e-9);
  BOOST_CHECK_EQUAL(ssst2.get("e1").get("ST01", "P").count, 2);
  const TermProvider provider2(baseline, ssst2);
  BOOST_CHECK_CLOSE(provider2.termsFor("e1").correction("ST01", "P"), 0.5,
                    1e-9);
}

BOOST_AUTO_TEST_CASE(test_ssst_nearer_neighbours_dominate)
{
  vector<Event> events = {
      // its own residual never contributes to its term
      locatedEvent("target", 46, 7, 5, {{"ST01", 5.0}}),
      locatedEvent("near", northOf(46, 0.5), 7, 5, {{"ST01", 1.0}}),
      locatedEvent("far1", northOf(46, 20), 7, 5, {{"ST01", 0.0}}),
      locatedEvent("far2", northOf(46, -20), 7, 5, {{"ST01", 0.0}}),
  };

  SsstParameters params;
  params.minNeighbours = 1;
  params.maxNeighbours = 10;
  params.maxDistance   = 100;
  params.minDistance   = 0.1;

  // plain median
  params.distancePower = 0;
  SourceTermSet ssst =
      computeSourceSpecificTerms(events, SourceTermSet(), params);
  BOOST_CHECK_SMALL(ssst.get("target").get("ST01", "P").correction, 1e-9);

  // inverse distance weighting
  params.distancePower = 2;
  ssst = computeSourceSpecificTerms(events, SourceTermSet(), params);
  BOOST_CHECK_CLOSE(ssst.get("target").get("ST01", "P").correction, 1.0,
                    1e-9);
  BOOST_CHECK_EQUAL(ssst.get("target").get("ST01", "P").count, 3);

  // the K nearest only
  params.distancePower = 0;
  params.maxNeighbours = 1;
  ssst = computeSourceSpecificTerms(events, SourceTermSet(), params);
  BOOST_CHECK_CLOSE(ssst.get("target").get("ST01", "P").correction, 1.0,
                    1e-9);

  // within the cutoff only
  params.maxNeighbours = 10;
  params.maxDistance   = 5;
  params.minNeighbours = 2;
  ssst = computeSourceSpecificTerms(events, SourceTermSet(), params);
  BOOST_CHECK(!ssst.get("target").has("ST01", "P"));
}

BOOST_AUTO_TEST_CASE(test_ssst_failed_events_keep_prior)
{
  vector<Event> events = {
      locatedEvent("e1", 46, 7, 5, {{"ST01", 0.2}}),
      locatedEvent("e2", northOf(46, 1), 7, 5, {{"ST01", 0.4}}),
      locatedEvent("e3", northOf(46, 2), 7, 5, {{"ST01", 0.6}}),
  };
  events[2].status = Event::Status::failed;

  SourceTermSet prior;
  prior.at("e3").set("ST01", "P", {0.7, 4});

  SsstParameters params;
  params.minNeighbours = 1;
  params.maxDistance   = 100;

  const SourceTermSet ssst = computeSourceSpecificTerms(events, prior, params);
  BOOST_CHECK_EQUAL(ssst.get("e3").get("ST01", "P").correction, 0.7);
  BOOST_CHECK_EQUAL(ssst.get("e3").get("ST01", "P").count, 4);

  // failed events are not neighbours
  BOOST_CHECK_CLOSE(ssst.get("e1").get("ST01", "P").correction, 0.4, 1e-9);
  BOOST_CHECK_CLOSE(ssst.get("e2").get("ST01", "P").correction, 0.2, 1e-9);
}

BOOST_AUTO_TEST_CASE(test_shrinking_distance)
{
  BOOST_CHECK_EQUAL(shrinkingDistance(50, 10, 1, 5), 50);
  BOOST_CHECK_EQUAL(shrinkingDistance(50, 10, 3, 5), 30);
  BOOST_CHECK_EQUAL(shrinkingDistance(50, 10, 5, 5), 10);
  BOOST_CHECK_EQUAL(shrinkingDistance(50, 10, 8, 5), 10);
  BOOST_CHECK_EQUAL(shrinkingDistance(50, 50, 3, 5), 50);
  BOOST_CHECK_EQUAL(shrinkingDistance(50, 10, 1, 1), 50);
}

BOOST_AUTO_TEST_CASE(test_dispersion)
{
  const Dispersion d = computeDispersion({1, 2, 3, 4, 100});
  BOOST_CHECK(d.isDefined());
  BOOST_CHECK_EQUAL(d.numResiduals, 5);
  BOOST_CHECK_EQUAL(d.median, 3);
  BOOST_CHECK_EQUAL(d.mad, 1);
  BOOST_CHECK_CLOSE(d.smad, 1.4826, 1e-9);
  BOOST_CHECK_EQUAL(d.value(DispersionType::MAD), 1);
  BOOST_CHECK_CLOSE(d.value(DispersionType::SMAD), 1.4826, 1e-9);

  const Dispersion empty = computeDispersion({});
  BOOST_CHECK(!empty.isDefined());
  BOOST_CHECK(std::isnan(empty.value(DispersionType::SMAD)));

  // residuals of used arrivals of located events only
  vector<Event> events = {locatedEvent("e1", 46, 7, 5,
                                       {{"ST01", 0.1}, {"ST02", 0.3}}),
                          locatedEvent("e2", 46, 7, 5, {{"ST01", 0.5}})};
  events[0].arrivals[1].weight = 0;
  events[1].status             = Event::Status::failed;
  const vector<double> residuals = collectResiduals(events);
  BOOST_REQUIRE_EQUAL(residuals.size(), 1);
  BOOST_CHECK_EQUAL(residuals[0], 0.1);
}

BOOST_AUTO_TEST_CASE(test_term_provider)
{
  StationTermSet staticTerms;
  staticTerms.set("ST01", "P", {0.1, 5});
  staticTerms.set("ST02", "P", {0.2, 5});

  SourceTermSet ssst;
  ssst.at("e1").set("ST01", "P", {0.9, 3});
  ssst.at("e1").set("ST02", "P", {0.0, 0}); // identity: static applies

  const TermProvider provider(staticTerms, ssst);
  const StationTermSet e1 = provider.termsFor("e1");
  BOOST_CHECK_EQUAL(e1.correction("ST01", "P"), 0.9);
  BOOST_CHECK_EQUAL(e1.correction("ST02", "P"), 0.2);

  const StationTermSet e2 = provider.termsFor("e2");
  BOOST_CHECK(e2 == staticTerms);

  const StationTermSet none = TermProvider().termsFor("e1");
  BOOST_CHECK(none.empty());
}
