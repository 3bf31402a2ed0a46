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
#include <boost/test/data/monomorphic.hpp>
#include <boost/test/data/test_case.hpp>

#include "mel/csvreader.h"
#include "mel/kdtree.h"
#include "mel/utctime.h"
#include "mel/utils.h"
#include "common.ipp"

#include <sstream>

using namespace std;
using namespace MEL;
namespace bdata = boost::unit_test::data;

namespace {

// latitude difference of `km` to the north
double kmNorth(double km) { return km / deg2km(1); }

} // namespace

BOOST_AUTO_TEST_CASE(test_statistics)
{
  BOOST_CHECK_EQUAL(computeMedian({3, 1, 2}), 2);
  BOOST_CHECK_EQUAL(computeMedian({4, 1, 3, 2}), 2.5);
  BOOST_CHECK(std::isnan(computeMedian({})));

  const vector<double> values = {1, 2, 3, 4, 100};
  BOOST_CHECK_EQUAL(computeMedianAbsoluteDeviation(values, 3), 1);
  BOOST_CHECK_EQUAL(computeMean({1, 2, 3, 6}), 3);
  BOOST_CHECK_CLOSE(computeRms({3, -4}), std::sqrt(12.5), 1e-9);
  BOOST_CHECK(std::isnan(computeRms({})));
}

BOOST_AUTO_TEST_CASE(test_weighted_median)
{
  // equal weights: the plain median
  BOOST_CHECK_EQUAL(computeWeightedMedian({5, 1, 3}, {1, 1, 1}), 3);
  BOOST_CHECK_EQUAL(computeWeightedMedian({1, 2, 3, 4}, {1, 1, 1, 1}), 2.5);

  // a heavy value wins
  BOOST_CHECK_EQUAL(computeWeightedMedian({1, 2, 3, 4}, {1, 1, 1, 10}), 4);
  BOOST_CHECK_EQUAL(computeWeightedMedian({1, 2, 3, 4}, {10, 1, 1, 1}), 1);

  // exactly half of the weight below
  BOOST_CHECK_EQUAL(computeWeightedMedian({1, 2, 3}, {2, 1, 1}), 1.5);

  BOOST_CHECK(std::isnan(computeWeightedMedian({}, {})));
  BOOST_CHECK_THROW(computeWeightedMedian({1, 2}, {1}), Exception);
}

BOOST_AUTO_TEST_CASE(test_distance)
{
  // one degree of latitude
  BOOST_CHECK_CLOSE(computeDistance(46, 7, 47, 7), deg2km(1), 1e-6);
  BOOST_CHECK_CLOSE(deg2km(1), 111.19, 0.01);
  BOOST_CHECK_SMALL(computeDistance(46, 7, 46, 7), 1e-9);

  // hypocentral
  BOOST_CHECK_CLOSE(computeDistance(46, 7, 3, 46, 7, 7), 4, 1e-9);

  Hypocenter h1, h2;
  h1.latitude = h2.latitude = 46;
  h1.longitude = h2.longitude = 7;
  h1.depth = 2;
  h2.depth = 5;
  BOOST_CHECK_CLOSE(computeDistance(h1, h2), 3, 1e-9);
}

BOOST_AUTO_TEST_CASE(test_strings)
{
  BOOST_CHECK_EQUAL(strf("%s-%03u", "it", 7u), "it-007");
  BOOST_CHECK_EQUAL(trimString("  ab c \t"), "ab c");

  const vector<string> tokens = splitString("a, b ,c", std::regex(R"(\s*,\s*)"));
  const vector<string> expected = {"a", "b", "c"};
  BOOST_CHECK_EQUAL_COLLECTIONS(tokens.begin(), tokens.end(), expected.begin(),
                                expected.end());
}

BOOST_AUTO_TEST_CASE(test_utctime)
{
  const UTCTime t = UTCClock::fromDate(2020, 3, 1, 12, 5, 7, 250000);
  BOOST_CHECK_EQUAL(UTCClock::toString(t), "2020-03-01T12:05:07.250000Z");
  BOOST_CHECK(UTCClock::fromString("2020-03-01T12:05:07.25Z") == t);
  BOOST_CHECK(UTCClock::fromString(UTCClock::toString(t)) == t);
  BOOST_CHECK_THROW(UTCClock::fromString("yesterday"), Exception);

  BOOST_CHECK_EQUAL(UTCClock::toNLLocString(t), "20200301 1205 07.2500");
  BOOST_CHECK(UTCClock::fromNLLocString("20200301", "1205", 7.25) == t);

  // hour 24 and out of range seconds
  BOOST_CHECK(UTCClock::fromNLLocString("20200229", "2400", 0) ==
              UTCClock::fromDate(2020, 3, 1));
  BOOST_CHECK(UTCClock::fromNLLocString("20200301", "1206", -52.75) == t);
  BOOST_CHECK(UTCClock::fromNLLocString("20200301", "1204", 67.25) == t);
  BOOST_CHECK_THROW(UTCClock::fromNLLocString("2020031", "1205", 0),
                    Exception);

  BOOST_CHECK_EQUAL(durToSec(secToDur(-1.5)), -1.5);
}

BOOST_AUTO_TEST_CASE(test_csv)
{
  stringstream ss;
  CSV::writeRow(ss, {"id", "reason"});
  CSV::writeRow(ss, {"ev1", "REJECTED, \"no\" phases"});
  CSV::writeRow(ss, {"ev2", ""});

  const vector<CSV::Row> rows = CSV::readWithHeader(ss);
  BOOST_REQUIRE_EQUAL(rows.size(), 2);
  BOOST_CHECK_EQUAL(rows[0].at("id"), "ev1");
  BOOST_CHECK_EQUAL(rows[0].at("reason"), "REJECTED, \"no\" phases");
  BOOST_CHECK_EQUAL(rows[1].at("reason"), "");

  BOOST_CHECK_THROW(CSV::readWithHeader("/nonexistent/file.csv"),
                    FileNotFound);
}

BOOST_DATA_TEST_CASE(test_kdtree_knn, bdata::xrange(1, 8), k)
{
  // a line of points 1 km apart going north
  using Tree = KDTree<unsigned>;
  vector<Tree::Point> points;
  for (unsigned i = 0; i < 20; i++)
  {
    points.push_back({46 + kmNorth(i), 7, 5, i});
  }
  const Tree tree(points);

  // nearest first
  auto neighbours = tree.knnSearch(46 + kmNorth(10.2), 7, 5, k, 100);
  BOOST_REQUIRE_EQUAL(neighbours.size(), k);
  BOOST_CHECK_EQUAL(neighbours[0].point->data, 10);
  for (size_t i = 1; i < neighbours.size(); i++)
  {
    BOOST_CHECK(neighbours[i].distance >= neighbours[i - 1].distance);
  }

  // distance cutoff
  neighbours = tree.knnSearch(46 + kmNorth(10.2), 7, 5, k, 1.5);
  BOOST_CHECK_EQUAL(neighbours.size(), std::min<size_t>(k, 3));
  for (const auto &n : neighbours) BOOST_CHECK(n.distance <= 1.5);

  // filter
  neighbours = tree.knnSearch(46 + kmNorth(10.2), 7, 5, k, 100,
                              [](const Tree::Point &p) { return p.data % 2; });
  BOOST_REQUIRE_EQUAL(neighbours.size(), k);
  BOOST_CHECK_EQUAL(neighbours[0].point->data, 11);
  for (const auto &n : neighbours) BOOST_CHECK(n.point->data % 2 == 1);
}

BOOST_AUTO_TEST_CASE(test_kdtree_empty)
{
  const KDTree<int> tree(vector<KDTree<int>::Point>{});
  BOOST_CHECK(tree.knnSearch(46, 7, 5, 3, 100).empty());
}
