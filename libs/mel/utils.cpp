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

#include "utils.h"
#include "log.h"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <limits>
#include <memory>
#include <numeric>
#include <stdarg.h>

namespace fs = boost::filesystem;

using namespace std;

namespace MEL {

std::string vstrf(const char *fmt, va_list ap)
{
  // A static buffer that hopefully covers 99% of all use cases
  char staticBuffer[256];

  va_list params;
  va_copy(params, ap);
  int r = vsnprintf(staticBuffer, sizeof(staticBuffer), fmt, params);
  va_end(params);

  if (r < 0)
  {
    return std::string();
  }

  if (size_t(r) < sizeof(staticBuffer))
  {
    return std::string(staticBuffer, r);
  }

  // the static buffer is not large enough
  size_t requiredSize = size_t(r) + 1; // +1 for \0
  unique_ptr<char[]> dynamicBuffer(new char[requiredSize]);
  va_copy(params, ap);
  r = vsnprintf(dynamicBuffer.get(), requiredSize, fmt, params);
  va_end(params);

  if (r < 0)
  {
    return std::string();
  }
  return std::string(dynamicBuffer.get(), r);
}

// Eventually this can be replaced with C++20 std::format
std::string strf(const char *fmt, ...)
{
  va_list params;
  va_start(params, fmt);
  std::string ret = vstrf(fmt, params);
  va_end(params);
  return ret;
}

std::vector<std::string> splitString(const std::string &str,
                                     const std::regex &regex)
{
  return {std::sregex_token_iterator{str.begin(), str.end(), regex, -1},
          std::sregex_token_iterator()};
}

std::string trimString(const std::string &str)
{
  const char *ws   = " \t\r\n";
  const auto first = str.find_first_not_of(ws);
  if (first == std::string::npos) return "";
  const auto last = str.find_last_not_of(ws);
  return str.substr(first, last - first + 1);
}

/*
 * Haversine formula on a spherical earth
 */
double computeDistance(
    double lat1, double lon1, double lat2, double lon2, double atKmDepth)
{
  const double deltaLat = degToRad(lat2 - lat1);
  const double deltaLon = degToRad(lon2 - lon1);

  if (deltaLat == 0 && deltaLon == 0) return 0.;

  double a = square(sin(deltaLat / 2.)) + cos(degToRad(lat1)) *
                                              cos(degToRad(lat2)) *
                                              square(sin(deltaLon / 2.));

  double distance = 2. * atan2(sqrt(a), sqrt(1. - a));
  if (!std::isfinite(distance))
  {
    throw Exception("Internal logic error: computeDistance failed");
  }
  return distance * ((EARTH_MEAN_RADIUS_METER / 1000.) - atKmDepth);
}

double computeDistance(double lat1,
                       double lon1,
                       double kmDepth1,
                       double lat2,
                       double lon2,
                       double kmDepth2)
{
  double atKmDepth = (kmDepth1 + kmDepth2) / 2.;
  double Hdist     = computeDistance(lat1, lon1, lat2, lon2, atKmDepth);
  if (kmDepth1 == kmDepth2) return Hdist;
  double Vdist = std::abs(kmDepth1 - kmDepth2);
  return std::sqrt(square(Hdist) + square(Vdist));
}

double computeDistance(const Hypocenter &h1, const Hypocenter &h2)
{
  return computeDistance(h1.latitude, h1.longitude, h1.depth, h2.latitude,
                         h2.longitude, h2.depth);
}

double computeMedian(const std::vector<double> &values)
{
  if (values.empty()) return std::numeric_limits<double>::quiet_NaN();

  vector<double> tmp(values);
  const auto middleItr = tmp.begin() + tmp.size() / 2;
  std::nth_element(tmp.begin(), middleItr, tmp.end());
  double median = *middleItr;
  if (tmp.size() % 2 == 0)
  {
    const auto leftMiddleItr = std::max_element(tmp.begin(), middleItr);
    median                   = (*leftMiddleItr + *middleItr) / 2;
  }
  return median;
}

double computeMedianAbsoluteDeviation(const std::vector<double> &values,
                                      const double median)
{
  vector<double> absoluteDeviations(values.size());
  for (size_t i = 0; i < values.size(); i++)
  {
    absoluteDeviations[i] = std::abs(values[i] - median);
  }
  return computeMedian(absoluteDeviations);
}

double computeMean(const std::vector<double> &values)
{
  if (values.empty()) return std::numeric_limits<double>::quiet_NaN();
  return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double computeRms(const std::vector<double> &values)
{
  if (values.empty()) return std::numeric_limits<double>::quiet_NaN();
  double sum = 0;
  for (double v : values) sum += v * v;
  return std::sqrt(sum / values.size());
}

double computeWeightedMedian(const std::vector<double> &values,
                             const std::vector<double> &weights)
{
  if (values.size() != weights.size())
  {
    throw Exception("computeWeightedMedian: values and weights size differ");
  }
  if (values.empty()) return std::numeric_limits<double>::quiet_NaN();

  vector<size_t> order(values.size());
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(),
            [&values](size_t a, size_t b) { return values[a] < values[b]; });

  const double total =
      std::accumulate(weights.begin(), weights.end(), 0.0);
  const double half = total / 2.;
  const double eps  = total * 1e-12;

  double cumulative = 0;
  for (size_t i = 0; i < order.size(); i++)
  {
    cumulative += weights[order[i]];
    if (cumulative >= half - eps)
    {
      // exactly half of the weight on each side: average the central pair
      if (std::abs(cumulative - half) <= eps && i + 1 < order.size())
      {
        return (values[order[i]] + values[order[i + 1]]) / 2.;
      }
      return values[order[i]];
    }
  }
  return values[order.back()];
}

std::string joinPath(const std::string &path1, const std::string &path2)
{
  return (fs::path(path1) / path2).string();
}

bool pathExists(const std::string &path)
{
  try
  {
    return fs::exists(path);
  }
  catch (exception &e)
  {
    logError(e.what());
    return false;
  }
}

bool isDirectory(const std::string &path)
{
  try
  {
    return fs::is_directory(path);
  }
  catch (exception &e)
  {
    logError(e.what());
    return false;
  }
}

bool directoryEmpty(const std::string &path)
{
  try
  {
    return !fs::exists(path) || (fs::is_directory(path) && fs::is_empty(path));
  }
  catch (exception &e)
  {
    logError(e.what());
    return false;
  }
}

bool createDirectories(const std::string &path)
{
  try
  {
    fs::create_directories(path);
    return true;
  }
  catch (exception &e)
  {
    logError(e.what());
    return false;
  }
}

bool removePath(const std::string &path)
{
  try
  {
    fs::remove_all(path);
    return true;
  }
  catch (exception &e)
  {
    logError(e.what());
    return false;
  }
}

bool renamePath(const std::string &from, const std::string &to)
{
  try
  {
    fs::rename(from, to);
    return true;
  }
  catch (exception &e)
  {
    logError(e.what());
    return false;
  }
}

std::vector<std::string> listDirectory(const std::string &path)
{
  vector<string> names;
  try
  {
    for (const fs::directory_entry &entry : fs::directory_iterator(path))
    {
      names.push_back(entry.path().filename().string());
    }
  }
  catch (exception &e)
  {
    logError(e.what());
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::string uniqueTempPath(const std::string &parent,
                           const std::string &prefix)
{
  return (fs::path(parent) / fs::unique_path(prefix + "-%%%%-%%%%-%%%%"))
      .string();
}

} // namespace MEL
