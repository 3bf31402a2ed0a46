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

#ifndef __MEL_UTILS_H__
#define __MEL_UTILS_H__

#include "catalog.h"
#include <cmath>
#include <cstdarg>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace MEL {

class Exception : public std::runtime_error
{
public:
  Exception(const std::string &message) : std::runtime_error(message) {}
};

// Malformed step list or option out of range: raised before any work starts
class ConfigurationError : public Exception
{
public:
  ConfigurationError(const std::string &message) : Exception(message) {}
};

// A destructive write would overwrite existing data without `force`
class PathAlreadyExists : public Exception
{
public:
  PathAlreadyExists(const std::string &path)
      : Exception("Path already exists: " + path), _path(path)
  {}
  const std::string &path() const { return _path; }

private:
  std::string _path;
};

// A read targets data that was never computed
class FileNotFound : public Exception
{
public:
  FileNotFound(const std::string &path)
      : Exception("File not found: " + path), _path(path)
  {}
  const std::string &path() const { return _path; }

private:
  std::string _path;
};

std::string strf(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

std::string vstrf(const char *fmt, va_list ap);

std::vector<std::string> splitString(const std::string &str,
                                     const std::regex &regex);

std::string trimString(const std::string &str);

inline double degToRad(double d) { return M_PI * d / 180.0; }

template <typename T> T square(T x) { return x * x; }

static const double EARTH_MEAN_RADIUS_METER = 6371008.77141506;

inline double kmOfDegree(double kmDepth = 0)
{
  return ((EARTH_MEAN_RADIUS_METER / 1000.) - kmDepth) * M_PI / 180.0;
}

inline double deg2km(double deg, double kmDepth = 0)
{
  return deg * kmOfDegree(kmDepth);
}

/*
 * Epicentral distance [km] between two points at `atKmDepth`
 * (spherical earth)
 */
double computeDistance(double lat1,
                       double lon1,
                       double lat2,
                       double lon2,
                       double atKmDepth = 0);

/*
 * Hypocentral distance [km]
 */
double computeDistance(double lat1,
                       double lon1,
                       double kmDepth1,
                       double lat2,
                       double lon2,
                       double kmDepth2);

double computeDistance(const Hypocenter &h1, const Hypocenter &h2);

//
// Robust statistics. All of them return NaN for an empty input
//
double computeMedian(const std::vector<double> &values);

double computeMedianAbsoluteDeviation(const std::vector<double> &values,
                                      const double median);

double computeMean(const std::vector<double> &values);

double computeRms(const std::vector<double> &values);

/*
 * Weighted median: the smallest value at which the cumulative weight
 * reaches half of the total weight (the two central values are averaged
 * when the half is hit exactly). Weights must be positive.
 */
double computeWeightedMedian(const std::vector<double> &values,
                             const std::vector<double> &weights);

//
// Filesystem helpers: errors are logged and reported via the return value
//
std::string joinPath(const std::string &path1, const std::string &path2);

bool pathExists(const std::string &path);

bool isDirectory(const std::string &path);

bool directoryEmpty(const std::string &path);

bool createDirectories(const std::string &path);

bool removePath(const std::string &path);

bool renamePath(const std::string &from, const std::string &to);

// sorted names of the entries of `path` (no recursion)
std::vector<std::string> listDirectory(const std::string &path);

std::string uniqueTempPath(const std::string &parent,
                           const std::string &prefix);

} // namespace MEL

#endif
