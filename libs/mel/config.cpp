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

#include "config.h"
#include "utils.h"

#include <algorithm>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cmath>
#include <limits>
#include <regex>

using namespace std;

namespace {

// ptree would silently wrap negative values
unsigned getUnsigned(const boost::property_tree::ptree &tree,
                     const string &key,
                     unsigned defaultValue)
{
  const long long value = tree.get<long long>(key, defaultValue);
  if (value < 0 || value > std::numeric_limits<unsigned>::max())
  {
    throw MEL::ConfigurationError(
        MEL::strf("Invalid value %lld for %s", value, key.c_str()));
  }
  return static_cast<unsigned>(value);
}

} // namespace

namespace MEL {

std::string toString(Step step) { return std::string(1, static_cast<char>(step)); }

Step stepFromString(const std::string &str)
{
  const string s = trimString(str);
  if (s == "A" || s == "a") return Step::A;
  if (s == "B" || s == "b") return Step::B;
  if (s == "C" || s == "c") return Step::C;
  throw ConfigurationError("Unknown step '" + str + "' (valid: A, B, C)");
}

std::string toString(DispersionType type)
{
  return type == DispersionType::MAD ? "MAD" : "SMAD";
}

namespace {

void checkIterative(const string &name,
                    unsigned maxIterations,
                    double tolerance)
{
  if (maxIterations < 1)
  {
    throw ConfigurationError(name + ".maxIterations must be at least 1");
  }
  if (!std::isfinite(tolerance) || tolerance < 0)
  {
    throw ConfigurationError(name + ".tolerance must be a non negative number");
  }
}

} // namespace

void Config::validate() const
{
  if (steps.empty())
  {
    throw ConfigurationError("No steps selected");
  }
  for (auto it = steps.begin(); it != steps.end(); ++it)
  {
    if (std::find(it + 1, steps.end(), *it) != steps.end())
    {
      throw ConfigurationError("Step " + toString(*it) +
                               " is selected more than once");
    }
  }

  if (numThreads == 0 || numThreads < -1)
  {
    throw ConfigurationError(
        strf("Invalid numThreads %d (-1 for all processing units or >= 1)",
             numThreads));
  }

  if (minPicks < 1)
  {
    throw ConfigurationError("minPicks must be at least 1");
  }

  checkIterative("static", staticTerms.maxIterations, staticTerms.tolerance);
  if (staticTerms.minResiduals < 1)
  {
    throw ConfigurationError("static.minResiduals must be at least 1");
  }

  checkIterative("ssst", ssst.maxIterations, ssst.tolerance);
  if (ssst.maxNeighbours < 1)
  {
    throw ConfigurationError("ssst.maxNeighbours must be at least 1");
  }
  if (ssst.minNeighbours < 1 || ssst.minNeighbours > ssst.maxNeighbours)
  {
    throw ConfigurationError(
        "ssst.minNeighbours must be between 1 and ssst.maxNeighbours");
  }
  if (!(ssst.maxDistanceStart > 0) || !(ssst.maxDistanceEnd > 0) ||
      !std::isfinite(ssst.maxDistanceStart) ||
      !std::isfinite(ssst.maxDistanceEnd))
  {
    throw ConfigurationError("ssst.maxDistanceStart/End must be positive");
  }
  if (ssst.maxDistanceEnd > ssst.maxDistanceStart)
  {
    throw ConfigurationError(
        "ssst.maxDistanceEnd cannot be greater than ssst.maxDistanceStart");
  }
  if (!(ssst.minDistance > 0) || !std::isfinite(ssst.minDistance))
  {
    throw ConfigurationError("ssst.minDistance must be positive");
  }
  if (!(ssst.distancePower >= 0) || !std::isfinite(ssst.distancePower))
  {
    throw ConfigurationError("ssst.distancePower must be non negative");
  }
}

Config readConfig(const std::string &filename)
{
  if (!pathExists(filename))
  {
    throw FileNotFound(filename);
  }

  namespace pt = boost::property_tree;

  Config cfg;
  try
  {
    pt::ptree tree;
    pt::read_ini(filename, tree);

    if (const auto steps = tree.get_optional<string>("general.steps"))
    {
      static const std::regex sep(R"(\s*,\s*)", std::regex::optimize);
      cfg.steps.clear();
      for (const string &s : splitString(trimString(*steps), sep))
      {
        if (!s.empty()) cfg.steps.push_back(stepFromString(s));
      }
    }
    cfg.numThreads = tree.get<int>("general.numThreads", cfg.numThreads);
    cfg.minPicks   = getUnsigned(tree, "general.minPicks", cfg.minPicks);

    const string dispersion = tree.get<string>(
        "general.dispersion", toString(cfg.dispersion));
    if (dispersion == "MAD")
      cfg.dispersion = DispersionType::MAD;
    else if (dispersion == "SMAD")
      cfg.dispersion = DispersionType::SMAD;
    else
      throw ConfigurationError("Unknown dispersion type: " + dispersion);

    auto &st         = cfg.staticTerms;
    st.maxIterations =
        getUnsigned(tree, "static.maxIterations", st.maxIterations);
    st.tolerance    = tree.get<double>("static.tolerance", st.tolerance);
    st.minResiduals = getUnsigned(tree, "static.minResiduals", st.minResiduals);

    auto &ss = cfg.ssst;
    ss.maxIterations =
        getUnsigned(tree, "ssst.maxIterations", ss.maxIterations);
    ss.tolerance = tree.get<double>("ssst.tolerance", ss.tolerance);
    ss.maxNeighbours =
        getUnsigned(tree, "ssst.maxNeighbours", ss.maxNeighbours);
    ss.minNeighbours =
        getUnsigned(tree, "ssst.minNeighbours", ss.minNeighbours);
    ss.maxDistanceStart =
        tree.get<double>("ssst.maxDistanceStart", ss.maxDistanceStart);
    ss.maxDistanceEnd =
        tree.get<double>("ssst.maxDistanceEnd", ss.maxDistanceEnd);
    ss.minDistance   = tree.get<double>("ssst.minDistance", ss.minDistance);
    ss.distancePower = tree.get<double>("ssst.distancePower", ss.distancePower);
    ss.useStaticBaseline =
        tree.get<bool>("ssst.useStaticBaseline", ss.useStaticBaseline);

    auto &nl        = cfg.nlloc;
    nl.exec         = tree.get<string>("nlloc.exec", nl.exec);
    nl.controlFile  = tree.get<string>("nlloc.controlFile", nl.controlFile);
    nl.timeGridRoot = tree.get<string>("nlloc.timeGridRoot", nl.timeGridRoot);
    nl.workingDir   = tree.get<string>("nlloc.workingDir", nl.workingDir);
    nl.delimiter    = tree.get<string>("nlloc.delimiter", nl.delimiter);
    nl.keepWorkingFiles =
        tree.get<bool>("nlloc.keepWorkingFiles", nl.keepWorkingFiles);
  }
  catch (pt::ptree_error &e)
  {
    throw ConfigurationError(
        strf("Cannot read configuration %s: %s", filename.c_str(), e.what()));
  }

  cfg.validate();
  return cfg;
}

} // namespace MEL
