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

#ifndef __MEL_CONFIG_H__
#define __MEL_CONFIG_H__

#include <string>
#include <vector>

namespace MEL {

/*
 * A: single-event location, no station terms
 * B: location with static station terms, iterative
 * C: location with source-specific station terms (SSST), iterative
 */
enum class Step : char
{
  A = 'A',
  B = 'B',
  C = 'C'
};

std::string toString(Step step);

Step stepFromString(const std::string &str);

inline bool isIterative(Step step) { return step != Step::A; }

enum class DispersionType
{
  MAD, // median absolute deviation
  SMAD // MAD scaled to approximate the standard deviation
};

std::string toString(DispersionType type);

struct NLLocOptions
{
  std::string exec = "NLLoc"; // NonLinLoc executable
  // NLLoc control file template; LOCFILES and LOCDELAY statements are
  // replaced for every event
  std::string controlFile;
  // travel-time grid root (the velocity model)
  std::string timeGridRoot;
  // parent of the per-event working directories ("" -> system temp dir)
  std::string workingDir;
  // network and station code separator in station labels ("" -> none)
  std::string delimiter;
  bool keepWorkingFiles = false;
};

struct Config
{
  // steps to run, in order
  std::vector<Step> steps = {Step::A, Step::B, Step::C};

  // relocation worker pool size: -1 -> all available processing units
  int numThreads = 1;

  // min number of usable picks required to locate an event
  unsigned minPicks = 4;

  // convergence signal
  DispersionType dispersion = DispersionType::SMAD;

  struct
  {
    unsigned maxIterations = 10;
    // stop when the relative change of the dispersion is below this value
    double tolerance = 0.01;
    // min residuals required to update the term of a station/phase
    unsigned minResiduals = 1;
  } staticTerms;

  struct
  {
    unsigned maxIterations = 10;
    double tolerance       = 0.01;
    // neighbouring events used per event and station/phase (K nearest)
    unsigned maxNeighbours = 50;
    // below this the static term is used instead
    unsigned minNeighbours = 5;
    // km, neighbour cutoff distance shrinking linearly from start
    // (first iteration) to end (last iteration)
    double maxDistanceStart = 50;
    double maxDistanceEnd   = 50;
    // km, inter-event distance floor for the inverse distance weighting
    double minDistance = 0.1;
    // weight = 1 / distance^distancePower (0 -> plain median)
    double distancePower = 1;
    // use the final static terms of step B, when available, as fallback
    // and as first iteration terms
    bool useStaticBaseline = true;
  } ssst;

  NLLocOptions nlloc;

  // throws ConfigurationError
  void validate() const;
};

/*
 * Load configuration from an INI file. Missing keys keep their default.

 [general]
 steps = A,B,C
 numThreads = -1
 minPicks = 4
 dispersion = SMAD

 [static]
 maxIterations = 10
 tolerance = 0.01
 minResiduals = 1

 [ssst]
 maxIterations = 10
 tolerance = 0.01
 maxNeighbours = 50
 minNeighbours = 5
 maxDistanceStart = 50
 maxDistanceEnd = 10
 minDistance = 0.1
 distancePower = 1
 useStaticBaseline = true

 [nlloc]
 exec = NLLoc
 controlFile = nlloc.in
 timeGridRoot = ./time/layer
 workingDir = /tmp
 delimiter = .
 keepWorkingFiles = false

 * Throws ConfigurationError on malformed content or invalid values
 */
Config readConfig(const std::string &filename);

} // namespace MEL

#endif
