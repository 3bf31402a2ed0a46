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

#include "utctime.h"
#include "utils.h"
#include <cmath>
#include <ctime>
#include <regex>

namespace chrono = std::chrono;
using chrono::duration_cast;
using chrono::time_point_cast;
using MEL::UTCClock;

namespace {

std::time_t to_time_t(const UTCClock::time_point &tp) noexcept
{
  // floor, so that times before the epoch keep a positive sub-second part
  auto secs = chrono::floor<chrono::seconds>(tp.time_since_epoch());
  return std::time_t(secs.count());
}

UTCClock::time_point from_time_t(std::time_t tt) noexcept
{
  return time_point_cast<UTCClock::duration>(
      chrono::time_point<UTCClock, chrono::seconds>(chrono::seconds(tt)));
}

} // namespace

namespace MEL {

UTCClock::time_point UTCClock::now()
{
  return time_point_cast<UTCClock::duration>(
      chrono::time_point<UTCClock, chrono::system_clock::duration>(
          chrono::system_clock::now().time_since_epoch()));
}

UTCClock::time_point UTCClock::fromDate(
    int year, int month, int day, int hour, int min, int sec, int usec)
{
  std::tm tm     = {};
  tm.tm_year     = year - 1900;
  tm.tm_mon      = month - 1;
  tm.tm_mday     = day;
  tm.tm_hour     = hour;
  tm.tm_min      = min;
  tm.tm_sec      = sec;
  tm.tm_isdst    = -1;
  std::time_t tt = timegm(&tm);
  return from_time_t(tt) + chrono::microseconds(usec);
}

void UTCClock::toDate(const UTCClock::time_point &tp,
                      int &year,
                      int &month,
                      int &day,
                      int &hour,
                      int &min,
                      int &sec,
                      int &usec)
{
  std::time_t tt = to_time_t(tp);
  std::tm tm;
  gmtime_r(&tt, &tm);
  year  = tm.tm_year + 1900;
  month = tm.tm_mon + 1;
  day   = tm.tm_mday;
  hour  = tm.tm_hour;
  min   = tm.tm_min;
  sec   = tm.tm_sec;
  usec  = (tp - from_time_t(tt)).count();
}

UTCClock::time_point UTCClock::fromString(const std::string &s)
{
  static const std::regex re(
      R"((\d\d\d\d)-(\d\d)-(\d\d)T(\d\d):(\d\d):(\d\d)(?:\.(\d+))?Z?)",
      std::regex::optimize);

  std::smatch m;
  if (!std::regex_match(s, m, re)) throw Exception("Invalid UTC string: " + s);

  int year  = std::stoi(m.str(1));
  int month = std::stoi(m.str(2));
  int day   = std::stoi(m.str(3));
  int hour  = std::stoi(m.str(4));
  int min   = std::stoi(m.str(5));
  int sec   = std::stoi(m.str(6));

  // read the fraction as an integer number of microseconds, reading it as a
  // floating point number would lose precision
  std::string fraction = m.str(7);
  if (fraction.size() > 6) fraction.resize(6);
  while (fraction.size() < 6) fraction.push_back('0');
  int usec = std::stoi(fraction);

  if (month < 1 || month > 12) throw Exception("Invalid UTC string: " + s);
  if (day < 1 || day > 31) throw Exception("Invalid UTC string: " + s);
  if (hour < 0 || hour > 23) throw Exception("Invalid UTC string: " + s);
  if (min < 0 || min > 59) throw Exception("Invalid UTC string: " + s);
  if (sec < 0 || sec > 60) throw Exception("Invalid UTC string: " + s);

  return fromDate(year, month, day, hour, min, sec, usec);
}

std::string UTCClock::toString(const UTCClock::time_point &tp)
{
  int year, month, day, hour, min, sec, usec;
  toDate(tp, year, month, day, hour, min, sec, usec);
  return strf("%04d-%02d-%02dT%02d:%02d:%02d.%06dZ", year, month, day, hour,
              min, sec, usec);
}

UTCClock::time_point UTCClock::fromNLLocString(const std::string &date,
                                               const std::string &hourMin,
                                               double seconds)
{
  static const std::regex dateRe(R"((\d\d\d\d)(\d\d)(\d\d))",
                                 std::regex::optimize);
  static const std::regex hourMinRe(R"((\d{1,2})(\d\d))", std::regex::optimize);

  std::smatch dm, hm;
  if (!std::regex_match(date, dm, dateRe))
    throw Exception("Invalid NonLinLoc date: " + date);
  if (!std::regex_match(hourMin, hm, hourMinRe))
    throw Exception("Invalid NonLinLoc hour-minute: " + hourMin);
  if (!std::isfinite(seconds))
    throw Exception("Invalid NonLinLoc seconds");

  // hour 24 and negative seconds are normalized by timegm and the duration
  // arithmetic
  return fromDate(std::stoi(dm.str(1)), std::stoi(dm.str(2)),
                  std::stoi(dm.str(3)), std::stoi(hm.str(1)),
                  std::stoi(hm.str(2))) +
         secToDur(seconds);
}

std::string UTCClock::toNLLocString(const UTCClock::time_point &tp)
{
  int year, month, day, hour, min, sec, usec;
  toDate(tp, year, month, day, hour, min, sec, usec);
  // round to 1e-4 s without letting 59.99995 print as 60.0000
  double seconds = std::floor((sec + usec / 1.e6) * 1.e4) / 1.e4;
  return strf("%04d%02d%02d %02d%02d %07.4f", year, month, day, hour, min,
              seconds);
}

} // namespace MEL
