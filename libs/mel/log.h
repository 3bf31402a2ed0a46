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

#ifndef __MEL_LOG_H__
#define __MEL_LOG_H__

#include "utils.h"

#include <cstdarg>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace MEL {

/*
 * Process-wide logging facade. The library never writes to a console or a
 * file by itself: the application registers the sinks once at start-up
 * (Logger::registerLoggers) and every message is forwarded there. Until
 * then all messages are discarded.
 */
class Logger
{
public:
  enum class Level
  {
    debug,
    info,
    warning,
    error,
  };

  using Sink = std::function<void(const std::string &)>;

  using FileSinkFactory =
      std::function<void *(const std::string &, const std::vector<Level> &)>;

  using FileSinkDestructor = std::function<void(void *)>;

  Logger()                       = delete;
  Logger(const Logger &)         = delete;
  void operator=(const Logger &) = delete;

  static void registerLoggers(const Sink &error,
                              const Sink &warning,
                              const Sink &info,
                              const Sink &debug,
                              const FileSinkFactory &createFileLogger,
                              const FileSinkDestructor &destroyFileLogger)
  {
    _error             = error;
    _warning           = warning;
    _info              = info;
    _debug             = debug;
    _createFileLogger  = createFileLogger;
    _destroyFileLogger = destroyFileLogger;
  }

  // Go back to the no-op sinks
  static void resetLoggers();

  static void logError(const std::string &s) { _error(s); }
  static void logWarning(const std::string &s) { _warning(s); }
  static void logInfo(const std::string &s) { _info(s); }
  static void logDebug(const std::string &s) { _debug(s); }

  static void log(const Level l, const std::string &s)
  {
    switch (l)
    {
    case Level::error: logError(s); break;
    case Level::warning: logWarning(s); break;
    case Level::info: logInfo(s); break;
    case Level::debug: logDebug(s); break;
    }
  }

  /*
   * Scoped file sink: messages of the selected levels are additionally
   * written to a file until the handle is destroyed
   */
  class File
  {
  public:
    explicit File(const std::function<void(void)> &cleanup) : _cleanup(cleanup)
    {}
    ~File() { _cleanup(); }
    File(const File &)           = delete;
    void operator=(const File &) = delete;

  private:
    const std::function<void(void)> _cleanup;
  };

  static std::unique_ptr<Logger::File> toFile(const std::string &filename,
                                              const std::vector<Level> &levels)
  {
    void *handle = _createFileLogger(filename, levels);
    auto cleanup = [handle]() { _destroyFileLogger(handle); };
    return std::unique_ptr<Logger::File>(new File(cleanup));
  }

private:
  static Sink _error;
  static Sink _warning;
  static Sink _info;
  static Sink _debug;
  static FileSinkFactory _createFileLogger;
  static FileSinkDestructor _destroyFileLogger;
};

inline void log(const Logger::Level l, const std::string &s)
{
  Logger::log(l, s);
}

__attribute__((format(printf, 2, 3))) inline void
logF(const Logger::Level l, const char *fmt, ...)
{
  va_list ap;
  va_start(ap, fmt);
  Logger::log(l, vstrf(fmt, ap));
  va_end(ap);
}

inline void logDebug(const std::string &s) { Logger::logDebug(s); }

__attribute__((format(printf, 1, 2))) inline void logDebugF(const char *fmt,
                                                            ...)
{
  va_list ap;
  va_start(ap, fmt);
  Logger::logDebug(vstrf(fmt, ap));
  va_end(ap);
}

inline void logInfo(const std::string &s) { Logger::logInfo(s); }

__attribute__((format(printf, 1, 2))) inline void logInfoF(const char *fmt, ...)
{
  va_list ap;
  va_start(ap, fmt);
  Logger::logInfo(vstrf(fmt, ap));
  va_end(ap);
}

inline void logWarning(const std::string &s) { Logger::logWarning(s); }

__attribute__((format(printf, 1, 2))) inline void logWarningF(const char *fmt,
                                                              ...)
{
  va_list ap;
  va_start(ap, fmt);
  Logger::logWarning(vstrf(fmt, ap));
  va_end(ap);
}

inline void logError(const std::string &s) { Logger::logError(s); }

__attribute__((format(printf, 1, 2))) inline void logErrorF(const char *fmt,
                                                            ...)
{
  va_list ap;
  va_start(ap, fmt);
  Logger::logError(vstrf(fmt, ap));
  va_end(ap);
}

} // namespace MEL

#endif
