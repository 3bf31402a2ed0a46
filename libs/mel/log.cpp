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

#include "log.h"

using namespace std;

namespace MEL {

namespace {

const Logger::Sink noopSink = [](const std::string &) {};

const Logger::FileSinkFactory noopFileSinkFactory =
    [](const std::string &, const std::vector<Logger::Level> &) -> void * {
  return nullptr;
};

const Logger::FileSinkDestructor noopFileSinkDestructor = [](void *) {};

} // namespace

//
// No-op handlers by default: it is up to the application to register
// something with Logger::registerLoggers(...)
//
Logger::Sink Logger::_error   = noopSink;
Logger::Sink Logger::_warning = noopSink;
Logger::Sink Logger::_info    = noopSink;
Logger::Sink Logger::_debug   = noopSink;

Logger::FileSinkFactory Logger::_createFileLogger = noopFileSinkFactory;

Logger::FileSinkDestructor Logger::_destroyFileLogger = noopFileSinkDestructor;

void Logger::resetLoggers()
{
  registerLoggers(noopSink, noopSink, noopSink, noopSink, noopFileSinkFactory,
                  noopFileSinkDestructor);
}

} // namespace MEL
