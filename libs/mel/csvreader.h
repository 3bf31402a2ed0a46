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

#ifndef __MEL_CSVREADER_H__
#define __MEL_CSVREADER_H__

#include <istream>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace MEL {
namespace CSV {

/*
 * CSV files, Excel dialect
 *
 * E.g.

 header1,header2,header3
 val1,"val 2 quoted",val3
 val1,"val 2 quoted with ""inner"" quote",val3
 val1,"val 2 quoted, with separator",val3

 * Each line can have a different number of columns. When rows are read
 * against a header, excess fields are discarded and missing ones are set
 * to an empty string. Empty lines are skipped.
 */

using Row = std::unordered_map<std::string, std::string>;

std::vector<std::string> readRow(const std::string &line);

/*
 * Read file without header line.
 */
std::vector<std::vector<std::string>> read(std::istream &in);

std::vector<std::vector<std::string>> read(const std::string &filename);

/*
 * Read file with header: The first line must be the header.
 */
std::vector<Row> readWithHeader(std::istream &in);

std::vector<Row> readWithHeader(const std::string &filename);

/*
 * Convert a header and some rows to a list of header-indexed rows
 */
std::vector<Row>
format(const std::vector<std::string> &header,
       const std::vector<std::vector<std::string>>::const_iterator &begin,
       const std::vector<std::vector<std::string>>::const_iterator &end);

/*
 * Quote a field only when required (separator, quote or line break)
 */
std::string quote(const std::string &field);

void writeRow(std::ostream &os, const std::vector<std::string> &fields);

} // namespace CSV
} // namespace MEL

#endif
