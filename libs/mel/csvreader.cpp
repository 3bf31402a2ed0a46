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

#include <fstream>

#include "csvreader.h"
#include "utils.h"

using namespace std;

namespace MEL {
namespace CSV {

namespace {

enum class CSVState
{
  UnquotedField,
  QuotedField,
  QuotedQuote
};

void openOrThrow(ifstream &csvfile, const string &filename)
{
  if (!pathExists(filename))
  {
    throw FileNotFound(filename);
  }
  csvfile.open(filename);
  if (!csvfile.is_open())
  {
    throw Exception("Cannot open file " + filename);
  }
}

} // namespace

vector<string> readRow(const string &line)
{
  CSVState state = CSVState::UnquotedField;
  vector<string> fields{""};
  for (char c : line)
  {
    string &field = fields.back();
    switch (state)
    {
    case CSVState::UnquotedField:
      switch (c)
      {
      case ',': fields.push_back(""); break; // end of field
      case '"': state = CSVState::QuotedField; break;
      default: field.push_back(c); break;
      }
      break;
    case CSVState::QuotedField:
      if (c == '"')
        state = CSVState::QuotedQuote;
      else
        field.push_back(c);
      break;
    case CSVState::QuotedQuote:
      switch (c)
      {
      case ',': // , after closing quote
        fields.push_back("");
        state = CSVState::UnquotedField;
        break;
      case '"': // "" -> "
        field.push_back('"');
        state = CSVState::QuotedField;
        break;
      default: // end of quote
        state = CSVState::UnquotedField;
        break;
      }
      break;
    }
  }
  return fields;
}

vector<vector<string>> read(istream &in)
{
  vector<vector<string>> table;
  string line;
  while (std::getline(in, line))
  {
    // handle windows end-of-line
    if (!line.empty() && *line.rbegin() == '\r')
    {
      line.pop_back();
    }
    if (line.empty())
    {
      continue;
    }
    table.push_back(readRow(line));
  }
  if (in.bad())
  {
    throw Exception("I/O error while reading CSV data");
  }
  return table;
}

vector<vector<string>> read(const string &filename)
{
  ifstream csvfile;
  openOrThrow(csvfile, filename);
  return read(csvfile);
}

vector<Row> format(const vector<string> &header,
                   const vector<vector<string>>::const_iterator &begin,
                   const vector<vector<string>>::const_iterator &end)
{
  vector<Row> rows;
  for (auto it = begin; it != end; it++)
  {
    const vector<string> &columns = *it;
    Row row;
    for (size_t i = 0; i < header.size(); ++i)
    {
      row[header[i]] = i < columns.size() ? columns[i] : "";
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

vector<Row> readWithHeader(istream &in)
{
  vector<vector<string>> rows = read(in);
  if (rows.empty())
  {
    return {};
  }
  return format(rows[0], rows.begin() + 1, rows.end());
}

vector<Row> readWithHeader(const string &filename)
{
  ifstream csvfile;
  openOrThrow(csvfile, filename);
  return readWithHeader(csvfile);
}

string quote(const string &field)
{
  if (field.find_first_of(",\"\r\n") == string::npos)
  {
    return field;
  }
  string quoted = "\"";
  for (char c : field)
  {
    if (c == '"') quoted.push_back('"');
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

void writeRow(ostream &os, const vector<string> &fields)
{
  for (size_t i = 0; i < fields.size(); i++)
  {
    if (i > 0) os << ',';
    os << quote(fields[i]);
  }
  os << '\n';
}

} // namespace CSV
} // namespace MEL
