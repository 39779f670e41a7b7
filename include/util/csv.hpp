// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Minimal RFC 4180 CSV support

 Purpose:
 - Read candidate lists (header row + records) in file order
 - Write result reports that round-trip through the reader

 Dialect: comma separator, '"' quoting with "" as an escaped quote, quoted
 fields may span lines, LF or CRLF record terminators, blank lines ignored,
 leading UTF-8 BOM ignored.
*/

#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace proxyscan {
namespace util {

class CsvError : public std::runtime_error {
public:
  CsvError(const std::string& what, size_t line) : std::runtime_error(what), line_(line) {}

  // 1-based line on which the offending record started
  size_t line() const { return line_; }

private:
  size_t line_;
};

class CsvReader {
public:
  explicit CsvReader(std::istream& in) : in_(in) {}

  // Read the next record into fields. Returns false at end of input.
  // Throws CsvError on an unterminated quoted field or on text after a
  // closing quote.
  bool ReadRecord(std::vector<std::string>& fields);

  // Line on which the most recently returned record started
  size_t record_line() const { return record_line_; }

private:
  std::istream& in_;
  size_t line_{1};
  size_t record_line_{0};
  bool at_start_{true};
};

// Quote a field if it contains a separator, quote, CR or LF.
std::string CsvEscape(const std::string& field);

// Join fields into one CSV line (without terminator).
std::string FormatCsvRecord(const std::vector<std::string>& fields);

}  // namespace util
}  // namespace proxyscan
