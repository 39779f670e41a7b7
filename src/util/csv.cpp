// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/csv.hpp"

namespace proxyscan {
namespace util {

bool CsvReader::ReadRecord(std::vector<std::string>& fields) {
  fields.clear();

  if (at_start_) {
    at_start_ = false;
    // Skip UTF-8 byte order mark
    if (in_.peek() == 0xEF) {
      in_.get();
      if (in_.get() != 0xBB || in_.get() != 0xBF) {
        throw CsvError("invalid byte order mark", 1);
      }
    }
  }

  // Skip blank lines between records
  int c = in_.get();
  while (c == '\n' || c == '\r') {
    if (c == '\n') {
      line_++;
    }
    c = in_.get();
  }
  if (c == std::char_traits<char>::eof()) {
    return false;
  }

  record_line_ = line_;
  std::string field;
  bool in_quotes = false;
  bool after_quote = false;

  while (true) {
    if (c == std::char_traits<char>::eof()) {
      if (in_quotes) {
        throw CsvError("unterminated quoted field", record_line_);
      }
      fields.push_back(std::move(field));
      return true;
    }

    char ch = static_cast<char>(c);
    if (in_quotes) {
      if (ch == '"') {
        if (in_.peek() == '"') {
          in_.get();
          field.push_back('"');
        } else {
          in_quotes = false;
          after_quote = true;
        }
      } else {
        if (ch == '\n') {
          line_++;
        }
        field.push_back(ch);
      }
    } else if (ch == ',') {
      fields.push_back(std::move(field));
      field.clear();
      after_quote = false;
    } else if (ch == '\n' || ch == '\r') {
      if (ch == '\r' && in_.peek() == '\n') {
        in_.get();
      }
      line_++;
      fields.push_back(std::move(field));
      return true;
    } else if (after_quote) {
      throw CsvError("unexpected character after closing quote", record_line_);
    } else if (ch == '"' && field.empty()) {
      in_quotes = true;
    } else {
      field.push_back(ch);
    }

    c = in_.get();
  }
}

std::string CsvEscape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char ch : field) {
    if (ch == '"') {
      out.push_back('"');
    }
    out.push_back(ch);
  }
  out.push_back('"');
  return out;
}

std::string FormatCsvRecord(const std::vector<std::string>& fields) {
  std::string line;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      line.push_back(',');
    }
    line += CsvEscape(fields[i]);
  }
  return line;
}

}  // namespace util
}  // namespace proxyscan
