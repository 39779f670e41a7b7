// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "verify/http_message.hpp"

#include "util/string_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace proxyscan {
namespace verify {

namespace {

// Longest chunk-size line (size plus extensions) accepted
constexpr size_t MAX_CHUNK_LINE = 1024;

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Content-Length value. Repeated headers arrive joined as "5, 5" and are
// accepted only when every value is the same.
std::optional<int64_t> ParseContentLength(const std::string& value) {
  std::optional<int64_t> length;
  size_t start = 0;
  while (true) {
    const size_t comma = value.find(',', start);
    const std::string item = value.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
    auto parsed = util::SafeParseInt64(util::Trim(item), 0, std::numeric_limits<int64_t>::max());
    if (!parsed || (length && *length != *parsed)) {
      return std::nullopt;
    }
    length = parsed;
    if (comma == std::string::npos) {
      return length;
    }
    start = comma + 1;
  }
}

// Parse a chunk-size line: hex digits, optionally followed by ";ext"
std::optional<uint64_t> ParseChunkSize(const std::string& line) {
  std::string digits = util::Trim(line.substr(0, line.find(';')));
  if (digits.empty() || digits.size() > 15) {
    return std::nullopt;
  }
  uint64_t value = 0;
  for (char c : digits) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    value = value * 16 + static_cast<uint64_t>(std::isdigit(static_cast<unsigned char>(c))
                                                   ? c - '0'
                                                   : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
  }
  return value;
}

}  // namespace

std::string HttpUrl::Authority() const {
  std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (port != 80) {
    h += ":" + std::to_string(port);
  }
  return h;
}

std::optional<HttpUrl> ParseHttpUrl(const std::string& url) {
  std::string u = util::Trim(url);
  if (u.empty()) {
    return std::nullopt;
  }

  auto scheme_pos = u.find("://");
  if (scheme_pos != std::string::npos) {
    if (ToLower(u.substr(0, scheme_pos)) != "http") {
      return std::nullopt;
    }
    u = u.substr(scheme_pos + 3);
  }

  // Drop fragment
  u = u.substr(0, u.find('#'));

  HttpUrl result;
  size_t target_pos = u.find_first_of("/?");
  std::string authority = target_pos == std::string::npos ? u : u.substr(0, target_pos);
  if (target_pos != std::string::npos) {
    result.target = u.substr(target_pos);
    if (result.target[0] == '?') {
      result.target = "/" + result.target;
    }
  }

  if (authority.find('@') != std::string::npos) {
    return std::nullopt;  // credentials in URL not supported
  }

  std::string port_str;
  if (!authority.empty() && authority[0] == '[') {
    size_t close = authority.find(']');
    if (close == std::string::npos || close < 2) {
      return std::nullopt;
    }
    result.host = authority.substr(1, close - 1);
    std::string rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest[0] != ':') {
        return std::nullopt;
      }
      port_str = rest.substr(1);
      if (port_str.empty()) {
        return std::nullopt;
      }
    }
  } else {
    size_t colon = authority.find(':');
    if (colon != std::string::npos) {
      result.host = authority.substr(0, colon);
      port_str = authority.substr(colon + 1);
      if (port_str.empty()) {
        return std::nullopt;
      }
    } else {
      result.host = authority;
    }
  }

  if (result.host.empty()) {
    return std::nullopt;
  }
  if (!port_str.empty()) {
    auto port = util::SafeParsePort(port_str);
    if (!port) {
      return std::nullopt;
    }
    result.port = *port;
  }
  return result;
}

std::string BuildProxyGetRequest(const HttpUrl& url, const std::string& user_agent) {
  std::string request;
  request.reserve(256);
  request += "GET " + url.ToString() + " HTTP/1.1\r\n";
  request += "Host: " + url.Authority() + "\r\n";
  request += "User-Agent: " + user_agent + "\r\n";
  request += "Accept: */*\r\n";
  request += "Connection: close\r\n";
  request += "\r\n";
  return request;
}

// ============================================================================
// HttpResponseParser
// ============================================================================

bool HttpResponseParser::Feed(const char* data, size_t len) {
  if (state_ == State::COMPLETE) {
    return true;
  }
  if (state_ == State::FAILED) {
    return false;
  }
  buffer_.append(data, len);
  bool ok = Process();

  // Compact consumed input
  if (pos_ > 0) {
    buffer_.erase(0, pos_);
    pos_ = 0;
  }
  return ok;
}

bool HttpResponseParser::FinishEof() {
  if (state_ == State::BODY && until_eof_) {
    state_ = State::COMPLETE;
  }
  return complete();
}

std::optional<std::string> HttpResponseParser::header(const std::string& name) const {
  auto it = headers_.find(ToLower(name));
  if (it == headers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool HttpResponseParser::Fail(const std::string& error) {
  state_ = State::FAILED;
  error_ = error;
  return false;
}

bool HttpResponseParser::TakeLine(std::string& line) {
  size_t nl = buffer_.find('\n', pos_);
  if (nl == std::string::npos) {
    return false;
  }
  line = buffer_.substr(pos_, nl - pos_);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  pos_ = nl + 1;
  return true;
}

bool HttpResponseParser::OnHeadersDone() {
  // Interim response (100 Continue, 103 Early Hints): the real one follows
  if (status_code_ >= 100 && status_code_ < 200) {
    headers_.clear();
    reason_.clear();
    status_code_ = 0;
    state_ = State::STATUS_LINE;
    return true;
  }

  headers_complete_ = true;

  if (status_code_ == 204 || status_code_ == 304) {
    state_ = State::COMPLETE;
    return true;
  }

  auto te = header("transfer-encoding");
  if (te && ToLower(*te).find("chunked") != std::string::npos) {
    state_ = State::CHUNK_SIZE;
    return true;
  }

  auto cl = header("content-length");
  if (cl) {
    auto length = ParseContentLength(*cl);
    if (!length) {
      return Fail("invalid Content-Length");
    }
    if (static_cast<uint64_t>(*length) > MAX_BODY_SIZE) {
      return Fail("response body too large");
    }
    if (*length == 0) {
      state_ = State::COMPLETE;
      return true;
    }
    remaining_ = static_cast<uint64_t>(*length);
    until_eof_ = false;
    state_ = State::BODY;
    return true;
  }

  until_eof_ = true;
  state_ = State::BODY;
  return true;
}

bool HttpResponseParser::Process() {
  std::string line;
  while (true) {
    switch (state_) {
      case State::STATUS_LINE:
      case State::HEADERS:
      case State::TRAILERS: {
        const size_t before = pos_;
        if (!TakeLine(line)) {
          if (header_bytes_ + (buffer_.size() - pos_) > MAX_HEADER_SIZE) {
            return Fail("response headers too large");
          }
          return true;
        }
        header_bytes_ += pos_ - before;
        if (header_bytes_ > MAX_HEADER_SIZE) {
          return Fail("response headers too large");
        }

        if (state_ == State::STATUS_LINE) {
          // "HTTP/1.1 200 OK"
          if (line.rfind("HTTP/", 0) != 0) {
            return Fail("invalid HTTP response");
          }
          size_t sp1 = line.find(' ');
          if (sp1 == std::string::npos || line.size() < sp1 + 4) {
            return Fail("invalid HTTP response");
          }
          std::string code = line.substr(sp1 + 1, 3);
          if (line.size() > sp1 + 4 && line[sp1 + 4] != ' ') {
            return Fail("invalid HTTP response");
          }
          auto status = util::SafeParseInt(code, 100, 999);
          if (!status) {
            return Fail("invalid HTTP response");
          }
          status_code_ = *status;
          reason_ = line.size() > sp1 + 5 ? util::Trim(line.substr(sp1 + 5)) : std::string();
          state_ = State::HEADERS;
        } else if (line.empty()) {
          if (state_ == State::TRAILERS) {
            state_ = State::COMPLETE;
          } else if (!OnHeadersDone()) {
            return false;
          }
        } else if (state_ == State::HEADERS) {
          size_t colon = line.find(':');
          if (colon == std::string::npos || colon == 0) {
            return Fail("invalid HTTP header");
          }
          std::string name = ToLower(util::Trim(line.substr(0, colon)));
          std::string value = util::Trim(line.substr(colon + 1));
          auto it = headers_.find(name);
          if (it == headers_.end()) {
            headers_.emplace(std::move(name), std::move(value));
          } else {
            it->second += ", " + value;
          }
        }
        // Trailer fields are ignored
        break;
      }

      case State::BODY: {
        size_t available = buffer_.size() - pos_;
        if (available == 0) {
          return true;
        }
        size_t take = until_eof_ ? available : static_cast<size_t>(std::min<uint64_t>(remaining_, available));
        if (body_.size() + take > MAX_BODY_SIZE) {
          return Fail("response body too large");
        }
        body_.append(buffer_, pos_, take);
        pos_ += take;
        if (!until_eof_) {
          remaining_ -= take;
          if (remaining_ == 0) {
            state_ = State::COMPLETE;
          }
        }
        break;
      }

      case State::CHUNK_SIZE: {
        const size_t before = pos_;
        if (!TakeLine(line)) {
          if (buffer_.size() - pos_ > MAX_CHUNK_LINE) {
            return Fail("invalid chunk size");
          }
          return true;
        }
        if (pos_ - before - 1 > MAX_CHUNK_LINE) {
          return Fail("invalid chunk size");
        }
        auto size = ParseChunkSize(line);
        if (!size) {
          return Fail("invalid chunk size");
        }
        if (*size == 0) {
          state_ = State::TRAILERS;
          break;
        }
        if (body_.size() + *size > MAX_BODY_SIZE) {
          return Fail("response body too large");
        }
        remaining_ = *size;
        state_ = State::CHUNK_DATA;
        break;
      }

      case State::CHUNK_DATA: {
        size_t available = buffer_.size() - pos_;
        if (available == 0) {
          return true;
        }
        size_t take = static_cast<size_t>(std::min<uint64_t>(remaining_, available));
        body_.append(buffer_, pos_, take);
        pos_ += take;
        remaining_ -= take;
        if (remaining_ == 0) {
          state_ = State::CHUNK_DATA_END;
        }
        break;
      }

      case State::CHUNK_DATA_END: {
        if (!TakeLine(line)) {
          if (buffer_.size() - pos_ > 2) {
            return Fail("invalid chunk terminator");
          }
          return true;
        }
        if (!line.empty()) {
          return Fail("invalid chunk terminator");
        }
        state_ = State::CHUNK_SIZE;
        break;
      }

      case State::COMPLETE:
        return true;

      case State::FAILED:
        return false;
    }
  }
}

}  // namespace verify
}  // namespace proxyscan
