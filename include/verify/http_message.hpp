// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Minimal HTTP/1.1 client-side message handling

 Purpose:
 - Parse the geolocation URL into the pieces a forward-proxy request needs
 - Build the proxied GET request (absolute-form request target)
 - Incrementally parse the response: status line, headers, and a body framed
   by Content-Length, chunked transfer coding, or connection close

 Interim 1xx responses are skipped. 204 and 304 responses have no body.
 Bodies larger than MAX_BODY_SIZE are rejected.
*/

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace proxyscan {
namespace verify {

struct HttpUrl {
  std::string host;      // without brackets for IPv6 literals
  uint16_t port{80};
  std::string target{"/"};  // path and query

  // "host" when port is 80, else "host:port" (IPv6 literals bracketed)
  std::string Authority() const;

  // Absolute form used as the request target when talking to a proxy
  std::string ToString() const { return "http://" + Authority() + target; }
};

// Parse "http://host[:port][/path][?query]". The scheme may be omitted
// (plain http is assumed). Any other scheme, an empty host or a bad port
// yields nullopt.
std::optional<HttpUrl> ParseHttpUrl(const std::string& url);

// GET request for url, addressed to a forward proxy
std::string BuildProxyGetRequest(const HttpUrl& url, const std::string& user_agent);

class HttpResponseParser {
public:
  static constexpr size_t MAX_HEADER_SIZE = 64 * 1024;
  static constexpr size_t MAX_BODY_SIZE = 1024 * 1024;

  // Consume received bytes. Returns false once the input is known to be
  // malformed; error() then describes the problem. Bytes after a complete
  // response are ignored.
  bool Feed(const char* data, size_t len);

  // The peer closed the connection. Completes a body that is delimited by
  // connection close. Returns complete().
  bool FinishEof();

  bool headers_complete() const { return headers_complete_; }
  bool complete() const { return state_ == State::COMPLETE; }
  bool failed() const { return state_ == State::FAILED; }

  int status_code() const { return status_code_; }
  const std::string& reason() const { return reason_; }
  const std::string& body() const { return body_; }
  const std::string& error() const { return error_; }

  // Header lookup, case-insensitive. Repeated headers are joined with ", ".
  std::optional<std::string> header(const std::string& name) const;

private:
  enum class State {
    STATUS_LINE,
    HEADERS,
    BODY,
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    TRAILERS,
    COMPLETE,
    FAILED
  };

  bool Process();
  bool TakeLine(std::string& line);
  bool OnHeadersDone();
  bool Fail(const std::string& error);

  State state_{State::STATUS_LINE};
  std::string buffer_;
  size_t pos_{0};
  size_t header_bytes_{0};

  int status_code_{0};
  std::string reason_;
  std::map<std::string, std::string> headers_;  // lowercase name -> value
  bool headers_complete_{false};

  bool until_eof_{false};
  uint64_t remaining_{0};
  std::string body_;
  std::string error_;
};

}  // namespace verify
}  // namespace proxyscan
