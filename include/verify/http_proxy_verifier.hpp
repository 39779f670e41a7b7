// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "verify/http_message.hpp"
#include "verify/proxy_verifier.hpp"

#include <chrono>
#include <memory>
#include <string>

#include <asio/io_context.hpp>

namespace proxyscan {
namespace verify {

static constexpr const char* DEFAULT_GEO_URL = "http://ip-api.com/json";
static constexpr std::chrono::seconds DEFAULT_TEST_TIMEOUT{10};

struct VerifierConfig {
  std::string geo_url{DEFAULT_GEO_URL};
  std::chrono::seconds timeout{DEFAULT_TEST_TIMEOUT};
};

// HttpProxyVerifier - checks a candidate by sending a plain HTTP/1.1
// forward-proxy request for the geolocation URL through it.
//
// One steady_timer bounds the whole exchange (connect, request write,
// response read). Response time is measured from the start of the connect
// until the response headers have arrived. Single attempt, no retry.
class HttpProxyVerifier : public ProxyVerifier {
public:
  // Throws std::invalid_argument if config.geo_url is not a plain http URL
  HttpProxyVerifier(asio::io_context& io_context, VerifierConfig config);

  void Verify(const scan::Candidate& candidate, VerifyCallback callback) override;

  const HttpUrl& url() const { return url_; }
  std::chrono::seconds timeout() const { return config_.timeout; }

private:
  asio::io_context& io_context_;
  VerifierConfig config_;
  HttpUrl url_;
  std::shared_ptr<const std::string> request_;
};

}  // namespace verify
}  // namespace proxyscan
