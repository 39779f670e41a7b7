// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "verify/http_proxy_verifier.hpp"

#include "util/logging.hpp"
#include "version.hpp"

#include <array>
#include <optional>
#include <stdexcept>
#include <utility>

#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/write.hpp>

namespace proxyscan {
namespace verify {

namespace {

static constexpr size_t RECV_BUFFER_SIZE = 4096;

// ProxyCheckSession - state of one verification unit. Kept alive by the
// shared_ptr captured in each pending handler; destroyed once the socket and
// the timer have no outstanding operations.
class ProxyCheckSession : public std::enable_shared_from_this<ProxyCheckSession> {
public:
  ProxyCheckSession(asio::io_context& io_context, scan::Candidate candidate,
                    std::shared_ptr<const std::string> request, std::chrono::seconds timeout,
                    ProxyVerifier::VerifyCallback callback)
      : socket_(io_context),
        timer_(io_context),
        candidate_(std::move(candidate)),
        request_(std::move(request)),
        timeout_(timeout),
        callback_(std::move(callback)) {}

  void Start() {
    start_ = std::chrono::steady_clock::now();

    timer_.expires_after(timeout_);
    timer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
      if (ec == asio::error::operation_aborted || self->done_) {
        return;
      }
      self->Finish(VerificationOutcome::Failure(self->candidate_,
                                                "timed out after " + std::to_string(self->timeout_.count()) + " s"));
    });

    LOG_VERIFY_TRACE("connecting to proxy candidate {}", candidate_.ToString());
    socket_.async_connect(candidate_.endpoint(),
                          [self = shared_from_this()](const asio::error_code& ec) { self->OnConnect(ec); });
  }

private:
  void OnConnect(const asio::error_code& ec) {
    if (done_) {
      return;
    }
    if (ec) {
      Finish(VerificationOutcome::Failure(candidate_, "connect failed: " + ec.message()));
      return;
    }

    asio::error_code opt_ec;
    socket_.set_option(asio::ip::tcp::no_delay(true), opt_ec);

    asio::async_write(socket_, asio::buffer(*request_),
                      [self = shared_from_this()](const asio::error_code& ec, size_t) { self->OnWrite(ec); });
  }

  void OnWrite(const asio::error_code& ec) {
    if (done_) {
      return;
    }
    if (ec) {
      Finish(VerificationOutcome::Failure(candidate_, "send failed: " + ec.message()));
      return;
    }
    DoRead();
  }

  void DoRead() {
    socket_.async_read_some(asio::buffer(recv_buffer_), [self = shared_from_this()](const asio::error_code& ec,
                                                                                    size_t bytes_transferred) {
      self->OnRead(ec, bytes_transferred);
    });
  }

  void OnRead(const asio::error_code& ec, size_t bytes_transferred) {
    if (done_) {
      return;
    }

    if (bytes_transferred > 0) {
      if (!parser_.Feed(recv_buffer_.data(), bytes_transferred)) {
        const std::string& error = parser_.error();
        Finish(VerificationOutcome::Failure(
            candidate_, error == "invalid HTTP response" ? error : "invalid HTTP response: " + error));
        return;
      }
      if (!headers_at_ && parser_.headers_complete()) {
        headers_at_ = std::chrono::steady_clock::now();
      }
      if (parser_.complete()) {
        OnResponse();
        return;
      }
    }

    if (ec == asio::error::eof) {
      if (parser_.FinishEof()) {
        OnResponse();
      } else {
        Finish(VerificationOutcome::Failure(candidate_,
                                            "read failed: connection closed before response was complete"));
      }
      return;
    }
    if (ec) {
      Finish(VerificationOutcome::Failure(candidate_, "read failed: " + ec.message()));
      return;
    }

    DoRead();
  }

  void OnResponse() {
    const int status = parser_.status_code();
    if (status < 200 || status > 299) {
      std::string reason = "HTTP status " + std::to_string(status);
      if (!parser_.reason().empty()) {
        reason += " " + parser_.reason();
      }
      Finish(VerificationOutcome::Failure(candidate_, reason));
      return;
    }

    auto headers_at = headers_at_.value_or(std::chrono::steady_clock::now());
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(headers_at - start_);
    Finish(EvaluateGeoResponse(candidate_, elapsed, parser_.body()));
  }

  void Finish(VerificationOutcome outcome) {
    if (done_) {
      return;
    }
    done_ = true;

    timer_.cancel();
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);

    if (outcome.ok()) {
      LOG_VERIFY_DEBUG("{} works as a proxy ({} ms, {})", candidate_.ToString(), outcome.result->response_time_ms,
                       outcome.result->location);
    } else {
      LOG_VERIFY_DEBUG("{} failed verification: {}", candidate_.ToString(), outcome.error);
    }

    auto callback = std::move(callback_);
    callback_ = nullptr;
    if (callback) {
      callback(std::move(outcome));
    }
  }

  asio::ip::tcp::socket socket_;
  asio::steady_timer timer_;
  scan::Candidate candidate_;
  std::shared_ptr<const std::string> request_;
  std::chrono::seconds timeout_;
  ProxyVerifier::VerifyCallback callback_;

  std::array<char, RECV_BUFFER_SIZE> recv_buffer_{};
  HttpResponseParser parser_;
  std::chrono::steady_clock::time_point start_;
  std::optional<std::chrono::steady_clock::time_point> headers_at_;
  bool done_{false};
};

}  // namespace

HttpProxyVerifier::HttpProxyVerifier(asio::io_context& io_context, VerifierConfig config)
    : io_context_(io_context), config_(std::move(config)) {
  auto url = ParseHttpUrl(config_.geo_url);
  if (!url) {
    throw std::invalid_argument("invalid geolocation URL '" + config_.geo_url + "' (only http:// is supported)");
  }
  url_ = *url;
  request_ = std::make_shared<const std::string>(BuildProxyGetRequest(url_, GetUserAgent()));
  LOG_VERIFY_DEBUG("verifier requests {} with a {} s budget", url_.ToString(), config_.timeout.count());
}

void HttpProxyVerifier::Verify(const scan::Candidate& candidate, VerifyCallback callback) {
  auto session =
      std::make_shared<ProxyCheckSession>(io_context_, candidate, request_, config_.timeout, std::move(callback));
  session->Start();
}

}  // namespace verify
}  // namespace proxyscan
