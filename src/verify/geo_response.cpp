// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "verify/verification.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

namespace proxyscan {
namespace verify {

namespace {

class GeoDecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

std::optional<std::string> OptionalString(const nlohmann::json& j, const char* field) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw GeoDecodeError(std::string("invalid type for field '") + field + "': expected a string, got " +
                         it->type_name());
  }
  return it->get<std::string>();
}

}  // namespace

VerificationOutcome EvaluateGeoResponse(const scan::Candidate& endpoint, std::chrono::milliseconds elapsed,
                                        const std::string& body) {
  std::string status;
  std::optional<std::string> city;
  std::optional<std::string> country;
  std::optional<std::string> message;

  try {
    nlohmann::json j = nlohmann::json::parse(body);
    if (!j.is_object()) {
      throw GeoDecodeError(std::string("expected a JSON object, got ") + j.type_name());
    }
    if (!j.contains("status")) {
      throw GeoDecodeError("missing field 'status'");
    }
    if (!j["status"].is_string()) {
      throw GeoDecodeError(std::string("invalid type for field 'status': expected a string, got ") +
                           j["status"].type_name());
    }
    status = j["status"].get<std::string>();
    city = OptionalString(j, "city");
    country = OptionalString(j, "country");
    message = OptionalString(j, "message");
  } catch (const nlohmann::json::exception& e) {
    return VerificationOutcome::Failure(endpoint, std::string("error decoding response body: ") + e.what());
  } catch (const GeoDecodeError& e) {
    return VerificationOutcome::Failure(endpoint, std::string("error decoding response body: ") + e.what());
  }

  if (status != "success") {
    return VerificationOutcome::Failure(endpoint, "Geo API error: " + message.value_or("API error"));
  }

  ProxyResult result;
  result.address = endpoint.address;
  result.response_time_ms = elapsed.count() < 0 ? 0 : static_cast<uint64_t>(elapsed.count());
  result.location = city.value_or("Unknown") + ", " + country.value_or("Unknown");
  return VerificationOutcome::Success(endpoint, std::move(result));
}

}  // namespace verify
}  // namespace proxyscan
