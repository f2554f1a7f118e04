#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace oauth {

using json = nlohmann::json;

// Type aliases
using ProviderName = std::string;
using UserId = std::string;

// Query parameters keep every value of a repeated key, in order of appearance
using QueryParams = std::map<std::string, std::vector<std::string>>;

// Error categories reported by the broker and its collaborators
enum class ErrorCode {
  NotFound,             // Unregistered provider
  Unauthorized,         // Missing or invalid token
  BadRequest,           // Malformed request
  ServerError,          // Storage or internal failure
  OAuthAuthentication,  // Authenticator could not complete the OAuth flow
  ScmCommunication,     // Token manager could not reach the SCM provider
  ScmUnauthorized,      // SCM provider rejected the token
  ScmPersistence        // Token manager could not read its storage
};

std::string to_string(ErrorCode code);

// HTTP status code the error is reported with
int http_status(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::ServerError;
  std::string message;
};

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(ErrorCode code, std::string message) {
    return Result{std::nullopt, Error{code, std::move(message)}};
  }

  static Result failure(Error err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Result of an operation without a value
struct Status {
  std::optional<Error> error;

  bool ok() const {
    return !error.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Status success() {
    return Status{};
  }

  static Status failure(ErrorCode code, std::string message) {
    return Status{Error{code, std::move(message)}};
  }
};

// OAuth protocol version of a registered provider
enum class ProtocolVersion { OAuth1, OAuth2 };

std::string to_string(ProtocolVersion version);

std::optional<ProtocolVersion> protocol_version_from_string(const std::string& str);

// Access credential for a (provider, user) pair
struct OAuthToken {
  std::string token;
  std::string scope;

  json to_json() const;
  static OAuthToken from_json(const json& j);
};

// The user on whose behalf a request runs
struct Subject {
  UserId user_id;
  std::string user_name;
  bool anonymous = true;

  static Subject anonymous_subject();
  static Subject of(UserId user_id, std::string user_name);
};

// Long-lived SCM credential managed outside the OAuth session
struct PersonalAccessToken {
  ProviderName scm_provider_name;
  std::string scm_provider_url;
  UserId che_user_id;
  std::string scm_user_name;
  std::string scm_token_name;
  std::string token;
};

struct LinkParameter {
  std::string name;
  std::string default_value;
  bool required = false;

  json to_json() const;
};

// Hypermedia link attached to a descriptor
struct Link {
  std::string href;
  std::string rel;
  std::string method = "GET";
  std::string produces;
  std::string consumes;
  std::vector<LinkParameter> parameters;

  json to_json() const;
};

// Directory entry for a registered provider
struct OAuthAuthenticatorDescriptor {
  ProviderName name;
  std::string endpoint_url;
  std::vector<Link> links;

  json to_json() const;
};

// HTTP redirect produced by the dispatcher
struct Redirect {
  static constexpr int STATUS = 307;  // Temporary Redirect

  std::string location;
};

}  // namespace oauth
