#include "core/types.hpp"

namespace oauth {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::Unauthorized:
      return "unauthorized";
    case ErrorCode::BadRequest:
      return "bad_request";
    case ErrorCode::ServerError:
      return "server_error";
    case ErrorCode::OAuthAuthentication:
      return "oauth_authentication";
    case ErrorCode::ScmCommunication:
      return "scm_communication";
    case ErrorCode::ScmUnauthorized:
      return "scm_unauthorized";
    case ErrorCode::ScmPersistence:
      return "scm_persistence";
  }
  return "server_error";
}

int http_status(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotFound:
      return 404;
    case ErrorCode::Unauthorized:
    case ErrorCode::ScmUnauthorized:
      return 401;
    case ErrorCode::BadRequest:
      return 400;
    case ErrorCode::ServerError:
    case ErrorCode::OAuthAuthentication:
    case ErrorCode::ScmCommunication:
    case ErrorCode::ScmPersistence:
      return 500;
  }
  return 500;
}

std::string to_string(ProtocolVersion version) {
  switch (version) {
    case ProtocolVersion::OAuth1:
      return "oauth1";
    case ProtocolVersion::OAuth2:
      return "oauth2";
  }
  return "oauth2";
}

std::optional<ProtocolVersion> protocol_version_from_string(const std::string& str) {
  if (str == "oauth1" || str == "OAuth1") return ProtocolVersion::OAuth1;
  if (str == "oauth2" || str == "OAuth2") return ProtocolVersion::OAuth2;
  return std::nullopt;
}

json OAuthToken::to_json() const {
  return json{{"token", token}, {"scope", scope}};
}

OAuthToken OAuthToken::from_json(const json& j) {
  OAuthToken t;
  t.token = j.value("token", j.value("access_token", ""));
  t.scope = j.value("scope", "");
  return t;
}

Subject Subject::anonymous_subject() {
  Subject s;
  s.user_id = "0000-00-0000";
  s.user_name = "Anonymous";
  s.anonymous = true;
  return s;
}

Subject Subject::of(UserId user_id, std::string user_name) {
  Subject s;
  s.user_id = std::move(user_id);
  s.user_name = std::move(user_name);
  s.anonymous = false;
  return s;
}

json LinkParameter::to_json() const {
  return json{{"name", name}, {"defaultValue", default_value}, {"required", required}};
}

json Link::to_json() const {
  json j{{"href", href}, {"rel", rel}, {"method", method}};
  if (!produces.empty()) j["produces"] = produces;
  if (!consumes.empty()) j["consumes"] = consumes;

  json params = json::array();
  for (const auto& p : parameters) {
    params.push_back(p.to_json());
  }
  j["parameters"] = params;
  return j;
}

json OAuthAuthenticatorDescriptor::to_json() const {
  json links_json = json::array();
  for (const auto& link : links) {
    links_json.push_back(link.to_json());
  }
  return json{{"name", name}, {"endpointUrl", endpoint_url}, {"links", links_json}};
}

}  // namespace oauth
