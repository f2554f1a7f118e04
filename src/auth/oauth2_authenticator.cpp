#include "auth/oauth2_authenticator.hpp"

#include <spdlog/spdlog.h>

#include "net/url.hpp"

namespace oauth::auth {

OAuth2Authenticator::OAuth2Authenticator(ProviderConfig config, std::shared_ptr<TokenStore> store, net::HttpSender sender)
    : config_(std::move(config)), store_(std::move(store)), sender_(std::move(sender)) {}

std::string OAuth2Authenticator::join_scopes(const std::vector<std::string>& scopes) const {
  const auto& effective = scopes.empty() ? config_.scopes : scopes;
  std::string joined;
  for (const auto& scope : effective) {
    if (scope.empty()) continue;
    if (!joined.empty()) joined += ' ';
    joined += scope;
  }
  return joined;
}

Result<std::string> OAuth2Authenticator::get_authenticate_url(const std::string& request_url, const std::vector<std::string>& scopes) {
  if (config_.auth_uri.empty()) {
    return Result<std::string>::failure(ErrorCode::OAuthAuthentication, "No authorization URI configured for " + config_.name);
  }

  std::vector<std::pair<std::string, std::string>> params = {
      {"response_type", "code"},
      {"client_id", config_.client_id},
  };
  if (!config_.redirect_uri.empty()) {
    params.emplace_back("redirect_uri", config_.redirect_uri);
  }
  auto scope = join_scopes(scopes);
  if (!scope.empty()) {
    params.emplace_back("scope", scope);
  }
  // The original request query comes back to the callback untouched
  params.emplace_back("state", net::query_of(request_url));

  char sep = config_.auth_uri.find('?') == std::string::npos ? '?' : '&';
  return Result<std::string>::success(config_.auth_uri + sep + net::build_query(params));
}

Result<UserId> OAuth2Authenticator::callback(const std::string& request_url, const std::vector<std::string>& scopes) {
  auto params = net::parse_query(net::query_of(request_url));

  auto error = net::get_parameter(params, "error");
  if (!error.empty()) {
    spdlog::warn("[OAuth2] {} rejected the authorization: {}", config_.name, error);
    return Result<UserId>::failure(ErrorCode::OAuthAuthentication, "Authorization failed: " + error);
  }

  auto code = net::get_parameter(params, "code");
  if (code.empty()) {
    return Result<UserId>::failure(ErrorCode::OAuthAuthentication, "Authorization code is missing");
  }

  auto state = net::query_params_from_state(net::get_parameter(params, "state"));
  auto user_id = net::get_parameter(state, "userId");
  if (user_id.empty()) {
    return Result<UserId>::failure(ErrorCode::OAuthAuthentication, "Cannot determine user from state");
  }

  auto token = exchange_code(code, scopes);
  if (!token.ok()) {
    return Result<UserId>::failure(*token.error);
  }

  auto saved = store_->save(config_.name, user_id, *token.value);
  if (saved.failed()) {
    return Result<UserId>::failure(ErrorCode::OAuthAuthentication, "Cannot store token: " + saved.error->message);
  }

  spdlog::info("[OAuth2] Stored {} token for user {}", config_.name, user_id);
  return Result<UserId>::success(user_id);
}

Result<OAuthToken> OAuth2Authenticator::exchange_code(const std::string& code, const std::vector<std::string>& scopes) {
  net::HttpOptions options;
  options.method = "POST";
  options.headers["Accept"] = "application/json";
  options.headers["Content-Type"] = "application/x-www-form-urlencoded";

  std::vector<std::pair<std::string, std::string>> form = {
      {"grant_type", "authorization_code"},
      {"code", code},
      {"client_id", config_.client_id},
      {"client_secret", config_.client_secret},
  };
  if (!config_.redirect_uri.empty()) {
    form.emplace_back("redirect_uri", config_.redirect_uri);
  }
  options.body = net::build_query(form);

  auto response = sender_(config_.token_uri, options);
  if (!response.error.empty()) {
    spdlog::error("[OAuth2] Token request to {} failed: {}", config_.token_uri, response.error);
    return Result<OAuthToken>::failure(ErrorCode::OAuthAuthentication, "Token request failed: " + response.error);
  }
  if (!response.ok()) {
    spdlog::error("[OAuth2] Token endpoint {} answered {}: {}", config_.token_uri, response.status_code, response.body);
    return Result<OAuthToken>::failure(ErrorCode::OAuthAuthentication,
                                       "Token endpoint answered HTTP " + std::to_string(response.status_code));
  }

  OAuthToken token;
  std::string provider_error;
  try {
    auto j = json::parse(response.body);
    token.token = j.value("access_token", "");
    token.scope = j.value("scope", "");
    provider_error = j.value("error", "");
  } catch (const json::exception&) {
    // Some providers answer form-encoded despite the Accept header
    auto form_response = net::parse_query(response.body);
    token.token = net::get_parameter(form_response, "access_token");
    token.scope = net::get_parameter(form_response, "scope");
    provider_error = net::get_parameter(form_response, "error");
  }

  if (token.token.empty()) {
    auto reason = provider_error.empty() ? std::string("no access_token in response") : provider_error;
    spdlog::error("[OAuth2] {} token exchange failed: {}", config_.name, reason);
    return Result<OAuthToken>::failure(ErrorCode::OAuthAuthentication, "Token exchange failed: " + reason);
  }
  if (token.scope.empty()) {
    token.scope = join_scopes(scopes);
  }
  return Result<OAuthToken>::success(std::move(token));
}

Result<std::optional<OAuthToken>> OAuth2Authenticator::get_token(const std::string& user) {
  return store_->get(config_.name, user);
}

bool OAuth2Authenticator::invalidate_token(const std::string& token) {
  if (!config_.revoke_uri.empty()) {
    net::HttpOptions options;
    options.method = "POST";
    options.headers["Content-Type"] = "application/x-www-form-urlencoded";
    options.body = net::build_query({{"token", token}, {"client_id", config_.client_id}, {"client_secret", config_.client_secret}});

    auto response = sender_(config_.revoke_uri, options);
    if (!response.ok()) {
      spdlog::warn("[OAuth2] Revocation at {} failed: HTTP {} {}", config_.revoke_uri, response.status_code, response.error);
      return false;
    }
  }

  auto removed = store_->remove_token(config_.name, token);
  if (removed.failed()) {
    spdlog::error("[OAuth2] Cannot remove {} token from store: {}", config_.name, removed.error->message);
    return false;
  }

  return *removed.value;
}

}  // namespace oauth::auth
