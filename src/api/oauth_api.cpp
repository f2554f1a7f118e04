#include "api/oauth_api.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "net/url.hpp"

namespace oauth::api {

OAuthApi::OAuthApi(std::shared_ptr<auth::AuthenticatorRegistry> registry, auth::PersonalAccessTokenManagerPtr token_manager,
                   std::string access_denied_error_page, std::string api_path)
    : registry_(std::move(registry)),
      token_manager_(std::move(token_manager)),
      access_denied_error_page_(std::move(access_denied_error_page)),
      api_path_(std::move(api_path)) {
  while (api_path_.size() > 1 && api_path_.back() == '/') {
    api_path_.pop_back();
  }
}

Result<auth::AuthenticatorPtr> OAuthApi::get_authenticator(const ProviderName& provider) const {
  std::optional<auth::RegisteredAuthenticator> entry;
  if (registry_) {
    entry = registry_->get(provider);
  }
  if (!entry) {
    spdlog::warn("[OAuthApi] Unsupported OAuth provider {}", provider);
    return Result<auth::AuthenticatorPtr>::failure(ErrorCode::NotFound, "Unsupported OAuth provider " + provider);
  }
  return Result<auth::AuthenticatorPtr>::success(entry->authenticator);
}

Result<Redirect> OAuthApi::authenticate(const std::string& request_url, const ProviderName& provider, const std::vector<std::string>& scopes,
                                        const std::string& redirect_after_login) const {
  auto oauth = get_authenticator(provider);
  if (!oauth.ok()) {
    return Result<Redirect>::failure(*oauth.error);
  }

  // The state is built from this URL's query, so it must name everything the callback needs
  std::string url = request_url;
  auto query = net::parse_query(net::query_of(url));
  if (!query.count(params::OAUTH_PROVIDER)) {
    url = net::append_query_parameter(url, params::OAUTH_PROVIDER, provider);
  }
  if (!query.count(params::SCOPE)) {
    for (const auto& scope : scopes) {
      url = net::append_query_parameter(url, params::SCOPE, scope);
    }
  }
  if (!redirect_after_login.empty() && !query.count(params::REDIRECT_AFTER_LOGIN)) {
    url = net::append_query_parameter(url, params::REDIRECT_AFTER_LOGIN, redirect_after_login);
  }

  auto auth_url = (*oauth.value)->get_authenticate_url(url, scopes);
  if (!auth_url.ok()) {
    spdlog::error("[OAuthApi] Cannot build {} authorization URL: {}", provider, auth_url.error->message);
    return Result<Redirect>::failure(ErrorCode::ServerError, auth_url.error->message);
  }

  spdlog::debug("[OAuthApi] Redirecting to {} authorization page", provider);
  return Result<Redirect>::success(Redirect{*auth_url.value});
}

Result<Redirect> OAuthApi::callback(const std::string& request_url, const std::vector<std::string>& error_values) const {
  auto state = net::query_params_from_state(net::get_state(request_url));

  auto errors = error_values;
  if (errors.empty()) {
    errors = net::get_parameters(net::parse_query(net::query_of(request_url)), params::OAUTH_ERROR);
  }

  const auto redirect_after_login = net::get_parameter(state, params::REDIRECT_AFTER_LOGIN);
  const auto error_parameter = std::string(ERROR_QUERY_NAME) + "=" + ACCESS_DENIED;

  if (std::find(errors.begin(), errors.end(), ACCESS_DENIED) != errors.end()) {
    if (!redirect_after_login.empty()) {
      spdlog::info("[OAuthApi] Access denied by user, returning to {}", redirect_after_login);
      return Result<Redirect>::success(Redirect{net::encode_redirect_url(redirect_after_login, error_parameter)});
    }
    spdlog::info("[OAuthApi] Access denied by user, no post-login URL in state");
    return Result<Redirect>::success(Redirect{access_denied_error_page_});
  }

  const auto provider = net::get_parameter(state, params::OAUTH_PROVIDER);
  auto oauth = get_authenticator(provider);
  if (!oauth.ok()) {
    return Result<Redirect>::failure(*oauth.error);
  }

  auto user = (*oauth.value)->callback(request_url, net::get_parameters(state, params::SCOPE));
  if (!user.ok()) {
    spdlog::warn("[OAuthApi] {} callback failed: {}", provider, user.error->message);
    if (redirect_after_login.empty()) {
      return Result<Redirect>::success(Redirect{access_denied_error_page_});
    }
    return Result<Redirect>::success(Redirect{net::append_query_parameter(redirect_after_login, ERROR_QUERY_NAME, ACCESS_DENIED)});
  }

  if (redirect_after_login.empty()) {
    spdlog::warn("[OAuthApi] {} callback for user {} carries no post-login URL", provider, *user.value);
    return Result<Redirect>::failure(ErrorCode::BadRequest, "State has no " + std::string(params::REDIRECT_AFTER_LOGIN));
  }

  spdlog::info("[OAuthApi] {} authorization completed for user {}", provider, *user.value);
  return Result<Redirect>::success(Redirect{redirect_after_login});
}

std::vector<OAuthAuthenticatorDescriptor> OAuthApi::get_registered_authenticators(const std::string& base_url) const {
  std::vector<OAuthAuthenticatorDescriptor> result;
  if (!registry_) {
    return result;
  }

  std::string base = base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }

  for (const auto& name : registry_->provider_names()) {
    auto entry = registry_->get(name);
    if (!entry) continue;

    Link link;
    link.href = base + api_path_ + "/authenticate";
    link.rel = "Authenticate URL";
    link.method = "GET";
    link.parameters = {
        LinkParameter{params::OAUTH_PROVIDER, name, true},
        LinkParameter{params::MODE, "federated_login", true},
    };

    OAuthAuthenticatorDescriptor descriptor;
    descriptor.name = name;
    descriptor.endpoint_url = entry->authenticator->endpoint_url();
    descriptor.links.push_back(std::move(link));
    result.push_back(std::move(descriptor));
  }

  return result;
}

Result<OAuthToken> OAuthApi::get_token(const ProviderName& provider, const Subject& subject) const {
  auto oauth = get_authenticator(provider);
  if (!oauth.ok()) {
    return Result<OAuthToken>::failure(*oauth.error);
  }

  for (const auto& user : {subject.user_id, subject.user_name}) {
    if (user.empty()) continue;

    auto token = (*oauth.value)->get_token(user);
    if (token.failed()) {
      spdlog::error("[OAuthApi] Cannot read {} token of {}: {}", provider, user, token.error->message);
      return Result<OAuthToken>::failure(ErrorCode::ServerError, token.error->message);
    }
    if (*token.value) {
      return Result<OAuthToken>::success(**token.value);
    }
  }

  spdlog::debug("[OAuthApi] No {} token for user {}", provider, subject.user_id);
  return Result<OAuthToken>::failure(ErrorCode::Unauthorized, "OAuth token for user " + subject.user_id + " was not found");
}

Status OAuthApi::invalidate_token(const ProviderName& provider, const Subject& subject) const {
  auto oauth = get_authenticator(provider);
  if (!oauth.ok()) {
    return Status{oauth.error};
  }

  const auto not_found = "OAuth token for provider " + provider + " was not found";
  if (!token_manager_) {
    spdlog::warn("[OAuthApi] No token manager, cannot invalidate {} token of {}", provider, subject.user_id);
    return Status::failure(ErrorCode::Unauthorized, not_found);
  }

  auto pat = token_manager_->get(subject, provider, std::nullopt);
  if (pat.failed()) {
    spdlog::warn("[OAuthApi] Cannot look up {} token of {}: {} ({})", provider, subject.user_id, pat.error->message,
                 to_string(pat.error->code));
    return Status::failure(ErrorCode::Unauthorized, not_found);
  }
  if (!*pat.value) {
    spdlog::debug("[OAuthApi] No {} token to invalidate for {}", provider, subject.user_id);
    return Status::failure(ErrorCode::Unauthorized, not_found);
  }

  if (!(*oauth.value)->invalidate_token((*pat.value)->token)) {
    spdlog::warn("[OAuthApi] {} refused to invalidate the token of {}", provider, subject.user_id);
    return Status::failure(ErrorCode::Unauthorized, not_found);
  }

  spdlog::info("[OAuthApi] Invalidated {} token of {}", provider, subject.user_id);
  return Status::success();
}

}  // namespace oauth::api
