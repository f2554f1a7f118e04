#pragma once

#include <memory>
#include <string>
#include <vector>

#include "auth/registry.hpp"
#include "auth/token_manager.hpp"
#include "core/types.hpp"

namespace oauth::api {

// Query parameter names shared by the authenticate and callback endpoints
namespace params {
constexpr const char* OAUTH_PROVIDER = "oauth_provider";
constexpr const char* SCOPE = "scope";
constexpr const char* REDIRECT_AFTER_LOGIN = "redirect_after_login";
constexpr const char* OAUTH_ERROR = "error";
constexpr const char* STATE = "state";
constexpr const char* USER_ID = "userId";
constexpr const char* MODE = "mode";
}  // namespace params

// Name of the query parameter appended to the post-login URL when the flow fails
constexpr const char* ERROR_QUERY_NAME = "error_code";
constexpr const char* ACCESS_DENIED = "access_denied";

// Dispatches OAuth requests to the authenticator registered for a provider.
// Holds no per-request state: everything the callback needs travels in the "state" parameter.
class OAuthApi {
 public:
  OAuthApi(std::shared_ptr<auth::AuthenticatorRegistry> registry, auth::PersonalAccessTokenManagerPtr token_manager,
           std::string access_denied_error_page, std::string api_path = "/api/oauth");

  // Redirect to the provider's authorization page.
  // request_url is the full URL of the incoming authenticate request; its query becomes the state.
  Result<Redirect> authenticate(const std::string& request_url, const ProviderName& provider, const std::vector<std::string>& scopes,
                                const std::string& redirect_after_login) const;

  // Handle the provider's redirect back to the broker and send the user to the post-login URL.
  // error_values overrides the "error" query values of request_url when not empty.
  Result<Redirect> callback(const std::string& request_url, const std::vector<std::string>& error_values = {}) const;

  // One descriptor per registered provider, sorted by name
  std::vector<OAuthAuthenticatorDescriptor> get_registered_authenticators(const std::string& base_url) const;

  // Token of the subject, looked up by user id then by user name
  Result<OAuthToken> get_token(const ProviderName& provider, const Subject& subject) const;

  // Revoke the subject's token for a provider
  Status invalidate_token(const ProviderName& provider, const Subject& subject) const;

 private:
  Result<auth::AuthenticatorPtr> get_authenticator(const ProviderName& provider) const;

  std::shared_ptr<auth::AuthenticatorRegistry> registry_;
  auth::PersonalAccessTokenManagerPtr token_manager_;
  std::string access_denied_error_page_;
  std::string api_path_;
};

}  // namespace oauth::api
