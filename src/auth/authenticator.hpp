#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace oauth::auth {

// Provider-specific side of an OAuth flow. One instance per provider; the broker only builds
// URLs and dispatches to it by provider name.
class OAuthAuthenticator {
 public:
  virtual ~OAuthAuthenticator() = default;

  // Provider name this authenticator is registered under (e.g., "github")
  virtual ProviderName provider_name() const = 0;

  // Base URL of the provider (e.g., "https://github.com")
  virtual std::string endpoint_url() const = 0;

  // URL of the provider's authorization page. The query of request_url must be carried
  // through the provider inside the "state" parameter.
  virtual Result<std::string> get_authenticate_url(const std::string& request_url, const std::vector<std::string>& scopes) = 0;

  // Complete the flow from the provider's redirect back to the broker.
  // Returns the id of the user the obtained token belongs to, or an OAuthAuthentication error.
  virtual Result<UserId> callback(const std::string& request_url, const std::vector<std::string>& scopes) = 0;

  // Token stored for a user id or user name; nullopt value when there is none.
  // Storage failures come back as ServerError.
  virtual Result<std::optional<OAuthToken>> get_token(const std::string& user) = 0;

  // Revoke a token at the provider and forget it. Returns false when the token is unknown or
  // the provider refused the revocation.
  virtual bool invalidate_token(const std::string& token) = 0;
};

using AuthenticatorPtr = std::shared_ptr<OAuthAuthenticator>;

}  // namespace oauth::auth
