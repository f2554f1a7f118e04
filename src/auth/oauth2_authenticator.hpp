#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "auth/authenticator.hpp"
#include "auth/token_store.hpp"
#include "core/config.hpp"
#include "net/http_client.hpp"

namespace oauth::auth {

// Authorization-code OAuth2 authenticator driven entirely by configuration.
// Tokens obtained in the callback are kept in the token store under the user id
// carried in the state.
class OAuth2Authenticator : public OAuthAuthenticator {
 public:
  OAuth2Authenticator(ProviderConfig config, std::shared_ptr<TokenStore> store, net::HttpSender sender = net::HttpClient().sender());

  ProviderName provider_name() const override {
    return config_.name;
  }

  std::string endpoint_url() const override {
    return config_.endpoint_url;
  }

  Result<std::string> get_authenticate_url(const std::string& request_url, const std::vector<std::string>& scopes) override;

  Result<UserId> callback(const std::string& request_url, const std::vector<std::string>& scopes) override;

  Result<std::optional<OAuthToken>> get_token(const std::string& user) override;

  bool invalidate_token(const std::string& token) override;

  const ProviderConfig& config() const {
    return config_;
  }

 private:
  // Exchange an authorization code for a token at the token endpoint
  Result<OAuthToken> exchange_code(const std::string& code, const std::vector<std::string>& scopes);

  std::string join_scopes(const std::vector<std::string>& scopes) const;

  ProviderConfig config_;
  std::shared_ptr<TokenStore> store_;
  net::HttpSender sender_;
};

}  // namespace oauth::auth
