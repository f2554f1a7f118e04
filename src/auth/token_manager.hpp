#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "auth/token_store.hpp"
#include "core/types.hpp"

namespace oauth::auth {

// Source of the personal access tokens a user holds for SCM providers.
// Failures are reported with the Scm* error codes.
class PersonalAccessTokenManager {
 public:
  virtual ~PersonalAccessTokenManager() = default;

  // Token of the subject for a provider, optionally restricted to one SCM server URL.
  // Value is nullopt when the subject has no token.
  virtual Result<std::optional<PersonalAccessToken>> get(const Subject& subject, const ProviderName& provider,
                                                         const std::optional<std::string>& scm_server_url) = 0;
};

using PersonalAccessTokenManagerPtr = std::shared_ptr<PersonalAccessTokenManager>;

// Personal access tokens resolved from the tokens the broker itself obtained
class StoredPersonalAccessTokenManager : public PersonalAccessTokenManager {
 public:
  StoredPersonalAccessTokenManager(std::shared_ptr<TokenStore> store, std::map<ProviderName, std::string> provider_urls = {});

  Result<std::optional<PersonalAccessToken>> get(const Subject& subject, const ProviderName& provider,
                                                 const std::optional<std::string>& scm_server_url) override;

 private:
  std::shared_ptr<TokenStore> store_;
  std::map<ProviderName, std::string> provider_urls_;
};

}  // namespace oauth::auth
