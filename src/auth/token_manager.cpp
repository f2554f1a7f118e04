#include "auth/token_manager.hpp"

#include <spdlog/spdlog.h>

namespace oauth::auth {

StoredPersonalAccessTokenManager::StoredPersonalAccessTokenManager(std::shared_ptr<TokenStore> store,
                                                                   std::map<ProviderName, std::string> provider_urls)
    : store_(std::move(store)), provider_urls_(std::move(provider_urls)) {}

Result<std::optional<PersonalAccessToken>> StoredPersonalAccessTokenManager::get(const Subject& subject, const ProviderName& provider,
                                                                                 const std::optional<std::string>& scm_server_url) {
  using R = Result<std::optional<PersonalAccessToken>>;

  std::string provider_url;
  auto url_it = provider_urls_.find(provider);
  if (url_it != provider_urls_.end()) {
    provider_url = url_it->second;
  }
  if (scm_server_url && !provider_url.empty() && *scm_server_url != provider_url) {
    return R::success(std::nullopt);
  }

  // Tokens are keyed by user id, older entries by user name
  for (const auto& user : {subject.user_id, subject.user_name}) {
    if (user.empty()) continue;

    auto stored = store_->get(provider, user);
    if (stored.failed()) {
      spdlog::error("[TokenManager] Cannot read tokens of {} for {}: {}", user, provider, stored.error->message);
      return R::failure(ErrorCode::ScmPersistence, stored.error->message);
    }
    if (!*stored.value) continue;

    PersonalAccessToken pat;
    pat.scm_provider_name = provider;
    pat.scm_provider_url = provider_url;
    pat.che_user_id = subject.user_id;
    pat.scm_user_name = subject.user_name;
    pat.scm_token_name = "oauth2-" + provider;
    pat.token = (*stored.value)->token;
    return R::success(std::move(pat));
  }

  return R::success(std::nullopt);
}

}  // namespace oauth::auth
