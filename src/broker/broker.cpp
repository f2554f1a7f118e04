// Broker initialization
#include "broker/broker.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"

namespace oauth {

void init(const Config& config) {
  auto log_path = config.log_file ? config.log_file->string() : std::string();
  init_log(log_path, 10, config.log_level, !config.log_file.has_value());
}

void shutdown() {
  spdlog::shutdown();
}

std::string version() {
  return OAUTH_BROKER_VERSION_STRING;
}

Broker Broker::from_config(const Config& config, net::HttpSender sender) {
  Broker broker;

  auto store_dir = config.token_store_dir.empty() ? config_paths::default_token_store_dir() : config.token_store_dir;
  broker.token_store = std::make_shared<auth::TokenStore>(store_dir);
  broker.registry = std::make_shared<auth::AuthenticatorRegistry>();

  std::map<ProviderName, std::string> provider_urls;
  for (const auto& provider : config.providers) {
    provider_urls[provider.name] = provider.endpoint_url;

    if (provider.protocol == ProtocolVersion::OAuth1) {
      spdlog::warn("[Broker] No built-in OAuth1 authenticator, provider {} must be registered by the embedder", provider.name);
      continue;
    }
    broker.registry->register_authenticator(ProtocolVersion::OAuth2,
                                            std::make_shared<auth::OAuth2Authenticator>(provider, broker.token_store, sender));
  }

  broker.token_manager = std::make_shared<auth::StoredPersonalAccessTokenManager>(broker.token_store, provider_urls);
  broker.api = std::make_shared<api::OAuthApi>(broker.registry, broker.token_manager, config.access_denied_error_page, config.api_path);
  broker.service = std::make_shared<server::OAuthService>(broker.api, config);

  spdlog::info("[Broker] {} provider(s) registered, token store at {}", broker.registry->size(), store_dir.string());
  return broker;
}

}  // namespace oauth
