#pragma once

// Core types
#include "core/config.hpp"
#include "core/types.hpp"

// Network
#include "net/http_client.hpp"
#include "net/http_server.hpp"
#include "net/url.hpp"

// Authenticators and token storage
#include "auth/authenticator.hpp"
#include "auth/oauth2_authenticator.hpp"
#include "auth/registry.hpp"
#include "auth/token_manager.hpp"
#include "auth/token_store.hpp"

// Dispatcher and HTTP front end
#include "api/oauth_api.hpp"
#include "server/oauth_service.hpp"

namespace oauth {

// Initialize logging from the configuration
void init(const Config& config);

// Flush and drop loggers
void shutdown();

// Get version string
std::string version();

// The broker's components, wired from configuration
struct Broker {
  std::shared_ptr<auth::TokenStore> token_store;
  std::shared_ptr<auth::AuthenticatorRegistry> registry;
  auth::PersonalAccessTokenManagerPtr token_manager;
  std::shared_ptr<api::OAuthApi> api;
  std::shared_ptr<server::OAuthService> service;

  // Registers an OAuth2Authenticator for every OAuth2 provider of the config.
  // OAuth1 providers need an authenticator registered through `registry` by the embedder.
  static Broker from_config(const Config& config, net::HttpSender sender = net::HttpClient().sender());
};

}  // namespace oauth
