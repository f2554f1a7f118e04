#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace oauth {

// OAuth provider configuration
struct ProviderConfig {
  ProviderName name;
  ProtocolVersion protocol = ProtocolVersion::OAuth2;
  std::string endpoint_url;  // e.g., "https://github.com"

  std::string client_id;
  std::string client_secret;

  std::string auth_uri;    // Authorization page
  std::string token_uri;   // Code exchange endpoint
  std::string revoke_uri;  // Optional revocation endpoint
  std::string redirect_uri;

  // Scopes requested when the client asks for none
  std::vector<std::string> scopes;
};

// Application configuration
struct Config {
  struct ServerSettings {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
  } server;

  // Externally visible base URL of the broker (used for request URLs and links)
  std::string public_url = "http://localhost:8080";

  // Path the OAuth endpoints are mounted under
  std::string api_path = "/api/oauth";

  // Where the user lands when access is denied and no post-login URL is known
  std::string access_denied_error_page = "/dashboard/#/oauth-access-denied";

  // Directory of the token store
  std::filesystem::path token_store_dir;

  // Headers set by the authenticating proxy
  std::string user_id_header = "X-Forwarded-User";
  std::string user_name_header = "X-Forwarded-Preferred-Username";

  // Provider configs
  std::vector<ProviderConfig> providers;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: OAUTH_BROKER_HOST, OAUTH_BROKER_PORT, OAUTH_BROKER_PUBLIC_URL,
  //        OAUTH_BROKER_LOG_LEVEL, OAUTH_BROKER_ERROR_PAGE
  static Config from_env();

  // Apply environment overrides to an existing config
  void apply_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  // Get provider config
  std::optional<ProviderConfig> get_provider(const std::string& name) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

std::filesystem::path default_token_store_dir();
}  // namespace config_paths

}  // namespace oauth
