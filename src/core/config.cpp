#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace oauth {

namespace fs = std::filesystem;

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot open {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    // Load server settings
    if (j.contains("server")) {
      const auto& server = j["server"];
      config.server.host = server.value("host", config.server.host);
      config.server.port = server.value("port", config.server.port);
    }

    config.public_url = j.value("public_url", config.public_url);
    config.api_path = j.value("api_path", config.api_path);
    config.access_denied_error_page = j.value("access_denied_error_page", config.access_denied_error_page);
    config.user_id_header = j.value("user_id_header", config.user_id_header);
    config.user_name_header = j.value("user_name_header", config.user_name_header);

    if (j.contains("token_store_dir")) {
      config.token_store_dir = j["token_store_dir"].get<std::string>();
    }

    // Load providers
    if (j.contains("providers")) {
      for (const auto& provider_json : j["providers"]) {
        ProviderConfig provider;
        provider.name = provider_json.value("name", "");
        if (provider.name.empty()) {
          spdlog::warn("[Config] Skipping provider without a name in {}", path.string());
          continue;
        }

        auto protocol = protocol_version_from_string(provider_json.value("protocol", "oauth2"));
        if (!protocol) {
          spdlog::warn("[Config] Skipping provider {} with unknown protocol", provider.name);
          continue;
        }
        provider.protocol = *protocol;

        provider.endpoint_url = provider_json.value("endpoint_url", "");
        provider.client_id = provider_json.value("client_id", "");
        provider.client_secret = provider_json.value("client_secret", "");
        provider.auth_uri = provider_json.value("auth_uri", "");
        provider.token_uri = provider_json.value("token_uri", "");
        provider.revoke_uri = provider_json.value("revoke_uri", "");
        provider.redirect_uri = provider_json.value("redirect_uri", "");

        if (provider_json.contains("scopes")) {
          for (const auto& scope : provider_json["scopes"]) {
            provider.scopes.push_back(scope.get<std::string>());
          }
        }

        config.providers.push_back(provider);
      }
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::error("[Config] Failed to parse {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();
  config.apply_env();
  return config;
}

void Config::apply_env() {
  if (const char* host = std::getenv("OAUTH_BROKER_HOST")) {
    server.host = host;
  }

  if (const char* port = std::getenv("OAUTH_BROKER_PORT")) {
    try {
      int value = std::stoi(port);
      if (value > 0 && value <= 65535) {
        server.port = static_cast<uint16_t>(value);
      } else {
        spdlog::warn("[Config] OAUTH_BROKER_PORT out of range: {}", port);
      }
    } catch (const std::exception&) {
      spdlog::warn("[Config] Invalid OAUTH_BROKER_PORT: {}", port);
    }
  }

  if (const char* url = std::getenv("OAUTH_BROKER_PUBLIC_URL")) {
    public_url = url;
  }

  if (const char* level = std::getenv("OAUTH_BROKER_LOG_LEVEL")) {
    log_level = level;
  }

  if (const char* page = std::getenv("OAUTH_BROKER_ERROR_PAGE")) {
    access_denied_error_page = page;
  }
}

void Config::save(const fs::path& path) const {
  json j;

  j["server"] = {{"host", server.host}, {"port", server.port}};
  j["public_url"] = public_url;
  j["api_path"] = api_path;
  j["access_denied_error_page"] = access_denied_error_page;
  j["user_id_header"] = user_id_header;
  j["user_name_header"] = user_name_header;
  if (!token_store_dir.empty()) {
    j["token_store_dir"] = token_store_dir.string();
  }

  // Save providers
  json providers_json = json::array();
  for (const auto& provider : providers) {
    json p;
    p["name"] = provider.name;
    p["protocol"] = to_string(provider.protocol);
    p["endpoint_url"] = provider.endpoint_url;
    p["client_id"] = provider.client_id;
    p["client_secret"] = provider.client_secret;
    p["auth_uri"] = provider.auth_uri;
    p["token_uri"] = provider.token_uri;
    if (!provider.revoke_uri.empty()) {
      p["revoke_uri"] = provider.revoke_uri;
    }
    p["redirect_uri"] = provider.redirect_uri;
    p["scopes"] = provider.scopes;
    providers_json.push_back(p);
  }
  j["providers"] = providers_json;

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  // Write to file
  std::ofstream file(path);
  if (file.is_open()) {
    file << j.dump(2);
  } else {
    spdlog::error("[Config] Cannot write {}", path.string());
  }
}

std::optional<ProviderConfig> Config::get_provider(const std::string& name) const {
  for (const auto& provider : providers) {
    if (provider.name == name) {
      return provider;
    }
  }
  return std::nullopt;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "oauth-broker";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".oauth-broker" / "config.json";
}

fs::path default_token_store_dir() {
  return config_dir() / "tokens";
}

}  // namespace config_paths

}  // namespace oauth
