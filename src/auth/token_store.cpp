#include "auth/token_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace oauth::auth {

namespace fs = std::filesystem;

namespace {

// Layout is {provider: {user: {"token": string, "scope": string}}}; returns the first violation
std::optional<std::string> layout_error(const json& j) {
  for (const auto& [provider, users] : j.items()) {
    if (!users.is_object()) {
      return "entry for provider " + provider + " is not an object";
    }
    for (const auto& [user, token] : users.items()) {
      if (!token.is_object()) {
        return "token of " + provider + "/" + user + " is not an object";
      }
      for (const char* field : {"token", "access_token", "scope"}) {
        if (token.contains(field) && !token[field].is_string()) {
          return std::string("field ") + field + " of " + provider + "/" + user + " is not a string";
        }
      }
    }
  }
  return std::nullopt;
}

}  // namespace

TokenStore::TokenStore(const fs::path& base_dir) : base_dir_(base_dir) {
  std::error_code ec;
  fs::create_directories(base_dir_, ec);
  if (ec) {
    spdlog::warn("[TokenStore] Failed to create {}: {}", base_dir_.string(), ec.message());
  }
}

fs::path TokenStore::tokens_file() const {
  return base_dir_ / "tokens.json";
}

Result<json> TokenStore::load() {
  auto path = tokens_file();
  if (!fs::exists(path)) {
    return Result<json>::success(json::object());
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<json>::failure(ErrorCode::ServerError, "Cannot open token store " + path.string());
  }

  try {
    json j = json::parse(file);
    if (!j.is_object()) {
      return Result<json>::failure(ErrorCode::ServerError, "Token store " + path.string() + " is not a JSON object");
    }
    if (auto error = layout_error(j)) {
      spdlog::warn("[TokenStore] Malformed {}: {}", path.string(), *error);
      return Result<json>::failure(ErrorCode::ServerError, "Malformed token store: " + *error);
    }
    return Result<json>::success(std::move(j));
  } catch (const std::exception& e) {
    spdlog::warn("[TokenStore] Failed to parse {}: {}", path.string(), e.what());
    return Result<json>::failure(ErrorCode::ServerError, std::string("Corrupted token store: ") + e.what());
  }
}

Status TokenStore::store(const json& j) {
  return atomic_write(tokens_file(), j.dump(2));
}

Status TokenStore::atomic_write(const fs::path& path, const std::string& content) {
  auto tmp_path = path;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file.is_open()) {
    spdlog::warn("[TokenStore] Failed to open temp file for writing: {}", tmp_path.string());
    return Status::failure(ErrorCode::ServerError, "Cannot write token store");
  }

  file << content;
  file.close();

  if (file.fail()) {
    spdlog::warn("[TokenStore] Failed to write temp file: {}", tmp_path.string());
    std::error_code ec;
    fs::remove(tmp_path, ec);
    return Status::failure(ErrorCode::ServerError, "Cannot write token store");
  }

  std::error_code ec;
  fs::rename(tmp_path, path, ec);
  if (ec) {
    spdlog::warn("[TokenStore] Failed to rename temp file {} -> {}: {}", tmp_path.string(), path.string(), ec.message());
    fs::remove(tmp_path, ec);
    return Status::failure(ErrorCode::ServerError, "Cannot write token store");
  }
  return Status::success();
}

Status TokenStore::save(const ProviderName& provider, const std::string& user, const OAuthToken& token) {
  std::lock_guard lock(mutex_);

  auto loaded = load();
  if (!loaded.ok()) {
    return Status{loaded.error};
  }

  json& j = *loaded.value;
  j[provider][user] = token.to_json();
  return store(j);
}

Result<std::optional<OAuthToken>> TokenStore::get(const ProviderName& provider, const std::string& user) {
  using R = Result<std::optional<OAuthToken>>;
  std::lock_guard lock(mutex_);

  auto loaded = load();
  if (!loaded.ok()) {
    return R::failure(*loaded.error);
  }

  const json& j = *loaded.value;
  if (!j.contains(provider) || !j[provider].contains(user)) {
    return R::success(std::nullopt);
  }
  return R::success(OAuthToken::from_json(j[provider][user]));
}

Result<bool> TokenStore::remove(const ProviderName& provider, const std::string& user) {
  std::lock_guard lock(mutex_);

  auto loaded = load();
  if (!loaded.ok()) {
    return Result<bool>::failure(*loaded.error);
  }

  json& j = *loaded.value;
  if (!j.contains(provider) || j[provider].erase(user) == 0) {
    return Result<bool>::success(false);
  }

  auto status = store(j);
  if (status.failed()) {
    return Result<bool>::failure(*status.error);
  }
  return Result<bool>::success(true);
}

Result<bool> TokenStore::remove_token(const ProviderName& provider, const std::string& token) {
  std::lock_guard lock(mutex_);

  auto loaded = load();
  if (!loaded.ok()) {
    return Result<bool>::failure(*loaded.error);
  }

  json& j = *loaded.value;
  if (!j.contains(provider)) {
    return Result<bool>::success(false);
  }

  bool removed = false;
  json& users = j[provider];
  for (auto it = users.begin(); it != users.end();) {
    if (it.value().value("token", "") == token) {
      it = users.erase(it);
      removed = true;
    } else {
      ++it;
    }
  }

  if (!removed) {
    return Result<bool>::success(false);
  }

  auto status = store(j);
  if (status.failed()) {
    return Result<bool>::failure(*status.error);
  }
  return Result<bool>::success(true);
}

}  // namespace oauth::auth
