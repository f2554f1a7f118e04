#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace oauth::auth {

// JSON file-based token store
// Storage layout:
//   base_dir/
//     tokens.json    {provider: {user: {"token": ..., "scope": ...}}}
class TokenStore {
 public:
  explicit TokenStore(const std::filesystem::path& base_dir);

  // Store (or replace) the token of a user for a provider
  Status save(const ProviderName& provider, const std::string& user, const OAuthToken& token);

  // Token of a user for a provider. Value is nullopt when none is stored;
  // an unreadable store is a ServerError.
  Result<std::optional<OAuthToken>> get(const ProviderName& provider, const std::string& user);

  // Forget the token of a user. Returns whether something was removed.
  Result<bool> remove(const ProviderName& provider, const std::string& user);

  // Forget every stored copy of a token value. Returns whether something was removed.
  Result<bool> remove_token(const ProviderName& provider, const std::string& token);

  const std::filesystem::path& base_dir() const {
    return base_dir_;
  }

 private:
  std::filesystem::path base_dir_;
  std::mutex mutex_;

  std::filesystem::path tokens_file() const;

  Result<json> load();
  Status store(const json& j);

  // Atomic write: write to .tmp then rename
  Status atomic_write(const std::filesystem::path& path, const std::string& content);
};

}  // namespace oauth::auth
