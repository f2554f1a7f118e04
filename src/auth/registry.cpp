#include "auth/registry.hpp"

#include <spdlog/spdlog.h>

namespace oauth::auth {

bool AuthenticatorRegistry::register_authenticator(ProtocolVersion protocol, AuthenticatorPtr authenticator) {
  if (!authenticator) {
    spdlog::warn("[Registry] Ignoring null {} authenticator", to_string(protocol));
    return false;
  }

  auto name = authenticator->provider_name();
  auto it = entries_.find(name);
  if (it != entries_.end()) {
    spdlog::warn("[Registry] Provider {} is already registered as {}, ignoring {} registration", name, to_string(it->second.protocol),
                 to_string(protocol));
    return false;
  }

  spdlog::info("[Registry] Registered {} authenticator: {}", to_string(protocol), name);
  entries_.emplace(name, RegisteredAuthenticator{protocol, std::move(authenticator)});
  return true;
}

std::optional<RegisteredAuthenticator> AuthenticatorRegistry::get(const ProviderName& name) const {
  auto it = entries_.find(name);
  if (it != entries_.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool AuthenticatorRegistry::contains(const ProviderName& name) const {
  return entries_.count(name) > 0;
}

std::vector<ProviderName> AuthenticatorRegistry::provider_names() const {
  std::vector<ProviderName> names;
  names.reserve(entries_.size());
  for (const auto& [name, entry] : entries_) {
    names.push_back(name);
  }
  return names;
}

std::vector<ProviderName> AuthenticatorRegistry::provider_names(ProtocolVersion protocol) const {
  std::vector<ProviderName> names;
  for (const auto& [name, entry] : entries_) {
    if (entry.protocol == protocol) {
      names.push_back(name);
    }
  }
  return names;
}

}  // namespace oauth::auth
