#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "auth/authenticator.hpp"

namespace oauth::auth {

// A registered authenticator tagged with the OAuth version it speaks
struct RegisteredAuthenticator {
  ProtocolVersion protocol = ProtocolVersion::OAuth2;
  AuthenticatorPtr authenticator;
};

// Registry of authenticators keyed by provider name.
// A name is unique across protocol versions: the first registration wins.
class AuthenticatorRegistry {
 public:
  // Register an authenticator under its provider name.
  // Returns false if the name is already taken or the authenticator is null.
  bool register_authenticator(ProtocolVersion protocol, AuthenticatorPtr authenticator);

  // Get the entry registered for the given provider name
  std::optional<RegisteredAuthenticator> get(const ProviderName& name) const;

  bool contains(const ProviderName& name) const;

  // Sorted names of all registered providers
  std::vector<ProviderName> provider_names() const;

  // Sorted names of the providers speaking the given protocol version
  std::vector<ProviderName> provider_names(ProtocolVersion protocol) const;

  size_t size() const {
    return entries_.size();
  }

 private:
  std::map<ProviderName, RegisteredAuthenticator> entries_;
};

}  // namespace oauth::auth
