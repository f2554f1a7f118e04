#pragma once

#include <memory>
#include <string>

#include "api/oauth_api.hpp"
#include "core/config.hpp"
#include "net/http_server.hpp"

namespace oauth::server {

// HTTP front end of the OAuth API.
//
// Routes (relative to Config::api_path):
//   GET    /authenticate   redirect to the provider's authorization page
//   GET    /callback       provider redirect target, redirects to the post-login URL
//   GET    /               registered providers as JSON
//   GET    /token          token of the current user for ?oauth_provider=
//   DELETE /token          revoke the token of the current user for ?oauth_provider=
class OAuthService {
 public:
  OAuthService(std::shared_ptr<api::OAuthApi> api, const Config& config);

  net::HttpResponse handle(const net::HttpRequest& request) const;

  // Subject of a request, taken from the headers set by the authenticating proxy
  Subject subject_of(const net::HttpRequest& request) const;

  // Absolute URL of a request as seen by the client
  std::string request_url(const net::HttpRequest& request) const;

 private:
  net::HttpResponse authenticate(const net::HttpRequest& request) const;
  net::HttpResponse callback(const net::HttpRequest& request) const;
  net::HttpResponse list_authenticators() const;
  net::HttpResponse get_token(const net::HttpRequest& request) const;
  net::HttpResponse invalidate_token(const net::HttpRequest& request) const;

  std::shared_ptr<api::OAuthApi> api_;
  std::string public_url_;
  std::string api_path_;
  std::string user_id_header_;
  std::string user_name_header_;
};

net::HttpResponse redirect_response(const Redirect& redirect);

net::HttpResponse json_response(int status_code, const json& body);

net::HttpResponse error_response(const Error& error);

}  // namespace oauth::server
