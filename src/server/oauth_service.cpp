#include "server/oauth_service.hpp"

#include <spdlog/spdlog.h>

#include "net/url.hpp"

namespace oauth::server {

namespace {

std::string trim_trailing_slash(std::string s) {
  while (s.size() > 1 && s.back() == '/') {
    s.pop_back();
  }
  return s;
}

net::HttpResponse method_not_allowed() {
  return json_response(405, json{{"message", "Method not allowed"}});
}

}  // namespace

net::HttpResponse redirect_response(const Redirect& redirect) {
  net::HttpResponse response;
  response.status_code = Redirect::STATUS;
  response.headers["Location"] = redirect.location;
  return response;
}

net::HttpResponse json_response(int status_code, const json& body) {
  net::HttpResponse response;
  response.status_code = status_code;
  response.headers["Content-Type"] = "application/json";
  response.body = body.dump();
  return response;
}

net::HttpResponse error_response(const Error& error) {
  return json_response(http_status(error.code), json{{"message", error.message}});
}

OAuthService::OAuthService(std::shared_ptr<api::OAuthApi> api, const Config& config)
    : api_(std::move(api)),
      public_url_(config.public_url),
      api_path_(trim_trailing_slash(config.api_path)),
      user_id_header_(config.user_id_header),
      user_name_header_(config.user_name_header) {
  while (!public_url_.empty() && public_url_.back() == '/') {
    public_url_.pop_back();
  }
}

Subject OAuthService::subject_of(const net::HttpRequest& request) const {
  auto user_id = request.header(user_id_header_);
  if (user_id.empty()) {
    return Subject::anonymous_subject();
  }
  auto user_name = request.header(user_name_header_);
  return Subject::of(user_id, user_name.empty() ? user_id : user_name);
}

std::string OAuthService::request_url(const net::HttpRequest& request) const {
  return public_url_ + request.target;
}

net::HttpResponse OAuthService::handle(const net::HttpRequest& request) const {
  auto path = trim_trailing_slash(request.path);
  const bool is_get = request.method == "GET";

  if (path == api_path_) {
    return is_get ? list_authenticators() : method_not_allowed();
  }
  if (path == api_path_ + "/authenticate") {
    return is_get ? authenticate(request) : method_not_allowed();
  }
  if (path == api_path_ + "/callback") {
    return is_get ? callback(request) : method_not_allowed();
  }
  if (path == api_path_ + "/token") {
    if (is_get) return get_token(request);
    if (request.method == "DELETE") return invalidate_token(request);
    return method_not_allowed();
  }

  return error_response({ErrorCode::NotFound, "No resource at " + request.path});
}

net::HttpResponse OAuthService::authenticate(const net::HttpRequest& request) const {
  auto query = net::parse_query(request.query);
  auto provider = net::get_parameter(query, api::params::OAUTH_PROVIDER);
  auto scopes = net::get_parameters(query, api::params::SCOPE);
  auto redirect_after_login = net::get_parameter(query, api::params::REDIRECT_AFTER_LOGIN);

  // The token is stored for the user named in the state, so only the authenticated subject may name it
  auto url = net::remove_query_parameter(request_url(request), api::params::USER_ID);
  auto subject = subject_of(request);
  if (subject.anonymous) {
    spdlog::warn("[OAuthService] Anonymous authenticate request for {}", provider);
  } else {
    url = net::append_query_parameter(url, api::params::USER_ID, subject.user_id);
  }

  auto redirect = api_->authenticate(url, provider, scopes, redirect_after_login);
  if (!redirect.ok()) {
    return error_response(*redirect.error);
  }
  return redirect_response(*redirect.value);
}

net::HttpResponse OAuthService::callback(const net::HttpRequest& request) const {
  auto errors = net::get_parameters(net::parse_query(request.query), api::params::OAUTH_ERROR);

  auto redirect = api_->callback(request_url(request), errors);
  if (!redirect.ok()) {
    return error_response(*redirect.error);
  }
  return redirect_response(*redirect.value);
}

net::HttpResponse OAuthService::list_authenticators() const {
  json body = json::array();
  for (const auto& descriptor : api_->get_registered_authenticators(public_url_)) {
    body.push_back(descriptor.to_json());
  }
  return json_response(200, body);
}

net::HttpResponse OAuthService::get_token(const net::HttpRequest& request) const {
  auto provider = net::get_parameter(net::parse_query(request.query), api::params::OAUTH_PROVIDER);

  auto token = api_->get_token(provider, subject_of(request));
  if (!token.ok()) {
    return error_response(*token.error);
  }
  return json_response(200, token.value->to_json());
}

net::HttpResponse OAuthService::invalidate_token(const net::HttpRequest& request) const {
  auto provider = net::get_parameter(net::parse_query(request.query), api::params::OAUTH_PROVIDER);

  auto status = api_->invalidate_token(provider, subject_of(request));
  if (status.failed()) {
    return error_response(*status.error);
  }

  net::HttpResponse response;
  response.status_code = 204;
  return response;
}

}  // namespace oauth::server
