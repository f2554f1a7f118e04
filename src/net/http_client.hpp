#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

namespace oauth::net {

// HTTP response
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string error;

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout{30};
};

// Sends one request and returns the response; transport failures come back with status_code 0
// and a non-empty error.
using HttpSender = std::function<HttpResponse(const std::string& url, const HttpOptions& options)>;

// Blocking HTTP/1.1 client over asio, used for the short back-channel calls of OAuth flows
// (token exchange, revocation)
class HttpClient {
 public:
  HttpClient() = default;

  HttpResponse request(const std::string& url, const HttpOptions& options) const;

  // Convenience methods
  HttpResponse get(const std::string& url, const std::map<std::string, std::string>& headers = {}) const;

  HttpResponse post(const std::string& url, const std::string& body, const std::map<std::string, std::string>& headers = {}) const;

  // POST an application/x-www-form-urlencoded body
  HttpResponse post_form(const std::string& url, const std::map<std::string, std::string>& form,
                         const std::map<std::string, std::string>& headers = {}) const;

  // Adapter for components that take an HttpSender
  HttpSender sender() const;
};

// Decode a body sent with Transfer-Encoding: chunked
std::string decode_chunked(const std::string& body);

}  // namespace oauth::net
