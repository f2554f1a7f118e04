#pragma once

#include <asio.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "net/http_client.hpp"

namespace oauth::net {

// Incoming HTTP request
struct HttpRequest {
  std::string method;
  std::string target;  // Path and query as sent by the client
  std::string path;
  std::string query;  // Without the leading '?'
  std::map<std::string, std::string> headers;  // Names lower-cased
  std::string body;

  // Header value by case-insensitive name, empty when missing
  std::string header(const std::string& name) const;
};

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

// Parse the request line and headers of a request (everything up to the blank line)
std::optional<HttpRequest> parse_request_head(const std::string& head);

// Serialize a response as an HTTP/1.1 message with Connection: close
std::string serialize_response(const HttpResponse& response);

std::string status_text(int status_code);

// Minimal HTTP/1.1 server: one request per connection
class HttpServer {
 public:
  HttpServer(asio::io_context& io_ctx, std::string host, uint16_t port, RequestHandler handler);

  ~HttpServer();

  // Bind, listen and start accepting. Returns false if the endpoint cannot be bound.
  bool start();

  void stop();

  // Port actually bound (useful when constructed with port 0)
  uint16_t port() const;

 private:
  class Connection;

  void do_accept();

  asio::ip::tcp::acceptor acceptor_;
  std::string host_;
  uint16_t port_;
  RequestHandler handler_;
};

}  // namespace oauth::net
