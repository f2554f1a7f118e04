#include "net/http_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace oauth::net {

namespace {

constexpr size_t MAX_HEADER_BYTES = 16 * 1024;
constexpr size_t MAX_BODY_BYTES = 64 * 1024;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

HttpResponse plain_error(int status_code) {
  HttpResponse response;
  response.status_code = status_code;
  response.headers["Content-Type"] = "text/plain";
  response.body = status_text(status_code);
  return response;
}

}  // namespace

std::string HttpRequest::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  if (it == headers.end()) {
    return "";
  }
  return it->second;
}

std::optional<HttpRequest> parse_request_head(const std::string& head) {
  std::istringstream stream(head);
  std::string request_line;
  if (!std::getline(stream, request_line)) {
    return std::nullopt;
  }
  if (!request_line.empty() && request_line.back() == '\r') {
    request_line.pop_back();
  }

  HttpRequest request;
  std::string version;
  std::istringstream line(request_line);
  if (!(line >> request.method >> request.target >> version) || version.rfind("HTTP/", 0) != 0) {
    return std::nullopt;
  }

  auto q = request.target.find('?');
  request.path = request.target.substr(0, q);
  if (q != std::string::npos) {
    request.query = request.target.substr(q + 1);
  }

  std::string header_line;
  while (std::getline(stream, header_line) && header_line != "\r" && !header_line.empty()) {
    auto colon = header_line.find(':');
    if (colon == std::string::npos) continue;
    std::string key = to_lower(header_line.substr(0, colon));
    std::string value = header_line.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    request.headers[key] = value;
  }

  return request;
}

std::string status_text(int status_code) {
  switch (status_code) {
    case 200:
      return "OK";
    case 204:
      return "No Content";
    case 302:
      return "Found";
    case 307:
      return "Temporary Redirect";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 500:
      return "Internal Server Error";
    default:
      return "Unknown";
  }
}

std::string serialize_response(const HttpResponse& response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status_code << " " << status_text(response.status_code) << "\r\n";
  for (const auto& [key, value] : response.headers) {
    out << key << ": " << value << "\r\n";
  }
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  out << "\r\n";
  out << response.body;
  return out.str();
}

// One accepted socket: read a request, answer it, close
class HttpServer::Connection : public std::enable_shared_from_this<HttpServer::Connection> {
 public:
  Connection(asio::ip::tcp::socket socket, RequestHandler handler)
      : socket_(std::move(socket)), buffer_(MAX_HEADER_BYTES + MAX_BODY_BYTES), handler_(std::move(handler)) {}

  void start() {
    auto self = shared_from_this();
    asio::async_read_until(socket_, buffer_, "\r\n\r\n", [self](const asio::error_code& ec, size_t header_bytes) {
      if (ec) {
        if (ec == asio::error::not_found) {
          self->reply(plain_error(413));
        } else if (ec != asio::error::eof) {
          spdlog::debug("[HttpServer] Read failed: {}", ec.message());
        }
        return;
      }
      self->on_head(header_bytes);
    });
  }

 private:
  void on_head(size_t header_bytes) {
    std::string head(asio::buffers_begin(buffer_.data()), asio::buffers_begin(buffer_.data()) + header_bytes);
    buffer_.consume(header_bytes);

    auto request = parse_request_head(head);
    if (!request) {
      reply(plain_error(400));
      return;
    }
    request_ = std::move(*request);

    size_t content_length = 0;
    auto length_header = request_.header("Content-Length");
    if (!length_header.empty()) {
      try {
        content_length = std::stoul(length_header);
      } catch (const std::exception&) {
        reply(plain_error(400));
        return;
      }
    }
    if (content_length > MAX_BODY_BYTES) {
      reply(plain_error(413));
      return;
    }
    if (buffer_.size() >= content_length) {
      take_body(content_length);
      dispatch();
      return;
    }

    auto self = shared_from_this();
    asio::async_read(socket_, buffer_, asio::transfer_exactly(content_length - buffer_.size()),
                     [self, content_length](const asio::error_code& ec, size_t) {
                       if (ec) {
                         spdlog::debug("[HttpServer] Body read failed: {}", ec.message());
                         return;
                       }
                       self->take_body(content_length);
                       self->dispatch();
                     });
  }

  void take_body(size_t content_length) {
    request_.body.assign(asio::buffers_begin(buffer_.data()), asio::buffers_begin(buffer_.data()) + content_length);
    buffer_.consume(content_length);
  }

  void dispatch() {
    HttpResponse response;
    try {
      response = handler_(request_);
    } catch (const std::exception& e) {
      spdlog::error("[HttpServer] Handler failed for {} {}: {}", request_.method, request_.path, e.what());
      response = plain_error(500);
    }
    spdlog::info("[HttpServer] {} {} -> {}", request_.method, request_.path, response.status_code);
    reply(response);
  }

  void reply(const HttpResponse& response) {
    auto self = shared_from_this();
    auto data = std::make_shared<std::string>(serialize_response(response));
    asio::async_write(socket_, asio::buffer(*data), [self, data](const asio::error_code& ec, size_t) {
      asio::error_code ignored;
      if (ec) {
        spdlog::debug("[HttpServer] Write failed: {}", ec.message());
      }
      self->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
      self->socket_.close(ignored);
    });
  }

  asio::ip::tcp::socket socket_;
  asio::streambuf buffer_;
  RequestHandler handler_;
  HttpRequest request_;
};

HttpServer::HttpServer(asio::io_context& io_ctx, std::string host, uint16_t port, RequestHandler handler)
    : acceptor_(io_ctx), host_(std::move(host)), port_(port), handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
  stop();
}

bool HttpServer::start() {
  asio::error_code ec;
  auto address = asio::ip::make_address(host_, ec);
  if (ec) {
    spdlog::error("[HttpServer] Invalid listen address {}: {}", host_, ec.message());
    return false;
  }

  asio::ip::tcp::endpoint endpoint(address, port_);
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    spdlog::error("[HttpServer] Cannot listen on {}:{}: {}", host_, port_, ec.message());
    asio::error_code ignored;
    acceptor_.close(ignored);
    return false;
  }

  spdlog::info("[HttpServer] Listening on {}:{}", host_, port());
  do_accept();
  return true;
}

void HttpServer::stop() {
  if (acceptor_.is_open()) {
    asio::error_code ignored;
    acceptor_.close(ignored);
  }
}

uint16_t HttpServer::port() const {
  asio::error_code ec;
  auto endpoint = acceptor_.local_endpoint(ec);
  return ec ? port_ : endpoint.port();
}

void HttpServer::do_accept() {
  acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        spdlog::warn("[HttpServer] Accept failed: {}", ec.message());
        do_accept();
      }
      return;
    }
    std::make_shared<Connection>(std::move(socket), handler_)->start();
    do_accept();
  });
}

}  // namespace oauth::net
