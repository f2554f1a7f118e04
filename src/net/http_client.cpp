#include "net/http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <cctype>
#include <regex>
#include <sstream>
#include <type_traits>

#include "net/url.hpp"

namespace oauth::net {

namespace {

using SslSocket = asio::ssl::stream<asio::ip::tcp::socket>;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string build_request(const ParsedUrl& url, const HttpOptions& options) {
  std::ostringstream req;
  req << options.method << " " << url.path;
  if (!url.query.empty()) {
    req << "?" << url.query;
  }
  req << " HTTP/1.1\r\n";
  req << "Host: " << url.host << "\r\n";
  req << "Connection: close\r\n";

  for (const auto& [key, value] : options.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!options.body.empty() || options.method == "POST") {
    req << "Content-Length: " << options.body.size() << "\r\n";
  }

  req << "\r\n";
  req << options.body;
  return req.str();
}

void parse_response(const std::string& raw, HttpResponse& response) {
  size_t header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    response.error = "Invalid HTTP response: missing header terminator";
    return;
  }

  std::istringstream stream(raw.substr(0, header_end + 2));
  std::string status_line;
  std::getline(stream, status_line);

  std::regex status_regex(R"(HTTP/[\d.]+ (\d+))");
  std::smatch match;
  if (!std::regex_search(status_line, match, status_regex)) {
    response.error = "Invalid HTTP response: cannot parse status code";
    return;
  }
  response.status_code = std::stoi(match[1].str());

  bool chunked = false;
  std::string header_line;
  while (std::getline(stream, header_line) && header_line != "\r") {
    auto colon = header_line.find(':');
    if (colon == std::string::npos) continue;
    std::string key = header_line.substr(0, colon);
    std::string value = header_line.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    if (to_lower(key) == "transfer-encoding" && to_lower(value).find("chunked") != std::string::npos) {
      chunked = true;
    }
    response.headers[key] = value;
  }

  std::string body = raw.substr(header_end + 4);
  response.body = chunked ? decode_chunked(body) : body;
}

// Resolve, connect, (handshake), write the request and read until the peer closes.
// Everything runs on a private io_context bounded by the request timeout.
template <typename Socket>
HttpResponse exchange(asio::io_context& io_ctx, Socket& socket, const ParsedUrl& url, const std::string& request_str,
                      std::chrono::seconds timeout) {
  HttpResponse response;
  asio::streambuf buffer;
  bool done = false;

  auto finish = [&](const std::string& error) {
    if (!error.empty()) {
      response.error = error;
    }
    done = true;
  };

  auto read_all = [&]() {
    asio::async_read(socket, buffer, asio::transfer_all(), [&](const asio::error_code& ec, size_t) {
      // Connection: close, so the peer ending the stream is the normal outcome
      if (ec && ec != asio::error::eof && ec != asio::ssl::error::stream_truncated) {
        return finish("Read failed: " + ec.message());
      }
      finish("");
    });
  };

  auto send = [&]() {
    asio::async_write(socket, asio::buffer(request_str), [&](const asio::error_code& ec, size_t) {
      if (ec) {
        return finish("Write failed: " + ec.message());
      }
      read_all();
    });
  };

  asio::ip::tcp::resolver resolver(io_ctx);
  resolver.async_resolve(url.host, url.port_or_default(), [&](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
    if (ec) {
      return finish("DNS resolution failed: " + ec.message());
    }
    asio::async_connect(socket.lowest_layer(), results, [&](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
      if (ec) {
        return finish("Connection failed: " + ec.message());
      }
      if constexpr (std::is_same_v<Socket, SslSocket>) {
        socket.async_handshake(asio::ssl::stream_base::client, [&](const asio::error_code& ec) {
          if (ec) {
            return finish("SSL handshake failed: " + ec.message());
          }
          send();
        });
      } else {
        send();
      }
    });
  });

  io_ctx.run_for(timeout);

  if (!done) {
    asio::error_code ignored;
    socket.lowest_layer().close(ignored);
    response.error = "Request timed out";
    return response;
  }
  if (!response.error.empty()) {
    return response;
  }

  std::string raw(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
  parse_response(raw, response);
  return response;
}

}  // namespace

std::string decode_chunked(const std::string& body) {
  std::string out;
  size_t pos = 0;

  while (pos < body.size()) {
    size_t line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos) break;

    size_t size = 0;
    try {
      size = std::stoul(body.substr(pos, line_end - pos), nullptr, 16);
    } catch (const std::exception&) {
      break;
    }
    if (size == 0) break;

    size_t data_start = line_end + 2;
    // Truncated or oversized chunk
    if (size > body.size() - data_start) break;
    out += body.substr(data_start, size);
    pos = data_start + size + 2;
  }

  return out;
}

HttpResponse HttpClient::request(const std::string& url, const HttpOptions& options) const {
  auto parsed = ParsedUrl::parse(url);
  if (!parsed) {
    spdlog::error("[HttpClient] Failed to parse URL: {}", url);
    return HttpResponse{0, {}, "", "Invalid URL"};
  }

  std::string request_str = build_request(*parsed, options);

  try {
    asio::io_context io_ctx;

    if (parsed->is_https()) {
      asio::ssl::context ssl_ctx(asio::ssl::context::tlsv12_client);
      ssl_ctx.set_default_verify_paths();
      ssl_ctx.set_verify_mode(asio::ssl::verify_peer);

      SslSocket socket(io_ctx, ssl_ctx);

      // Set SNI hostname
      SSL_set_tlsext_host_name(socket.native_handle(), parsed->host.c_str());

      return exchange(io_ctx, socket, *parsed, request_str, options.timeout);
    }

    asio::ip::tcp::socket socket(io_ctx);
    return exchange(io_ctx, socket, *parsed, request_str, options.timeout);
  } catch (const std::exception& e) {
    spdlog::error("[HttpClient] {} {} failed: {}", options.method, url, e.what());
    return HttpResponse{0, {}, "", e.what()};
  }
}

HttpResponse HttpClient::get(const std::string& url, const std::map<std::string, std::string>& headers) const {
  HttpOptions options;
  options.method = "GET";
  options.headers = headers;
  return request(url, options);
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body, const std::map<std::string, std::string>& headers) const {
  HttpOptions options;
  options.method = "POST";
  options.body = body;
  options.headers = headers;
  return request(url, options);
}

HttpResponse HttpClient::post_form(const std::string& url, const std::map<std::string, std::string>& form,
                                   const std::map<std::string, std::string>& headers) const {
  std::vector<std::pair<std::string, std::string>> pairs(form.begin(), form.end());
  auto all_headers = headers;
  all_headers["Content-Type"] = "application/x-www-form-urlencoded";
  return post(url, build_query(pairs), all_headers);
}

HttpSender HttpClient::sender() const {
  return [client = *this](const std::string& url, const HttpOptions& options) {
    return client.request(url, options);
  };
}

}  // namespace oauth::net
