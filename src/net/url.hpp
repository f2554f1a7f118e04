#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/types.hpp"

namespace oauth::net {

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;  // Without the leading '?'
  std::string fragment;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  // scheme://host[:port]
  std::string origin() const;

  static std::optional<ParsedUrl> parse(const std::string& url);
};

// Percent-encode everything but RFC 3986 unreserved characters
std::string url_encode(const std::string& value);

// application/x-www-form-urlencoded encoding: space becomes '+', '*' is kept
std::string form_encode(const std::string& value);

// Decode %XX escapes; '+' becomes a space
std::string url_decode(const std::string& value);

// Parse "a=1&b=2&a=3" into a multimap, decoding keys and values
QueryParams parse_query(const std::string& query);

// Build "a=1&b=2" from ordered pairs, encoding keys and values
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

// First value of a parameter, or empty string
std::string get_parameter(const QueryParams& params, const std::string& name);

// All values of a parameter
std::vector<std::string> get_parameters(const QueryParams& params, const std::string& name);

// Query of a URL without '?' and fragment, empty when there is none
std::string query_of(const std::string& url);

// Decoded value of the "state" query parameter of a URL, empty when missing
std::string get_state(const std::string& url);

// Parameters of the original request carried inside a decoded state value
QueryParams query_params_from_state(const std::string& state);

// Append name=value to the query of a URL, inserting '?' or '&' as needed
std::string append_query_parameter(const std::string& url, const std::string& name, const std::string& value);

// Drop every occurrence of a parameter from the query of a URL, keeping the rest verbatim
std::string remove_query_parameter(const std::string& url, const std::string& name);

// Rewrite the query of url as form_encode(query + "&" + extra), so that query values holding
// characters such as '{' or '}' stay valid in a Location header. Without a query the extra
// parameter is appended as-is.
std::string encode_redirect_url(const std::string& url, const std::string& extra);

}  // namespace oauth::net
