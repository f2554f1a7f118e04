#include "net/url.hpp"

#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>

namespace oauth::net {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string percent_encode(const std::string& value, bool form) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (char c : value) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || c == '-' || c == '_' || c == '.') {
      escaped << c;
    } else if (!form && c == '~') {
      escaped << c;
    } else if (form && c == '*') {
      escaped << c;
    } else if (form && c == ' ') {
      escaped << '+';
    } else {
      escaped << std::uppercase;
      escaped << '%' << std::setw(2) << static_cast<int>(uc);
      escaped << std::nouppercase;
    }
  }

  return escaped.str();
}

}  // namespace

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  std::regex url_regex(R"(^(https?):\/\/([^:\/\s?#]+)(?::(\d+))?(\/[^\?#\s]*)?(?:\?([^#\s]*))?(?:#(\S*))?$)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();
  result.fragment = match[6].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::string ParsedUrl::origin() const {
  std::string out = scheme + "://" + host;
  if (!port.empty()) {
    out += ":" + port;
  }
  return out;
}

std::string url_encode(const std::string& value) {
  return percent_encode(value, false);
}

std::string form_encode(const std::string& value) {
  return percent_encode(value, true);
}

std::string url_decode(const std::string& value) {
  std::string out;
  out.reserve(value.size());

  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      out += ' ';
    } else if (c == '%' && i + 2 < value.size()) {
      int hi = hex_value(value[i + 1]);
      int lo = hex_value(value[i + 2]);
      if (hi < 0 || lo < 0) {
        out += c;
        continue;
      }
      out += static_cast<char>((hi << 4) | lo);
      i += 2;
    } else {
      out += c;
    }
  }

  return out;
}

QueryParams parse_query(const std::string& query) {
  QueryParams params;
  std::string q = query;
  if (!q.empty() && q.front() == '?') {
    q.erase(0, 1);
  }

  size_t start = 0;
  while (start <= q.size()) {
    size_t end = q.find('&', start);
    if (end == std::string::npos) end = q.size();

    std::string pair = q.substr(start, end - start);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      if (eq == std::string::npos) {
        params[url_decode(pair)].emplace_back();
      } else {
        params[url_decode(pair.substr(0, eq))].push_back(url_decode(pair.substr(eq + 1)));
      }
    }

    start = end + 1;
  }

  return params;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
  std::ostringstream out;
  bool first = true;
  for (const auto& [key, value] : params) {
    if (!first) out << "&";
    out << url_encode(key) << "=" << url_encode(value);
    first = false;
  }
  return out.str();
}

std::string get_parameter(const QueryParams& params, const std::string& name) {
  auto it = params.find(name);
  if (it == params.end() || it->second.empty()) {
    return "";
  }
  return it->second.front();
}

std::vector<std::string> get_parameters(const QueryParams& params, const std::string& name) {
  auto it = params.find(name);
  if (it == params.end()) {
    return {};
  }
  return it->second;
}

std::string query_of(const std::string& url) {
  size_t q = url.find('?');
  if (q == std::string::npos) {
    return "";
  }
  size_t hash = url.find('#', q);
  return url.substr(q + 1, hash == std::string::npos ? std::string::npos : hash - q - 1);
}

std::string get_state(const std::string& url) {
  return get_parameter(parse_query(query_of(url)), "state");
}

QueryParams query_params_from_state(const std::string& state) {
  return parse_query(state);
}

std::string append_query_parameter(const std::string& url, const std::string& name, const std::string& value) {
  std::string base = url;
  std::string fragment;
  size_t hash = base.find('#');
  if (hash != std::string::npos) {
    fragment = base.substr(hash);
    base.erase(hash);
  }

  char sep = '?';
  if (base.find('?') != std::string::npos) {
    sep = (base.back() == '?' || base.back() == '&') ? '\0' : '&';
  }

  std::string out = base;
  if (sep != '\0') out += sep;
  out += url_encode(name) + "=" + url_encode(value);
  return out + fragment;
}

std::string remove_query_parameter(const std::string& url, const std::string& name) {
  size_t q = url.find('?');
  if (q == std::string::npos) {
    return url;
  }
  size_t hash = url.find('#', q);
  std::string fragment = hash == std::string::npos ? "" : url.substr(hash);
  std::string query = url.substr(q + 1, hash == std::string::npos ? std::string::npos : hash - q - 1);

  std::string kept;
  size_t start = 0;
  while (start <= query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string::npos) end = query.size();

    std::string pair = query.substr(start, end - start);
    if (!pair.empty() && url_decode(pair.substr(0, pair.find('='))) != name) {
      if (!kept.empty()) kept += '&';
      kept += pair;
    }

    start = end + 1;
  }

  return url.substr(0, q) + (kept.empty() ? "" : "?" + kept) + fragment;
}

std::string encode_redirect_url(const std::string& url, const std::string& extra) {
  size_t q = url.find('?');
  if (q == std::string::npos) {
    size_t hash = url.find('#');
    return url.substr(0, hash) + "?" + extra;
  }

  std::string query = query_of(url);
  if (query.empty()) {
    return url.substr(0, q + 1) + extra;
  }
  return url.substr(0, q + 1) + form_encode(query + "&" + extra);
}

}  // namespace oauth::net
