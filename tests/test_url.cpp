#include <gtest/gtest.h>

#include "net/url.hpp"

using namespace oauth;
using namespace oauth::net;

// --- ParsedUrl Tests ---

TEST(ParsedUrlTest, Parse) {
  auto url = ParsedUrl::parse("https://github.com:8443/login/oauth/authorize?client_id=x#top");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->scheme, "https");
  EXPECT_EQ(url->host, "github.com");
  EXPECT_EQ(url->port, "8443");
  EXPECT_EQ(url->path, "/login/oauth/authorize");
  EXPECT_EQ(url->query, "client_id=x");
  EXPECT_EQ(url->fragment, "top");
  EXPECT_EQ(url->origin(), "https://github.com:8443");
}

TEST(ParsedUrlTest, Defaults) {
  auto https = ParsedUrl::parse("https://gitlab.com");
  ASSERT_TRUE(https.has_value());
  EXPECT_EQ(https->path, "/");
  EXPECT_EQ(https->port_or_default(), "443");

  auto http = ParsedUrl::parse("http://localhost/api");
  ASSERT_TRUE(http.has_value());
  EXPECT_FALSE(http->is_https());
  EXPECT_EQ(http->port_or_default(), "80");
}

TEST(ParsedUrlTest, Invalid) {
  EXPECT_FALSE(ParsedUrl::parse("ftp://host/file").has_value());
  EXPECT_FALSE(ParsedUrl::parse("not a url").has_value());
}

// --- Encoding Tests ---

TEST(UrlEncodingTest, UrlEncode) {
  EXPECT_EQ(url_encode("abc-_.~"), "abc-_.~");
  EXPECT_EQ(url_encode("a b"), "a%20b");
  EXPECT_EQ(url_encode("a&b=c"), "a%26b%3Dc");
  EXPECT_EQ(url_encode("{\"k\":1}"), "%7B%22k%22%3A1%7D");
}

TEST(UrlEncodingTest, FormEncode) {
  EXPECT_EQ(form_encode("a b"), "a+b");
  EXPECT_EQ(form_encode("a*b"), "a*b");
  EXPECT_EQ(form_encode("a~b"), "a%7Eb");
  EXPECT_EQ(form_encode("x=1&y=2"), "x%3D1%26y%3D2");
}

TEST(UrlEncodingTest, Decode) {
  EXPECT_EQ(url_decode("a%20b"), "a b");
  EXPECT_EQ(url_decode("a+b"), "a b");
  EXPECT_EQ(url_decode("%7B%7d"), "{}");
  EXPECT_EQ(url_decode("100%"), "100%");
  EXPECT_EQ(url_decode("%zz"), "%zz");
}

// --- Query Tests ---

TEST(QueryTest, ParseKeepsRepeatedValues) {
  auto params = parse_query("?scope=repo&scope=user&oauth_provider=github&flag");
  EXPECT_EQ(get_parameters(params, "scope"), (std::vector<std::string>{"repo", "user"}));
  EXPECT_EQ(get_parameter(params, "oauth_provider"), "github");
  ASSERT_EQ(params.count("flag"), 1u);
  EXPECT_EQ(get_parameter(params, "flag"), "");
  EXPECT_EQ(get_parameter(params, "missing"), "");
  EXPECT_TRUE(get_parameters(params, "missing").empty());
}

TEST(QueryTest, ParseEmpty) {
  EXPECT_TRUE(parse_query("").empty());
  EXPECT_TRUE(parse_query("&&").empty());
}

TEST(QueryTest, BuildQuery) {
  EXPECT_EQ(build_query({{"a", "1"}, {"b", "x y"}}), "a=1&b=x%20y");
  EXPECT_EQ(build_query({}), "");
}

TEST(QueryTest, QueryOf) {
  EXPECT_EQ(query_of("http://h/p?a=1&b=2#frag"), "a=1&b=2");
  EXPECT_EQ(query_of("http://h/p"), "");
  EXPECT_EQ(query_of("http://h/p?"), "");
}

TEST(QueryTest, AppendQueryParameter) {
  EXPECT_EQ(append_query_parameter("http://h/p", "a", "1"), "http://h/p?a=1");
  EXPECT_EQ(append_query_parameter("http://h/p?x=y", "a", "1 2"), "http://h/p?x=y&a=1%202");
  EXPECT_EQ(append_query_parameter("http://h/p?", "a", "1"), "http://h/p?a=1");
  EXPECT_EQ(append_query_parameter("http://h/#/page", "a", "1"), "http://h/?a=1#/page");
}

TEST(QueryTest, RemoveQueryParameter) {
  EXPECT_EQ(remove_query_parameter("http://h/p?a=1&userId=x&b=2&userId=y", "userId"), "http://h/p?a=1&b=2");
  EXPECT_EQ(remove_query_parameter("http://h/p?user%49d=x&c=%7B%7D", "userId"), "http://h/p?c=%7B%7D");
  EXPECT_EQ(remove_query_parameter("http://h/p?userId=x#frag", "userId"), "http://h/p#frag");
  EXPECT_EQ(remove_query_parameter("http://h/p?userId", "userId"), "http://h/p");
  EXPECT_EQ(remove_query_parameter("http://h/p", "userId"), "http://h/p");
}

// --- State Tests ---

TEST(StateTest, RoundTripThroughProvider) {
  // Query of the authenticate request, including a post-login URL with its own query
  std::string original = "oauth_provider=github&scope=repo&redirect_after_login=" +
                         url_encode("http://ide/flow?params={\"a\":\"b c\"}") + "&userId=u1";

  // Provider echoes the state back on the callback
  std::string callback = "http://broker/api/oauth/callback?code=123&" + build_query({{"state", original}});

  EXPECT_EQ(get_state(callback), original);

  auto state = query_params_from_state(get_state(callback));
  EXPECT_EQ(get_parameter(state, "oauth_provider"), "github");
  EXPECT_EQ(get_parameter(state, "userId"), "u1");
  EXPECT_EQ(get_parameter(state, "redirect_after_login"), "http://ide/flow?params={\"a\":\"b c\"}");
}

TEST(StateTest, MissingState) {
  EXPECT_EQ(get_state("http://broker/api/oauth/callback?code=1"), "");
  EXPECT_TRUE(query_params_from_state("").empty());
}

// --- Redirect URL Tests ---

TEST(RedirectUrlTest, EncodesQuery) {
  auto url = encode_redirect_url("http://ide/flow?params={\"a\":1}", "error_code=access_denied");
  EXPECT_EQ(url, "http://ide/flow?params%3D%7B%22a%22%3A1%7D%26error_code%3Daccess_denied");
}

TEST(RedirectUrlTest, NoQuery) {
  EXPECT_EQ(encode_redirect_url("http://ide/flow", "error_code=access_denied"), "http://ide/flow?error_code=access_denied");
  EXPECT_EQ(encode_redirect_url("http://ide/flow?", "error_code=access_denied"), "http://ide/flow?error_code=access_denied");
}
