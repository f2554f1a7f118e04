#include <gtest/gtest.h>

#include <filesystem>

#include "auth/oauth2_authenticator.hpp"
#include "net/url.hpp"

using namespace oauth;
using namespace oauth::auth;
namespace fs = std::filesystem;

namespace {

// Records requests and answers with a canned response
struct FakeSender {
  struct Call {
    std::string url;
    net::HttpOptions options;
  };

  std::vector<Call> calls;
  net::HttpResponse response;

  net::HttpSender sender() {
    return [this](const std::string& url, const net::HttpOptions& options) {
      calls.push_back({url, options});
      return response;
    };
  }
};

net::HttpResponse json_reply(int status, const std::string& body) {
  net::HttpResponse response;
  response.status_code = status;
  response.headers["Content-Type"] = "application/json";
  response.body = body;
  return response;
}

}  // namespace

class OAuth2AuthenticatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    test_dir_ = fs::temp_directory_path() / ("oauth_broker_oauth2_" + std::string(name));
    fs::remove_all(test_dir_);
    store_ = std::make_shared<TokenStore>(test_dir_);

    config_.name = "github";
    config_.endpoint_url = "https://github.com";
    config_.client_id = "client-1";
    config_.client_secret = "s3cret";
    config_.auth_uri = "https://github.com/login/oauth/authorize";
    config_.token_uri = "https://github.com/login/oauth/access_token";
    config_.redirect_uri = "http://broker/api/oauth/callback";
    config_.scopes = {"repo", "user"};
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  std::shared_ptr<OAuth2Authenticator> make_authenticator() {
    return std::make_shared<OAuth2Authenticator>(config_, store_, fake_.sender());
  }

  // Callback URL as the provider would send it for a state carrying the given request query
  static std::string callback_url(const std::string& code, const std::string& request_query) {
    return "http://broker/api/oauth/callback?" + net::build_query({{"code", code}, {"state", request_query}});
  }

  fs::path test_dir_;
  std::shared_ptr<TokenStore> store_;
  ProviderConfig config_;
  FakeSender fake_;
};

TEST_F(OAuth2AuthenticatorTest, Identity) {
  auto oauth = make_authenticator();
  EXPECT_EQ(oauth->provider_name(), "github");
  EXPECT_EQ(oauth->endpoint_url(), "https://github.com");
}

TEST_F(OAuth2AuthenticatorTest, AuthenticateUrl) {
  auto oauth = make_authenticator();
  std::string request = "http://broker/api/oauth/authenticate?oauth_provider=github&userId=u1";

  auto url = oauth->get_authenticate_url(request, {"repo", "workflow"});
  ASSERT_TRUE(url.ok());
  EXPECT_EQ(url.value->rfind(config_.auth_uri + "?", 0), 0u);

  auto params = net::parse_query(net::query_of(*url.value));
  EXPECT_EQ(net::get_parameter(params, "response_type"), "code");
  EXPECT_EQ(net::get_parameter(params, "client_id"), "client-1");
  EXPECT_EQ(net::get_parameter(params, "redirect_uri"), "http://broker/api/oauth/callback");
  EXPECT_EQ(net::get_parameter(params, "scope"), "repo workflow");
  // The request query comes back verbatim as the state
  EXPECT_EQ(net::get_parameter(params, "state"), "oauth_provider=github&userId=u1");
}

TEST_F(OAuth2AuthenticatorTest, AuthenticateUrlDefaultScopes) {
  auto oauth = make_authenticator();

  auto url = oauth->get_authenticate_url("http://broker/api/oauth/authenticate?oauth_provider=github", {});
  ASSERT_TRUE(url.ok());
  EXPECT_EQ(net::get_parameter(net::parse_query(net::query_of(*url.value)), "scope"), "repo user");
}

TEST_F(OAuth2AuthenticatorTest, AuthenticateUrlWithoutAuthUri) {
  config_.auth_uri.clear();
  auto oauth = make_authenticator();

  auto url = oauth->get_authenticate_url("http://broker/api/oauth/authenticate", {});
  ASSERT_TRUE(url.failed());
  EXPECT_EQ(url.error->code, ErrorCode::OAuthAuthentication);
}

TEST_F(OAuth2AuthenticatorTest, CallbackExchangesCode) {
  fake_.response = json_reply(200, R"({"access_token":"gho_abc","scope":"repo","token_type":"bearer"})");
  auto oauth = make_authenticator();

  auto user = oauth->callback(callback_url("code-1", "oauth_provider=github&userId=u1"), {"repo"});
  ASSERT_TRUE(user.ok()) << user.error->message;
  EXPECT_EQ(*user.value, "u1");

  ASSERT_EQ(fake_.calls.size(), 1u);
  const auto& call = fake_.calls[0];
  EXPECT_EQ(call.url, config_.token_uri);
  EXPECT_EQ(call.options.method, "POST");
  EXPECT_EQ(call.options.headers.at("Accept"), "application/json");

  auto form = net::parse_query(call.options.body);
  EXPECT_EQ(net::get_parameter(form, "grant_type"), "authorization_code");
  EXPECT_EQ(net::get_parameter(form, "code"), "code-1");
  EXPECT_EQ(net::get_parameter(form, "client_secret"), "s3cret");
  EXPECT_EQ(net::get_parameter(form, "redirect_uri"), config_.redirect_uri);

  auto token = oauth->get_token("u1");
  ASSERT_TRUE(token.ok());
  ASSERT_TRUE(token.value->has_value());
  EXPECT_EQ((*token.value)->token, "gho_abc");
  EXPECT_EQ((*token.value)->scope, "repo");
}

TEST_F(OAuth2AuthenticatorTest, CallbackFormEncodedResponse) {
  net::HttpResponse response;
  response.status_code = 200;
  response.body = "access_token=gho_form&token_type=bearer";
  fake_.response = response;
  auto oauth = make_authenticator();

  auto user = oauth->callback(callback_url("code-2", "userId=u2"), {"repo", "user"});
  ASSERT_TRUE(user.ok());

  auto token = oauth->get_token("u2");
  ASSERT_TRUE(token.ok());
  ASSERT_TRUE(token.value->has_value());
  EXPECT_EQ((*token.value)->token, "gho_form");
  // Requested scopes stand in when the provider does not echo them
  EXPECT_EQ((*token.value)->scope, "repo user");
}

TEST_F(OAuth2AuthenticatorTest, CallbackProviderError) {
  auto oauth = make_authenticator();

  auto user = oauth->callback("http://broker/api/oauth/callback?error=access_denied&state=userId%3Du1", {});
  ASSERT_TRUE(user.failed());
  EXPECT_EQ(user.error->code, ErrorCode::OAuthAuthentication);
  EXPECT_TRUE(fake_.calls.empty());
}

TEST_F(OAuth2AuthenticatorTest, CallbackMissingCode) {
  auto oauth = make_authenticator();

  auto user = oauth->callback("http://broker/api/oauth/callback?state=userId%3Du1", {});
  ASSERT_TRUE(user.failed());
  EXPECT_EQ(user.error->code, ErrorCode::OAuthAuthentication);
  EXPECT_TRUE(fake_.calls.empty());
}

TEST_F(OAuth2AuthenticatorTest, CallbackMissingUser) {
  auto oauth = make_authenticator();

  auto user = oauth->callback(callback_url("code-3", "oauth_provider=github"), {});
  ASSERT_TRUE(user.failed());
  EXPECT_EQ(user.error->code, ErrorCode::OAuthAuthentication);
  EXPECT_TRUE(fake_.calls.empty());
}

TEST_F(OAuth2AuthenticatorTest, CallbackTokenEndpointFailure) {
  fake_.response = json_reply(401, R"({"error":"bad_verification_code"})");
  auto oauth = make_authenticator();

  auto user = oauth->callback(callback_url("code-4", "userId=u1"), {});
  ASSERT_TRUE(user.failed());
  EXPECT_EQ(user.error->code, ErrorCode::OAuthAuthentication);
  EXPECT_FALSE(oauth->get_token("u1").value->has_value());
}

TEST_F(OAuth2AuthenticatorTest, CallbackErrorInSuccessfulResponse) {
  // GitHub answers 200 with an error body for bad codes
  fake_.response = json_reply(200, R"({"error":"bad_verification_code"})");
  auto oauth = make_authenticator();

  auto user = oauth->callback(callback_url("code-5", "userId=u1"), {});
  ASSERT_TRUE(user.failed());
  EXPECT_NE(user.error->message.find("bad_verification_code"), std::string::npos);
}

TEST_F(OAuth2AuthenticatorTest, CallbackTransportFailure) {
  net::HttpResponse response;
  response.error = "connection refused";
  fake_.response = response;
  auto oauth = make_authenticator();

  auto user = oauth->callback(callback_url("code-6", "userId=u1"), {});
  ASSERT_TRUE(user.failed());
  EXPECT_EQ(user.error->code, ErrorCode::OAuthAuthentication);
}

TEST_F(OAuth2AuthenticatorTest, InvalidateWithoutRevokeEndpoint) {
  auto oauth = make_authenticator();
  store_->save("github", "u1", OAuthToken{"gho_1", ""});

  EXPECT_TRUE(oauth->invalidate_token("gho_1"));
  EXPECT_FALSE(oauth->get_token("u1").value->has_value());
  EXPECT_TRUE(fake_.calls.empty());

  // Nothing left to invalidate
  EXPECT_FALSE(oauth->invalidate_token("gho_1"));
}

TEST_F(OAuth2AuthenticatorTest, InvalidateWithRevokeEndpoint) {
  config_.revoke_uri = "https://provider.example.com/oauth/revoke";
  fake_.response = json_reply(200, "{}");
  auto oauth = make_authenticator();
  store_->save("github", "u1", OAuthToken{"gho_1", ""});

  EXPECT_TRUE(oauth->invalidate_token("gho_1"));
  ASSERT_EQ(fake_.calls.size(), 1u);
  EXPECT_EQ(fake_.calls[0].url, config_.revoke_uri);
  EXPECT_EQ(net::get_parameter(net::parse_query(fake_.calls[0].options.body), "token"), "gho_1");
  EXPECT_FALSE(oauth->get_token("u1").value->has_value());
}

TEST_F(OAuth2AuthenticatorTest, InvalidateUnknownTokenAfterRevocation) {
  config_.revoke_uri = "https://provider.example.com/oauth/revoke";
  fake_.response = json_reply(200, "{}");
  auto oauth = make_authenticator();

  EXPECT_FALSE(oauth->invalidate_token("never-issued"));
  EXPECT_EQ(fake_.calls.size(), 1u);
}

TEST_F(OAuth2AuthenticatorTest, InvalidateRefusedByProvider) {
  config_.revoke_uri = "https://provider.example.com/oauth/revoke";
  fake_.response = json_reply(400, R"({"error":"invalid_token"})");
  auto oauth = make_authenticator();
  store_->save("github", "u1", OAuthToken{"gho_1", ""});

  EXPECT_FALSE(oauth->invalidate_token("gho_1"));
  // Still stored
  EXPECT_TRUE(oauth->get_token("u1").value->has_value());
}
