#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "auth/token_store.hpp"

using namespace oauth;
using namespace oauth::auth;
namespace fs = std::filesystem;

class TokenStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    test_dir_ = fs::temp_directory_path() / ("oauth_broker_token_store_" + std::string(name));
    fs::remove_all(test_dir_);
    store_ = std::make_shared<TokenStore>(test_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  fs::path test_dir_;
  std::shared_ptr<TokenStore> store_;
};

TEST_F(TokenStoreTest, CreatesBaseDir) {
  EXPECT_TRUE(fs::is_directory(test_dir_));
  EXPECT_EQ(store_->base_dir(), test_dir_);
}

TEST_F(TokenStoreTest, GetFromEmptyStore) {
  auto token = store_->get("github", "u1");
  ASSERT_TRUE(token.ok());
  EXPECT_FALSE(token.value->has_value());
}

TEST_F(TokenStoreTest, SaveAndGet) {
  ASSERT_TRUE(store_->save("github", "u1", OAuthToken{"gho_1", "repo"}).ok());

  auto token = store_->get("github", "u1");
  ASSERT_TRUE(token.ok());
  ASSERT_TRUE(token.value->has_value());
  EXPECT_EQ((*token.value)->token, "gho_1");
  EXPECT_EQ((*token.value)->scope, "repo");

  // Other user and other provider are independent
  EXPECT_FALSE(store_->get("github", "u2").value->has_value());
  EXPECT_FALSE(store_->get("gitlab", "u1").value->has_value());
}

TEST_F(TokenStoreTest, SaveReplaces) {
  store_->save("github", "u1", OAuthToken{"old", ""});
  store_->save("github", "u1", OAuthToken{"new", "repo"});

  auto token = store_->get("github", "u1");
  ASSERT_TRUE(token.ok());
  EXPECT_EQ((*token.value)->token, "new");
}

TEST_F(TokenStoreTest, PersistsAcrossInstances) {
  store_->save("gitlab", "u1", OAuthToken{"glpat", "api"});

  TokenStore reopened(test_dir_);
  auto token = reopened.get("gitlab", "u1");
  ASSERT_TRUE(token.ok());
  ASSERT_TRUE(token.value->has_value());
  EXPECT_EQ((*token.value)->token, "glpat");

  // No temp file left behind
  EXPECT_TRUE(fs::exists(test_dir_ / "tokens.json"));
  EXPECT_FALSE(fs::exists(test_dir_ / "tokens.json.tmp"));
}

TEST_F(TokenStoreTest, Remove) {
  store_->save("github", "u1", OAuthToken{"gho_1", ""});

  auto removed = store_->remove("github", "u1");
  ASSERT_TRUE(removed.ok());
  EXPECT_TRUE(*removed.value);
  EXPECT_FALSE(store_->get("github", "u1").value->has_value());

  auto again = store_->remove("github", "u1");
  ASSERT_TRUE(again.ok());
  EXPECT_FALSE(*again.value);

  auto unknown_provider = store_->remove("gitlab", "u1");
  ASSERT_TRUE(unknown_provider.ok());
  EXPECT_FALSE(*unknown_provider.value);
}

TEST_F(TokenStoreTest, RemoveTokenRemovesEveryCopy) {
  store_->save("github", "u1", OAuthToken{"shared", ""});
  store_->save("github", "alice", OAuthToken{"shared", ""});
  store_->save("github", "u2", OAuthToken{"other", ""});
  store_->save("gitlab", "u1", OAuthToken{"shared", ""});

  auto removed = store_->remove_token("github", "shared");
  ASSERT_TRUE(removed.ok());
  EXPECT_TRUE(*removed.value);

  EXPECT_FALSE(store_->get("github", "u1").value->has_value());
  EXPECT_FALSE(store_->get("github", "alice").value->has_value());
  EXPECT_TRUE(store_->get("github", "u2").value->has_value());
  // Scoped to one provider
  EXPECT_TRUE(store_->get("gitlab", "u1").value->has_value());

  auto missing = store_->remove_token("github", "shared");
  ASSERT_TRUE(missing.ok());
  EXPECT_FALSE(*missing.value);
}

TEST_F(TokenStoreTest, CorruptedFileIsServerError) {
  {
    std::ofstream file(test_dir_ / "tokens.json");
    file << "{ broken";
  }

  auto token = store_->get("github", "u1");
  ASSERT_TRUE(token.failed());
  EXPECT_EQ(token.error->code, ErrorCode::ServerError);

  auto saved = store_->save("github", "u1", OAuthToken{"t", ""});
  ASSERT_TRUE(saved.failed());
  EXPECT_EQ(saved.error->code, ErrorCode::ServerError);

  EXPECT_TRUE(store_->remove("github", "u1").failed());
  EXPECT_TRUE(store_->remove_token("github", "t").failed());
}

TEST_F(TokenStoreTest, NonObjectFileIsServerError) {
  {
    std::ofstream file(test_dir_ / "tokens.json");
    file << "[1, 2, 3]";
  }

  auto token = store_->get("github", "u1");
  ASSERT_TRUE(token.failed());
  EXPECT_EQ(token.error->code, ErrorCode::ServerError);
}

TEST_F(TokenStoreTest, MalformedEntriesAreServerError) {
  for (const char* content : {R"({"github": {"u1": "gho_plain"}})", R"({"gitlab": "oops"})",
                              R"({"github": {"u1": {"token": 42}}})"}) {
    {
      std::ofstream file(test_dir_ / "tokens.json", std::ios::trunc);
      file << content;
    }

    auto token = store_->get("github", "u1");
    ASSERT_TRUE(token.failed()) << content;
    EXPECT_EQ(token.error->code, ErrorCode::ServerError);

    EXPECT_TRUE(store_->save("github", "u2", OAuthToken{"t", ""}).failed()) << content;
    EXPECT_TRUE(store_->remove("github", "u1").failed()) << content;
    EXPECT_TRUE(store_->remove_token("github", "gho_plain").failed()) << content;
  }
}
