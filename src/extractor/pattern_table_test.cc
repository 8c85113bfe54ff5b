// Copyright 2010-2021, Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
//     * Redistributions of source code must retain the above copyright
// notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above
// copyright notice, this list of conditions and the following disclaimer
// in the documentation and/or other materials provided with the
// distribution.
//     * Neither the name of Google Inc. nor the names of its
// contributors may be used to endorse or promote products derived from
// this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "extractor/pattern_table.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "re2/re2.h"
#include "testing/gunit.h"

namespace tokenscout {
namespace {

class PatternTableTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const std::vector<std::string> keys = {"sessionid", "auth_token"};
    absl::StatusOr<std::unique_ptr<const PatternTable>> table =
        PatternTable::Create(keys);
    ASSERT_OK(table);
    table_ = *std::move(table);
  }

  std::unique_ptr<const PatternTable> table_;
};

TEST_F(PatternTableTest, NameValuePair) {
  std::string key, value;
  EXPECT_TRUE(RE2::PartialMatch("sessionid=abc123def456",
                                table_->name_value_pair(), &key, &value));
  EXPECT_EQ(key, "sessionid");
  EXPECT_EQ(value, "abc123def456");

  EXPECT_TRUE(RE2::PartialMatch("foo\n  AUTH_TOKEN = abc123def456  \nbar",
                                table_->name_value_pair(), &key, &value));
  EXPECT_EQ(key, "AUTH_TOKEN");
  EXPECT_EQ(value, "abc123def456");

  // Not alone on its line.
  EXPECT_FALSE(RE2::PartialMatch("a=b; sessionid=abc123def456",
                                 table_->name_value_pair()));
  EXPECT_FALSE(RE2::PartialMatch("sessionid=abc123def456; a=b",
                                 table_->name_value_pair()));
}

TEST_F(PatternTableTest, CookieHeader) {
  std::string key, value;
  EXPECT_TRUE(RE2::PartialMatch("Cookie: a=b; sessionid=abc123def456; c=d",
                                table_->cookie_header(), &key, &value));
  EXPECT_EQ(value, "abc123def456");

  EXPECT_TRUE(RE2::PartialMatch("a=b; sessionid=abc123def456",
                                table_->cookie_header(), &key, &value));
  EXPECT_EQ(value, "abc123def456");

  // The key must not be the tail of a longer name.
  EXPECT_FALSE(RE2::PartialMatch("xsessionid=abc123def456;",
                                 table_->cookie_header()));
  // Values end at ';' or the end of a line.
  EXPECT_FALSE(RE2::PartialMatch("sessionid=abc123def456\"",
                                 table_->cookie_header()));
}

TEST_F(PatternTableTest, Curl) {
  std::string key, value;
  EXPECT_TRUE(RE2::PartialMatch(
      "curl 'https://example.com' -H 'Cookie: a=b; sessionid=abc123def456'",
      table_->curl_header(), &key, &value));
  EXPECT_EQ(value, "abc123def456");

  EXPECT_TRUE(RE2::PartialMatch(
      "curl --header \"cookie: sessionid=abc123def456\" https://example.com",
      table_->curl_header(), &key, &value));
  EXPECT_EQ(value, "abc123def456");

  EXPECT_FALSE(RE2::PartialMatch(
      "curl -H 'Accept: */*' -d 'sessionid=abc123def456'",
      table_->curl_header()));

  EXPECT_TRUE(RE2::PartialMatch("curl -b 'sessionid=abc123def456' x",
                                table_->curl_cookie_flag(), &key, &value));
  EXPECT_EQ(value, "abc123def456");
}

TEST_F(PatternTableTest, ApiClientExport) {
  std::string key, value;
  EXPECT_TRUE(RE2::PartialMatch(
      R"({"key": "Cookie", "value": "a=b; sessionid=abc123def456; c=d"})",
      table_->api_client_export(), &key, &value));
  EXPECT_EQ(value, "abc123def456");

  EXPECT_TRUE(RE2::PartialMatch(
      R"({"key":"Authorization","value":"auth_token=abc123def456"})",
      table_->api_client_export(), &key, &value));
  EXPECT_EQ(key, "auth_token");
  EXPECT_EQ(value, "abc123def456");

  // The value belongs to another object.
  EXPECT_FALSE(RE2::PartialMatch(
      R"({"key": "Cookie"}, {"value": "sessionid=abc123def456"})",
      table_->api_client_export()));
}

TEST_F(PatternTableTest, Json) {
  std::string key, value;
  EXPECT_TRUE(RE2::PartialMatch(
      R"({"name": "sessionid", "domain": "x", "value": "abc123def456"})",
      table_->json_name_first(), &key, &value));
  EXPECT_EQ(value, "abc123def456");

  // Groups are in (value, key) order.
  EXPECT_TRUE(RE2::PartialMatch(
      R"({"string": "abc123def456", "key": "SessionId"})",
      table_->json_value_first(), &value, &key));
  EXPECT_EQ(key, "SessionId");
  EXPECT_EQ(value, "abc123def456");

  EXPECT_FALSE(RE2::PartialMatch(
      R"({"name": "sessionid"}, {"value": "abc123def456"})",
      table_->json_name_first()));
}

TEST(PatternTableCreateTest, QuotesKeyNames) {
  const std::vector<std::string> keys = {"a.b"};
  absl::StatusOr<std::unique_ptr<const PatternTable>> table =
      PatternTable::Create(keys);
  ASSERT_OK(table);
  EXPECT_TRUE(
      RE2::PartialMatch("a.b=abc123def456", (*table)->name_value_pair()));
  EXPECT_FALSE(
      RE2::PartialMatch("axb=abc123def456", (*table)->name_value_pair()));
}

TEST(PatternTableCreateTest, RejectsEmptyKeys) {
  EXPECT_TRUE(absl::IsInvalidArgument(PatternTable::Create({}).status()));

  const std::vector<std::string> keys = {"sessionid", ""};
  EXPECT_TRUE(absl::IsInvalidArgument(PatternTable::Create(keys).status()));
}

}  // namespace
}  // namespace tokenscout
