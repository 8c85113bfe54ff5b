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

#include "extractor/token_validator.h"

#include <string>

#include "testing/gunit.h"

namespace tokenscout {
namespace {

TEST(TokenValidatorTest, AcceptsTypicalTokens) {
  EXPECT_TRUE(IsValidTokenShape("abc123def456ghi789jkl012mno345pq"));
  EXPECT_TRUE(IsValidTokenShape("0123456789abcdef0123456789abcdef"));
  EXPECT_TRUE(IsValidTokenShape("ABCDEF0123456789"));
  EXPECT_TRUE(IsValidTokenShape("abc-123_def-456"));
  EXPECT_TRUE(IsValidTokenShape("eyJhbGciOi.eyJzdWIiOi.c2lnbmF0dXJl"));
  EXPECT_TRUE(IsValidTokenShape("dGVzdHRva2Vu=="));
}

TEST(TokenValidatorTest, TrimsSurroundingWhitespace) {
  EXPECT_TRUE(IsValidTokenShape("  abc123def456  "));
  EXPECT_TRUE(IsValidTokenShape("\tabc123def456\n"));
  EXPECT_FALSE(IsValidTokenShape("abc123 def456"));
}

TEST(TokenValidatorTest, LengthBoundaries) {
  EXPECT_FALSE(IsValidTokenShape(""));
  EXPECT_FALSE(IsValidTokenShape("        "));
  EXPECT_FALSE(IsValidTokenShape(std::string(7, 'a')));
  EXPECT_FALSE(IsValidTokenShape("abc1234"));
  EXPECT_TRUE(IsValidTokenShape(std::string(8, 'a')));
  EXPECT_TRUE(IsValidTokenShape(std::string(256, 'a')));
  EXPECT_FALSE(IsValidTokenShape(std::string(257, 'a')));

  // Whitespace does not count toward the length.
  EXPECT_FALSE(IsValidTokenShape("   abc1234   "));
}

TEST(TokenValidatorTest, RejectsForeignCharacters) {
  EXPECT_FALSE(IsValidTokenShape("abc@def#ghi$jkl"));
  EXPECT_FALSE(IsValidTokenShape("this is not a token"));
  EXPECT_FALSE(IsValidTokenShape("abc/def+ghi/jkl"));
  EXPECT_FALSE(IsValidTokenShape("abcdefgh;"));
  EXPECT_FALSE(IsValidTokenShape("\"abcdefgh\""));
  EXPECT_FALSE(IsValidTokenShape("abcd\xC3\xA9" "efgh"));
}

TEST(TokenValidatorTest, CustomBounds) {
  constexpr TokenValidator kValidator(4, 10);
  EXPECT_EQ(kValidator.min_length(), 4u);
  EXPECT_EQ(kValidator.max_length(), 10u);
  EXPECT_FALSE(kValidator.IsValidTokenShape("abc"));
  EXPECT_TRUE(kValidator.IsValidTokenShape("abcd"));
  EXPECT_TRUE(kValidator.IsValidTokenShape("0123456789"));
  EXPECT_FALSE(kValidator.IsValidTokenShape("0123456789a"));
}

TEST(TokenValidatorTest, DefaultBounds) {
  constexpr TokenValidator kValidator;
  EXPECT_EQ(kValidator.min_length(), kDefaultMinTokenLength);
  EXPECT_EQ(kValidator.max_length(), kDefaultMaxTokenLength);
}

TEST(TokenValidatorTest, CharacterClasses) {
  for (const char c : std::string("azAZ09-_.=")) {
    EXPECT_TRUE(TokenValidator::IsTokenChar(c)) << c;
  }
  for (const char c : std::string(" +/;:\"'@\t")) {
    EXPECT_FALSE(TokenValidator::IsTokenChar(c)) << c;
  }

  EXPECT_TRUE(TokenValidator::IsHexChar('0'));
  EXPECT_TRUE(TokenValidator::IsHexChar('f'));
  EXPECT_TRUE(TokenValidator::IsHexChar('F'));
  EXPECT_FALSE(TokenValidator::IsHexChar('g'));
  EXPECT_FALSE(TokenValidator::IsHexChar('-'));

  EXPECT_TRUE(TokenValidator::IsBase64Char('+'));
  EXPECT_TRUE(TokenValidator::IsBase64Char('/'));
  EXPECT_TRUE(TokenValidator::IsBase64Char('='));
  EXPECT_FALSE(TokenValidator::IsBase64Char('.'));
}

TEST(TokenValidatorTest, ShapeFamilies) {
  EXPECT_TRUE(TokenValidator::IsHexLike("deadBEEF-0123_45"));
  EXPECT_FALSE(TokenValidator::IsHexLike("deadbeefg"));
  EXPECT_FALSE(TokenValidator::IsHexLike(""));

  EXPECT_TRUE(TokenValidator::IsBase64Like("dGVzdA+/=="));
  EXPECT_FALSE(TokenValidator::IsBase64Like("a.b"));
  EXPECT_FALSE(TokenValidator::IsBase64Like(""));

  EXPECT_TRUE(TokenValidator::IsGenericToken("a.b.c.d."));
  EXPECT_FALSE(TokenValidator::IsGenericToken("a.b.c.d"));
  EXPECT_FALSE(TokenValidator::IsGenericToken("a.b.c.d!"));
}

}  // namespace
}  // namespace tokenscout
