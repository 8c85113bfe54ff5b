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

#include "base/logging.h"

#include "absl/flags/declare.h"
#include "absl/flags/flag.h"
#include "testing/gunit.h"

ABSL_DECLARE_FLAG(int, v);

namespace tokenscout {
namespace {

class LoggingTest : public ::testing::Test {
 protected:
  void TearDown() override {
    internal::SetConfigVLogLevel(0);
    absl::SetFlag(&FLAGS_v, 0);
  }
};

TEST_F(LoggingTest, ConfigLevel) {
  absl::SetFlag(&FLAGS_v, 0);
  internal::SetConfigVLogLevel(0);
  EXPECT_EQ(internal::GetVLogLevel(), 0);
  EXPECT_FALSE(TOKENSCOUT_VLOG_IS_ON(1));

  internal::SetConfigVLogLevel(2);
  EXPECT_EQ(internal::GetVLogLevel(), 2);
  EXPECT_TRUE(TOKENSCOUT_VLOG_IS_ON(1));
  EXPECT_TRUE(TOKENSCOUT_VLOG_IS_ON(2));
  EXPECT_FALSE(TOKENSCOUT_VLOG_IS_ON(3));

  // Negative levels are clamped.
  internal::SetConfigVLogLevel(-5);
  EXPECT_EQ(internal::GetVLogLevel(), 0);
}

TEST_F(LoggingTest, FlagWins) {
  absl::SetFlag(&FLAGS_v, 3);
  internal::SetConfigVLogLevel(1);
  EXPECT_EQ(internal::GetVLogLevel(), 3);
  TOKENSCOUT_VLOG(3) << "visible at --v=3";
}

}  // namespace
}  // namespace tokenscout
