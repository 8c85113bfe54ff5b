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

#include "extractor/candidate.h"

#include <set>
#include <sstream>
#include <string>

#include "absl/strings/string_view.h"
#include "testing/gunit.h"

namespace tokenscout {
namespace {

TEST(CandidateTest, SourceFormatName) {
  EXPECT_EQ(SourceFormatName(SourceFormat::kRawValue), "Raw Value");
  EXPECT_EQ(SourceFormatName(SourceFormat::kNameValuePair), "Name=Value Pair");
  EXPECT_EQ(SourceFormatName(SourceFormat::kCookieHeader),
            "HTTP Cookie Header");
  EXPECT_EQ(SourceFormatName(SourceFormat::kCurlCommand), "cURL Command");
  EXPECT_EQ(SourceFormatName(SourceFormat::kApiClientExport),
            "API Client Export");
  EXPECT_EQ(SourceFormatName(SourceFormat::kJson), "JSON Format");

  std::set<absl::string_view> names;
  for (const SourceFormat format : kAllSourceFormats) {
    names.insert(SourceFormatName(format));
  }
  EXPECT_EQ(names.size(), kAllSourceFormats.size());
}

TEST(CandidateTest, StreamOperator) {
  std::ostringstream os;
  os << SourceFormat::kCurlCommand;
  EXPECT_EQ(os.str(), "cURL Command");
}

TEST(CandidateTest, DescribeCandidate) {
  Candidate candidate;
  candidate.token_value = "abc123def456";
  candidate.source_format = SourceFormat::kCookieHeader;
  candidate.confidence = 0.91;
  EXPECT_EQ(DescribeCandidate(candidate),
            "Found HTTP Cookie Header with 91% confidence");

  candidate.source_format = SourceFormat::kRawValue;
  candidate.confidence = 0.855;
  EXPECT_EQ(DescribeCandidate(candidate),
            "Found Raw Value with 85% confidence");

  candidate.confidence = 1.0;
  EXPECT_EQ(DescribeCandidate(candidate),
            "Found Raw Value with 100% confidence");
}

TEST(CandidateTest, DebugString) {
  Candidate candidate;
  candidate.token_value = "abc123def456";
  candidate.source_format = SourceFormat::kJson;
  candidate.confidence = 0.75;
  candidate.metadata["valid_json"] = "false";
  candidate.metadata["key"] = "sessionid";
  EXPECT_EQ(candidate.DebugString(),
            "{value: \"abc123def456\", format: \"JSON Format\", "
            "confidence: 0.75, metadata: {key: sessionid, valid_json: false}}");
}

TEST(CandidateTest, Equality) {
  Candidate a;
  a.token_value = "abc123def456";
  a.confidence = 0.5;
  Candidate b = a;
  EXPECT_EQ(a, b);

  b.metadata["length"] = "12";
  EXPECT_NE(a, b);

  b = a;
  b.source_format = SourceFormat::kNameValuePair;
  EXPECT_NE(a, b);
}

}  // namespace
}  // namespace tokenscout
