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

#ifndef TOKENSCOUT_EXTRACTOR_CANDIDATE_H_
#define TOKENSCOUT_EXTRACTOR_CANDIDATE_H_

#include <array>
#include <ostream>
#include <string>

#include "absl/container/btree_map.h"
#include "absl/strings/string_view.h"

namespace tokenscout {

// The textual convention a candidate was recognized in. The enumerators are
// listed in detector priority order.
enum class SourceFormat {
  kRawValue,
  kNameValuePair,
  kCookieHeader,
  kCurlCommand,
  kApiClientExport,
  kJson,
};

inline constexpr std::array<SourceFormat, 6> kAllSourceFormats = {
    SourceFormat::kRawValue,     SourceFormat::kNameValuePair,
    SourceFormat::kCookieHeader, SourceFormat::kCurlCommand,
    SourceFormat::kApiClientExport, SourceFormat::kJson,
};

// Returns the user facing label, e.g. "HTTP Cookie Header".
absl::string_view SourceFormatName(SourceFormat format);

std::ostream &operator<<(std::ostream &os, SourceFormat format);

// A session token found in pasted text, with its provenance.
struct Candidate {
  // Always non-empty and always a valid token shape.
  std::string token_value;
  SourceFormat source_format = SourceFormat::kRawValue;
  // Heuristic trust in [0, 1]. Not a calibrated probability.
  double confidence = 0.0;
  // Detector specific facts, e.g. "length" or "cookie_count". Informational
  // only. Ordered so that the debug output is stable.
  absl::btree_map<std::string, std::string> metadata;

  // Note that this contains the token value.
  std::string DebugString() const;

  friend bool operator==(const Candidate &lhs, const Candidate &rhs) {
    return lhs.token_value == rhs.token_value &&
           lhs.source_format == rhs.source_format &&
           lhs.confidence == rhs.confidence && lhs.metadata == rhs.metadata;
  }
  friend bool operator!=(const Candidate &lhs, const Candidate &rhs) {
    return !(lhs == rhs);
  }
};

// Returns "Found <format> with <N>% confidence".
std::string DescribeCandidate(const Candidate &candidate);

}  // namespace tokenscout

#endif  // TOKENSCOUT_EXTRACTOR_CANDIDATE_H_
