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

#include <ostream>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"

namespace tokenscout {

absl::string_view SourceFormatName(SourceFormat format) {
  switch (format) {
    case SourceFormat::kRawValue:
      return "Raw Value";
    case SourceFormat::kNameValuePair:
      return "Name=Value Pair";
    case SourceFormat::kCookieHeader:
      return "HTTP Cookie Header";
    case SourceFormat::kCurlCommand:
      return "cURL Command";
    case SourceFormat::kApiClientExport:
      return "API Client Export";
    case SourceFormat::kJson:
      return "JSON Format";
  }
  return "Unknown";
}

std::ostream &operator<<(std::ostream &os, SourceFormat format) {
  return os << SourceFormatName(format);
}

std::string Candidate::DebugString() const {
  return absl::StrFormat(
      "{value: \"%s\", format: \"%s\", confidence: %.2f, metadata: {%s}}",
      token_value, SourceFormatName(source_format), confidence,
      absl::StrJoin(metadata, ", ", absl::PairFormatter(": ")));
}

std::string DescribeCandidate(const Candidate &candidate) {
  // Truncates toward zero. The epsilon absorbs the rounding of computed
  // scores such as 0.85 + 3 * 0.02.
  const int percent = static_cast<int>(candidate.confidence * 100.0 + 1e-9);
  return absl::StrCat("Found ", SourceFormatName(candidate.source_format),
                      " with ", percent, "% confidence");
}

}  // namespace tokenscout
