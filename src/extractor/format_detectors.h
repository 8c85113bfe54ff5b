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

// Format detectors. Each detector recognizes one textual convention and
// returns at most one candidate. Detectors never fail: input they do not
// recognize, including malformed input, yields std::nullopt.
//
// Detectors expect input that was already bounded by the caller, see
// SessionTokenExtractor.

#ifndef TOKENSCOUT_EXTRACTOR_FORMAT_DETECTORS_H_
#define TOKENSCOUT_EXTRACTOR_FORMAT_DETECTORS_H_

#include <cstddef>
#include <optional>

#include "absl/strings/string_view.h"
#include "extractor/candidate.h"
#include "extractor/pattern_table.h"
#include "extractor/token_validator.h"
#include "protocol/extractor_config.pb.h"

namespace tokenscout {

// Read-only collaborators of the detectors. Does not own anything.
struct DetectorContext {
  const config::ExtractorConfig &config;
  const TokenValidator &validator;
  const PatternTable &patterns;
};

// The whole trimmed input is a single token. Declines a recognized
// <key>=<value> pair and digit-free words joined by '_', '-' or '.'.
std::optional<Candidate> DetectRawValue(absl::string_view text,
                                        const DetectorContext &context);

// "sessionid=..." on a line of its own.
std::optional<Candidate> DetectNameValuePair(absl::string_view text,
                                             const DetectorContext &context);

// "Cookie: a=b; sessionid=...; c=d", the header name being optional.
std::optional<Candidate> DetectCookieHeader(absl::string_view text,
                                            const DetectorContext &context);

// curl ... -H 'Cookie: sessionid=...' or curl ... -b 'sessionid=...'
std::optional<Candidate> DetectCurlCommand(absl::string_view text,
                                           const DetectorContext &context);

// API client (Postman style) export with a Cookie or Authorization header.
std::optional<Candidate> DetectApiClientExport(absl::string_view text,
                                               const DetectorContext &context);

// {"name": "sessionid", "value": "..."} in either key order.
std::optional<Candidate> DetectJson(absl::string_view text,
                                    const DetectorContext &context);

using DetectorFunction = std::optional<Candidate> (*)(absl::string_view,
                                                      const DetectorContext &);

// Returns the detector producing candidates of `format`.
DetectorFunction GetDetector(SourceFormat format);

// Confidence of a raw value: a base score raised by a typical length, a hex
// shape and a common hash length (32, 40 or 64), capped.
double ScoreRawValue(absl::string_view token,
                     const config::ExtractorConfig::ConfidenceWeights &weights);

// Confidence of a cookie header match with `entry_count` entries, capped.
double ScoreCookieHeader(
    size_t entry_count,
    const config::ExtractorConfig::ConfidenceWeights &weights);

// Number of ';'-delimited entries in `text`, i.e. the number of ';' plus one.
size_t CountCookieEntries(absl::string_view text);

// Returns true if the whole of `text` parses as JSON. Input nested too deeply
// for the parser is not well formed.
bool IsWellFormedJson(absl::string_view text);

}  // namespace tokenscout

#endif  // TOKENSCOUT_EXTRACTOR_FORMAT_DETECTORS_H_
