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

// Session token extraction from pasted text.
//
// Usage:
//   const SessionTokenExtractor &extractor = SessionTokenExtractor::Default();
//   if (std::optional<Candidate> best = extractor.ExtractBest(text)) {
//     ... best->token_value ...
//   }

#ifndef TOKENSCOUT_EXTRACTOR_SESSION_TOKEN_EXTRACTOR_H_
#define TOKENSCOUT_EXTRACTOR_SESSION_TOKEN_EXTRACTOR_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "extractor/candidate.h"
#include "extractor/format_detectors.h"
#include "extractor/pattern_table.h"
#include "extractor/token_validator.h"
#include "protocol/extractor_config.pb.h"

namespace tokenscout {

// Runs the format detectors over a piece of text and merges their results.
// Instances are immutable, so a single instance may be used from any number
// of threads at once.
class SessionTokenExtractor {
 public:
  SessionTokenExtractor(const SessionTokenExtractor &) = delete;
  SessionTokenExtractor &operator=(const SessionTokenExtractor &) = delete;

  // Normalizes `config` and compiles the patterns for its key names. On
  // success the config's `verbose_level` becomes the process-wide one.
  static absl::StatusOr<std::unique_ptr<const SessionTokenExtractor>> Create(
      const config::ExtractorConfig &config);

  // Returns the process-wide extractor built from the default config.
  static const SessionTokenExtractor &Default();

  // Returns the candidate of the first detector that matches, trying them in
  // the order of kAllSourceFormats.
  std::optional<Candidate> ExtractBest(absl::string_view text) const;

  // Returns the candidates of all detectors, highest confidence first. Ties
  // keep detector order. When several detectors extract the same token, only
  // the most confident candidate is kept.
  std::vector<Candidate> AnalyzeAll(absl::string_view text) const;

  // ExtractBest() reduced to the token.
  std::optional<std::string> ExtractBestValue(absl::string_view text) const;

  // Runs the single detector for `format`.
  std::optional<Candidate> Detect(SourceFormat format,
                                  absl::string_view text) const;

  bool ContainsPossibleToken(absl::string_view text) const;

  // Returns true if `candidate` is trusted enough to be applied without
  // confirmation.
  bool IsHighConfidence(const Candidate &candidate) const;

  const config::ExtractorConfig &config() const { return config_; }

 private:
  SessionTokenExtractor(config::ExtractorConfig config,
                        std::unique_ptr<const PatternTable> patterns);

  // Truncates `text` to the configured processing length.
  absl::string_view BoundInput(absl::string_view text) const;

  const config::ExtractorConfig config_;
  const TokenValidator validator_;
  const std::unique_ptr<const PatternTable> patterns_;
  const DetectorContext context_;
};

// Shorthands for the default extractor.
std::optional<Candidate> ExtractBest(absl::string_view text);
std::vector<Candidate> AnalyzeAll(absl::string_view text);
std::optional<std::string> ExtractBestValue(absl::string_view text);

}  // namespace tokenscout

#endif  // TOKENSCOUT_EXTRACTOR_SESSION_TOKEN_EXTRACTOR_H_
