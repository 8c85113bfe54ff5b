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

#include "extractor/session_token_extractor.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/no_destructor.h"
#include "absl/container/flat_hash_set.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "base/logging.h"
#include "config/extractor_config_handler.h"
#include "extractor/candidate.h"
#include "extractor/format_detectors.h"
#include "extractor/pattern_table.h"
#include "protocol/extractor_config.pb.h"

namespace tokenscout {
namespace {

bool IsUtf8ContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

SessionTokenExtractor::SessionTokenExtractor(
    config::ExtractorConfig config,
    std::unique_ptr<const PatternTable> patterns)
    : config_(std::move(config)),
      validator_(static_cast<size_t>(config_.min_token_length()),
                 static_cast<size_t>(config_.max_token_length())),
      patterns_(std::move(patterns)),
      context_{config_, validator_, *patterns_} {}

absl::StatusOr<std::unique_ptr<const SessionTokenExtractor>>
SessionTokenExtractor::Create(const config::ExtractorConfig &config) {
  config::ExtractorConfig normalized = config;
  const absl::Status status =
      config::ExtractorConfigHandler::NormalizeConfig(&normalized);
  if (!status.ok()) {
    return status;
  }
  const std::vector<std::string> key_names(
      normalized.session_key_names().begin(),
      normalized.session_key_names().end());
  absl::StatusOr<std::unique_ptr<const PatternTable>> patterns =
      PatternTable::Create(key_names);
  if (!patterns.ok()) {
    return patterns.status();
  }
  internal::SetConfigVLogLevel(normalized.verbose_level());
  return absl::WrapUnique<const SessionTokenExtractor>(
      new SessionTokenExtractor(std::move(normalized), *std::move(patterns)));
}

const SessionTokenExtractor &SessionTokenExtractor::Default() {
  static const absl::NoDestructor<std::unique_ptr<const SessionTokenExtractor>>
      kDefault([] {
        absl::StatusOr<std::unique_ptr<const SessionTokenExtractor>>
            extractor = Create(config::ExtractorConfigHandler::DefaultConfig());
        CHECK_OK(extractor.status());
        return *std::move(extractor);
      }());
  return **kDefault;
}

absl::string_view SessionTokenExtractor::BoundInput(
    absl::string_view text) const {
  const size_t limit = static_cast<size_t>(config_.max_processing_length());
  if (text.size() <= limit) {
    return text;
  }
  // Never cut a multi-byte character in half.
  size_t cut = limit;
  while (cut > 0 && IsUtf8ContinuationByte(text[cut])) {
    --cut;
  }
  TOKENSCOUT_VLOG(1) << "Input truncated from " << text.size() << " to "
                     << cut << " bytes";
  return text.substr(0, cut);
}

std::optional<Candidate> SessionTokenExtractor::Detect(
    SourceFormat format, absl::string_view text) const {
  return GetDetector(format)(BoundInput(text), context_);
}

std::optional<Candidate> SessionTokenExtractor::ExtractBest(
    absl::string_view text) const {
  const absl::string_view bounded = BoundInput(text);
  for (const SourceFormat format : kAllSourceFormats) {
    std::optional<Candidate> candidate = GetDetector(format)(bounded, context_);
    if (candidate.has_value()) {
      TOKENSCOUT_VLOG(1) << "Best match: " << format << ", confidence "
                         << candidate->confidence << ", length "
                         << candidate->token_value.size();
      return candidate;
    }
  }
  TOKENSCOUT_VLOG(1) << "No token in " << bounded.size() << " bytes";
  return std::nullopt;
}

std::vector<Candidate> SessionTokenExtractor::AnalyzeAll(
    absl::string_view text) const {
  const absl::string_view bounded = BoundInput(text);
  std::vector<Candidate> candidates;
  for (const SourceFormat format : kAllSourceFormats) {
    std::optional<Candidate> candidate = GetDetector(format)(bounded, context_);
    if (candidate.has_value()) {
      TOKENSCOUT_VLOG(2) << format << " matched, confidence "
                         << candidate->confidence;
      candidates.push_back(*std::move(candidate));
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate &lhs, const Candidate &rhs) {
                     return lhs.confidence > rhs.confidence;
                   });
  std::vector<Candidate> result;
  absl::flat_hash_set<std::string> seen;
  for (Candidate &candidate : candidates) {
    if (seen.insert(candidate.token_value).second) {
      result.push_back(std::move(candidate));
    }
  }
  TOKENSCOUT_VLOG(1) << result.size() << " distinct candidates out of "
                     << candidates.size();
  return result;
}

std::optional<std::string> SessionTokenExtractor::ExtractBestValue(
    absl::string_view text) const {
  std::optional<Candidate> candidate = ExtractBest(text);
  if (!candidate.has_value()) {
    return std::nullopt;
  }
  return std::move(candidate->token_value);
}

bool SessionTokenExtractor::ContainsPossibleToken(
    absl::string_view text) const {
  return ExtractBest(text).has_value();
}

bool SessionTokenExtractor::IsHighConfidence(const Candidate &candidate) const {
  return candidate.confidence > config_.high_confidence_threshold();
}

std::optional<Candidate> ExtractBest(absl::string_view text) {
  return SessionTokenExtractor::Default().ExtractBest(text);
}

std::vector<Candidate> AnalyzeAll(absl::string_view text) {
  return SessionTokenExtractor::Default().AnalyzeAll(text);
}

std::optional<std::string> ExtractBestValue(absl::string_view text) {
  return SessionTokenExtractor::Default().ExtractBestValue(text);
}

}  // namespace tokenscout
