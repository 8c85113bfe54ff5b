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

#include "extractor/format_detectors.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "absl/container/btree_map.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "base/logging.h"
#include "extractor/candidate.h"
#include "extractor/pattern_table.h"
#include "extractor/token_validator.h"
#include "json/json.h"
#include "protocol/extractor_config.pb.h"
#include "re2/re2.h"

namespace tokenscout {
namespace {

using ::tokenscout::config::ExtractorConfig;

// A detector gives up after examining this many matches whose value fails
// validation. Keeps the work per call linear in the input size.
constexpr int kMaxMatchesPerDetector = 32;

// Hex digest lengths of MD5, SHA-1 and SHA-256.
constexpr int kHashLengths[] = {32, 40, 64};

enum class GroupOrder {
  kKeyFirst,
  kValueFirst,
};

struct KeyValueMatch {
  std::string key;  // lowercased
  std::string value;
  size_t begin = 0;  // offset of the whole match in the text
};

absl::string_view ToStringView(const re2::StringPiece &piece) {
  return absl::string_view(piece.data(), piece.size());
}

// Returns the first match of `re` at or after `start` whose value is a valid
// token. `re` must have exactly two capturing groups, ordered by `order`.
std::optional<KeyValueMatch> FindValidKeyValue(absl::string_view text,
                                               const RE2 &re, GroupOrder order,
                                               const TokenValidator &validator,
                                               size_t start = 0) {
  const re2::StringPiece input(text.data(), text.size());
  re2::StringPiece groups[3];
  const int key_group = order == GroupOrder::kKeyFirst ? 1 : 2;
  const int value_group = order == GroupOrder::kKeyFirst ? 2 : 1;

  size_t pos = start;
  for (int i = 0; i < kMaxMatchesPerDetector && pos < text.size(); ++i) {
    if (!re.Match(input, pos, input.size(), RE2::UNANCHORED, groups, 3)) {
      break;
    }
    const size_t begin = groups[0].data() - input.data();
    const absl::string_view value = ToStringView(groups[value_group]);
    if (validator.IsValidTokenShape(value)) {
      KeyValueMatch match;
      match.key = absl::AsciiStrToLower(ToStringView(groups[key_group]));
      match.value = std::string(value);
      match.begin = begin;
      return match;
    }
    pos = std::max(begin + groups[0].size(), pos + 1);
  }
  return std::nullopt;
}

bool ContainsIgnoreCase(absl::string_view text, absl::string_view needle) {
  return std::search(text.begin(), text.end(), needle.begin(), needle.end(),
                     [](char a, char b) {
                       return absl::ascii_tolower(a) == absl::ascii_tolower(b);
                     }) != text.end();
}

// Identifiers and slugs such as "not_a_valid_session_id": separated words
// without a single digit.
bool IsWordLike(absl::string_view s) {
  return std::none_of(s.begin(), s.end(), absl::ascii_isdigit) &&
         s.find_first_of("_-.") != absl::string_view::npos;
}

Candidate MakeCandidate(std::string token_value, SourceFormat format,
                        double confidence,
                        absl::btree_map<std::string, std::string> metadata) {
  Candidate candidate;
  candidate.token_value = std::move(token_value);
  candidate.source_format = format;
  candidate.confidence = confidence;
  candidate.metadata = std::move(metadata);
  return candidate;
}

}  // namespace

double ScoreRawValue(absl::string_view token,
                     const ExtractorConfig::ConfidenceWeights &weights) {
  const int length = static_cast<int>(token.size());
  double confidence = weights.raw_base();
  if (length >= weights.raw_typical_min_length() &&
      length <= weights.raw_typical_max_length()) {
    confidence += weights.raw_typical_length_bonus();
  }
  if (TokenValidator::IsHexLike(token)) {
    confidence += weights.raw_hex_bonus();
  }
  if (std::find(std::begin(kHashLengths), std::end(kHashLengths), length) !=
      std::end(kHashLengths)) {
    confidence += weights.raw_hash_length_bonus();
  }
  // A bare value is indistinguishable from any other short string.
  return std::min(confidence, weights.raw_cap());
}

double ScoreCookieHeader(size_t entry_count,
                         const ExtractorConfig::ConfidenceWeights &weights) {
  return std::min(weights.cookie_header_cap(),
                  weights.cookie_header_base() +
                      static_cast<double>(entry_count) *
                          weights.cookie_header_per_entry());
}

size_t CountCookieEntries(absl::string_view text) {
  return std::count(text.begin(), text.end(), ';') + 1;
}

bool IsWellFormedJson(absl::string_view text) {
  Json::CharReaderBuilder builder;
  builder["allowComments"] = false;
  builder["failIfExtra"] = true;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  // jsoncpp throws instead of failing when nesting exceeds its stack limit.
  try {
    return reader->parse(text.data(), text.data() + text.size(), &root,
                         &errors);
  } catch (const Json::Exception &e) {
    TOKENSCOUT_VLOG(2) << "JSON parse aborted: " << e.what();
    return false;
  }
}

std::optional<Candidate> DetectRawValue(absl::string_view text,
                                        const DetectorContext &context) {
  const absl::string_view trimmed = absl::StripAsciiWhitespace(text);
  if (!context.validator.IsValidTokenShape(trimmed)) {
    return std::nullopt;
  }
  // "sessionid=..." is token shaped as a whole. Leave it to
  // DetectNameValuePair() so that the key is not reported as part of the
  // token.
  if (RE2::PartialMatch(re2::StringPiece(trimmed.data(), trimmed.size()),
                        context.patterns.name_value_pair())) {
    return std::nullopt;
  }
  if (IsWordLike(trimmed)) {
    return std::nullopt;
  }
  return MakeCandidate(
      std::string(trimmed), SourceFormat::kRawValue,
      ScoreRawValue(trimmed, context.config.weights()),
      {{"length", absl::StrCat(trimmed.size())},
       {"hex_like", TokenValidator::IsHexLike(trimmed) ? "true" : "false"}});
}

std::optional<Candidate> DetectNameValuePair(absl::string_view text,
                                             const DetectorContext &context) {
  std::optional<KeyValueMatch> match =
      FindValidKeyValue(text, context.patterns.name_value_pair(),
                        GroupOrder::kKeyFirst, context.validator);
  if (!match.has_value()) {
    return std::nullopt;
  }
  return MakeCandidate(std::move(match->value), SourceFormat::kNameValuePair,
                       context.config.weights().name_value_pair(),
                       {{"format", "name=value"}, {"key", match->key}});
}

std::optional<Candidate> DetectCookieHeader(absl::string_view text,
                                            const DetectorContext &context) {
  std::optional<KeyValueMatch> match =
      FindValidKeyValue(text, context.patterns.cookie_header(),
                        GroupOrder::kKeyFirst, context.validator);
  if (!match.has_value()) {
    return std::nullopt;
  }
  // More entries around the match make a coincidental match less likely.
  const size_t entry_count = CountCookieEntries(text);
  return MakeCandidate(
      std::move(match->value), SourceFormat::kCookieHeader,
      ScoreCookieHeader(entry_count, context.config.weights()),
      {{"cookie_count", absl::StrCat(entry_count)},
       {"has_header_name",
        ContainsIgnoreCase(text, "cookie:") ? "true" : "false"},
       {"key", match->key}});
}

std::optional<Candidate> DetectCurlCommand(absl::string_view text,
                                           const DetectorContext &context) {
  const size_t curl_pos = text.find("curl");
  if (curl_pos == absl::string_view::npos) {
    return std::nullopt;
  }

  absl::string_view flag = "header";
  std::optional<KeyValueMatch> match =
      FindValidKeyValue(text, context.patterns.curl_header(),
                        GroupOrder::kKeyFirst, context.validator, curl_pos);
  if (!match.has_value()) {
    flag = "cookie";
    match = FindValidKeyValue(text, context.patterns.curl_cookie_flag(),
                              GroupOrder::kKeyFirst, context.validator,
                              curl_pos);
  }
  if (!match.has_value()) {
    return std::nullopt;
  }
  return MakeCandidate(std::move(match->value), SourceFormat::kCurlCommand,
                       context.config.weights().curl_command(),
                       {{"flag", std::string(flag)}, {"key", match->key}});
}

std::optional<Candidate> DetectApiClientExport(absl::string_view text,
                                               const DetectorContext &context) {
  const bool names_tool = ContainsIgnoreCase(text, "postman");
  // Untitled exports still carry "key"/"value" header entries.
  if (!names_tool && !(absl::StrContains(text, "\"key\"") &&
                       absl::StrContains(text, "\"value\""))) {
    return std::nullopt;
  }
  std::optional<KeyValueMatch> match =
      FindValidKeyValue(text, context.patterns.api_client_export(),
                        GroupOrder::kKeyFirst, context.validator);
  if (!match.has_value()) {
    return std::nullopt;
  }
  return MakeCandidate(std::move(match->value), SourceFormat::kApiClientExport,
                       context.config.weights().api_client_export(),
                       {{"tool", names_tool ? "postman" : "unnamed"},
                        {"key", match->key}});
}

std::optional<Candidate> DetectJson(absl::string_view text,
                                    const DetectorContext &context) {
  if (!absl::StrContains(text, '{') || !absl::StrContains(text, '}')) {
    return std::nullopt;
  }
  std::optional<KeyValueMatch> match =
      FindValidKeyValue(text, context.patterns.json_name_first(),
                        GroupOrder::kKeyFirst, context.validator);
  std::optional<KeyValueMatch> reversed =
      FindValidKeyValue(text, context.patterns.json_value_first(),
                        GroupOrder::kValueFirst, context.validator);
  if (reversed.has_value() &&
      (!match.has_value() || reversed->begin < match->begin)) {
    match = std::move(reversed);
  }
  if (!match.has_value()) {
    return std::nullopt;
  }

  // The fragment may sit inside otherwise malformed text.
  const bool well_formed = IsWellFormedJson(text);
  const ExtractorConfig::ConfidenceWeights &weights = context.config.weights();
  return MakeCandidate(
      std::move(match->value), SourceFormat::kJson,
      well_formed ? weights.json_well_formed() : weights.json_malformed(),
      {{"valid_json", well_formed ? "true" : "false"}, {"key", match->key}});
}

DetectorFunction GetDetector(SourceFormat format) {
  switch (format) {
    case SourceFormat::kRawValue:
      return &DetectRawValue;
    case SourceFormat::kNameValuePair:
      return &DetectNameValuePair;
    case SourceFormat::kCookieHeader:
      return &DetectCookieHeader;
    case SourceFormat::kCurlCommand:
      return &DetectCurlCommand;
    case SourceFormat::kApiClientExport:
      return &DetectApiClientExport;
    case SourceFormat::kJson:
      return &DetectJson;
  }
  return nullptr;
}

}  // namespace tokenscout
