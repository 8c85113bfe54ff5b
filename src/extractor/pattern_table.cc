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

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "base/logging.h"
#include "re2/re2.h"

namespace tokenscout {
namespace {

// Characters a captured value may consist of. Anything else ends the value,
// and the validator has the final say.
constexpr absl::string_view kValue = R"re(([\w\-.=]+))re";

// Patterns use "$KEY" for the capturing key name alternation and "$VALUE" for
// the capturing value.
constexpr absl::string_view kNameValuePairPattern =
    R"re((?im)^[ \t]*$KEY[ \t]*=[ \t]*$VALUE[ \t\r]*$)re";
constexpr absl::string_view kCookieHeaderPattern =
    R"re((?im)\b$KEY\s*=\s*$VALUE(?:;|[ \t\r]*$))re";
constexpr absl::string_view kCurlHeaderPattern =
    R"re((?is)(?:-H|--header)\s*["']cookie:[^"']*?\b$KEY=$VALUE)re";
constexpr absl::string_view kCurlCookieFlagPattern =
    R"re((?is)(?:-b|--cookie)\s*["'][^"']*?\b$KEY=$VALUE)re";
constexpr absl::string_view kApiClientExportPattern =
    R"re((?is)"key"\s*:\s*"(?:cookie|authorization)"[^{}]*?)re"
    R"re("value"\s*:\s*"[^"]*?\b$KEY=$VALUE[";])re";
constexpr absl::string_view kJsonNameFirstPattern =
    R"re((?is)"(?:name|key)"\s*:\s*"$KEY"[^{}]*?)re"
    R"re("(?:value|string)"\s*:\s*"$VALUE")re";
constexpr absl::string_view kJsonValueFirstPattern =
    R"re((?is)"(?:value|string)"\s*:\s*"$VALUE"[^{}]*?)re"
    R"re("(?:name|key)"\s*:\s*"$KEY")re";

std::unique_ptr<const RE2> Compile(absl::string_view pattern,
                                   absl::string_view key_alternation) {
  const std::string expanded = absl::StrReplaceAll(
      pattern, {{"$KEY", key_alternation}, {"$VALUE", kValue}});
  RE2::Options options;
  options.set_log_errors(false);
  return std::make_unique<const RE2>(expanded, options);
}

}  // namespace

PatternTable::PatternTable(const std::string &key_alternation)
    : name_value_pair_(Compile(kNameValuePairPattern, key_alternation)),
      cookie_header_(Compile(kCookieHeaderPattern, key_alternation)),
      curl_header_(Compile(kCurlHeaderPattern, key_alternation)),
      curl_cookie_flag_(Compile(kCurlCookieFlagPattern, key_alternation)),
      api_client_export_(Compile(kApiClientExportPattern, key_alternation)),
      json_name_first_(Compile(kJsonNameFirstPattern, key_alternation)),
      json_value_first_(Compile(kJsonValueFirstPattern, key_alternation)) {}

absl::StatusOr<std::unique_ptr<const PatternTable>> PatternTable::Create(
    absl::Span<const std::string> key_names) {
  if (key_names.empty()) {
    return absl::InvalidArgumentError("No session key names");
  }
  for (const std::string &key : key_names) {
    if (key.empty()) {
      return absl::InvalidArgumentError("Empty session key name");
    }
  }
  const std::string key_alternation = absl::StrCat(
      "(",
      absl::StrJoin(key_names, "|",
                    [](std::string *out, const std::string &key) {
                      absl::StrAppend(out, RE2::QuoteMeta(key));
                    }),
      ")");

  auto table = absl::WrapUnique(new PatternTable(key_alternation));
  for (const RE2 *re :
       {table->name_value_pair_.get(), table->cookie_header_.get(),
        table->curl_header_.get(), table->curl_cookie_flag_.get(),
        table->api_client_export_.get(), table->json_name_first_.get(),
        table->json_value_first_.get()}) {
    if (!re->ok()) {
      return absl::InternalError(
          absl::StrCat("Cannot compile ", re->pattern(), ": ", re->error()));
    }
    DCHECK_EQ(re->NumberOfCapturingGroups(), 2) << re->pattern();
  }
  TOKENSCOUT_VLOG(1) << "Compiled pattern table for " << key_names.size()
                     << " key names";
  return std::unique_ptr<const PatternTable>(std::move(table));
}

}  // namespace tokenscout
