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

#ifndef TOKENSCOUT_EXTRACTOR_PATTERN_TABLE_H_
#define TOKENSCOUT_EXTRACTOR_PATTERN_TABLE_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "re2/re2.h"

namespace tokenscout {

// Compiled matchers shared by the format detectors.
//
// Every pattern has exactly two capturing groups, the recognized key name and
// the candidate value. They appear in that order except for
// json_value_first(), where the value comes first. The table is immutable
// once created, and RE2 matching through a const reference is thread-safe.
class PatternTable {
 public:
  PatternTable(const PatternTable &) = delete;
  PatternTable &operator=(const PatternTable &) = delete;

  // Builds the table for the given session key names. The names are quoted,
  // so any non-empty name is accepted literally.
  static absl::StatusOr<std::unique_ptr<const PatternTable>> Create(
      absl::Span<const std::string> key_names);

  // <key> = <value> standing alone on its line.
  const RE2 &name_value_pair() const { return *name_value_pair_; }
  // <key>=<value> terminated by ';' or the end of a line.
  const RE2 &cookie_header() const { return *cookie_header_; }
  // -H/--header 'Cookie: ... <key>=<value>'
  const RE2 &curl_header() const { return *curl_header_; }
  // -b/--cookie '... <key>=<value>'
  const RE2 &curl_cookie_flag() const { return *curl_cookie_flag_; }
  // "key": "Cookie"|"Authorization" ... "value": "... <key>=<value>"
  const RE2 &api_client_export() const { return *api_client_export_; }
  // "name"|"key": "<key>" ... "value"|"string": "<value>"
  const RE2 &json_name_first() const { return *json_name_first_; }
  // "value"|"string": "<value>" ... "name"|"key": "<key>"
  const RE2 &json_value_first() const { return *json_value_first_; }

 private:
  explicit PatternTable(const std::string &key_alternation);

  std::unique_ptr<const RE2> name_value_pair_;
  std::unique_ptr<const RE2> cookie_header_;
  std::unique_ptr<const RE2> curl_header_;
  std::unique_ptr<const RE2> curl_cookie_flag_;
  std::unique_ptr<const RE2> api_client_export_;
  std::unique_ptr<const RE2> json_name_first_;
  std::unique_ptr<const RE2> json_value_first_;
};

}  // namespace tokenscout

#endif  // TOKENSCOUT_EXTRACTOR_PATTERN_TABLE_H_
