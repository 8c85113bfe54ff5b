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

#include "extractor/token_validator.h"

#include <algorithm>

#include "absl/strings/ascii.h"
#include "absl/strings/string_view.h"

namespace tokenscout {
namespace {

template <typename Predicate>
bool AllOf(absl::string_view s, Predicate predicate) {
  return !s.empty() && std::all_of(s.begin(), s.end(), predicate);
}

}  // namespace

bool TokenValidator::IsTokenChar(char c) {
  return absl::ascii_isalnum(c) || c == '-' || c == '_' || c == '.' ||
         c == '=';
}

bool TokenValidator::IsHexChar(char c) { return absl::ascii_isxdigit(c); }

bool TokenValidator::IsBase64Char(char c) {
  return absl::ascii_isalnum(c) || c == '+' || c == '/' || c == '=' ||
         c == '_' || c == '-';
}

bool TokenValidator::IsHexLike(absl::string_view s) {
  return AllOf(s, [](char c) { return IsHexChar(c) || c == '-' || c == '_'; });
}

bool TokenValidator::IsBase64Like(absl::string_view s) {
  return AllOf(s, IsBase64Char);
}

bool TokenValidator::IsGenericToken(absl::string_view s) {
  return s.size() >= kGenericTokenMinLength && AllOf(s, IsTokenChar);
}

bool TokenValidator::IsValidTokenShape(absl::string_view candidate) const {
  const absl::string_view trimmed = absl::StripAsciiWhitespace(candidate);
  if (trimmed.size() < min_length_ || trimmed.size() > max_length_) {
    return false;
  }
  if (!AllOf(trimmed, IsTokenChar)) {
    return false;
  }
  return IsHexLike(trimmed) || IsBase64Like(trimmed) ||
         IsGenericToken(trimmed);
}

bool IsValidTokenShape(absl::string_view candidate) {
  static constexpr TokenValidator kValidator;
  return kValidator.IsValidTokenShape(candidate);
}

}  // namespace tokenscout
