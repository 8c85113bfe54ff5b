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

#ifndef TOKENSCOUT_EXTRACTOR_TOKEN_VALIDATOR_H_
#define TOKENSCOUT_EXTRACTOR_TOKEN_VALIDATOR_H_

#include <cstddef>

#include "absl/strings/string_view.h"

namespace tokenscout {

inline constexpr size_t kDefaultMinTokenLength = 8;
inline constexpr size_t kDefaultMaxTokenLength = 256;

// Shortest string accepted by the generic token shape.
inline constexpr size_t kGenericTokenMinLength = 8;

// Decides whether a string is shaped like a plausible session token.
//
// A string passes when, after trimming surrounding ASCII whitespace,
//  - its length is within [min_length, max_length],
//  - every character is an ASCII letter, a digit, '-', '_', '.' or '=', and
//  - it is hex-like, base64-like or a generic token.
//
// The validator holds no state besides the bounds and is safe to share
// between threads.
class TokenValidator {
 public:
  constexpr TokenValidator()
      : TokenValidator(kDefaultMinTokenLength, kDefaultMaxTokenLength) {}
  constexpr TokenValidator(size_t min_length, size_t max_length)
      : min_length_(min_length), max_length_(max_length) {}

  bool IsValidTokenShape(absl::string_view candidate) const;

  size_t min_length() const { return min_length_; }
  size_t max_length() const { return max_length_; }

  // Character classes.
  static bool IsTokenChar(char c);
  static bool IsHexChar(char c);
  static bool IsBase64Char(char c);

  // Shape families. All of them reject the empty string.
  //
  // [0-9a-fA-F_-]+
  static bool IsHexLike(absl::string_view s);
  // [A-Za-z0-9+/=_-]+
  static bool IsBase64Like(absl::string_view s);
  // At least kGenericTokenMinLength token characters.
  static bool IsGenericToken(absl::string_view s);

 private:
  size_t min_length_;
  size_t max_length_;
};

// Validates with the default bounds.
bool IsValidTokenShape(absl::string_view candidate);

}  // namespace tokenscout

#endif  // TOKENSCOUT_EXTRACTOR_TOKEN_VALIDATOR_H_
