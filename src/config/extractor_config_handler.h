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

// Handler of the extractor configuration.

#ifndef TOKENSCOUT_CONFIG_EXTRACTOR_CONFIG_HANDLER_H_
#define TOKENSCOUT_CONFIG_EXTRACTOR_CONFIG_HANDLER_H_

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "protocol/extractor_config.pb.h"

namespace tokenscout {
namespace config {

// Key names recognized when the config does not list any.
inline constexpr absl::string_view kDefaultSessionKeyNames[] = {
    "sessionid", "session_id", "aflsession", "auth_token"};

// This is pure static class.  All public static methods are thread-safe.
class ExtractorConfigHandler {
 public:
  ExtractorConfigHandler() = delete;
  ExtractorConfigHandler(const ExtractorConfigHandler &) = delete;
  ExtractorConfigHandler &operator=(const ExtractorConfigHandler &) = delete;

  // Returns the normalized default config. The instance is built once and
  // never changes.
  static const ExtractorConfig &DefaultConfig();
  static std::shared_ptr<const ExtractorConfig> GetSharedDefaultConfig();

  // Parses a text-format ExtractorConfig and normalizes it.
  static absl::StatusOr<ExtractorConfig> ParseConfig(
      absl::string_view text_proto);

  // Reads and parses a text-format ExtractorConfig file.
  static absl::StatusOr<ExtractorConfig> LoadConfig(
      const std::string &filename);

  // Fills the stock key names when none are given, lowercases and
  // deduplicates the key names, then validates the bounds and weights.
  // Returns InvalidArgument when the config cannot be used.
  static absl::Status NormalizeConfig(ExtractorConfig *config);
};

}  // namespace config
}  // namespace tokenscout

#endif  // TOKENSCOUT_CONFIG_EXTRACTOR_CONFIG_HANDLER_H_
