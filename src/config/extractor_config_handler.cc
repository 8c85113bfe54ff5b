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
#include "config/extractor_config_handler.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/no_destructor.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "base/file_util.h"
#include "base/logging.h"
#include "google/protobuf/text_format.h"
#include "protocol/extractor_config.pb.h"

namespace tokenscout {
namespace config {
namespace {

bool IsValidKeyName(absl::string_view key) {
  if (key.empty()) {
    return false;
  }
  for (const char c : key) {
    if (!absl::ascii_islower(c) && !absl::ascii_isdigit(c) && c != '_' &&
        c != '-') {
      return false;
    }
  }
  return true;
}

absl::Status NormalizeKeyNames(ExtractorConfig *config) {
  if (config->session_key_names().empty()) {
    for (const absl::string_view key : kDefaultSessionKeyNames) {
      config->add_session_key_names(std::string(key));
    }
    return absl::OkStatus();
  }

  std::vector<std::string> keys;
  absl::flat_hash_set<std::string> seen;
  for (const std::string &raw_key : config->session_key_names()) {
    std::string key =
        absl::AsciiStrToLower(absl::StripAsciiWhitespace(raw_key));
    if (!IsValidKeyName(key)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid session key name: \"", raw_key, "\""));
    }
    if (seen.insert(key).second) {
      keys.push_back(std::move(key));
    }
  }
  config->clear_session_key_names();
  for (std::string &key : keys) {
    config->add_session_key_names(std::move(key));
  }
  return absl::OkStatus();
}

absl::Status CheckUnitInterval(absl::string_view name, double value) {
  if (value < 0.0 || value > 1.0) {
    return absl::InvalidArgumentError(
        absl::StrCat(name, " must be in [0, 1], got ", value));
  }
  return absl::OkStatus();
}

absl::Status CheckWeights(const ExtractorConfig::ConfidenceWeights &weights) {
  struct NamedWeight {
    absl::string_view name;
    double value;
  };
  const NamedWeight named_weights[] = {
      {"raw_base", weights.raw_base()},
      {"raw_typical_length_bonus", weights.raw_typical_length_bonus()},
      {"raw_hex_bonus", weights.raw_hex_bonus()},
      {"raw_hash_length_bonus", weights.raw_hash_length_bonus()},
      {"raw_cap", weights.raw_cap()},
      {"name_value_pair", weights.name_value_pair()},
      {"cookie_header_base", weights.cookie_header_base()},
      {"cookie_header_per_entry", weights.cookie_header_per_entry()},
      {"cookie_header_cap", weights.cookie_header_cap()},
      {"curl_command", weights.curl_command()},
      {"api_client_export", weights.api_client_export()},
      {"json_well_formed", weights.json_well_formed()},
      {"json_malformed", weights.json_malformed()},
  };
  for (const NamedWeight &weight : named_weights) {
    if (absl::Status status = CheckUnitInterval(weight.name, weight.value);
        !status.ok()) {
      return status;
    }
  }
  if (weights.raw_typical_min_length() > weights.raw_typical_max_length()) {
    return absl::InvalidArgumentError(
        "raw_typical_min_length must not exceed raw_typical_max_length");
  }
  return absl::OkStatus();
}

ExtractorConfig CreateDefaultConfig() {
  ExtractorConfig config;
  // The stock config only lacks the key names.
  CHECK_OK(ExtractorConfigHandler::NormalizeConfig(&config));
  return config;
}

}  // namespace

const ExtractorConfig &ExtractorConfigHandler::DefaultConfig() {
  return *GetSharedDefaultConfig();  // NOLINT: The referenced object has static
                                     // lifetime.
}

std::shared_ptr<const ExtractorConfig>
ExtractorConfigHandler::GetSharedDefaultConfig() {
  static absl::NoDestructor<std::shared_ptr<const ExtractorConfig>>
      kDefaultSharedConfig(
          std::make_shared<const ExtractorConfig>(CreateDefaultConfig()));
  return *kDefaultSharedConfig;
}

absl::StatusOr<ExtractorConfig> ExtractorConfigHandler::ParseConfig(
    absl::string_view text_proto) {
  ExtractorConfig config;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(text_proto),
                                                     &config)) {
    return absl::InvalidArgumentError("Cannot parse ExtractorConfig text");
  }
  if (absl::Status status = NormalizeConfig(&config); !status.ok()) {
    return status;
  }
  return config;
}

absl::StatusOr<ExtractorConfig> ExtractorConfigHandler::LoadConfig(
    const std::string &filename) {
  TOKENSCOUT_VLOG(1) << "Loading extractor config: " << filename;
  absl::StatusOr<std::string> content = FileUtil::GetContents(filename);
  if (!content.ok()) {
    return content.status();
  }
  absl::StatusOr<ExtractorConfig> config = ParseConfig(*content);
  if (!config.ok()) {
    LOG(ERROR) << "Invalid extractor config " << filename << ": "
               << config.status();
  }
  return config;
}

absl::Status ExtractorConfigHandler::NormalizeConfig(ExtractorConfig *config) {
  DCHECK(config);
  if (config->min_token_length() < 1) {
    return absl::InvalidArgumentError("min_token_length must be positive");
  }
  if (config->max_token_length() < config->min_token_length()) {
    return absl::InvalidArgumentError(
        "max_token_length must not be smaller than min_token_length");
  }
  if (config->max_processing_length() < config->max_token_length()) {
    return absl::InvalidArgumentError(
        "max_processing_length must not be smaller than max_token_length");
  }
  if (config->verbose_level() < 0) {
    return absl::InvalidArgumentError("verbose_level must not be negative");
  }
  if (absl::Status status = CheckUnitInterval(
          "high_confidence_threshold", config->high_confidence_threshold());
      !status.ok()) {
    return status;
  }
  if (absl::Status status = CheckWeights(config->weights()); !status.ok()) {
    return status;
  }
  return NormalizeKeyNames(config);
}

}  // namespace config
}  // namespace tokenscout
