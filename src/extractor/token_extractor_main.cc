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

// Finds the session token in a piece of pasted text.
//
// example:
// pbpaste | ./token_extractor_main --mode=all
// ./token_extractor_main --input=request.txt --value_only
//
// Exits with 0 when a token is found, 1 when there is none and 2 on errors.

#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/status/statusor.h"
#include "base/file_util.h"
#include "base/init_tokenscout.h"
#include "base/logging.h"
#include "config/extractor_config_handler.h"
#include "extractor/candidate.h"
#include "extractor/session_token_extractor.h"
#include "protocol/extractor_config.pb.h"

ABSL_FLAG(std::string, input, "", "input file name (default: stdin)");
ABSL_FLAG(std::string, config, "", "text-format ExtractorConfig file");
ABSL_FLAG(std::string, mode, "best",
          "\"best\" prints the first match, \"all\" prints every candidate");
ABSL_FLAG(bool, value_only, false, "prints only the token values");

namespace tokenscout {
namespace {

constexpr int kExitFound = 0;
constexpr int kExitNotFound = 1;
constexpr int kExitError = 2;

void PrintCandidate(const Candidate &candidate) {
  if (absl::GetFlag(FLAGS_value_only)) {
    std::cout << candidate.token_value << std::endl;
    return;
  }
  std::cout << DescribeCandidate(candidate) << std::endl;
  std::cout << "  " << candidate.DebugString() << std::endl;
}

int Run() {
  config::ExtractorConfig extractor_config =
      config::ExtractorConfigHandler::DefaultConfig();
  if (!absl::GetFlag(FLAGS_config).empty()) {
    absl::StatusOr<config::ExtractorConfig> loaded =
        config::ExtractorConfigHandler::LoadConfig(absl::GetFlag(FLAGS_config));
    if (!loaded.ok()) {
      LOG(ERROR) << loaded.status();
      return kExitError;
    }
    extractor_config = *std::move(loaded);
  }

  absl::StatusOr<std::unique_ptr<const SessionTokenExtractor>> extractor =
      SessionTokenExtractor::Create(extractor_config);
  if (!extractor.ok()) {
    LOG(ERROR) << extractor.status();
    return kExitError;
  }

  std::string text;
  if (absl::GetFlag(FLAGS_input).empty()) {
    text.assign(std::istreambuf_iterator<char>(std::cin),
                std::istreambuf_iterator<char>());
  } else {
    absl::StatusOr<std::string> contents =
        FileUtil::GetContents(absl::GetFlag(FLAGS_input));
    if (!contents.ok()) {
      LOG(ERROR) << contents.status();
      return kExitError;
    }
    text = *std::move(contents);
  }

  const std::string mode = absl::GetFlag(FLAGS_mode);
  if (mode == "best") {
    const std::optional<Candidate> best = (*extractor)->ExtractBest(text);
    if (!best.has_value()) {
      return kExitNotFound;
    }
    PrintCandidate(*best);
    if (!absl::GetFlag(FLAGS_value_only) &&
        (*extractor)->IsHighConfidence(*best)) {
      std::cout << "  (high confidence)" << std::endl;
    }
    return kExitFound;
  }
  if (mode == "all") {
    const std::vector<Candidate> candidates = (*extractor)->AnalyzeAll(text);
    for (const Candidate &candidate : candidates) {
      PrintCandidate(candidate);
    }
    return candidates.empty() ? kExitNotFound : kExitFound;
  }

  LOG(ERROR) << "Unknown --mode: " << mode;
  return kExitError;
}

}  // namespace
}  // namespace tokenscout

int main(int argc, char *argv[]) {
  const std::vector<std::string> args = tokenscout::InitTokenScout(argc, argv);

  if (absl::GetFlag(FLAGS_input).empty() && !args.empty()) {
    absl::SetFlag(&FLAGS_input, args[0]);
  }

  return tokenscout::Run();
}
