// Copyright 2025 The TensorStore Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "omfile/read_options.h"

#include <stdint.h>

#include <optional>
#include <ostream>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "omfile/internal/env.h"

ABSL_FLAG(std::optional<uint64_t>, omfile_io_size_max, std::nullopt,
          "Maximum size in bytes of a single coalesced read. "
          "Overrides OMFILE_IO_SIZE_MAX.");

ABSL_FLAG(std::optional<uint64_t>, omfile_io_size_merge, std::nullopt,
          "Maximum gap in bytes between two ranges merged into one read. "
          "Overrides OMFILE_IO_SIZE_MERGE.");

namespace omfile {

ReadOptions ReadOptions::Default() {
  ReadOptions options;
  if (auto v = internal::GetFlagOrEnvValue(FLAGS_omfile_io_size_max,
                                           "OMFILE_IO_SIZE_MAX")) {
    options.io_size_max = *v;
  }
  if (auto v = internal::GetFlagOrEnvValue(FLAGS_omfile_io_size_merge,
                                           "OMFILE_IO_SIZE_MERGE")) {
    options.io_size_merge = *v;
  }
  return options;
}

absl::Status ReadOptions::Validate() const {
  if (io_size_max == 0) {
    return absl::InvalidArgumentError("io_size_max must be positive");
  }
  return absl::OkStatus();
}

std::ostream& operator<<(std::ostream& os, const ReadOptions& x) {
  return os << "{io_size_max=" << x.io_size_max
            << ", io_size_merge=" << x.io_size_merge << "}";
}

}  // namespace omfile
