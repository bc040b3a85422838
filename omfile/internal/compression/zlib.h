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

#ifndef OMFILE_INTERNAL_COMPRESSION_ZLIB_H_
#define OMFILE_INTERNAL_COMPRESSION_ZLIB_H_

/// \file
/// Entropy stage of the compressed chunk codecs, backed by zlib.

#include <stddef.h>

#include "absl/status/status.h"
#include "absl/strings/cord.h"

namespace omfile {
namespace zlib {

/// Compresses `input` and appends the zlib stream to `*output`.
///
/// \param level Compression level in `[-1, 9]`; `-1` selects the zlib
///     default.
void Encode(const absl::Cord& input, absl::Cord* output, int level = -1);

/// Decompresses the zlib stream `input` and appends the result to `*output`.
///
/// \param max_output_size Upper bound on the number of bytes produced.
/// \error `absl::StatusCode::kInvalidArgument` if `input` is corrupt,
///     truncated, followed by trailing bytes, or decodes to more than
///     `max_output_size` bytes.
absl::Status Decode(const absl::Cord& input, absl::Cord* output,
                    size_t max_output_size);

}  // namespace zlib
}  // namespace omfile

#endif  // OMFILE_INTERNAL_COMPRESSION_ZLIB_H_
