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

#include "omfile/internal/compression/zlib.h"

#include <stddef.h>

#include <limits>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "omfile/internal/compression/cord_stream_manager.h"
#include "omfile/util/status.h"

// Include zlib header last because it defines a bunch of poorly-named macros.
#include <zlib.h>

namespace omfile {
namespace zlib {
namespace {

struct InflateOp {
  static int Init(z_stream* s, [[maybe_unused]] int level) {
    return inflateInit(s);
  }
  static int Process(z_stream* s, int flags) { return inflate(s, flags); }
  static int Destroy(z_stream* s) { return inflateEnd(s); }
  static constexpr bool kDataErrorPossible = true;
};

struct DeflateOp {
  static int Init(z_stream* s, int level) { return deflateInit(s, level); }
  static int Process(z_stream* s, int flags) { return deflate(s, flags); }
  static int Destroy(z_stream* s) { return deflateEnd(s); }
  static constexpr bool kDataErrorPossible = false;
};

/// Inflates or deflates `input` using zlib, appending to `*output`.
///
/// \tparam Op Either `InflateOp` or `DeflateOp`.
template <typename Op>
absl::Status ProcessZlib(const absl::Cord& input, absl::Cord* output,
                         int level, size_t max_output_size) {
  z_stream s = {};
  internal::CordStreamManager<z_stream, /*BufferSize=*/16 * 1024>
      stream_manager(s, input, output);
  int err = Op::Init(&s, level);
  if (err != Z_OK) {
    return absl::ResourceExhaustedError(
        absl::StrCat("Failed to initialize zlib stream: ", err));
  }
  struct StreamDestroyer {
    z_stream* s;
    ~StreamDestroyer() { Op::Destroy(s); }
  } stream_destroyer{&s};

  while (true) {
    const bool input_complete = stream_manager.FeedInputAndOutputBuffers();
    err = Op::Process(&s, input_complete ? Z_FINISH : Z_NO_FLUSH);
    const bool made_progress = stream_manager.HandleOutput();
    if (stream_manager.output_size() > max_output_size) {
      return absl::InvalidArgumentError(absl::StrCat(
          "zlib-compressed data exceeds ", max_output_size, " bytes"));
    }
    if (err == Z_OK) continue;
    if (err == Z_BUF_ERROR && made_progress) continue;
    break;
  }
  switch (err) {
    case Z_STREAM_END:
      if (!stream_manager.has_input_remaining()) {
        return absl::OkStatus();
      }
      [[fallthrough]];
    case Z_NEED_DICT:
    case Z_DATA_ERROR:
    case Z_BUF_ERROR:
      if (Op::kDataErrorPossible) {
        return absl::InvalidArgumentError(
            "Error decoding zlib-compressed data");
      }
      [[fallthrough]];
    default:
      return absl::InternalError(
          absl::StrCat("Unexpected zlib status: ", err));
  }
}

}  // namespace

void Encode(const absl::Cord& input, absl::Cord* output, int level) {
  OMFILE_CHECK_OK(ProcessZlib<DeflateOp>(input, output, level,
                                         std::numeric_limits<size_t>::max()));
}

absl::Status Decode(const absl::Cord& input, absl::Cord* output,
                    size_t max_output_size) {
  return ProcessZlib<InflateOp>(input, output, 0, max_output_size);
}

}  // namespace zlib
}  // namespace omfile
