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

#ifndef OMFILE_INTERNAL_COMPRESSION_CORD_STREAM_MANAGER_H_
#define OMFILE_INTERNAL_COMPRESSION_CORD_STREAM_MANAGER_H_

#include <stddef.h>

#include <algorithm>
#include <limits>
#include <string_view>

#include "absl/strings/cord.h"

namespace omfile {
namespace internal {

/// Binds the input and output of a zlib-style stream to cords.
///
/// \tparam Stream The stream type, which must have `next_in`, `avail_in`,
///     `next_out`, and `avail_out` members.
template <typename Stream, size_t BufferSize>
class CordStreamManager {
 public:
  explicit CordStreamManager(Stream& stream, const absl::Cord& input,
                             absl::Cord* output)
      : stream_(stream),
        output_(output),
        char_it_(input.char_begin()),
        input_remaining_(input.size()) {}

  /// Points the stream at the next input fragment and at an empty output
  /// buffer.  Returns `true` once the fragment is the last of the input.
  bool FeedInputAndOutputBuffers() {
    stream_.next_out = reinterpret_cast<decltype(stream_.next_out)>(buffer_);
    stream_.avail_out = BufferSize;
    cur_chunk_ = nullptr;
    if (input_remaining_) {
      std::string_view chunk = absl::Cord::ChunkRemaining(char_it_);
      using Count = decltype(stream_.avail_in);
      cur_chunk_ = chunk.data();
      stream_.next_in = reinterpret_cast<decltype(stream_.next_in)>(
          const_cast<char*>(chunk.data()));
      stream_.avail_in = static_cast<Count>(
          std::min(static_cast<size_t>(std::numeric_limits<Count>::max()),
                   chunk.size()));
    }
    return static_cast<size_t>(stream_.avail_in) == input_remaining_;
  }

  /// Appends the produced bytes to the output cord and advances the input.
  ///
  /// Returns `true` if any input was consumed or output produced.
  bool HandleOutput() {
    const size_t produced = BufferSize - stream_.avail_out;
    output_->Append(std::string_view(buffer_, produced));
    output_size_ += produced;
    if (cur_chunk_) {
      size_t consumed =
          reinterpret_cast<const char*>(stream_.next_in) - cur_chunk_;
      absl::Cord::Advance(&char_it_, consumed);
      input_remaining_ -= consumed;
      if (consumed) return true;
    }
    return produced != 0;
  }

  bool has_input_remaining() const { return input_remaining_ != 0; }

  /// Number of bytes appended to the output so far.
  size_t output_size() const { return output_size_; }

 private:
  char buffer_[BufferSize];
  Stream& stream_;
  absl::Cord* output_;
  absl::Cord::CharIterator char_it_;
  size_t input_remaining_;
  size_t output_size_ = 0;
  const char* cur_chunk_ = nullptr;
};

}  // namespace internal
}  // namespace omfile

#endif  // OMFILE_INTERNAL_COMPRESSION_CORD_STREAM_MANAGER_H_
