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

#ifndef OMFILE_FORMAT_HEADER_H_
#define OMFILE_FORMAT_HEADER_H_

/// \file
/// Classification of the file header and decoding of the trailer.
///
/// Every file starts with the magic bytes `'O','M'` followed by a version
/// byte.  Versions 1 and 2 are legacy files whose single 2D variable is
/// described by the header itself.  Version 3 files store the location of
/// the root metadata record in a trailer at the end of the file:
///
///     'O' 'M' 0x03 0x00 0x00 0x00 0x00 0x00   magic, version, padding
///     u64 root_offset
///     u64 root_size

#include <stddef.h>
#include <stdint.h>

#include <iosfwd>

#include "absl/strings/cord.h"
#include "omfile/byte_range.h"
#include "omfile/util/result.h"

namespace omfile {

enum class HeaderType {
  kInvalid,
  kLegacy,
  kTrailerAddressed,
};

std::ostream& operator<<(std::ostream& os, HeaderType t);

constexpr char kMagic0 = 'O';
constexpr char kMagic1 = 'M';
constexpr uint8_t kLegacyVersion1 = 1;
constexpr uint8_t kLegacyVersion2 = 2;
constexpr uint8_t kTrailerVersion = 3;

/// Number of bytes fetched from offset 0 to classify a file.  Equal to the
/// size of the legacy header, so that legacy files need no second fetch.
constexpr size_t kHeaderSize = 40;

/// Size of the header written at the start of a trailer-addressed file.
constexpr size_t kTrailerAddressedHeaderSize = 8;

constexpr size_t kTrailerSize = 24;

/// Classifies a file from its first bytes.  Fewer than 3 bytes, a wrong
/// magic, or an unknown version give `HeaderType::kInvalid`.
HeaderType GetHeaderType(const absl::Cord& header);

/// Decodes the trailer of a trailer-addressed file.
///
/// \error `ErrorKind::kInvalidTrailer` if `trailer` is not
///     `kTrailerSize` bytes, its magic or version does not match, or the root
///     location is empty or overflows.
Result<OffsetSize> DecodeTrailer(const absl::Cord& trailer);

/// Returns the byte range of the trailer in a file of `file_size` bytes.
///
/// \error `ErrorKind::kInvalidTrailer` if the file is too small to hold a
///     header and a trailer.
Result<ByteRange> GetTrailerByteRange(uint64_t file_size);

}  // namespace omfile

#endif  // OMFILE_FORMAT_HEADER_H_
