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

#include "omfile/format/header.h"

#include <stdint.h>

#include <ostream>
#include <string>

#include "absl/base/internal/endian.h"
#include "absl/strings/cord.h"
#include "omfile/byte_range.h"
#include "omfile/errors.h"
#include "omfile/util/result.h"
#include "omfile/util/str_cat.h"

namespace omfile {

std::ostream& operator<<(std::ostream& os, HeaderType t) {
  switch (t) {
    case HeaderType::kInvalid:
      return os << "invalid";
    case HeaderType::kLegacy:
      return os << "legacy";
    case HeaderType::kTrailerAddressed:
      return os << "trailer-addressed";
  }
  return os << "<unknown>";
}

HeaderType GetHeaderType(const absl::Cord& header) {
  if (header.size() < 3) return HeaderType::kInvalid;
  char prefix[3];
  header.Subcord(0, 3).CopyToArray(prefix);
  if (prefix[0] != kMagic0 || prefix[1] != kMagic1) {
    return HeaderType::kInvalid;
  }
  switch (static_cast<uint8_t>(prefix[2])) {
    case kLegacyVersion1:
    case kLegacyVersion2:
      return HeaderType::kLegacy;
    case kTrailerVersion:
      return HeaderType::kTrailerAddressed;
    default:
      return HeaderType::kInvalid;
  }
}

Result<OffsetSize> DecodeTrailer(const absl::Cord& trailer) {
  if (trailer.size() != kTrailerSize) {
    return InvalidTrailerError(omfile::StrCat("Expected ", kTrailerSize,
                                              " trailer bytes, but received ",
                                              trailer.size()));
  }
  std::string flat(trailer);
  const char* p = flat.data();
  if (p[0] != kMagic0 || p[1] != kMagic1 ||
      static_cast<uint8_t>(p[2]) != kTrailerVersion) {
    return InvalidTrailerError("Trailer magic does not match");
  }
  OffsetSize root;
  root.offset = absl::little_endian::Load64(p + 8);
  root.size = absl::little_endian::Load64(p + 16);
  if (root.size == 0 || root.Overflows()) {
    return InvalidTrailerError(
        omfile::StrCat("Trailer specifies invalid root location ", root));
  }
  return root;
}

Result<ByteRange> GetTrailerByteRange(uint64_t file_size) {
  if (file_size < kTrailerAddressedHeaderSize + kTrailerSize) {
    return InvalidTrailerError(omfile::StrCat(
        "File of ", file_size, " bytes is too small to contain a trailer"));
  }
  return ByteRange{file_size - kTrailerSize, file_size};
}

}  // namespace omfile
