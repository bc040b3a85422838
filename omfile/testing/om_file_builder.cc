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

#include "omfile/testing/om_file_builder.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/base/casts.h"
#include "absl/strings/cord.h"
#include "absl/types/span.h"
#include "omfile/byte_range.h"
#include "omfile/format/compression.h"
#include "omfile/format/data_type.h"
#include "omfile/format/header.h"
#include "omfile/internal/compression/zlib.h"
#include "omfile/util/iterate_over_index_range.h"

namespace omfile {
namespace internal_testing {
namespace {

template <typename T>
void PutValue(std::string& dst, T v) {
  if constexpr (sizeof(T) == 1) {
    dst.push_back(static_cast<char>(v));
  } else if constexpr (sizeof(T) == 2) {
    PutLE16(dst, absl::bit_cast<uint16_t>(v));
  } else if constexpr (sizeof(T) == 4) {
    PutLE32(dst, absl::bit_cast<uint32_t>(v));
  } else {
    PutLE64(dst, absl::bit_cast<uint64_t>(v));
  }
}

// Replaces every row but the first by its difference to the previous row.
template <typename U>
void DeltaEncode2d(std::vector<U>& values, size_t cols) {
  const size_t rows = values.size() / cols;
  for (size_t r = rows; r-- > 1;) {
    for (size_t c = 0; c < cols; ++c) {
      values[r * cols + c] =
          static_cast<U>(values[r * cols + c] - values[(r - 1) * cols + c]);
    }
  }
}

template <typename U>
void XorEncode2d(std::vector<U>& values, size_t cols) {
  const size_t rows = values.size() / cols;
  for (size_t r = rows; r-- > 1;) {
    for (size_t c = 0; c < cols; ++c) {
      values[r * cols + c] ^= values[(r - 1) * cols + c];
    }
  }
}

template <typename T>
uint16_t QuantizeInt16(T value, double scale_factor, double add_offset,
                       bool logarithmic) {
  if (std::isnan(value)) {
    return static_cast<uint16_t>(std::numeric_limits<int16_t>::max());
  }
  double v = value;
  if (logarithmic) v = std::log10(1 + v);
  const double x = std::clamp(
      std::round((v + add_offset) * scale_factor),
      static_cast<double>(std::numeric_limits<int16_t>::min()),
      static_cast<double>(std::numeric_limits<int16_t>::max() - 1));
  return static_cast<uint16_t>(static_cast<int16_t>(x));
}

// Returns the elements of the chunk at `origin`, `shape` in row-major order.
template <typename T>
std::vector<T> GatherChunk(absl::Span<const T> values,
                           absl::Span<const uint64_t> dimensions,
                           absl::Span<const uint64_t> origin,
                           absl::Span<const uint64_t> shape) {
  std::vector<uint64_t> strides(dimensions.size());
  uint64_t stride = 1;
  for (size_t i = dimensions.size(); i-- > 0;) {
    strides[i] = stride;
    stride *= dimensions[i];
  }
  std::vector<T> result;
  IterateOverIndexRange(origin, shape, [&](absl::Span<const uint64_t> pos) {
    uint64_t index = 0;
    for (size_t i = 0; i < pos.size(); ++i) index += pos[i] * strides[i];
    result.push_back(values[index]);
  });
  return result;
}

// Invokes `func(origin, shape)` for every chunk in row-major grid order.
template <typename Func>
void ForEachChunk(absl::Span<const uint64_t> dimensions,
                  absl::Span<const uint64_t> chunks, Func func) {
  const size_t rank = dimensions.size();
  std::vector<uint64_t> grid(rank), zero(rank, 0);
  for (size_t i = 0; i < rank; ++i) {
    grid[i] = (dimensions[i] + chunks[i] - 1) / chunks[i];
  }
  IterateOverIndexRange(zero, grid, [&](absl::Span<const uint64_t> g) {
    std::vector<uint64_t> origin(rank), shape(rank);
    for (size_t i = 0; i < rank; ++i) {
      origin[i] = g[i] * chunks[i];
      shape[i] = std::min(chunks[i], dimensions[i] - origin[i]);
    }
    func(absl::Span<const uint64_t>(origin),
         absl::Span<const uint64_t>(shape));
  });
}

}  // namespace

void PutLE16(std::string& dst, uint16_t v) {
  dst.push_back(static_cast<char>(v & 0xff));
  dst.push_back(static_cast<char>((v >> 8) & 0xff));
}

void PutLE32(std::string& dst, uint32_t v) {
  PutLE16(dst, static_cast<uint16_t>(v & 0xffff));
  PutLE16(dst, static_cast<uint16_t>(v >> 16));
}

void PutLE64(std::string& dst, uint64_t v) {
  PutLE32(dst, static_cast<uint32_t>(v & 0xffffffff));
  PutLE32(dst, static_cast<uint32_t>(v >> 32));
}

void PutF32(std::string& dst, float v) {
  PutLE32(dst, absl::bit_cast<uint32_t>(v));
}

void PutF64(std::string& dst, double v) {
  PutLE64(dst, absl::bit_cast<uint64_t>(v));
}

template <typename T>
std::string EncodeChunk(CompressionType compression, double scale_factor,
                        double add_offset, absl::Span<const T> values,
                        size_t cols) {
  std::string raw;
  bool transformed = false;
  switch (compression) {
    case CompressionType::kNone:
      for (T v : values) PutValue(raw, v);
      return raw;
    case CompressionType::kPforDelta2dInt16:
    case CompressionType::kPforDelta2dInt16Logarithmic:
      if constexpr (std::is_floating_point_v<T>) {
        const bool logarithmic =
            compression == CompressionType::kPforDelta2dInt16Logarithmic;
        std::vector<uint16_t> q;
        for (T v : values) {
          q.push_back(
              QuantizeInt16(v, scale_factor, add_offset, logarithmic));
        }
        DeltaEncode2d(q, cols);
        for (uint16_t v : q) PutLE16(raw, v);
        transformed = true;
      }
      break;
    case CompressionType::kFpxXor2d:
      if constexpr (std::is_floating_point_v<T>) {
        using Bits = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
        std::vector<Bits> bits;
        for (T v : values) bits.push_back(absl::bit_cast<Bits>(v));
        XorEncode2d(bits, cols);
        for (Bits v : bits) PutValue(raw, v);
        transformed = true;
      }
      break;
    case CompressionType::kPforDelta2d:
      if constexpr (std::is_integral_v<T>) {
        using U = std::make_unsigned_t<T>;
        std::vector<U> u;
        for (T v : values) u.push_back(static_cast<U>(v));
        DeltaEncode2d(u, cols);
        for (U v : u) PutValue(raw, v);
        transformed = true;
      }
      break;
  }
  if (!transformed) {
    // Combinations that readers reject; store the plain elements.
    for (T v : values) PutValue(raw, v);
  }
  absl::Cord encoded;
  zlib::Encode(absl::Cord(raw), &encoded);
  return std::string(encoded);
}

std::string EncodeRecord(const RecordSpec& spec) {
  std::string r;
  r.push_back(static_cast<char>(spec.data_type));
  r.push_back(static_cast<char>(spec.compression));
  PutLE16(r, static_cast<uint16_t>(spec.name.size()));
  PutLE32(r, static_cast<uint32_t>(spec.children.size()));
  PutF64(r, spec.scale_factor);
  PutF64(r, spec.add_offset);
  PutLE64(r, spec.dimensions.size());
  for (uint64_t d : spec.dimensions) PutLE64(r, d);
  for (uint64_t c : spec.chunks) PutLE64(r, c);
  PutLE64(r, spec.index_offset);
  for (const OffsetSize& child : spec.children) {
    PutLE64(r, child.offset);
    PutLE64(r, child.size);
  }
  r += spec.name;
  r += spec.payload;
  return r;
}

std::string EncodeTrailer(OffsetSize root) {
  std::string t = {kMagic0, kMagic1, static_cast<char>(kTrailerVersion)};
  t.resize(8, '\0');
  PutLE64(t, root.offset);
  PutLE64(t, root.size);
  return t;
}

OmFileBuilder::OmFileBuilder() {
  data_ = {kMagic0, kMagic1, static_cast<char>(kTrailerVersion)};
  data_.resize(kTrailerAddressedHeaderSize, '\0');
}

OffsetSize OmFileBuilder::AddRaw(std::string_view bytes) {
  OffsetSize location{data_.size(), bytes.size()};
  data_.append(bytes.data(), bytes.size());
  return location;
}

OffsetSize OmFileBuilder::AddRecord(const RecordSpec& spec) {
  return AddRaw(EncodeRecord(spec));
}

template <typename T>
OffsetSize OmFileBuilder::AddArray(const ArraySpec& spec,
                                   absl::Span<const T> values) {
  std::vector<OffsetSize> payloads;
  ForEachChunk(spec.dimensions, spec.chunks,
               [&](absl::Span<const uint64_t> origin,
                   absl::Span<const uint64_t> shape) {
                 auto chunk =
                     GatherChunk(values, spec.dimensions, origin, shape);
                 payloads.push_back(AddRaw(EncodeChunk<T>(
                     spec.compression, spec.scale_factor, spec.add_offset,
                     chunk, shape.back())));
               });
  std::string index;
  for (const OffsetSize& p : payloads) {
    PutLE64(index, p.offset);
    PutLE64(index, p.size);
  }
  const OffsetSize index_location = AddRaw(index);
  RecordSpec record;
  record.data_type = kArrayDataType<T>;
  record.compression = spec.compression;
  record.scale_factor = spec.scale_factor;
  record.add_offset = spec.add_offset;
  record.dimensions = spec.dimensions;
  record.chunks = spec.chunks;
  record.index_offset = index_location.offset;
  record.children = spec.children;
  record.name = spec.name;
  return AddRecord(record);
}

template <typename T>
OffsetSize OmFileBuilder::AddScalar(std::string_view name, const T& value,
                                    std::vector<OffsetSize> children) {
  RecordSpec record;
  record.data_type = kScalarDataType<T>;
  record.children = std::move(children);
  record.name = std::string(name);
  if constexpr (std::is_same_v<T, std::string>) {
    PutLE64(record.payload, value.size());
    record.payload += value;
  } else {
    PutValue(record.payload, value);
  }
  return AddRecord(record);
}

OffsetSize OmFileBuilder::AddGroup(std::string_view name,
                                   std::vector<OffsetSize> children) {
  RecordSpec record;
  record.children = std::move(children);
  record.name = std::string(name);
  return AddRecord(record);
}

std::string OmFileBuilder::Build(OffsetSize root) const {
  return data_ + EncodeTrailer(root);
}

std::string MakeLegacyFile(uint8_t version, CompressionType compression,
                           float scale_factor,
                           absl::Span<const uint64_t> dimensions,
                           absl::Span<const uint64_t> chunks,
                           absl::Span<const float> values) {
  if (version == kLegacyVersion1) {
    compression = CompressionType::kPforDelta2dInt16;
  }
  std::vector<std::string> payloads;
  ForEachChunk(dimensions, chunks,
               [&](absl::Span<const uint64_t> origin,
                   absl::Span<const uint64_t> shape) {
                 auto chunk = GatherChunk(values, dimensions, origin, shape);
                 payloads.push_back(EncodeChunk<float>(
                     compression, scale_factor, 0, chunk, shape.back()));
               });
  std::string file = {kMagic0, kMagic1, static_cast<char>(version)};
  file.push_back(version == kLegacyVersion1
                     ? '\0'
                     : static_cast<char>(compression));
  PutF32(file, scale_factor);
  for (uint64_t d : dimensions) PutLE64(file, d);
  for (uint64_t c : chunks) PutLE64(file, c);
  uint64_t end = 0;
  for (const std::string& p : payloads) {
    end += p.size();
    PutLE64(file, end);
  }
  for (const std::string& p : payloads) file += p;
  return file;
}

std::string MakeGridFile() {
  std::vector<int32_t> values(25);
  for (int32_t i = 0; i < 25; ++i) values[i] = i;
  OmFileBuilder builder;
  ArraySpec spec;
  spec.name = "grid";
  spec.compression = CompressionType::kPforDelta2d;
  spec.dimensions = {5, 5};
  spec.chunks = {2, 2};
  auto root = builder.AddArray<int32_t>(spec, values);
  return builder.Build(root);
}

std::string MakeTreeFile() {
  OmFileBuilder builder;
  auto units = builder.AddScalar<std::string>("units", "K");

  std::vector<float> temperature_values(24);
  for (size_t i = 0; i < temperature_values.size(); ++i) {
    temperature_values[i] = 0.5f * static_cast<float>(i);
  }
  ArraySpec temperature_spec;
  temperature_spec.name = "temperature";
  temperature_spec.compression = CompressionType::kFpxXor2d;
  temperature_spec.dimensions = {4, 6};
  temperature_spec.chunks = {2, 3};
  temperature_spec.children = {units};
  auto temperature =
      builder.AddArray<float>(temperature_spec, temperature_values);

  auto count = builder.AddScalar<int64_t>("count", 42);
  auto unnamed = builder.AddGroup("", {count});

  ArraySpec height_spec;
  height_spec.name = "height";
  height_spec.compression = CompressionType::kNone;
  height_spec.dimensions = {3};
  height_spec.chunks = {2};
  const double height_values[] = {1.5, 2.5, 3.5};
  auto height = builder.AddArray<double>(height_spec, height_values);

  auto root = builder.AddGroup("root", {temperature, unnamed, height});
  return builder.Build(root);
}

#define OMFILE_INTERNAL_INSTANTIATE_BUILDER(T)                             \
  template std::string EncodeChunk<T>(CompressionType, double, double,     \
                                      absl::Span<const T>, size_t);        \
  template OffsetSize OmFileBuilder::AddArray<T>(const ArraySpec&,         \
                                                 absl::Span<const T>);     \
  template OffsetSize OmFileBuilder::AddScalar<T>(                         \
      std::string_view, const T&, std::vector<OffsetSize>);                \
  /**/
OMFILE_INTERNAL_INSTANTIATE_BUILDER(int8_t)
OMFILE_INTERNAL_INSTANTIATE_BUILDER(uint8_t)
OMFILE_INTERNAL_INSTANTIATE_BUILDER(int16_t)
OMFILE_INTERNAL_INSTANTIATE_BUILDER(uint16_t)
OMFILE_INTERNAL_INSTANTIATE_BUILDER(int32_t)
OMFILE_INTERNAL_INSTANTIATE_BUILDER(uint32_t)
OMFILE_INTERNAL_INSTANTIATE_BUILDER(int64_t)
OMFILE_INTERNAL_INSTANTIATE_BUILDER(uint64_t)
OMFILE_INTERNAL_INSTANTIATE_BUILDER(float)
OMFILE_INTERNAL_INSTANTIATE_BUILDER(double)
#undef OMFILE_INTERNAL_INSTANTIATE_BUILDER

template OffsetSize OmFileBuilder::AddScalar<std::string>(
    std::string_view, const std::string&, std::vector<OffsetSize>);

}  // namespace internal_testing
}  // namespace omfile
