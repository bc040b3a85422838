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

#include "omfile/reader.h"

#include <stddef.h>
#include <stdint.h>

#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/types/span.h"
#include "omfile/byte_range.h"
#include "omfile/errors.h"
#include "omfile/format/data_type.h"
#include "omfile/format/header.h"
#include "omfile/format/variable.h"
#include "omfile/internal/log/verbose_flag.h"
#include "omfile/range.h"
#include "omfile/read/chunk_decoder.h"
#include "omfile/read/read_planner.h"
#include "omfile/read_options.h"
#include "omfile/source/byte_range_source.h"
#include "omfile/util/result.h"
#include "omfile/util/status.h"
#include "omfile/util/str_cat.h"
#include "omfile/variable_tree.h"

namespace omfile {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag reader_logging("omfile_reader");

// Checks `ranges` against `variable` and returns the number of requested
// elements.
Result<size_t> ValidateRequest(const Variable& variable,
                               DataType element_type,
                               absl::Span<const Range> ranges) {
  if (variable.data_type() != ArrayDataType(element_type)) {
    return DataTypeMismatchError(
        omfile::StrCat("Cannot read ", variable.data_type(),
                       " variable as array of ", element_type));
  }
  const auto dimensions = variable.dimensions();
  if (ranges.size() != dimensions.size()) {
    return DimensionMismatchError(
        omfile::StrCat("Expected ", dimensions.size(),
                       " ranges, but received ", ranges.size()));
  }
  size_t num_elements = 1;
  for (size_t i = 0; i < ranges.size(); ++i) {
    const Range& r = ranges[i];
    if (r.start > r.end || r.end > dimensions[i]) {
      return RangeOutOfBoundsError(
          omfile::StrCat("Range ", r, " of dimension ", i,
                         " is not within [0, ", dimensions[i], ")"));
    }
    const uint64_t size = r.size();
    if (size != 0 && num_elements > std::numeric_limits<size_t>::max() / size) {
      return RangeOutOfBoundsError(
          omfile::StrCat("Requested region ", ranges,
                         " has too many elements"));
    }
    num_elements *= size;
  }
  return num_elements;
}

// Fetches and decodes every chunk overlapping `ranges` into `output`.
template <typename T>
absl::Status ReadChunks(ByteRangeSource& source, const Variable& variable,
                        absl::Span<const Range> ranges,
                        const ReadOptions& options, absl::Span<T> output) {
  ReadPlanner planner(variable, options);
  ChunkDecoder<T> decoder(variable, ranges, output);
  for (const IndexRead& index_read : planner.PlanIndexReads(ranges)) {
    ABSL_LOG_IF(INFO, reader_logging)
        << "Fetching chunk index " << index_read.byte_range << " for "
        << index_read.chunks.size() << " chunks";
    OMFILE_ASSIGN_OR_RETURN(auto index_bytes,
                            ReadExactly(source, index_read.byte_range));
    OMFILE_ASSIGN_OR_RETURN(auto data_reads,
                            planner.PlanDataReads(index_read, index_bytes));
    for (const DataRead& data_read : data_reads) {
      ABSL_LOG_IF(INFO, reader_logging.Level(1))
          << "Fetching chunk data " << data_read.byte_range << " for "
          << data_read.chunks.size() << " chunks";
      OMFILE_ASSIGN_OR_RETURN(auto data,
                              ReadExactly(source, data_read.byte_range));
      for (const ChunkRead& chunk : data_read.chunks) {
        OMFILE_RETURN_IF_ERROR(decoder.DecodeChunk(
            chunk.grid_position,
            internal::GetSubCord(data, data_read.byte_range.inclusive_min,
                                 chunk.byte_range)));
      }
    }
  }
  return absl::OkStatus();
}

}  // namespace

Reader::Reader(ByteRangeSourcePtr source, ReadOptions options)
    : source_(std::move(source)), options_(options) {}

Reader::Reader(ByteRangeSourcePtr source, ReadOptions options,
               Variable variable, std::optional<OffsetSize> location)
    : source_(std::move(source)),
      options_(options),
      state_(State::kInitialized),
      variable_(std::move(variable)),
      location_(location) {}

Reader::Reader(Reader&& other) noexcept
    : source_(std::move(other.source_)),
      options_(other.options_),
      state_(std::exchange(other.state_, State::kDisposed)),
      variable_(std::move(other.variable_)),
      location_(other.location_) {
  other.variable_.reset();
}

Reader& Reader::operator=(Reader&& other) noexcept {
  if (this != &other) {
    source_ = std::move(other.source_);
    options_ = other.options_;
    state_ = std::exchange(other.state_, State::kDisposed);
    variable_ = std::move(other.variable_);
    other.variable_.reset();
    location_ = other.location_;
  }
  return *this;
}

Result<Reader> Reader::Open(ByteRangeSourcePtr source, ReadOptions options) {
  Reader reader(std::move(source), options);
  OMFILE_RETURN_IF_ERROR(reader.Initialize());
  return reader;
}

absl::Status Reader::Initialize() {
  switch (state_) {
    case State::kInitialized:
      return absl::OkStatus();
    case State::kDisposed:
      return NotInitializedError("Reader has been disposed");
    case State::kUninitialized:
      break;
  }
  if (!source_) {
    return NotInitializedError("Reader has no source");
  }
  OMFILE_ASSIGN_OR_RETURN(auto header,
                          ReadExactly(*source_, ByteRange{0, kHeaderSize}));
  const HeaderType header_type = GetHeaderType(header);
  ABSL_LOG_IF(INFO, reader_logging) << "Header type: " << header_type;
  switch (header_type) {
    case HeaderType::kInvalid:
      return InvalidFormatError("File does not start with an OM header");
    case HeaderType::kLegacy: {
      OMFILE_ASSIGN_OR_RETURN(auto variable,
                              Variable::FromLegacyHeader(header));
      variable_ = std::move(variable);
      location_ = std::nullopt;
      break;
    }
    case HeaderType::kTrailerAddressed: {
      OMFILE_ASSIGN_OR_RETURN(auto file_size, source_->Size());
      OMFILE_ASSIGN_OR_RETURN(auto trailer_range,
                              GetTrailerByteRange(file_size));
      OMFILE_ASSIGN_OR_RETURN(auto trailer,
                              ReadExactly(*source_, trailer_range));
      OMFILE_ASSIGN_OR_RETURN(auto root, DecodeTrailer(trailer));
      ABSL_LOG_IF(INFO, reader_logging) << "Root variable at " << root;
      OMFILE_ASSIGN_OR_RETURN(
          auto variable, LoadVariable(*source_, root),
          MaybeAnnotateStatus(_, "Loading root variable"));
      variable_ = std::move(variable);
      location_ = root;
      break;
    }
  }
  state_ = State::kInitialized;
  return absl::OkStatus();
}

void Reader::Dispose() {
  if (state_ == State::kDisposed) return;
  variable_.reset();
  location_ = std::nullopt;
  state_ = State::kDisposed;
}

Result<const Variable*> Reader::GetVariable() const {
  if (state_ != State::kInitialized) {
    return NotInitializedError(state_ == State::kDisposed
                                   ? "Reader has been disposed"
                                   : "Reader has not been initialized");
  }
  return &*variable_;
}

Result<DataType> Reader::data_type() const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  return variable->data_type();
}

Result<CompressionType> Reader::compression() const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  return variable->compression();
}

Result<double> Reader::scale_factor() const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  return variable->scale_factor();
}

Result<double> Reader::add_offset() const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  return variable->add_offset();
}

Result<std::vector<uint64_t>> Reader::dimensions() const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  return std::vector<uint64_t>(variable->dimensions().begin(),
                               variable->dimensions().end());
}

Result<std::vector<uint64_t>> Reader::chunks() const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  return std::vector<uint64_t>(variable->chunks().begin(),
                               variable->chunks().end());
}

Result<std::optional<std::string>> Reader::name() const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  auto name = variable->name();
  if (!name) return std::optional<std::string>();
  return std::optional<std::string>(std::string(*name));
}

Result<uint64_t> Reader::child_count() const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  return variable->child_count();
}

Result<std::optional<OffsetSize>> Reader::location() const {
  OMFILE_RETURN_IF_ERROR(GetVariable().status());
  return location_;
}

Result<Reader> Reader::GetChild(uint64_t index) const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  OMFILE_ASSIGN_OR_RETURN(auto child_location,
                          variable->child_location(index));
  return OpenChild(child_location);
}

Result<Reader> Reader::OpenChild(OffsetSize location) const {
  OMFILE_RETURN_IF_ERROR(GetVariable().status());
  ABSL_LOG_IF(INFO, reader_logging) << "Opening child at " << location;
  OMFILE_ASSIGN_OR_RETURN(
      auto variable, LoadVariable(*source_, location),
      MaybeAnnotateStatus(_, omfile::StrCat("Loading child at ", location)));
  return Reader(source_, options_, std::move(variable), location);
}

template <typename T>
Result<std::vector<T>> Reader::Read(absl::Span<const Range> ranges,
                                    const ReadOptions& options) const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  OMFILE_RETURN_IF_ERROR(options.Validate());
  OMFILE_ASSIGN_OR_RETURN(
      size_t num_elements,
      ValidateRequest(*variable, kScalarDataType<T>, ranges));
  std::vector<T> output(num_elements);
  if (num_elements != 0) {
    OMFILE_RETURN_IF_ERROR(ReadChunks<T>(*source_, *variable, ranges, options,
                                         absl::MakeSpan(output)));
  }
  return output;
}

template <typename T>
absl::Status Reader::ReadInto(absl::Span<const Range> ranges,
                              absl::Span<T> output,
                              const ReadOptions& options) const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  OMFILE_RETURN_IF_ERROR(options.Validate());
  OMFILE_ASSIGN_OR_RETURN(
      size_t num_elements,
      ValidateRequest(*variable, kScalarDataType<T>, ranges));
  if (output.size() < num_elements) {
    return BufferTooSmallError(
        omfile::StrCat("Output buffer holds ", output.size(),
                       " elements, but the request has ", num_elements));
  }
  if (num_elements == 0) return absl::OkStatus();
  return ReadChunks<T>(*source_, *variable, ranges, options,
                       output.first(num_elements));
}

Result<FlatVariableMetadata> Reader::GetFlatVariableMetadata() const {
  OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
  return FlattenVariableTree(*source_, *variable, location_);
}

#define OMFILE_INTERNAL_INSTANTIATE_READ(T)                            \
  template Result<std::vector<T>> Reader::Read<T>(                     \
      absl::Span<const Range> ranges, const ReadOptions& options)      \
      const;                                                           \
  template absl::Status Reader::ReadInto<T>(                           \
      absl::Span<const Range> ranges, absl::Span<T> output,            \
      const ReadOptions& options) const;                               \
  /**/
OMFILE_INTERNAL_INSTANTIATE_READ(int8_t)
OMFILE_INTERNAL_INSTANTIATE_READ(uint8_t)
OMFILE_INTERNAL_INSTANTIATE_READ(int16_t)
OMFILE_INTERNAL_INSTANTIATE_READ(uint16_t)
OMFILE_INTERNAL_INSTANTIATE_READ(int32_t)
OMFILE_INTERNAL_INSTANTIATE_READ(uint32_t)
OMFILE_INTERNAL_INSTANTIATE_READ(int64_t)
OMFILE_INTERNAL_INSTANTIATE_READ(uint64_t)
OMFILE_INTERNAL_INSTANTIATE_READ(float)
OMFILE_INTERNAL_INSTANTIATE_READ(double)
#undef OMFILE_INTERNAL_INSTANTIATE_READ

}  // namespace omfile
