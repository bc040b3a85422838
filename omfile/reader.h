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

#ifndef OMFILE_READER_H_
#define OMFILE_READER_H_

/// \file
/// Reader of one variable of an OM file.
///
/// Example::
///
///     OMFILE_ASSIGN_OR_RETURN(auto source,
///                             FileByteRangeSource::Open("era5.om"));
///     OMFILE_ASSIGN_OR_RETURN(auto reader, Reader::Open(source));
///     OMFILE_ASSIGN_OR_RETURN(
///         std::vector<float> values,
///         reader.Read<float>({Range{0, 10}, Range{20, 30}}));
///
/// A reader is `Uninitialized` until `Initialize` succeeds and `Disposed`
/// after `Dispose`.  Outside of the `Initialized` state every accessor fails
/// with `ErrorKind::kNotInitialized`.
///
/// A single reader must not be used from several threads at once.  Readers
/// returned by `GetChild` are independent and share only the source.

#include <stdint.h>

#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "omfile/byte_range.h"
#include "omfile/format/compression.h"
#include "omfile/format/data_type.h"
#include "omfile/format/variable.h"
#include "omfile/range.h"
#include "omfile/read_options.h"
#include "omfile/source/byte_range_source.h"
#include "omfile/util/result.h"
#include "omfile/variable_tree.h"

namespace omfile {

class Reader {
 public:
  explicit Reader(ByteRangeSourcePtr source,
                  ReadOptions options = ReadOptions::Default());

  Reader(Reader&& other) noexcept;
  Reader& operator=(Reader&& other) noexcept;
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;

  /// Constructs a reader and initializes it.
  static Result<Reader> Open(ByteRangeSourcePtr source,
                             ReadOptions options = ReadOptions::Default());

  /// Reads the header, and for trailer-addressed files the trailer and the
  /// root metadata record.  Has no effect if already initialized.
  ///
  /// \error `ErrorKind::kInvalidFormat` if the header is not recognized.
  /// \error `ErrorKind::kInvalidTrailer` if the trailer is malformed.
  /// \error `ErrorKind::kDecodeError` if the root record is malformed.
  /// \error `ErrorKind::kNotInitialized` if the reader has been disposed.
  /// \error Errors from the source are returned unchanged.
  absl::Status Initialize();

  /// Releases the metadata record.  Calling it again has no effect.
  void Dispose();

  bool initialized() const { return state_ == State::kInitialized; }

  const ReadOptions& options() const { return options_; }
  const ByteRangeSourcePtr& source() const { return source_; }

  Result<DataType> data_type() const;
  Result<CompressionType> compression() const;
  Result<double> scale_factor() const;
  Result<double> add_offset() const;
  Result<std::vector<uint64_t>> dimensions() const;
  Result<std::vector<uint64_t>> chunks() const;
  Result<std::optional<std::string>> name() const;
  Result<uint64_t> child_count() const;

  /// Location of the metadata record of this variable, or `std::nullopt`
  /// for the root of a legacy file.
  Result<std::optional<OffsetSize>> location() const;

  /// Returns an initialized reader of child `index`.
  ///
  /// \error `ErrorKind::kIndexOutOfRange` if `index >= child_count()`.
  Result<Reader> GetChild(uint64_t index) const;

  /// Returns an initialized reader of the variable whose metadata record is
  /// at `location`.
  Result<Reader> OpenChild(OffsetSize location) const;

  /// Returns the value of a scalar variable, or `std::nullopt` if the
  /// variable is not a scalar of type `T`.
  template <typename T>
  Result<std::optional<T>> ReadScalar() const {
    OMFILE_ASSIGN_OR_RETURN(const Variable* variable, GetVariable());
    return variable->ReadScalar<T>();
  }

  /// Reads the region `ranges`, one half-open range per dimension, and
  /// returns its elements in row-major order.
  ///
  /// \tparam T Element type, one of the numeric types of `DataTypeOf`.
  /// \error `ErrorKind::kDataTypeMismatch` if the variable is not an array
  ///     of `T`.
  /// \error `ErrorKind::kDimensionMismatch` if `ranges.size()` differs from
  ///     the rank.
  /// \error `ErrorKind::kRangeOutOfBounds` if a range is inverted or extends
  ///     past its dimension.
  /// \error `ErrorKind::kDecodeError` if the chunk index or a chunk is
  ///     corrupt.
  /// \error Errors from the source are returned unchanged.
  template <typename T>
  Result<std::vector<T>> Read(absl::Span<const Range> ranges) const {
    return Read<T>(ranges, options_);
  }
  template <typename T>
  Result<std::vector<T>> Read(absl::Span<const Range> ranges,
                              const ReadOptions& options) const;

  /// Same as `Read`, but writes the elements to the front of `output`.
  ///
  /// On error, `output` may hold some of the requested elements.
  ///
  /// \error `ErrorKind::kBufferTooSmall` if `output` is smaller than the
  ///     requested region.
  template <typename T>
  absl::Status ReadInto(absl::Span<const Range> ranges,
                        absl::Span<T> output) const {
    return ReadInto<T>(ranges, output, options_);
  }
  template <typename T>
  absl::Status ReadInto(absl::Span<const Range> ranges, absl::Span<T> output,
                        const ReadOptions& options) const;

  /// Returns the path and location of every named variable in the tree
  /// rooted at this reader's variable.
  Result<FlatVariableMetadata> GetFlatVariableMetadata() const;

 private:
  enum class State { kUninitialized, kInitialized, kDisposed };

  Reader(ByteRangeSourcePtr source, ReadOptions options, Variable variable,
         std::optional<OffsetSize> location);

  Result<const Variable*> GetVariable() const;

  ByteRangeSourcePtr source_;
  ReadOptions options_;
  State state_ = State::kUninitialized;
  std::optional<Variable> variable_;
  std::optional<OffsetSize> location_;
};

}  // namespace omfile

#endif  // OMFILE_READER_H_
