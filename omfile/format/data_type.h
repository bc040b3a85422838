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

#ifndef OMFILE_FORMAT_DATA_TYPE_H_
#define OMFILE_FORMAT_DATA_TYPE_H_

#include <stddef.h>
#include <stdint.h>

#include <iosfwd>
#include <string>
#include <string_view>

namespace omfile {

/// Type tag of a variable, as stored in the metadata record.
///
/// Scalar tags `kInt8`..`kString` have an array counterpart at a fixed
/// offset of 11: `kInt8Array`..`kStringArray`.
enum class DataType : uint8_t {
  kNone = 0,
  kInt8 = 1,
  kUint8 = 2,
  kInt16 = 3,
  kUint16 = 4,
  kInt32 = 5,
  kUint32 = 6,
  kInt64 = 7,
  kUint64 = 8,
  kFloat = 9,
  kDouble = 10,
  kString = 11,
  kInt8Array = 12,
  kUint8Array = 13,
  kInt16Array = 14,
  kUint16Array = 15,
  kInt32Array = 16,
  kUint32Array = 17,
  kInt64Array = 18,
  kUint64Array = 19,
  kFloatArray = 20,
  kDoubleArray = 21,
  kStringArray = 22,
};

constexpr uint8_t kMaxDataTypeTag = 22;
constexpr uint8_t kArrayDataTypeOffset = 11;

constexpr bool IsValidDataTypeTag(uint8_t tag) {
  return tag <= kMaxDataTypeTag;
}

constexpr bool IsScalar(DataType t) {
  return t >= DataType::kInt8 && t <= DataType::kString;
}

constexpr bool IsArray(DataType t) {
  return t >= DataType::kInt8Array && t <= DataType::kStringArray;
}

/// Returns the array tag whose elements have scalar type `t`.
///
/// \pre `IsScalar(t)`
constexpr DataType ArrayDataType(DataType t) {
  return static_cast<DataType>(static_cast<uint8_t>(t) +
                               kArrayDataTypeOffset);
}

/// Returns the scalar tag of the elements of array type `t`.
///
/// \pre `IsArray(t)`
constexpr DataType ElementDataType(DataType t) {
  return static_cast<DataType>(static_cast<uint8_t>(t) -
                               kArrayDataTypeOffset);
}

/// Returns the encoded width in bytes of one element of `t`, or `0` for
/// strings and `kNone`.
size_t ElementSize(DataType t);

std::string_view DataTypeName(DataType t);

std::ostream& operator<<(std::ostream& os, DataType t);

/// Maps a C++ element type to its scalar tag.
template <typename T>
struct DataTypeOf;

#define OMFILE_INTERNAL_DATA_TYPE_OF(T, TAG)         \
  template <>                                      \
  struct DataTypeOf<T> {                           \
    static constexpr DataType value = DataType::TAG; \
  };                                               \
  /**/
OMFILE_INTERNAL_DATA_TYPE_OF(int8_t, kInt8)
OMFILE_INTERNAL_DATA_TYPE_OF(uint8_t, kUint8)
OMFILE_INTERNAL_DATA_TYPE_OF(int16_t, kInt16)
OMFILE_INTERNAL_DATA_TYPE_OF(uint16_t, kUint16)
OMFILE_INTERNAL_DATA_TYPE_OF(int32_t, kInt32)
OMFILE_INTERNAL_DATA_TYPE_OF(uint32_t, kUint32)
OMFILE_INTERNAL_DATA_TYPE_OF(int64_t, kInt64)
OMFILE_INTERNAL_DATA_TYPE_OF(uint64_t, kUint64)
OMFILE_INTERNAL_DATA_TYPE_OF(float, kFloat)
OMFILE_INTERNAL_DATA_TYPE_OF(double, kDouble)
OMFILE_INTERNAL_DATA_TYPE_OF(std::string, kString)
#undef OMFILE_INTERNAL_DATA_TYPE_OF

template <typename T>
constexpr DataType kScalarDataType = DataTypeOf<T>::value;

template <typename T>
constexpr DataType kArrayDataType = ArrayDataType(DataTypeOf<T>::value);

/// Invokes `func(T{})` with a value of the numeric C++ element type whose
/// scalar tag is `t`, and returns its result.  Returns `false` without
/// invoking `func` for strings and `kNone`.
///
/// `func` must return `bool`.
template <typename Func>
bool DispatchNumericType(DataType t, Func&& func) {
  switch (t) {
    case DataType::kInt8:
      return func(int8_t{});
    case DataType::kUint8:
      return func(uint8_t{});
    case DataType::kInt16:
      return func(int16_t{});
    case DataType::kUint16:
      return func(uint16_t{});
    case DataType::kInt32:
      return func(int32_t{});
    case DataType::kUint32:
      return func(uint32_t{});
    case DataType::kInt64:
      return func(int64_t{});
    case DataType::kUint64:
      return func(uint64_t{});
    case DataType::kFloat:
      return func(float{});
    case DataType::kDouble:
      return func(double{});
    default:
      return false;
  }
}

}  // namespace omfile

#endif  // OMFILE_FORMAT_DATA_TYPE_H_
