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

#include "omfile/format/data_type.h"

#include <stddef.h>

#include <ostream>
#include <string_view>

namespace omfile {

size_t ElementSize(DataType t) {
  if (IsArray(t)) t = ElementDataType(t);
  switch (t) {
    case DataType::kInt8:
    case DataType::kUint8:
      return 1;
    case DataType::kInt16:
    case DataType::kUint16:
      return 2;
    case DataType::kInt32:
    case DataType::kUint32:
    case DataType::kFloat:
      return 4;
    case DataType::kInt64:
    case DataType::kUint64:
    case DataType::kDouble:
      return 8;
    default:
      return 0;
  }
}

std::string_view DataTypeName(DataType t) {
  switch (t) {
    case DataType::kNone:
      return "none";
    case DataType::kInt8:
      return "int8";
    case DataType::kUint8:
      return "uint8";
    case DataType::kInt16:
      return "int16";
    case DataType::kUint16:
      return "uint16";
    case DataType::kInt32:
      return "int32";
    case DataType::kUint32:
      return "uint32";
    case DataType::kInt64:
      return "int64";
    case DataType::kUint64:
      return "uint64";
    case DataType::kFloat:
      return "float";
    case DataType::kDouble:
      return "double";
    case DataType::kString:
      return "string";
    case DataType::kInt8Array:
      return "int8_array";
    case DataType::kUint8Array:
      return "uint8_array";
    case DataType::kInt16Array:
      return "int16_array";
    case DataType::kUint16Array:
      return "uint16_array";
    case DataType::kInt32Array:
      return "int32_array";
    case DataType::kUint32Array:
      return "uint32_array";
    case DataType::kInt64Array:
      return "int64_array";
    case DataType::kUint64Array:
      return "uint64_array";
    case DataType::kFloatArray:
      return "float_array";
    case DataType::kDoubleArray:
      return "double_array";
    case DataType::kStringArray:
      return "string_array";
  }
  return "<unknown>";
}

std::ostream& operator<<(std::ostream& os, DataType t) {
  return os << DataTypeName(t);
}

}  // namespace omfile
