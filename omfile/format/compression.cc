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

#include "omfile/format/compression.h"

#include <ostream>
#include <string_view>

#include "omfile/format/data_type.h"

namespace omfile {

bool IsSupportedCombination(CompressionType compression, DataType element) {
  switch (compression) {
    case CompressionType::kPforDelta2dInt16:
    case CompressionType::kPforDelta2dInt16Logarithmic:
    case CompressionType::kFpxXor2d:
      return element == DataType::kFloat || element == DataType::kDouble;
    case CompressionType::kPforDelta2d:
      return IsScalar(element) && element != DataType::kString &&
             element != DataType::kFloat && element != DataType::kDouble;
    case CompressionType::kNone:
      return ElementSize(element) != 0;
  }
  return false;
}

std::string_view CompressionTypeName(CompressionType c) {
  switch (c) {
    case CompressionType::kPforDelta2dInt16:
      return "pfor_delta2d_int16";
    case CompressionType::kFpxXor2d:
      return "fpx_xor2d";
    case CompressionType::kPforDelta2d:
      return "pfor_delta2d";
    case CompressionType::kPforDelta2dInt16Logarithmic:
      return "pfor_delta2d_int16_logarithmic";
    case CompressionType::kNone:
      return "none";
  }
  return "<unknown>";
}

std::ostream& operator<<(std::ostream& os, CompressionType c) {
  return os << CompressionTypeName(c);
}

}  // namespace omfile
