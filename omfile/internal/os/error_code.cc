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

#include "omfile/internal/os/error_code.h"

#include <string.h>

#include <string>

namespace omfile {
namespace internal_os {
namespace {

// Selects the message for either `strerror_r` flavour: the GNU version
// returns the message pointer, the XSI version fills `buf` and returns int.
[[maybe_unused]] const char* GetStrerrorResult(const char* buf,
                                               const char* result) {
  return result;
}
[[maybe_unused]] const char* GetStrerrorResult(const char* buf, int result) {
  return buf;
}

}  // namespace

std::string GetOsErrorMessage(int error_code) {
  char buf[4096];
  buf[0] = 0;
  return std::string(
      GetStrerrorResult(buf, ::strerror_r(error_code, buf, sizeof(buf))));
}

}  // namespace internal_os
}  // namespace omfile
