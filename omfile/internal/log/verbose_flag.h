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

#ifndef OMFILE_INTERNAL_LOG_VERBOSE_FLAG_H_
#define OMFILE_INTERNAL_LOG_VERBOSE_FLAG_H_

#include <atomic>
#include <limits>
#include <string_view>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"

namespace omfile {
namespace internal_log {

/// Sets the verbose logging levels from a comma separated list of `name` or
/// `name=level` entries.  The special name "all" sets the default level for
/// every flag not listed explicitly.
void UpdateVerboseLogging(std::string_view input, bool overwrite);

/// Named switch for opt-in verbose logging.  The level of a flag is taken from
/// `--omfile_verbose_logging` or, when the flag is unset, from the
/// `OMFILE_VERBOSE_LOGGING` environment variable.
///
/// Declare at namespace scope and test it in a log statement:
///
///   namespace {
///   ABSL_CONST_INIT internal_log::VerboseFlag planner_logging(
///       "omfile_read_planner");
///   }
///   ABSL_LOG_IF(INFO, planner_logging) << "planned " << n << " reads";
///
class VerboseFlag {
 public:
  constexpr static int kValueUninitialized = std::numeric_limits<int>::max();

  // `name` must outlive the flag; flags are never deallocated.
  explicit constexpr VerboseFlag(const char* name)
      : value_(kValueUninitialized), name_(name), next_(nullptr) {}

  VerboseFlag(const VerboseFlag&) = delete;
  VerboseFlag& operator=(const VerboseFlag&) = delete;

  /// Returns whether logging is enabled at `level` (>= 0).
  ABSL_ATTRIBUTE_ALWAYS_INLINE
  bool Level(int level) {
    int v = value_.load(std::memory_order_relaxed);
    if (ABSL_PREDICT_TRUE(level > v)) return false;
    return SlowPath(this, v, level);
  }

  ABSL_ATTRIBUTE_ALWAYS_INLINE
  operator bool() { return Level(0); }

 private:
  static bool SlowPath(VerboseFlag* flag, int old_v, int level);
  static int Register(VerboseFlag* flag);

  std::atomic<int> value_;
  const char* const name_;
  VerboseFlag* next_;  // Guarded by the registry mutex.

  friend void UpdateVerboseLogging(std::string_view, bool);
};

}  // namespace internal_log
}  // namespace omfile

#endif  // OMFILE_INTERNAL_LOG_VERBOSE_FLAG_H_
