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

#include "omfile/internal/log/verbose_flag.h"

#include <algorithm>
#include <atomic>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/flags/flag.h"
#include "absl/log/absl_log.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"
#include "omfile/internal/env.h"

ABSL_FLAG(std::string, omfile_verbose_logging, {},
          "comma-separated list of omfile verbose logging flags")
    .OnUpdate([]() {
      if (!absl::GetFlag(FLAGS_omfile_verbose_logging).empty()) {
        omfile::internal_log::UpdateVerboseLogging(
            absl::GetFlag(FLAGS_omfile_verbose_logging), true);
      }
    });

namespace omfile {
namespace internal_log {
namespace {

ABSL_CONST_INIT absl::Mutex g_mutex(absl::kConstInit);

// Every flag seen so far, linked through `VerboseFlag::next_`.
ABSL_CONST_INIT VerboseFlag* g_list_head ABSL_GUARDED_BY(g_mutex) = nullptr;

struct LevelConfig {
  int default_level = -1;
  absl::flat_hash_map<std::string, int> levels;
};

void ParseLevelConfig(std::string_view input, LevelConfig& config) {
  for (std::string_view entry :
       absl::StrSplit(input, ',', absl::SkipEmpty())) {
    const size_t eq = entry.rfind('=');
    if (eq == entry.npos) {
      config.levels.insert_or_assign(std::string(entry), 0);
      continue;
    }
    if (eq == 0) continue;
    int level;
    if (!absl::SimpleAtoi(entry.substr(eq + 1), &level)) continue;
    level = std::clamp(level, -1, 1000);
    config.levels.insert_or_assign(std::string(entry.substr(0, eq)), level);
  }
  config.default_level = -1;
  if (auto it = config.levels.find("all"); it != config.levels.end()) {
    config.default_level = it->second;
  }
}

// The environment variable is consulted on first use.
LevelConfig& GetLevelConfig() ABSL_EXCLUSIVE_LOCKS_REQUIRED(g_mutex) {
  static LevelConfig* config = [] {
    auto* config = new LevelConfig;
    if (auto env = internal::GetEnv("OMFILE_VERBOSE_LOGGING"); env) {
      ParseLevelConfig(*env, *config);
    }
    return config;
  }();
  return *config;
}

int LevelFor(const LevelConfig& config, std::string_view name) {
  auto it = config.levels.find(name);
  return it == config.levels.end() ? config.default_level : it->second;
}

}  // namespace

void UpdateVerboseLogging(std::string_view input, bool overwrite)
    ABSL_LOCKS_EXCLUDED(g_mutex) {
  ABSL_LOG(INFO) << "--omfile_verbose_logging=" << input;
  LevelConfig update;
  ParseLevelConfig(input, update);

  absl::MutexLock lock(&g_mutex);
  LevelConfig& config = GetLevelConfig();
  if (overwrite) {
    config = std::move(update);
  } else {
    for (auto& [name, level] : update.levels) {
      config.levels.insert_or_assign(name, level);
    }
    if (update.levels.count("all")) {
      config.default_level = update.default_level;
    }
  }
  for (VerboseFlag* flag = g_list_head; flag != nullptr; flag = flag->next_) {
    flag->value_.store(LevelFor(config, flag->name_),
                       std::memory_order_seq_cst);
  }
}

/* static */
int VerboseFlag::Register(VerboseFlag* flag) {
  absl::MutexLock lock(&g_mutex);
  int v = flag->value_.load(std::memory_order_relaxed);
  if (v == kValueUninitialized) {
    v = LevelFor(GetLevelConfig(), flag->name_);
    flag->value_.store(v, std::memory_order_relaxed);
    flag->next_ = std::exchange(g_list_head, flag);
  }
  return v;
}

/* static */
bool VerboseFlag::SlowPath(VerboseFlag* flag, int old_v, int level) {
  if (ABSL_PREDICT_TRUE(old_v != kValueUninitialized)) {
    return level >= 0;
  }
  return Register(flag) >= level;
}

static_assert(std::is_trivially_destructible<VerboseFlag>::value,
              "VerboseFlag must be trivially destructible");

}  // namespace internal_log
}  // namespace omfile
