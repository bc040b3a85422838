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

#ifndef OMFILE_VARIABLE_TREE_H_
#define OMFILE_VARIABLE_TREE_H_

/// \file
/// Navigation of the metadata tree of a trailer-addressed file.
///
/// Variables refer to their children by `OffsetSize` only.  A child is
/// materialized by fetching its record and parsing it, so no variable ever
/// holds a reference to another one.

#include <stddef.h>

#include <optional>
#include <string>

#include "absl/container/btree_map.h"
#include "omfile/byte_range.h"
#include "omfile/format/variable.h"
#include "omfile/source/byte_range_source.h"
#include "omfile/util/result.h"

namespace omfile {

/// Maps `"parent/child/name"` paths to the location of each named variable.
using FlatVariableMetadata = absl::btree_map<std::string, OffsetSize>;

/// Nesting depth at which `FlattenVariableTree` gives up.
constexpr size_t kMaxVariableTreeDepth = 256;

/// Number of visited variables at which `FlattenVariableTree` gives up.  A
/// variable reachable along several paths is visited once per path.
constexpr size_t kMaxVariableTreeNodes = size_t{1} << 20;

/// Fetches the metadata record at `location` from `source` and parses it.
///
/// \error `ErrorKind::kDecodeError` if `location` overflows or the record is
///     malformed.
/// \error Errors from `source` are returned unchanged.
Result<Variable> LoadVariable(ByteRangeSource& source, OffsetSize location);

/// Walks the tree below `root` depth-first and records the location of every
/// variable that has both a name and a location.
///
/// Each named variable contributes its name as a path component to its
/// descendants; unnamed variables are walked but contribute nothing.  The
/// root of a legacy file has neither a name nor a location, and is passed
/// with `root_location == std::nullopt`.  When two variables map to the
/// same path, the one visited last wins.
///
/// \error `ErrorKind::kDecodeError` if a child record is malformed, a child
///     refers to one of its ancestors, or the tree exceeds
///     `kMaxVariableTreeDepth` or `kMaxVariableTreeNodes`.
Result<FlatVariableMetadata> FlattenVariableTree(
    ByteRangeSource& source, const Variable& root,
    std::optional<OffsetSize> root_location);

}  // namespace omfile

#endif  // OMFILE_VARIABLE_TREE_H_
