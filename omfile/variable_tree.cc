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

#include "omfile/variable_tree.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_join.h"
#include "omfile/byte_range.h"
#include "omfile/errors.h"
#include "omfile/format/variable.h"
#include "omfile/source/byte_range_source.h"
#include "omfile/util/result.h"
#include "omfile/util/status.h"
#include "omfile/util/str_cat.h"

namespace omfile {
namespace {

struct TreeWalker {
  ByteRangeSource& source;
  FlatVariableMetadata result;
  std::vector<std::string> path;
  // Locations of the variables on the path from the root.
  std::vector<OffsetSize> ancestors;
  size_t num_visited = 0;

  absl::Status Visit(const Variable& variable,
                     std::optional<OffsetSize> location) {
    if (ancestors.size() >= kMaxVariableTreeDepth) {
      return DecodeError(omfile::StrCat("Variable tree is nested deeper than ",
                                        kMaxVariableTreeDepth, " levels"));
    }
    if (++num_visited > kMaxVariableTreeNodes) {
      return DecodeError(omfile::StrCat("Variable tree has more than ",
                                        kMaxVariableTreeNodes, " variables"));
    }
    const auto name = variable.name();
    if (name) {
      path.emplace_back(*name);
      if (location) {
        result.insert_or_assign(absl::StrJoin(path, "/"), *location);
      }
    }
    if (location) ancestors.push_back(*location);
    for (uint64_t i = 0; i < variable.child_count(); ++i) {
      OMFILE_ASSIGN_OR_RETURN(auto child_location,
                              variable.child_location(i));
      if (std::find(ancestors.begin(), ancestors.end(), child_location) !=
          ancestors.end()) {
        return DecodeError(omfile::StrCat(
            "Child ", i, " of \"", absl::StrJoin(path, "/"), "\" at ",
            child_location, " is one of its own ancestors"));
      }
      OMFILE_ASSIGN_OR_RETURN(
          auto child, LoadVariable(source, child_location),
          MaybeAnnotateStatus(_, omfile::StrCat("Loading child ", i, " of \"",
                                                absl::StrJoin(path, "/"),
                                                "\"")));
      OMFILE_RETURN_IF_ERROR(Visit(child, child_location));
    }
    if (location) ancestors.pop_back();
    if (name) path.pop_back();
    return absl::OkStatus();
  }
};

}  // namespace

Result<Variable> LoadVariable(ByteRangeSource& source, OffsetSize location) {
  if (location.Overflows()) {
    return DecodeError(
        omfile::StrCat("Variable location ", location, " overflows"));
  }
  OMFILE_ASSIGN_OR_RETURN(auto record,
                          ReadExactly(source, location.byte_range()));
  return Variable::Parse(std::move(record));
}

Result<FlatVariableMetadata> FlattenVariableTree(
    ByteRangeSource& source, const Variable& root,
    std::optional<OffsetSize> root_location) {
  TreeWalker walker{source, {}, {}, {}, 0};
  OMFILE_RETURN_IF_ERROR(walker.Visit(root, root_location));
  return std::move(walker.result);
}

}  // namespace omfile
