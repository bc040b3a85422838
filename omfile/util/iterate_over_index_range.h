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

#ifndef OMFILE_UTIL_ITERATE_OVER_INDEX_RANGE_H_
#define OMFILE_UTIL_ITERATE_OVER_INDEX_RANGE_H_

#include <stddef.h>
#include <stdint.h>

#include <cassert>

#include "absl/container/inlined_vector.h"
#include "absl/types/span.h"

namespace omfile {
namespace internal_iterate {

template <typename Func>
void LoopImpl(Func& func, size_t dim, const uint64_t* origin,
              const uint64_t* shape, absl::Span<uint64_t> indices) {
  const uint64_t start = origin[dim];
  const uint64_t stop = start + shape[dim];
  if (dim + 1 == indices.size()) {
    for (uint64_t i = start; i < stop; ++i) {
      indices[dim] = i;
      func(absl::Span<const uint64_t>(indices));
    }
  } else {
    for (uint64_t i = start; i < stop; ++i) {
      indices[dim] = i;
      LoopImpl(func, dim + 1, origin, shape, indices);
    }
  }
}

}  // namespace internal_iterate

/// Iterates in C (row-major) order over the hyperrectangle specified by
/// `origin` and `shape`, and invokes `func` with an
/// `absl::Span<const uint64_t>` of indices for each position.
///
/// For example:
///
/// `IterateOverIndexRange({0, 1}, {2, 2}, func)`
/// invokes:
///
///     `func({0, 1})`, `func({0, 2})`,
///     `func({1, 1})`, `func({1, 2})`.
///
/// A zero-rank range invokes `func` once with an empty span; a range with a
/// zero extent does not invoke `func`.
///
/// \dchecks `origin.size() == shape.size()`.
template <typename Func>
void IterateOverIndexRange(absl::Span<const uint64_t> origin,
                           absl::Span<const uint64_t> shape, Func&& func) {
  assert(origin.size() == shape.size());
  if (shape.empty()) {
    func(absl::Span<const uint64_t>());
    return;
  }
  absl::InlinedVector<uint64_t, 8> indices(shape.size());
  internal_iterate::LoopImpl(func, 0, origin.data(), shape.data(),
                             absl::MakeSpan(indices));
}

}  // namespace omfile

#endif  // OMFILE_UTIL_ITERATE_OVER_INDEX_RANGE_H_
