// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_LIMITS_H
#define GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_LIMITS_H

#include <cstddef>
#include <cstdint>

namespace google {
namespace cloud {
namespace bigtable {
namespace gc_policy {

// The serialized size of a column family GcRule accepted by the store.
constexpr std::size_t kMaxGCRuleSize = 500;

// A GcRule within kMaxGCRuleSize embeds at most kMaxGCRuleSize / 2 rules
// (the smallest rule is >= 2 bytes), so no rule the store accepts nests
// deeper than this.
constexpr std::size_t kMaxGCRuleDepth = kMaxGCRuleSize / 2;

// `max_age` is a google.protobuf.Duration, whose range is +-10000 years.
constexpr std::int64_t kMaxGCRuleAgeSeconds = 315576000000LL;

}  // namespace gc_policy
}  // namespace bigtable
}  // namespace cloud
}  // namespace google

#endif  // GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_LIMITS_H
