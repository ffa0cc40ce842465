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

#ifndef GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_POLICY_H
#define GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_POLICY_H

#include "google/cloud/status.h"
#include "google/cloud/status_or.h"
#include "absl/types/optional.h"
#include "gc_limits.h"
#include "gc_rule.h"
#include <google/bigtable/admin/v2/table.pb.h>
#include <google/protobuf/struct.pb.h>
#include <chrono>
#include <string>

namespace google {
namespace cloud {
namespace bigtable {
namespace gc_policy {

// Compiling and decompiling are recursive. A GcRule the store accepts
// serializes to at most kMaxGCRuleSize (500) bytes, and the smallest GcRule
// (a small max_num_versions) is >= 2 bytes, so it embeds at most 250 rules.
// `ParseRule()` caps the depth of rule trees at the same kMaxGCRuleDepth.
//
// Each recursive call takes well under 1KB of stack (a few pointers and
// integers plus the partially built result), so the recursion stays below
// 250KB, which fits in the smallest default stack we run on (512KiB on
// MacOS X).
static_assert(kMaxGCRuleSize == 500,
              "Max GC rule size changed. Recheck the logic of proof above.");
static_assert(kMaxGCRuleDepth == kMaxGCRuleSize / 2,
              "GC rule depth must follow from the size limit.");

/**
 * Maps a validated rule tree onto the policy applied to a column family.
 *
 * An absent rule compiles to "no GC", i.e. a `GcRule` with no rule set. A
 * composite without `mode` compiles to its only child; a union or
 * intersection keeps the order of its children. Never fails.
 */
google::bigtable::admin::v2::GcRule Compile(absl::optional<Rule> const& rule);

/// Compiles a single validated rule.
google::bigtable::admin::v2::GcRule Compile(Rule const& rule);

/**
 * Reconstructs the canonical JSON rule tree of a policy.
 *
 * The result is accepted by `ParseRule()` and compiles back to a policy
 * equal to `policy` (up to unwrapping of 1-ary unions and intersections,
 * which the grammar cannot express).
 *
 * @param policy the live policy, as returned by the store.
 * @param is_top_level whether `policy` is the root of a column family's
 *     GcRule. At the top level "no GC" (including an empty union or
 *     intersection) yields `absl::nullopt` and a single threshold is
 *     wrapped as `{"rules": [...]}`.
 *
 * @return `kInvalidArgument` if the policy has no JSON rule form: a nested
 *     "no GC" rule, a `max_num_versions` below 1, or a `max_age` that is
 *     not a positive whole number of seconds.
 */
StatusOr<absl::optional<google::protobuf::Value>> Decompile(
    google::bigtable::admin::v2::GcRule const& policy,
    bool is_top_level = true);

/// Prints a duration as "<n><unit>", in the largest unit dividing it.
std::string FormatMaxAge(std::chrono::seconds max_age);

/// Prints a JSON rule tree compactly. Values with no JSON form, such as
/// an unset `Value` or a non-finite number, are `kInvalidArgument`.
StatusOr<std::string> RuleJsonToString(google::protobuf::Value const& value);

/**
 * Validates a GcRule the way the column family admin API does.
 *
 * The serialized rule must fit in kMaxGCRuleSize bytes, `max_age` must be
 * at least 1ms and `max_num_versions` positive. Unions and intersections
 * may be empty. Errors name the failing node in the `path` metadata, in
 * the form `ParseRule()` uses.
 */
Status CheckGCRuleIsValid(google::bigtable::admin::v2::GcRule const& rule);

/**
 * Renders a policy for logs, e.g. `Union[MaxAge(168h), MaxVersions(10)]`.
 *
 * "No GC" renders as `NoGC`.
 */
std::string GcRuleDebugString(google::bigtable::admin::v2::GcRule const& rule);

}  // namespace gc_policy
}  // namespace bigtable
}  // namespace cloud
}  // namespace google

#endif  // GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_POLICY_H
