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

#ifndef GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_RULE_H
#define GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_RULE_H

#include "google/cloud/status.h"
#include "google/cloud/status_or.h"
#include "absl/types/variant.h"
#include <google/protobuf/struct.pb.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace google {
namespace cloud {
namespace bigtable {
namespace gc_policy {

// Keys of the JSON rule grammar.
constexpr char kModeKey[] = "mode";
constexpr char kRulesKey[] = "rules";
constexpr char kMaxAgeKey[] = "max_age";
constexpr char kMaxVersionKey[] = "max_version";

constexpr char kUnionMode[] = "union";
constexpr char kIntersectionMode[] = "intersection";

// All validation errors are `kInvalidArgument` statuses whose `ErrorInfo`
// has this domain and a reason naming the `ValidationErrorKind`.
constexpr char kValidationErrorDomain[] = "gc_rule.validation";

enum class ValidationErrorKind {
  // The status is OK or not a rule validation error.
  kNone,
  kUnknownKey,
  kConflictingLeafFields,
  kMissingLeafField,
  kInvalidRuleCount,
  kInvalidMode,
  kInvalidDuration,
  kInvalidVersionCount,
  // The node is not a JSON object, `rules` is not an array or the text is
  // not JSON at all.
  kMalformedRule,
  kNestingTooDeep,
};

/// The `ErrorInfo::reason()` used for validation errors of kind `kind`.
std::string ValidationErrorReason(ValidationErrorKind kind);

/**
 * Classifies a status returned by `ParseRule()` or `ParseRuleJson()`.
 *
 * @return the kind of validation error, or `kNone` if `status` is OK or
 *     did not originate in rule validation.
 */
ValidationErrorKind GetValidationErrorKind(Status const& status);

struct MaxAgeRule {
  std::chrono::seconds max_age;
};

struct MaxVersionsRule {
  std::int32_t max_versions;
};

// A leaf carries exactly one threshold.
using LeafRule = absl::variant<MaxAgeRule, MaxVersionsRule>;

enum class CompositeMode {
  // The single-rule wrapper: `{"rules": [rule]}`.
  kNone,
  kUnion,
  kIntersection,
};

class Rule;

struct CompositeRule {
  CompositeMode mode;
  std::vector<Rule> children;
};

/**
 * A validated node of a GC rule tree.
 *
 * Objects of this class are only produced by `ParseRule()`, so every
 * `Rule` satisfies the grammar: composites with `CompositeMode::kNone` have
 * exactly one child and the others at least two. Children are owned by
 * value.
 */
class Rule {
 public:
  explicit Rule(LeafRule leaf) : node_(std::move(leaf)) {}
  explicit Rule(CompositeRule composite) : node_(std::move(composite)) {}

  bool is_leaf() const { return absl::holds_alternative<LeafRule>(node_); }
  bool is_composite() const {
    return absl::holds_alternative<CompositeRule>(node_);
  }

  LeafRule const& leaf() const { return absl::get<LeafRule>(node_); }
  CompositeRule const& composite() const {
    return absl::get<CompositeRule>(node_);
  }

  absl::variant<LeafRule, CompositeRule> const& node() const { return node_; }

 private:
  absl::variant<LeafRule, CompositeRule> node_;
};

/**
 * Validates a JSON value against the GC rule grammar.
 *
 * The whole tree is checked before anything is returned; the first error
 * found (depth-first, in child order) is reported. When a node has more
 * than one unknown key, the lexicographically smallest one is named.
 *
 * @param raw the decoded JSON, typically from `ParseRuleJson()`.
 * @param is_top_level whether `raw` is the root of the tree. It selects the
 *     root of the `path` reported in error metadata.
 */
StatusOr<Rule> ParseRule(google::protobuf::Value const& raw,
                         bool is_top_level = true);

/**
 * Decodes JSON text into a `google::protobuf::Value`.
 *
 * Text that is not JSON fails with `kMalformedRule`. Rule text may nest as
 * deep as `ParseRule()` accepts; anything deeper fails with
 * `kNestingTooDeep`.
 */
StatusOr<google::protobuf::Value> ParseRuleJson(std::string const& text);

/**
 * Parses a `max_age` string such as "168h".
 *
 * Accepted units are `s`, `m` and `h`, preceded by a positive decimal
 * integer. Other units are rejected with `kInvalidDuration`.
 */
StatusOr<std::chrono::seconds> ParseMaxAge(std::string const& text);

}  // namespace gc_policy
}  // namespace bigtable
}  // namespace cloud
}  // namespace google

#endif  // GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_RULE_H
