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

#include "gc_policy.h"
#include "google/cloud/internal/make_status.h"
#include "google/cloud/status_or.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/types/optional.h"
#include "absl/types/variant.h"
#include "gc_limits.h"
#include "gc_rule.h"
#include <google/bigtable/admin/v2/table.pb.h>
#include <google/protobuf/duration.pb.h>
#include <google/protobuf/repeated_field.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/time_util.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace google {
namespace cloud {
namespace bigtable {
namespace gc_policy {
namespace {

using ::google::bigtable::admin::v2::GcRule;
using ::google::protobuf::Value;
using ::google::protobuf::util::TimeUtil;

// 2^53: larger doubles are not all whole numbers an int64 can round-trip.
constexpr double kMaxExactInteger = 9007199254740992.0;

struct LeafCompiler {
  GcRule operator()(MaxAgeRule const& leaf) const {
    GcRule rule;
    *rule.mutable_max_age() = TimeUtil::SecondsToDuration(leaf.max_age.count());
    return rule;
  }
  GcRule operator()(MaxVersionsRule const& leaf) const {
    GcRule rule;
    rule.set_max_num_versions(leaf.max_versions);
    return rule;
  }
};

struct NodeCompiler {
  GcRule operator()(LeafRule const& leaf) const {
    return absl::visit(LeafCompiler{}, leaf);
  }
  // NOLINTNEXTLINE(misc-no-recursion)
  GcRule operator()(CompositeRule const& composite) const {
    GcRule rule;
    google::protobuf::RepeatedPtrField<GcRule>* children = nullptr;
    switch (composite.mode) {
      case CompositeMode::kNone:
        // `ParseRule()` guarantees exactly one child.
        return Compile(composite.children.front());
      case CompositeMode::kUnion:
        children = rule.mutable_union_()->mutable_rules();
        break;
      case CompositeMode::kIntersection:
        children = rule.mutable_intersection()->mutable_rules();
        break;
    }
    for (auto const& child : composite.children) {
      *children->Add() = Compile(child);
    }
    return rule;
  }
};

StatusOr<std::string> DecompileMaxAge(GcRule const& rule) {
  auto const& max_age = rule.max_age();
  if (max_age.nanos() != 0 || max_age.seconds() < 1) {
    return google::cloud::internal::InvalidArgumentError(
        absl::StrCat("max_age ", TimeUtil::ToString(max_age),
                     " is not a positive whole number of seconds"),
        GCP_ERROR_INFO().WithMetadata("rule", rule.DebugString()));
  }
  return FormatMaxAge(std::chrono::seconds(max_age.seconds()));
}

StatusOr<Value> DecompileNode(GcRule const& rule);

// NOLINTNEXTLINE(misc-no-recursion)
StatusOr<Value> DecompileCombinator(
    char const* mode, google::protobuf::RepeatedPtrField<GcRule> const& rules,
    GcRule const& rule) {
  if (rules.empty()) {
    return google::cloud::internal::InvalidArgumentError(
        absl::StrCat("an empty ", mode, " can only be a top level rule"),
        GCP_ERROR_INFO().WithMetadata("rule", rule.DebugString()));
  }
  Value result;
  auto& fields = *result.mutable_struct_value()->mutable_fields();
  auto& children = *fields[kRulesKey].mutable_list_value();
  for (auto const& r : rules) {
    auto child = DecompileNode(r);
    if (!child) return std::move(child).status();
    *children.add_values() = *std::move(child);
  }
  // A single child is emitted in the single-rule form, since the grammar
  // has no 1-ary union or intersection.
  if (rules.size() > 1) fields[kModeKey].set_string_value(mode);
  return result;
}

// See the comment next to `static_assert(kMaxGCRuleSize ==` for the proof
// of safety of this function despite the recursive calls.
// NOLINTNEXTLINE(misc-no-recursion)
StatusOr<Value> DecompileNode(GcRule const& rule) {
  switch (rule.rule_case()) {
    case GcRule::kMaxAge: {
      auto max_age = DecompileMaxAge(rule);
      if (!max_age) return std::move(max_age).status();
      Value result;
      (*result.mutable_struct_value()->mutable_fields())[kMaxAgeKey]
          .set_string_value(*std::move(max_age));
      return result;
    }
    case GcRule::kMaxNumVersions: {
      if (rule.max_num_versions() < 1) {
        return google::cloud::internal::InvalidArgumentError(
            absl::StrCat("max_num_versions ", rule.max_num_versions(),
                         " is not a positive count"),
            GCP_ERROR_INFO().WithMetadata("rule", rule.DebugString()));
      }
      Value result;
      (*result.mutable_struct_value()->mutable_fields())[kMaxVersionKey]
          .set_number_value(rule.max_num_versions());
      return result;
    }
    case GcRule::kUnion:
      return DecompileCombinator(kUnionMode, rule.union_().rules(), rule);
    case GcRule::kIntersection:
      return DecompileCombinator(kIntersectionMode,
                                 rule.intersection().rules(), rule);
    case GcRule::RULE_NOT_SET:
      return google::cloud::internal::InvalidArgumentError(
          "a rule without GC can only be a top level rule", GCP_ERROR_INFO());
  }
  return google::cloud::internal::InvalidArgumentError(
      "unknown GCRule",
      GCP_ERROR_INFO().WithMetadata("rule", rule.DebugString()));
}

Value SingleRule(Value child) {
  Value result;
  auto& fields = *result.mutable_struct_value()->mutable_fields();
  *fields[kRulesKey].mutable_list_value()->add_values() = std::move(child);
  return result;
}

// NOLINTNEXTLINE(misc-no-recursion)
Status CheckPolicyChildren(
    google::protobuf::RepeatedPtrField<GcRule> const& rules,
    std::string const& path);

// Checks `rule` and its children, naming the failing node by `path` the
// way `ParseRule()` names rule nodes. The size check in
// `CheckGCRuleIsValid()` bounds the recursion, see the comment next to
// `static_assert(kMaxGCRuleSize ==`.
// NOLINTNEXTLINE(misc-no-recursion)
Status CheckPolicyNode(GcRule const& rule, std::string const& path) {
  auto invalid = [&](std::string const& what) {
    return google::cloud::internal::InvalidArgumentError(
        absl::StrCat(what, " at ", path),
        GCP_ERROR_INFO()
            .WithMetadata("path", path)
            .WithMetadata("rule", GcRuleDebugString(rule)));
  };
  switch (rule.rule_case()) {
    case GcRule::kMaxAge:
      if (TimeUtil::DurationToMilliseconds(rule.max_age()) < 1) {
        return invalid("max_age must be at least 1ms");
      }
      return Status();
    case GcRule::kMaxNumVersions:
      if (rule.max_num_versions() < 1) {
        return invalid("max_num_versions must be positive");
      }
      return Status();
    // An empty union or intersection is how clients fold "no GC", so it is
    // accepted just like a rule with nothing set.
    case GcRule::kUnion:
      return CheckPolicyChildren(rule.union_().rules(), path);
    case GcRule::kIntersection:
      return CheckPolicyChildren(rule.intersection().rules(), path);
    case GcRule::RULE_NOT_SET:
      return Status();
  }
  return invalid("unknown GcRule");
}

// NOLINTNEXTLINE(misc-no-recursion)
Status CheckPolicyChildren(
    google::protobuf::RepeatedPtrField<GcRule> const& rules,
    std::string const& path) {
  for (int i = 0; i != rules.size(); ++i) {
    auto status =
        CheckPolicyNode(rules.Get(i), absl::StrCat(path, ".rules[", i, "]"));
    if (!status.ok()) return status;
  }
  return Status();
}

// Whole numbers print without a fraction, the way `max_version` is written.
// NOLINTNEXTLINE(misc-no-recursion)
StatusOr<nlohmann::json> ToJson(Value const& value) {
  switch (value.kind_case()) {
    case Value::kNullValue:
      return nlohmann::json(nullptr);
    case Value::kBoolValue:
      return nlohmann::json(value.bool_value());
    case Value::kNumberValue: {
      auto const n = value.number_value();
      if (!std::isfinite(n)) break;
      if (std::floor(n) == n && std::abs(n) <= kMaxExactInteger) {
        return nlohmann::json(static_cast<std::int64_t>(n));
      }
      return nlohmann::json(n);
    }
    case Value::kStringValue:
      return nlohmann::json(value.string_value());
    case Value::kListValue: {
      auto result = nlohmann::json::array();
      for (auto const& element : value.list_value().values()) {
        auto child = ToJson(element);
        if (!child) return child;
        result.push_back(*std::move(child));
      }
      return result;
    }
    case Value::kStructValue: {
      auto result = nlohmann::json::object();
      for (auto const& field : value.struct_value().fields()) {
        auto child = ToJson(field.second);
        if (!child) return child;
        result[field.first] = *std::move(child);
      }
      return result;
    }
    case Value::KIND_NOT_SET:
      break;
  }
  return google::cloud::internal::InvalidArgumentError(
      "GC rules hold a value with no JSON form", GCP_ERROR_INFO());
}

// NOLINTNEXTLINE(misc-no-recursion)
std::string DebugStringOfChildren(
    google::protobuf::RepeatedPtrField<GcRule> const& rules) {
  std::vector<std::string> children;
  children.reserve(rules.size());
  for (auto const& r : rules) children.push_back(GcRuleDebugString(r));
  return absl::StrJoin(children, ", ");
}

}  // namespace

GcRule Compile(absl::optional<Rule> const& rule) {
  if (!rule) return GcRule();
  return Compile(*rule);
}

// NOLINTNEXTLINE(misc-no-recursion)
GcRule Compile(Rule const& rule) {
  return absl::visit(NodeCompiler{}, rule.node());
}

StatusOr<absl::optional<Value>> Decompile(GcRule const& policy,
                                          bool is_top_level) {
  if (is_top_level) {
    switch (policy.rule_case()) {
      case GcRule::RULE_NOT_SET:
        return absl::optional<Value>();
      case GcRule::kUnion:
        if (policy.union_().rules().empty()) return absl::optional<Value>();
        break;
      case GcRule::kIntersection:
        if (policy.intersection().rules().empty()) {
          return absl::optional<Value>();
        }
        break;
      case GcRule::kMaxAge:
      case GcRule::kMaxNumVersions: {
        auto leaf = DecompileNode(policy);
        if (!leaf) return std::move(leaf).status();
        return absl::make_optional(SingleRule(*std::move(leaf)));
      }
      default:
        break;
    }
  }
  auto node = DecompileNode(policy);
  if (!node) return std::move(node).status();
  return absl::make_optional(*std::move(node));
}

std::string FormatMaxAge(std::chrono::seconds max_age) {
  auto const seconds = max_age.count();
  if (seconds != 0 && seconds % 3600 == 0) {
    return absl::StrCat(seconds / 3600, "h");
  }
  if (seconds != 0 && seconds % 60 == 0) {
    return absl::StrCat(seconds / 60, "m");
  }
  return absl::StrCat(seconds, "s");
}

StatusOr<std::string> RuleJsonToString(google::protobuf::Value const& value) {
  auto json = ToJson(value);
  if (!json) return std::move(json).status();
  try {
    return json->dump();
  } catch (nlohmann::json::exception const& e) {
    return google::cloud::internal::InvalidArgumentError(
        absl::StrCat("could not print GC rules: ", e.what()),
        GCP_ERROR_INFO());
  }
}

Status CheckGCRuleIsValid(GcRule const& rule) {
  auto const size = rule.ByteSizeLong();
  if (size > kMaxGCRuleSize) {
    return google::cloud::internal::InvalidArgumentError(
        absl::StrFormat("GC rule is too large: %u bytes serialized, the "
                        "limit is %u",
                        size, kMaxGCRuleSize),
        GCP_ERROR_INFO().WithMetadata("size", absl::StrCat(size)));
  }
  return CheckPolicyNode(rule, "$");
}

// NOLINTNEXTLINE(misc-no-recursion)
std::string GcRuleDebugString(GcRule const& rule) {
  switch (rule.rule_case()) {
    case GcRule::kMaxAge: {
      auto const& max_age = rule.max_age();
      if (max_age.nanos() == 0) {
        return absl::StrCat(
            "MaxAge(", FormatMaxAge(std::chrono::seconds(max_age.seconds())),
            ")");
      }
      return absl::StrCat("MaxAge(", TimeUtil::ToString(max_age), ")");
    }
    case GcRule::kMaxNumVersions:
      return absl::StrCat("MaxVersions(", rule.max_num_versions(), ")");
    case GcRule::kUnion:
      return absl::StrCat(
          "Union[", DebugStringOfChildren(rule.union_().rules()), "]");
    case GcRule::kIntersection:
      return absl::StrCat(
          "Intersection[", DebugStringOfChildren(rule.intersection().rules()),
          "]");
    case GcRule::RULE_NOT_SET:
      break;
  }
  return "NoGC";
}

}  // namespace gc_policy
}  // namespace bigtable
}  // namespace cloud
}  // namespace google
