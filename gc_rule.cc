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

#include "gc_rule.h"
#include "google/cloud/internal/make_status.h"
#include "google/cloud/status_or.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/types/optional.h"
#include "gc_limits.h"
#include <google/protobuf/struct.pb.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace google {
namespace cloud {
namespace bigtable {
namespace gc_policy {
namespace {

using ::google::protobuf::Value;

Status ValidationError(ValidationErrorKind kind, std::string message,
                       google::cloud::internal::ErrorInfoBuilder info) {
  return google::cloud::internal::InvalidArgumentError(
      std::move(message), std::move(info)
                              .WithReason(ValidationErrorReason(kind))
                              .WithDomain(kValidationErrorDomain));
}

std::string JsonKindName(Value const& value) {
  switch (value.kind_case()) {
    case Value::kNullValue:
      return "null";
    case Value::kNumberValue:
      return "number";
    case Value::kStringValue:
      return "string";
    case Value::kBoolValue:
      return "bool";
    case Value::kStructValue:
      return "object";
    case Value::kListValue:
      return "array";
    case Value::KIND_NOT_SET:
      break;
  }
  return "unset";
}

// Renders a scalar for error messages; containers are named by kind.
std::string JsonScalarText(Value const& value) {
  switch (value.kind_case()) {
    case Value::kNumberValue:
      return absl::StrCat(value.number_value());
    case Value::kStringValue:
      return value.string_value();
    case Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    default:
      return JsonKindName(value);
  }
}

// Returns the smallest key of `fields` outside `allowed`, if any.
absl::optional<std::string> FindUnknownKey(
    google::protobuf::Map<std::string, Value> const& fields,
    std::vector<std::string> const& allowed) {
  absl::optional<std::string> unknown;
  for (auto const& field : fields) {
    if (std::find(allowed.begin(), allowed.end(), field.first) !=
        allowed.end()) {
      continue;
    }
    if (!unknown || field.first < *unknown) unknown = field.first;
  }
  return unknown;
}

StatusOr<std::chrono::seconds> ParseMaxAgeAt(std::string const& text,
                                             std::string const& path) {
  auto invalid = [&](std::string const& why) {
    return ValidationError(
        ValidationErrorKind::kInvalidDuration,
        absl::StrCat("invalid `max_age` duration \"", text, "\": ", why),
        GCP_ERROR_INFO().WithMetadata("path", path).WithMetadata("value",
                                                                 text));
  };
  if (text.size() < 2) {
    return invalid("expected <positive integer><unit>");
  }
  std::int64_t unit_seconds;
  switch (text.back()) {
    case 's':
      unit_seconds = 1;
      break;
    case 'm':
      unit_seconds = 60;
      break;
    case 'h':
      unit_seconds = 3600;
      break;
    default:
      return invalid("unit must be one of `s`, `m` or `h`");
  }
  auto const digits = text.substr(0, text.size() - 1);
  if (!std::all_of(digits.begin(), digits.end(),
                   [](char c) { return absl::ascii_isdigit(c); })) {
    return invalid("expected <positive integer><unit>");
  }
  std::int64_t count;
  if (!absl::SimpleAtoi(digits, &count)) {
    return invalid("value out of range");
  }
  if (count < 1) {
    return invalid("must be positive");
  }
  if (count > kMaxGCRuleAgeSeconds / unit_seconds) {
    return invalid("value out of range");
  }
  return std::chrono::seconds(count * unit_seconds);
}

StatusOr<std::int32_t> ParseMaxVersion(Value const& value,
                                       std::string const& path) {
  auto invalid = [&](std::string const& why) {
    return ValidationError(
        ValidationErrorKind::kInvalidVersionCount,
        absl::StrCat("invalid `max_version` ", JsonScalarText(value), ": ",
                     why),
        GCP_ERROR_INFO()
            .WithMetadata("path", path)
            .WithMetadata("value", JsonScalarText(value)));
  };
  if (value.kind_case() != Value::kNumberValue) {
    return invalid(absl::StrCat("must be a number, got ", JsonKindName(value)));
  }
  auto const n = value.number_value();
  if (!std::isfinite(n) || std::floor(n) != n) {
    return invalid("must be an integer");
  }
  if (n < 1) {
    return invalid("must be at least 1");
  }
  if (n > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
    return invalid("value out of range");
  }
  return static_cast<std::int32_t>(n);
}

StatusOr<Rule> ParseLeaf(
    google::protobuf::Map<std::string, Value> const& fields,
    std::string const& path) {
  auto unknown = FindUnknownKey(fields, {kMaxAgeKey, kMaxVersionKey});
  if (unknown) {
    return ValidationError(
        ValidationErrorKind::kUnknownKey,
        absl::StrCat("unknown key `", *unknown, "` in rule at ", path),
        GCP_ERROR_INFO().WithMetadata("path", path).WithMetadata("key",
                                                                 *unknown));
  }
  auto const max_age = fields.find(kMaxAgeKey);
  auto const max_version = fields.find(kMaxVersionKey);
  bool const has_max_age = max_age != fields.end();
  bool const has_max_version = max_version != fields.end();
  if (has_max_age && has_max_version) {
    return ValidationError(
        ValidationErrorKind::kConflictingLeafFields,
        absl::StrCat("rule at ", path,
                     " sets both `max_age` and `max_version`"),
        GCP_ERROR_INFO().WithMetadata("path", path));
  }
  if (!has_max_age && !has_max_version) {
    return ValidationError(
        ValidationErrorKind::kMissingLeafField,
        absl::StrCat("rule at ", path,
                     " needs `rules`, `max_age` or `max_version`"),
        GCP_ERROR_INFO().WithMetadata("path", path));
  }

  if (has_max_version) {
    auto versions = ParseMaxVersion(max_version->second, path);
    if (!versions) return std::move(versions).status();
    return Rule(LeafRule(MaxVersionsRule{*versions}));
  }
  if (max_age->second.kind_case() != Value::kStringValue) {
    return ValidationError(
        ValidationErrorKind::kInvalidDuration,
        absl::StrCat("`max_age` at ", path, " must be a string, got ",
                     JsonKindName(max_age->second)),
        GCP_ERROR_INFO()
            .WithMetadata("path", path)
            .WithMetadata("value", JsonScalarText(max_age->second)));
  }
  auto age = ParseMaxAgeAt(max_age->second.string_value(), path);
  if (!age) return std::move(age).status();
  return Rule(LeafRule(MaxAgeRule{*age}));
}

// See the comment next to `kMaxGCRuleDepth` for why `depth` bounds the
// recursion.
// NOLINTNEXTLINE(misc-no-recursion)
StatusOr<Rule> ParseNode(Value const& raw, std::string const& path,
                         std::size_t depth) {
  if (depth > kMaxGCRuleDepth) {
    return ValidationError(
        ValidationErrorKind::kNestingTooDeep,
        absl::StrFormat("rules nest deeper than %u levels at %s",
                        kMaxGCRuleDepth, path),
        GCP_ERROR_INFO().WithMetadata("path", path));
  }
  if (raw.kind_case() != Value::kStructValue) {
    return ValidationError(
        ValidationErrorKind::kMalformedRule,
        absl::StrCat("rule at ", path, " must be a JSON object, got ",
                     JsonKindName(raw)),
        GCP_ERROR_INFO().WithMetadata("path", path));
  }
  auto const& fields = raw.struct_value().fields();
  auto const rules = fields.find(kRulesKey);
  if (rules == fields.end()) return ParseLeaf(fields, path);

  auto unknown = FindUnknownKey(fields, {kModeKey, kRulesKey});
  if (unknown) {
    return ValidationError(
        ValidationErrorKind::kUnknownKey,
        absl::StrCat("unknown key `", *unknown, "` in rule at ", path),
        GCP_ERROR_INFO().WithMetadata("path", path).WithMetadata("key",
                                                                 *unknown));
  }
  if (rules->second.kind_case() != Value::kListValue) {
    return ValidationError(
        ValidationErrorKind::kMalformedRule,
        absl::StrCat("`rules` at ", path, " must be an array, got ",
                     JsonKindName(rules->second)),
        GCP_ERROR_INFO().WithMetadata("path", path));
  }
  auto const& elements = rules->second.list_value().values();
  auto const actual = static_cast<std::size_t>(elements.size());

  CompositeMode mode = CompositeMode::kNone;
  auto const mode_field = fields.find(kModeKey);
  if (mode_field == fields.end()) {
    if (actual != 1) {
      return ValidationError(
          ValidationErrorKind::kInvalidRuleCount,
          absl::StrCat("`rules` at ", path, " must have exactly 1 rule when ",
                       "`mode` is not set, got ", actual),
          GCP_ERROR_INFO()
              .WithMetadata("path", path)
              .WithMetadata("expected", "1")
              .WithMetadata("actual", absl::StrCat(actual)));
    }
  } else {
    auto const& mode_value = mode_field->second;
    if (mode_value.kind_case() == Value::kStringValue &&
        mode_value.string_value() == kUnionMode) {
      mode = CompositeMode::kUnion;
    } else if (mode_value.kind_case() == Value::kStringValue &&
               mode_value.string_value() == kIntersectionMode) {
      mode = CompositeMode::kIntersection;
    } else {
      return ValidationError(
          ValidationErrorKind::kInvalidMode,
          absl::StrCat("`mode` at ", path, " must be \"", kUnionMode,
                       "\" or \"", kIntersectionMode, "\", got ",
                       JsonScalarText(mode_value)),
          GCP_ERROR_INFO()
              .WithMetadata("path", path)
              .WithMetadata("value", JsonScalarText(mode_value)));
    }
    if (actual < 2) {
      return ValidationError(
          ValidationErrorKind::kInvalidRuleCount,
          absl::StrCat("`rules` at ", path,
                       " needs at least 2 rules when `mode` is set, got ",
                       actual),
          GCP_ERROR_INFO()
              .WithMetadata("path", path)
              .WithMetadata("expected", "at least 2")
              .WithMetadata("actual", absl::StrCat(actual)));
    }
  }

  CompositeRule composite{mode, {}};
  composite.children.reserve(actual);
  for (int i = 0; i != elements.size(); ++i) {
    auto child = ParseNode(elements.Get(i),
                           absl::StrCat(path, ".rules[", i, "]"), depth + 1);
    if (!child) return std::move(child).status();
    composite.children.push_back(*std::move(child));
  }
  return Rule(std::move(composite));
}

// Every rule level is an object holding a `rules` array. The extra level
// lets rules one step too deep reach `ParseNode()`, which names their path.
constexpr std::size_t kMaxRuleJsonDepth = 2 * kMaxGCRuleDepth + 2;

// NOLINTNEXTLINE(misc-no-recursion)
StatusOr<Value> ToValue(nlohmann::json const& json, std::size_t depth) {
  Value value;
  switch (json.type()) {
    case nlohmann::json::value_t::null:
      value.set_null_value(google::protobuf::NULL_VALUE);
      return value;
    case nlohmann::json::value_t::boolean:
      value.set_bool_value(json.get<bool>());
      return value;
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::number_float:
      value.set_number_value(json.get<double>());
      return value;
    case nlohmann::json::value_t::string:
      value.set_string_value(json.get<std::string>());
      return value;
    case nlohmann::json::value_t::array:
    case nlohmann::json::value_t::object:
      break;
    default:
      return ValidationError(ValidationErrorKind::kMalformedRule,
                             "GC rules must be plain JSON", GCP_ERROR_INFO());
  }
  if (depth > kMaxRuleJsonDepth) {
    return ValidationError(
        ValidationErrorKind::kNestingTooDeep,
        absl::StrFormat("rules nest deeper than %u levels", kMaxGCRuleDepth),
        GCP_ERROR_INFO().WithMetadata("path", "$"));
  }
  if (json.is_array()) {
    auto& list = *value.mutable_list_value();
    for (auto const& element : json) {
      auto child = ToValue(element, depth + 1);
      if (!child) return std::move(child).status();
      *list.add_values() = *std::move(child);
    }
    return value;
  }
  auto& fields = *value.mutable_struct_value()->mutable_fields();
  for (auto const& field : json.items()) {
    auto child = ToValue(field.value(), depth + 1);
    if (!child) return std::move(child).status();
    fields[field.key()] = *std::move(child);
  }
  return value;
}

}  // namespace

std::string ValidationErrorReason(ValidationErrorKind kind) {
  switch (kind) {
    case ValidationErrorKind::kUnknownKey:
      return "UNKNOWN_KEY";
    case ValidationErrorKind::kConflictingLeafFields:
      return "CONFLICTING_LEAF_FIELDS";
    case ValidationErrorKind::kMissingLeafField:
      return "MISSING_LEAF_FIELD";
    case ValidationErrorKind::kInvalidRuleCount:
      return "INVALID_RULE_COUNT";
    case ValidationErrorKind::kInvalidMode:
      return "INVALID_MODE";
    case ValidationErrorKind::kInvalidDuration:
      return "INVALID_DURATION";
    case ValidationErrorKind::kInvalidVersionCount:
      return "INVALID_VERSION_COUNT";
    case ValidationErrorKind::kMalformedRule:
      return "MALFORMED_RULE";
    case ValidationErrorKind::kNestingTooDeep:
      return "NESTING_TOO_DEEP";
    case ValidationErrorKind::kNone:
      break;
  }
  return "";
}

ValidationErrorKind GetValidationErrorKind(Status const& status) {
  if (status.ok() || status.code() != StatusCode::kInvalidArgument ||
      status.error_info().domain() != kValidationErrorDomain) {
    return ValidationErrorKind::kNone;
  }
  for (auto kind : {ValidationErrorKind::kUnknownKey,
                    ValidationErrorKind::kConflictingLeafFields,
                    ValidationErrorKind::kMissingLeafField,
                    ValidationErrorKind::kInvalidRuleCount,
                    ValidationErrorKind::kInvalidMode,
                    ValidationErrorKind::kInvalidDuration,
                    ValidationErrorKind::kInvalidVersionCount,
                    ValidationErrorKind::kMalformedRule,
                    ValidationErrorKind::kNestingTooDeep}) {
    if (status.error_info().reason() == ValidationErrorReason(kind)) {
      return kind;
    }
  }
  return ValidationErrorKind::kNone;
}

StatusOr<Rule> ParseRule(google::protobuf::Value const& raw,
                         bool is_top_level) {
  return ParseNode(raw, is_top_level ? "$" : "rule", 1);
}

StatusOr<google::protobuf::Value> ParseRuleJson(std::string const& text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (nlohmann::json::exception const& e) {
    return ValidationError(
        ValidationErrorKind::kMalformedRule,
        absl::StrCat("could not parse GC rules: ", e.what()),
        GCP_ERROR_INFO());
  }
  return ToValue(json, 1);
}

StatusOr<std::chrono::seconds> ParseMaxAge(std::string const& text) {
  return ParseMaxAgeAt(text, kMaxAgeKey);
}

}  // namespace gc_policy
}  // namespace bigtable
}  // namespace cloud
}  // namespace google
