// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "gc_policy.h"
#include "google/cloud/testing_util/is_proto_equal.h"
#include "google/cloud/testing_util/status_matchers.h"
#include "absl/strings/str_cat.h"
#include "absl/types/optional.h"
#include "gc_limits.h"
#include "gc_rule.h"
#include <google/bigtable/admin/v2/table.pb.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/text_format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <chrono>
#include <cstddef>
#include <string>

namespace google {
namespace cloud {
namespace bigtable {
namespace gc_policy {
namespace {

using ::google::bigtable::admin::v2::GcRule;
using ::google::cloud::StatusCode;
using ::google::cloud::testing_util::IsOkAndHolds;
using ::google::cloud::testing_util::IsProtoEqual;
using ::google::cloud::testing_util::StatusIs;
using ::google::protobuf::Value;

Value Json(std::string const& text) {
  auto value = ParseRuleJson(text);
  EXPECT_STATUS_OK(value);
  return value ? *value : Value();
}

GcRule Policy(std::string const& text) {
  GcRule rule;
  EXPECT_TRUE(google::protobuf::TextFormat::ParseFromString(text, &rule));
  return rule;
}

// Parses and compiles `text`, failing the test on validation errors.
GcRule CompileJson(std::string const& text) {
  auto rule = ParseRule(Json(text));
  EXPECT_STATUS_OK(rule);
  if (!rule) return GcRule();
  return Compile(*rule);
}

TEST(GcPolicyCompile, SingleRuleCompilesToTheRule) {
  EXPECT_THAT(CompileJson(R"({"rules": [{"max_version": 10}]})"),
              IsProtoEqual(Policy("max_num_versions: 10")));
}

TEST(GcPolicyCompile, Union) {
  EXPECT_THAT(
      CompileJson(
          R"({"mode": "union", "rules": [{"max_age": "168h"}, {"max_version": 10}]})"),
      IsProtoEqual(Policy(R"pb(
        union {
          rules { max_age { seconds: 604800 } }
          rules { max_num_versions: 10 }
        }
      )pb")));
}

TEST(GcPolicyCompile, Intersection) {
  EXPECT_THAT(
      CompileJson(
          R"({"mode": "intersection", "rules": [{"max_age": "168h"}, {"max_version": 10}]})"),
      IsProtoEqual(Policy(R"pb(
        intersection {
          rules { max_age { seconds: 604800 } }
          rules { max_num_versions: 10 }
        }
      )pb")));
}

TEST(GcPolicyCompile, NoRuleIsNoGc) {
  auto policy = Compile(absl::optional<Rule>());
  EXPECT_EQ(GcRule::RULE_NOT_SET, policy.rule_case());
}

TEST(GcPolicyCompile, NestedSingleRuleWrappersAreUnwrapped) {
  EXPECT_THAT(CompileJson(R"({
    "mode": "intersection",
    "rules": [
      {"rules": [{"rules": [{"max_age": "30m"}]}]},
      {"mode": "union", "rules": [{"max_version": 3}, {"max_age": "45s"}]}
    ]})"),
              IsProtoEqual(Policy(R"pb(
                intersection {
                  rules { max_age { seconds: 1800 } }
                  rules {
                    union {
                      rules { max_num_versions: 3 }
                      rules { max_age { seconds: 45 } }
                    }
                  }
                }
              )pb")));
}

TEST(GcPolicyCompile, IsDeterministic) {
  auto rule = ParseRule(Json(R"({
    "mode": "union",
    "rules": [
      {"max_version": 7},
      {"mode": "intersection", "rules": [{"max_age": "2h"}, {"max_version": 2}]},
      {"max_age": "1s"}
    ]})"));
  ASSERT_STATUS_OK(rule);
  auto first = Compile(*rule);
  auto second = Compile(*rule);
  EXPECT_THAT(second, IsProtoEqual(first));
  EXPECT_EQ(first.SerializeAsString(), second.SerializeAsString());
}

TEST(GcPolicyDecompile, NoGcIsAbsent) {
  auto canonical = Decompile(GcRule());
  ASSERT_STATUS_OK(canonical);
  EXPECT_FALSE(canonical->has_value());
}

TEST(GcPolicyDecompile, EmptyCombinatorsAreAbsent) {
  for (auto const* text : {"union {}", "intersection {}"}) {
    SCOPED_TRACE(text);
    auto canonical = Decompile(Policy(text));
    ASSERT_STATUS_OK(canonical);
    EXPECT_FALSE(canonical->has_value());
  }
}

TEST(GcPolicyDecompile, TopLevelLeafUsesSingleRuleForm) {
  auto canonical = Decompile(Policy("max_num_versions: 10"));
  ASSERT_STATUS_OK(canonical);
  ASSERT_TRUE(canonical->has_value());
  EXPECT_THAT(**canonical,
              IsProtoEqual(Json(R"({"rules": [{"max_version": 10}]})")));

  canonical = Decompile(Policy("max_age { seconds: 604800 }"));
  ASSERT_STATUS_OK(canonical);
  ASSERT_TRUE(canonical->has_value());
  EXPECT_THAT(**canonical,
              IsProtoEqual(Json(R"({"rules": [{"max_age": "168h"}]})")));
}

TEST(GcPolicyDecompile, NestedLeafIsBare) {
  auto canonical = Decompile(Policy("max_age { seconds: 90 }"),
                             /*is_top_level=*/false);
  ASSERT_STATUS_OK(canonical);
  ASSERT_TRUE(canonical->has_value());
  EXPECT_THAT(**canonical, IsProtoEqual(Json(R"({"max_age": "90s"})")));
}

TEST(GcPolicyDecompile, Combinators) {
  auto canonical = Decompile(Policy(R"pb(
    union {
      rules { max_age { seconds: 604800 } }
      rules {
        intersection {
          rules { max_num_versions: 1 }
          rules { max_age { seconds: 600 } }
        }
      }
    }
  )pb"));
  ASSERT_STATUS_OK(canonical);
  ASSERT_TRUE(canonical->has_value());
  EXPECT_THAT(**canonical, IsProtoEqual(Json(R"({
    "mode": "union",
    "rules": [
      {"max_age": "168h"},
      {"mode": "intersection", "rules": [{"max_version": 1}, {"max_age": "10m"}]}
    ]})")));
}

TEST(GcPolicyDecompile, SingleChildCombinatorUsesSingleRuleForm) {
  auto canonical = Decompile(Policy(R"pb(
    intersection {
      rules { max_num_versions: 2 }
      rules { union { rules { max_num_versions: 4 } } }
    }
  )pb"));
  ASSERT_STATUS_OK(canonical);
  ASSERT_TRUE(canonical->has_value());
  EXPECT_THAT(**canonical, IsProtoEqual(Json(R"({
    "mode": "intersection",
    "rules": [{"max_version": 2}, {"rules": [{"max_version": 4}]}]})")));

  // The grammar has no 1-ary combinator, so the policy compiles back to its
  // only child.
  auto rule = ParseRule(**canonical);
  ASSERT_STATUS_OK(rule);
  EXPECT_THAT(Compile(*rule), IsProtoEqual(Policy(R"pb(
                intersection {
                  rules { max_num_versions: 2 }
                  rules { max_num_versions: 4 }
                }
              )pb")));
}

TEST(GcPolicyDecompile, PoliciesWithoutRuleForm) {
  for (auto const* text : {
           "union { rules { max_num_versions: 1 } rules {} }",
           "intersection { rules { union {} } rules { max_num_versions: 1 } }",
           "max_age { seconds: 1 nanos: 500000000 }",
           "max_age { nanos: 1000000 }",
           "union { rules { max_age { seconds: -5 } } "
           "rules { max_num_versions: 1 } }",
           "max_num_versions: 0",
           "intersection { rules { max_num_versions: -3 } "
           "rules { max_age { seconds: 60 } } }",
       }) {
    SCOPED_TRACE(text);
    EXPECT_THAT(Decompile(Policy(text)),
                StatusIs(StatusCode::kInvalidArgument));
  }
}

TEST(GcPolicyDecompile, RoundTrip) {
  for (auto const* text : {
           "max_num_versions: 1",
           "max_age { seconds: 604800 }",
           "max_age { seconds: 5400 }",
           "max_age { seconds: 61 }",
           "union { rules { max_age { seconds: 3600 } } "
           "rules { max_num_versions: 10 } }",
           "intersection { rules { max_num_versions: 3 } "
           "rules { max_age { seconds: 86400 } } rules { max_num_versions: 5 } }",
           "union { rules { intersection { rules { max_num_versions: 2 } "
           "rules { max_age { seconds: 120 } } } } "
           "rules { union { rules { max_age { seconds: 1 } } "
           "rules { max_num_versions: 100 } } } }",
       }) {
    SCOPED_TRACE(text);
    auto const policy = Policy(text);
    auto canonical = Decompile(policy);
    ASSERT_STATUS_OK(canonical);
    ASSERT_TRUE(canonical->has_value());
    auto json = RuleJsonToString(**canonical);
    ASSERT_STATUS_OK(json);
    auto rule = ParseRule(Json(*json));
    ASSERT_STATUS_OK(rule);
    EXPECT_THAT(Compile(*rule), IsProtoEqual(policy));
  }
}

TEST(GcPolicyDecompile, FormatMaxAge) {
  EXPECT_EQ("168h", FormatMaxAge(std::chrono::hours(168)));
  EXPECT_EQ("90m", FormatMaxAge(std::chrono::minutes(90)));
  EXPECT_EQ("61s", FormatMaxAge(std::chrono::seconds(61)));
  EXPECT_EQ("1h", FormatMaxAge(std::chrono::seconds(3600)));
}

TEST(GcPolicyValidity, ValidRules) {
  EXPECT_STATUS_OK(CheckGCRuleIsValid(GcRule()));
  EXPECT_STATUS_OK(CheckGCRuleIsValid(Policy("union {}")));
  EXPECT_STATUS_OK(CheckGCRuleIsValid(Policy("max_age { nanos: 1000000 }")));
  EXPECT_STATUS_OK(CheckGCRuleIsValid(
      CompileJson(R"({"mode": "union", "rules": [{"max_age": "168h"}, )"
                  R"({"max_version": 10}]})")));
}

TEST(GcPolicyValidity, InvalidRules) {
  for (auto const* text : {
           "max_num_versions: 0",
           "max_age { seconds: 0 }",
           "max_age { nanos: 999999 }",
           "union { rules { max_num_versions: 1 } rules { max_num_versions: "
           "-1 } }",
       }) {
    SCOPED_TRACE(text);
    EXPECT_THAT(CheckGCRuleIsValid(Policy(text)),
                StatusIs(StatusCode::kInvalidArgument));
  }
}

TEST(GcPolicyValidity, ErrorNamesTheFailingRule) {
  auto status = CheckGCRuleIsValid(Policy(R"pb(
    union {
      rules { max_num_versions: 1 }
      rules {
        intersection {
          rules { max_age { seconds: 60 } }
          rules { max_num_versions: 0 }
        }
      }
    }
  )pb"));
  EXPECT_THAT(status, StatusIs(StatusCode::kInvalidArgument,
                               ::testing::HasSubstr("max_num_versions")));
  EXPECT_EQ("$.rules[1].rules[1]", status.error_info().metadata().at("path"));
}

TEST(GcPolicyJson, PrintsDeeplyNestedRules) {
  std::string text = R"({"max_version":1})";
  for (std::size_t i = 1; i < kMaxGCRuleDepth; ++i) {
    text = absl::StrCat(R"({"rules":[)", text, "]}");
  }
  EXPECT_THAT(RuleJsonToString(Json(text)), IsOkAndHolds(text));
}

TEST(GcPolicyJson, PrintsWholeNumbersWithoutFraction) {
  EXPECT_THAT(
      RuleJsonToString(Json(R"({"mode": "union", "rules": [)"
                            R"({"max_age": "7h"}, {"max_version": 10}]})")),
      IsOkAndHolds(R"({"mode":"union","rules":[{"max_age":"7h"},)"
                   R"({"max_version":10}]})"));
  EXPECT_THAT(RuleJsonToString(Value()),
              StatusIs(StatusCode::kInvalidArgument));
}

TEST(GcPolicyValidity, OversizedRule) {
  GcRule rule;
  for (int i = 0; i != 200; ++i) {
    rule.mutable_union_()->add_rules()->set_max_num_versions(i + 1);
  }
  ASSERT_GT(rule.ByteSizeLong(), kMaxGCRuleSize);
  EXPECT_THAT(CheckGCRuleIsValid(rule),
              StatusIs(StatusCode::kInvalidArgument,
                       ::testing::HasSubstr("too large")));
}

TEST(GcPolicyDebugString, Renders) {
  EXPECT_EQ("NoGC", GcRuleDebugString(GcRule()));
  EXPECT_EQ("MaxVersions(10)",
            GcRuleDebugString(Policy("max_num_versions: 10")));
  EXPECT_EQ("MaxAge(1.500s)",
            GcRuleDebugString(Policy("max_age { seconds: 1 nanos: 500000000 }")));
  EXPECT_EQ("Union[MaxAge(168h), MaxVersions(10)]",
            GcRuleDebugString(Policy(R"pb(
              union {
                rules { max_age { seconds: 604800 } }
                rules { max_num_versions: 10 }
              }
            )pb")));
  EXPECT_EQ("Intersection[MaxVersions(1), Union[]]",
            GcRuleDebugString(Policy(R"pb(
              intersection {
                rules { max_num_versions: 1 }
                rules { union {} }
              }
            )pb")));
}

}  // namespace
}  // namespace gc_policy
}  // namespace bigtable
}  // namespace cloud
}  // namespace google
