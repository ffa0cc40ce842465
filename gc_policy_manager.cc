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

#include "gc_policy_manager.h"
#include "google/cloud/internal/make_status.h"
#include "google/cloud/status_or.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/types/optional.h"
#include "gc_policy.h"
#include "gc_rule.h"
#include "persist/utils/logging.h"
#include <google/bigtable/admin/v2/table.pb.h>
#include <google/protobuf/struct.pb.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace google {
namespace cloud {
namespace bigtable {
namespace gc_policy {
namespace {

// Adds the operation and column family to a store error, keeping its code
// and error info.
Status WithContext(Status const& status, std::string const& operation,
                   std::string const& name) {
  return Status(status.code(),
                absl::StrCat(operation, "(", name, "): ", status.message()),
                status.error_info());
}

}  // namespace

StatusOr<DeletionMode> ParseDeletionMode(std::string const& name) {
  auto const upper = absl::AsciiStrToUpper(name);
  if (upper.empty() || upper == "DEFAULT") return DeletionMode::kDefault;
  if (upper == "ABANDON") return DeletionMode::kAbandon;
  return google::cloud::internal::InvalidArgumentError(
      absl::StrCat("unknown deletion policy \"", name,
                   "\", expected ABANDON or DEFAULT"),
      GCP_ERROR_INFO().WithMetadata("deletion_policy", name));
}

std::string DeletionModeName(DeletionMode mode) {
  switch (mode) {
    case DeletionMode::kAbandon:
      return "ABANDON";
    case DeletionMode::kDefault:
      break;
  }
  return "DEFAULT";
}

GcPolicyManager::GcPolicyManager(std::shared_ptr<GcPolicyStore> store)
    : store_(std::move(store)) {}

StatusOr<google::bigtable::admin::v2::GcRule> GcPolicyManager::Apply(
    grpc::ClientContext& context, TableResource const& table,
    std::string const& column_family_id,
    absl::optional<google::protobuf::Value> const& raw_rule,
    DeletionMode deletion_mode) {
  auto const name = ColumnFamilyName(table, column_family_id);
  absl::optional<Rule> rule;
  if (raw_rule) {
    auto parsed = ParseRule(*raw_rule, /*is_top_level=*/true);
    if (!parsed) {
      DBG("invalid GC rules for {}: {}", name, parsed.status());
      return std::move(parsed).status();
    }
    rule = *std::move(parsed);
  }
  auto policy = Compile(rule);

  auto stored = store_->SetGcPolicy(context, table, column_family_id, policy);
  if (!stored) {
    LWARN("SetGcPolicy({}) failed: {} {}", name, stored.status().code(),
          stored.status());
    return WithContext(stored.status(), "SetGcPolicy", name);
  }
  DBG("applied GC policy {} to {} (deletion policy {})",
      GcRuleDebugString(*stored), name, DeletionModeName(deletion_mode));

  std::lock_guard<std::mutex> lock(mu_);
  managed_.insert_or_assign(
      name,
      ColumnFamilyGCConfig{table, column_family_id, *stored, deletion_mode});
  return stored;
}

StatusOr<absl::optional<google::protobuf::Value>> GcPolicyManager::Read(
    grpc::ClientContext& context, TableResource const& table,
    std::string const& column_family_id) {
  auto const name = ColumnFamilyName(table, column_family_id);
  auto policy = store_->GetGcPolicy(context, table, column_family_id);
  if (!policy) {
    if (policy.status().code() == StatusCode::kNotFound) {
      DBG("no column family {}, treating as no GC policy", name);
      return absl::optional<google::protobuf::Value>();
    }
    LWARN("GetGcPolicy({}) failed: {} {}", name, policy.status().code(),
          policy.status());
    return WithContext(policy.status(), "GetGcPolicy", name);
  }
  if (!policy->has_value()) return absl::optional<google::protobuf::Value>();
  auto canonical = Decompile(**policy, /*is_top_level=*/true);
  if (!canonical) return WithContext(canonical.status(), "Decompile", name);
  return canonical;
}

StatusOr<std::map<std::string, absl::optional<google::protobuf::Value>>>
GcPolicyManager::List(grpc::ClientContext& context,
                      TableResource const& table) {
  auto policies = store_->ListGcPolicies(context, table);
  if (!policies) {
    LWARN("ListGcPolicies({}) failed: {} {}", table.FullName(),
          policies.status().code(), policies.status());
    return WithContext(policies.status(), "ListGcPolicies", table.FullName());
  }
  std::map<std::string, absl::optional<google::protobuf::Value>> result;
  for (auto const& family : *policies) {
    auto canonical = Decompile(family.second, /*is_top_level=*/true);
    if (!canonical) {
      return WithContext(canonical.status(), "Decompile",
                         ColumnFamilyName(table, family.first));
    }
    result.emplace(family.first, *std::move(canonical));
  }
  return result;
}

Status GcPolicyManager::Release(grpc::ClientContext& context,
                                TableResource const& table,
                                std::string const& column_family_id,
                                DeletionMode deletion_mode) {
  auto const name = ColumnFamilyName(table, column_family_id);
  if (deletion_mode == DeletionMode::kAbandon) {
    DBG("abandoning GC policy of {}, the store is left untouched", name);
    std::lock_guard<std::mutex> lock(mu_);
    managed_.erase(name);
    return Status();
  }

  auto cleared = store_->SetGcPolicy(context, table, column_family_id,
                                     google::bigtable::admin::v2::GcRule());
  if (!cleared) {
    LWARN("SetGcPolicy({}) failed while releasing: {} {}", name,
          cleared.status().code(), cleared.status());
    return WithContext(cleared.status(), "SetGcPolicy", name);
  }
  DBG("released GC policy of {}", name);
  std::lock_guard<std::mutex> lock(mu_);
  managed_.erase(name);
  return Status();
}

bool GcPolicyManager::IsManaged(TableResource const& table,
                                std::string const& column_family_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return managed_.count(ColumnFamilyName(table, column_family_id)) != 0;
}

absl::optional<ColumnFamilyGCConfig> GcPolicyManager::ManagedConfig(
    TableResource const& table, std::string const& column_family_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = managed_.find(ColumnFamilyName(table, column_family_id));
  if (it == managed_.end()) return absl::nullopt;
  return it->second;
}

std::string GcPolicyManager::ColumnFamilyName(
    TableResource const& table, std::string const& column_family_id) {
  return absl::StrCat(table.FullName(), "/columnFamilies/", column_family_id);
}

}  // namespace gc_policy
}  // namespace bigtable
}  // namespace cloud
}  // namespace google
