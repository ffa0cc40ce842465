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

#include "persist/memory/gc_policy_store.h"
#include "google/cloud/internal/make_status.h"
#include "google/cloud/status_or.h"
#include "absl/types/optional.h"
#include "gc_policy.h"
#include "persist/utils/logging.h"
#include <google/bigtable/admin/v2/table.pb.h>
#include <grpcpp/client_context.h>
#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace google {
namespace cloud {
namespace bigtable {
namespace gc_policy {
namespace {

Status CheckDeadline(grpc::ClientContext const& context) {
  if (context.deadline() < std::chrono::system_clock::now()) {
    return google::cloud::internal::DeadlineExceededError(
        "deadline exceeded before the call started", GCP_ERROR_INFO());
  }
  return Status();
}

}  // namespace

Status MemoryGcPolicyStore::CreateColumnFamily(
    TableResource const& table, std::string const& column_family_id,
    absl::optional<google::bigtable::admin::v2::GcRule> gc_rule) {
  google::bigtable::admin::v2::GcRule policy;
  if (gc_rule) {
    auto status = CheckGCRuleIsValid(*gc_rule);
    if (!status.ok()) return status;
    policy = *std::move(gc_rule);
  }
  std::lock_guard<std::mutex> lock(mu_);
  auto& families = families_by_table_[table.FullName()];
  if (!families.emplace(column_family_id, std::move(policy)).second) {
    return google::cloud::internal::AlreadyExistsError(
        "Column family already exists.",
        GCP_ERROR_INFO()
            .WithMetadata("table_name", table.FullName())
            .WithMetadata("column_family", column_family_id));
  }
  return Status();
}

StatusOr<google::bigtable::admin::v2::GcRule> MemoryGcPolicyStore::SetGcPolicy(
    grpc::ClientContext& context, TableResource const& table,
    std::string const& column_family_id,
    google::bigtable::admin::v2::GcRule const& policy) {
  auto deadline = CheckDeadline(context);
  if (!deadline.ok()) return deadline;
  auto valid = CheckGCRuleIsValid(policy);
  if (!valid.ok()) {
    LWARN("rejected GC rule for {}: {}", column_family_id, valid);
    return valid;
  }

  std::lock_guard<std::mutex> lock(mu_);
  auto families = FindTable(table);
  if (!families) return std::move(families).status();
  auto it = (*families)->find(column_family_id);
  if (it == (*families)->end()) {
    return google::cloud::internal::NotFoundError(
        "No such column family.",
        GCP_ERROR_INFO()
            .WithMetadata("table_name", table.FullName())
            .WithMetadata("column_family", column_family_id));
  }
  it->second = policy;
  DBG("set GC rule of {}/{} to {}", table.FullName(), column_family_id,
      GcRuleDebugString(policy));
  return it->second;
}

StatusOr<absl::optional<google::bigtable::admin::v2::GcRule>>
MemoryGcPolicyStore::GetGcPolicy(grpc::ClientContext& context,
                                 TableResource const& table,
                                 std::string const& column_family_id) {
  auto deadline = CheckDeadline(context);
  if (!deadline.ok()) return deadline;

  std::lock_guard<std::mutex> lock(mu_);
  auto families = FindTable(table);
  if (!families) return std::move(families).status();
  auto it = (*families)->find(column_family_id);
  if (it == (*families)->end()) {
    return google::cloud::internal::NotFoundError(
        "No such column family.",
        GCP_ERROR_INFO()
            .WithMetadata("table_name", table.FullName())
            .WithMetadata("column_family", column_family_id));
  }
  if (it->second.rule_case() ==
      google::bigtable::admin::v2::GcRule::RULE_NOT_SET) {
    return absl::optional<google::bigtable::admin::v2::GcRule>();
  }
  return absl::make_optional(it->second);
}

StatusOr<std::map<std::string, google::bigtable::admin::v2::GcRule>>
MemoryGcPolicyStore::ListGcPolicies(grpc::ClientContext& context,
                                    TableResource const& table) {
  auto deadline = CheckDeadline(context);
  if (!deadline.ok()) return deadline;

  std::lock_guard<std::mutex> lock(mu_);
  auto families = FindTable(table);
  if (!families) return std::move(families).status();
  return **families;
}

StatusOr<MemoryGcPolicyStore::ColumnFamilies*> MemoryGcPolicyStore::FindTable(
    TableResource const& table) {
  auto it = families_by_table_.find(table.FullName());
  if (it == families_by_table_.end()) {
    return google::cloud::internal::NotFoundError(
        "No such table.",
        GCP_ERROR_INFO().WithMetadata("table_name", table.FullName()));
  }
  return &it->second;
}

}  // namespace gc_policy
}  // namespace bigtable
}  // namespace cloud
}  // namespace google
