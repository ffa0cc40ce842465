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

#ifndef GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_POLICY_MANAGER_H
#define GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_POLICY_MANAGER_H

#include "google/cloud/bigtable/table_resource.h"
#include "google/cloud/status.h"
#include "google/cloud/status_or.h"
#include "absl/types/optional.h"
#include "persist/gc_policy_store.h"
#include <google/bigtable/admin/v2/table.pb.h>
#include <google/protobuf/struct.pb.h>
#include <grpcpp/client_context.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace google {
namespace cloud {
namespace bigtable {
namespace gc_policy {

// What releasing a managed GC policy does to the store.
enum class DeletionMode {
  // Reset the family's policy to "no GC".
  kDefault,
  // Leave the live policy untouched. Replicated instances do not allow
  // removing a GC policy.
  kAbandon,
};

/**
 * Parses the `deletion_policy` of a GC policy configuration.
 *
 * "ABANDON" selects `kAbandon`; "DEFAULT" and the empty string select
 * `kDefault`. Matching ignores case.
 */
StatusOr<DeletionMode> ParseDeletionMode(std::string const& name);

std::string DeletionModeName(DeletionMode mode);

/// The GC configuration of one column family, as last applied.
struct ColumnFamilyGCConfig {
  TableResource table;
  std::string column_family_id;
  google::bigtable::admin::v2::GcRule policy;
  DeletionMode deletion_mode;
};

/**
 * Applies JSON GC rules to column families and reads them back.
 *
 * Rules are validated and compiled before the store is contacted, so an
 * invalid rule never reaches it. The manager remembers which families it
 * configured; `Release()` forgets them.
 *
 * Calls for different column families may run concurrently. Concurrent
 * calls for the same family must be serialized by the caller.
 */
class GcPolicyManager {
 public:
  explicit GcPolicyManager(std::shared_ptr<GcPolicyStore> store);

  /**
   * Validates, compiles and applies a GC rule.
   *
   * @param raw_rule the JSON rule tree; `absl::nullopt` applies "no GC".
   * @param deletion_mode what a later `Release()` should default to; it is
   *     recorded in the family's `ColumnFamilyGCConfig`.
   *
   * @return the policy as stored. Validation errors are returned before
   *     any call to the store.
   */
  StatusOr<google::bigtable::admin::v2::GcRule> Apply(
      grpc::ClientContext& context, TableResource const& table,
      std::string const& column_family_id,
      absl::optional<google::protobuf::Value> const& raw_rule,
      DeletionMode deletion_mode = DeletionMode::kDefault);

  /**
   * Reads the canonical JSON rule tree of a column family.
   *
   * @return `absl::nullopt` if the family has no GC policy or does not
   *     exist.
   */
  StatusOr<absl::optional<google::protobuf::Value>> Read(
      grpc::ClientContext& context, TableResource const& table,
      std::string const& column_family_id);

  /// Reads the canonical JSON rule trees of all column families of a table.
  StatusOr<std::map<std::string, absl::optional<google::protobuf::Value>>>
  List(grpc::ClientContext& context, TableResource const& table);

  /**
   * Stops managing the GC policy of a column family.
   *
   * With `DeletionMode::kAbandon` the store is not contacted and the call
   * always succeeds. Otherwise the family's policy is reset to "no GC".
   */
  Status Release(grpc::ClientContext& context, TableResource const& table,
                 std::string const& column_family_id,
                 DeletionMode deletion_mode);

  bool IsManaged(TableResource const& table,
                 std::string const& column_family_id) const;

  absl::optional<ColumnFamilyGCConfig> ManagedConfig(
      TableResource const& table, std::string const& column_family_id) const;

 private:
  static std::string ColumnFamilyName(TableResource const& table,
                                      std::string const& column_family_id);

  std::shared_ptr<GcPolicyStore> store_;
  std::map<std::string, ColumnFamilyGCConfig> managed_;
  mutable std::mutex mu_;
};

}  // namespace gc_policy
}  // namespace bigtable
}  // namespace cloud
}  // namespace google

#endif  // GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_GC_POLICY_MANAGER_H
