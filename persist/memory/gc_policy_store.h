/**
 * @file gc_policy_store.h
 * @brief volatile memory-backed GC policy store.
 */

#ifndef GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_PERSIST_MEMORY_GC_POLICY_STORE_H
#define GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_PERSIST_MEMORY_GC_POLICY_STORE_H

#include "google/cloud/status.h"
#include "google/cloud/status_or.h"
#include "absl/types/optional.h"
#include "persist/gc_policy_store.h"
#include <google/bigtable/admin/v2/table.pb.h>
#include <grpcpp/client_context.h>
#include <map>
#include <mutex>
#include <string>

namespace google {
namespace cloud {
namespace bigtable {
namespace gc_policy {

/**
 * Memory-backed store of column family GC policies.
 *
 * Policies are validated with `CheckGCRuleIsValid()` before they are
 * stored, like the column family admin API does. Calls whose deadline has
 * already passed fail with `kDeadlineExceeded` without touching the store.
 */
class MemoryGcPolicyStore : public GcPolicyStore {
 public:
  MemoryGcPolicyStore() = default;

  // Disable copying.
  MemoryGcPolicyStore(MemoryGcPolicyStore const&) = delete;
  MemoryGcPolicyStore& operator=(MemoryGcPolicyStore const&) = delete;

  /**
   * Registers a column family, optionally with an initial policy.
   *
   * @return `kAlreadyExists` if the family is already registered,
   *     `kInvalidArgument` if `gc_rule` is not a valid GC rule.
   */
  Status CreateColumnFamily(
      TableResource const& table, std::string const& column_family_id,
      absl::optional<google::bigtable::admin::v2::GcRule> gc_rule =
          absl::nullopt);

  StatusOr<google::bigtable::admin::v2::GcRule> SetGcPolicy(
      grpc::ClientContext& context, TableResource const& table,
      std::string const& column_family_id,
      google::bigtable::admin::v2::GcRule const& policy) override;

  StatusOr<absl::optional<google::bigtable::admin::v2::GcRule>> GetGcPolicy(
      grpc::ClientContext& context, TableResource const& table,
      std::string const& column_family_id) override;

  StatusOr<std::map<std::string, google::bigtable::admin::v2::GcRule>>
  ListGcPolicies(grpc::ClientContext& context,
                 TableResource const& table) override;

 private:
  using ColumnFamilies =
      std::map<std::string, google::bigtable::admin::v2::GcRule>;

  // Must be called with `mu_` held.
  StatusOr<ColumnFamilies*> FindTable(TableResource const& table);

  std::map<std::string, ColumnFamilies> families_by_table_;
  mutable std::mutex mu_;
};

}  // namespace gc_policy
}  // namespace bigtable
}  // namespace cloud
}  // namespace google

#endif  // GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_PERSIST_MEMORY_GC_POLICY_STORE_H
