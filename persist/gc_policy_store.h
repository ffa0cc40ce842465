/**
 * @file gc_policy_store.h
 * @brief Interface to the store holding column family GC policies.
 */

#ifndef GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_PERSIST_GC_POLICY_STORE_H
#define GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_PERSIST_GC_POLICY_STORE_H

#include "google/cloud/bigtable/table_resource.h"
#include "google/cloud/status_or.h"
#include "absl/types/optional.h"
#include <google/bigtable/admin/v2/table.pb.h>
#include <grpcpp/client_context.h>
#include <map>
#include <string>

namespace google {
namespace cloud {
namespace bigtable {
namespace gc_policy {

/**
 * Reads and writes the GC policy of column families.
 *
 * Every call takes the caller's `grpc::ClientContext`, whose deadline and
 * cancellation bound the call. Implementations never retry; retry and
 * backoff belong to the caller.
 */
class GcPolicyStore {
 public:
  virtual ~GcPolicyStore() = default;

  /**
   * Replaces the GC policy of a column family.
   *
   * A `GcRule` with no rule set clears the policy ("no GC").
   *
   * @return the policy as stored, which may be a normalized form of
   *     `policy`.
   */
  virtual StatusOr<google::bigtable::admin::v2::GcRule> SetGcPolicy(
      grpc::ClientContext& context, TableResource const& table,
      std::string const& column_family_id,
      google::bigtable::admin::v2::GcRule const& policy) = 0;

  /**
   * Reads the GC policy of a column family.
   *
   * @return `absl::nullopt` if the family has no policy, `kNotFound` if
   *     the table or family does not exist.
   */
  virtual StatusOr<absl::optional<google::bigtable::admin::v2::GcRule>>
  GetGcPolicy(grpc::ClientContext& context, TableResource const& table,
              std::string const& column_family_id) = 0;

  /// Reads the GC policies of all column families of a table.
  virtual StatusOr<std::map<std::string, google::bigtable::admin::v2::GcRule>>
  ListGcPolicies(grpc::ClientContext& context, TableResource const& table) = 0;
};

}  // namespace gc_policy
}  // namespace bigtable
}  // namespace cloud
}  // namespace google

#endif  // GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_PERSIST_GC_POLICY_STORE_H
