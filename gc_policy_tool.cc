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

#include "google/cloud/bigtable/table_resource.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/strings/str_cat.h"
#include "gc_policy.h"
#include "gc_policy_manager.h"
#include "gc_rule.h"
#include "persist/memory/gc_policy_store.h"
#include "persist/utils/logging.h"
#include <google/protobuf/util/message_differencer.h>
#include <grpcpp/client_context.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

ABSL_FLAG(std::string, rules, "", "the GC rules, as JSON");
ABSL_FLAG(std::string, rules_file, "",
          "a file with the GC rules, as JSON; overrides --rules");
ABSL_FLAG(std::string, table, "projects/test/instances/test/tables/test",
          "the table the rules are applied to in the dry run");
ABSL_FLAG(std::string, column_family, "cf",
          "the column family the rules are applied to in the dry run");
ABSL_FLAG(std::string, deletion_policy, "",
          "deletion policy of the column family: ABANDON or DEFAULT");
ABSL_FLAG(std::string, log_path, "gc_policy_tool.log", "log file path");
ABSL_FLAG(std::string, log_level, "warn",
          "log level: debug, info, warn, error");

namespace {

namespace gc = ::google::cloud::bigtable::gc_policy;

google::cloud::StatusOr<std::string> ReadRules() {
  auto const path = absl::GetFlag(FLAGS_rules_file);
  if (path.empty()) return absl::GetFlag(FLAGS_rules);
  std::ifstream in(path);
  if (!in) {
    return google::cloud::Status(google::cloud::StatusCode::kNotFound,
                                 absl::StrCat("cannot open ", path));
  }
  std::stringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

int Fail(google::cloud::Status const& status) {
  LERROR("gc_policy_tool failed: {} {}", status.code(), status);
  std::cerr << status << "\n";
  return 1;
}

// Validates the rules, then applies them to an in-memory column family and
// reads them back, checking that the canonical form compiles to the same
// policy.
int Run() {
  auto text = ReadRules();
  if (!text) return Fail(text.status());
  auto deletion_mode =
      gc::ParseDeletionMode(absl::GetFlag(FLAGS_deletion_policy));
  if (!deletion_mode) return Fail(deletion_mode.status());
  auto table = google::cloud::bigtable::MakeTableResource(
      absl::GetFlag(FLAGS_table));
  if (!table) return Fail(table.status());
  auto const column_family = absl::GetFlag(FLAGS_column_family);

  absl::optional<google::protobuf::Value> raw;
  if (!text->empty()) {
    auto value = gc::ParseRuleJson(*text);
    if (!value) return Fail(value.status());
    raw = *std::move(value);
  }

  auto store = std::make_shared<gc::MemoryGcPolicyStore>();
  auto created = store->CreateColumnFamily(*table, column_family);
  if (!created.ok()) return Fail(created);
  gc::GcPolicyManager manager(store);

  grpc::ClientContext apply_context;
  auto policy = manager.Apply(apply_context, *table, column_family, raw,
                              *deletion_mode);
  if (!policy) return Fail(policy.status());
  LINFO("dry run applied {} to {}/columnFamilies/{}",
        gc::GcRuleDebugString(*policy), table->FullName(), column_family);
  std::cout << "policy: " << gc::GcRuleDebugString(*policy) << "\n";

  grpc::ClientContext read_context;
  auto canonical = manager.Read(read_context, *table, column_family);
  if (!canonical) return Fail(canonical.status());
  if (!canonical->has_value()) {
    std::cout << "canonical: (no GC policy)\n";
    return 0;
  }
  auto json = gc::RuleJsonToString(**canonical);
  if (!json) return Fail(json.status());
  std::cout << "canonical: " << *json << "\n";

  auto reparsed = gc::ParseRule(**canonical);
  if (!reparsed) return Fail(reparsed.status());
  if (!google::protobuf::util::MessageDifferencer::Equals(
          gc::Compile(*reparsed), *policy)) {
    LERROR("canonical form of {} does not compile back to the policy",
           gc::GcRuleDebugString(*policy));
    std::cerr << "canonical form does not compile back to the policy\n";
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(absl::StrCat(
      "Usage: ", argv[0],
      " --rules='{\"rules\":[{\"max_version\":10}]}'",
      " [--deletion_policy=ABANDON]"));
  absl::ParseCommandLine(argc, argv);
  ConfigureGcPolicyLogging(absl::GetFlag(FLAGS_log_path),
                           absl::GetFlag(FLAGS_log_level));
  std::atexit(ShutdownGcPolicyLogging);

  return Run();
}
