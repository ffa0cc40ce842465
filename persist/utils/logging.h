#ifndef GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_PERSIST_UTILS_LOGGING_H
#define GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_PERSIST_UTILS_LOGGING_H

#include "google/cloud/status.h"
#include "absl/strings/ascii.h"
#include "fmtlog-inl.h"
#include <string>
#include <string_view>

#define DBG(...) logd(__VA_ARGS__)
#define LINFO(...) logi(__VA_ARGS__)
#define LERROR(...) loge(__VA_ARGS__)
#define LWARN(...) logw(__VA_ARGS__)

// Unknown names select WRN.
static inline fmtlog::LogLevel ParseLogLevel(std::string const& name) {
  auto const level = absl::AsciiStrToLower(name);
  if (level == "dbg" || level == "debug") {
    return fmtlog::DBG;
  }
  if (level == "info" || level == "inf") {
    return fmtlog::INF;
  }
  if (level == "warn" || level == "warning" || level == "wrn") {
    return fmtlog::WRN;
  }
  if (level == "err" || level == "error") {
    return fmtlog::ERR;
  }
  return fmtlog::WRN;
}

static inline void ConfigureGcPolicyLogging(std::string const& log_path,
                                            std::string const& log_level) {
  fmtlog::setLogFile(log_path.c_str(), false);
  fmtlog::setLogLevel(ParseLogLevel(log_level));
  fmtlog::flushOn(fmtlog::WRN);
  fmtlog::setThreadName("main");
}

// Drains the log queue. There is no polling thread.
static inline void ShutdownGcPolicyLogging() {
  fmtlog::poll(true);
  fmtlog::closeLogFile();
}

// Custom fmt formatter for status
template <>
struct fmt::formatter<google::cloud::Status>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(google::cloud::Status status, FormatContext& ctx) const {
    return formatter<std::string_view>::format(status.message(), ctx);
  }
};

// Custom fmt formatter for StatusCode
template <>
struct fmt::formatter<google::cloud::StatusCode>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(google::cloud::StatusCode code, FormatContext& ctx) const {
    return formatter<std::string_view>::format(
        google::cloud::StatusCodeToString(code), ctx);
  }
};

#endif  // GOOGLE_CLOUD_CPP_GOOGLE_CLOUD_BIGTABLE_GC_POLICY_PERSIST_UTILS_LOGGING_H
