#pragma once

#include <string_view>

#include <absl/base/log_severity.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace countryid {

// "debug" | "info" | "warning" | "error" | "none", case-insensitive
absl::StatusOr<absl::LogSeverityAtLeast> ParseLogLevel(std::string_view level);

// absl::InitializeLog() plus the stderr threshold for `level`
absl::Status InitLogging(std::string_view level);

}  // namespace countryid
