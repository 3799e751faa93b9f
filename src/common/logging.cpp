#include "countryid/common/logging.h"

#include <string>

#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace countryid {

absl::StatusOr<absl::LogSeverityAtLeast> ParseLogLevel(std::string_view level) {
    const std::string lower = absl::AsciiStrToLower(level);
    if (lower == "debug" || lower == "info") {
        return absl::LogSeverityAtLeast::kInfo;
    }
    if (lower == "warning") {
        return absl::LogSeverityAtLeast::kWarning;
    }
    if (lower == "error") {
        return absl::LogSeverityAtLeast::kError;
    }
    if (lower == "none") {
        return absl::LogSeverityAtLeast::kInfinity;
    }
    return absl::InvalidArgumentError(absl::StrCat("Unknown log level: ", level));
}

absl::Status InitLogging(std::string_view level) {
    auto severity = ParseLogLevel(level);
    if (!severity.ok()) {
        return severity.status();
    }
    absl::InitializeLog();
    absl::SetStderrThreshold(*severity);
    return absl::OkStatus();
}

}  // namespace countryid
