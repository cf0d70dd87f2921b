#ifndef SRC_CHUG_CLI_ETA_FORMAT_H_
#define SRC_CHUG_CLI_ETA_FORMAT_H_

#include <optional>
#include <string>

#include "absl/time/time.h"

namespace chug::cli {

/// "ETA: <seconds>.<milliseconds>s", "ETA: inf" or "ETA: None" when there is no estimate
[[nodiscard]] auto FormatEta(const std::optional<absl::Duration>& eta) -> std::string;

/// absl::FormatDuration of the estimate truncated to whole seconds, "unknown" when there is no estimate
[[nodiscard]] auto HumanEta(const std::optional<absl::Duration>& eta) -> std::string;

}  // namespace chug::cli

#endif  // SRC_CHUG_CLI_ETA_FORMAT_H_
