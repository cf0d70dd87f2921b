#include "chug/cli/eta_format.h"

#include "chug/base/types.h"
#include "spdlog/fmt/fmt.h"

namespace chug::cli {

auto FormatEta(const std::optional<absl::Duration>& eta) -> std::string {
  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (!eta.has_value()) return "ETA: None";
  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (*eta == absl::InfiniteDuration()) return "ETA: inf";

  static constexpr i64 MILLIS_PER_SECOND = 1000;
  const auto total_ms = absl::ToInt64Milliseconds(*eta);
  return fmt::format("ETA: {}.{:03}s", total_ms / MILLIS_PER_SECOND, total_ms % MILLIS_PER_SECOND);
}

auto HumanEta(const std::optional<absl::Duration>& eta) -> std::string {
  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (!eta.has_value()) return "unknown";
  return absl::FormatDuration(absl::Trunc(*eta, absl::Seconds(1)));
}

}  // namespace chug::cli
