#include "chug/cli/eta_format.h"

#include <optional>

#include "absl/time/time.h"
#include "catch2/catch_test_macros.hpp"

using chug::cli::FormatEta;
using chug::cli::HumanEta;

TEST_CASE("Formats an estimate as seconds with millisecond precision", "[chug][cli][FormatEta]") {
  CHECK(FormatEta(std::nullopt) == "ETA: None");
  CHECK(FormatEta(absl::ZeroDuration()) == "ETA: 0.000s");
  CHECK(FormatEta(absl::Milliseconds(5)) == "ETA: 0.005s");
  CHECK(FormatEta(absl::Milliseconds(1234)) == "ETA: 1.234s");
  CHECK(FormatEta(absl::Seconds(95) + absl::Milliseconds(40)) == "ETA: 95.040s");
  CHECK(FormatEta(absl::InfiniteDuration()) == "ETA: inf");
}

TEST_CASE("Humanized estimate is truncated to whole seconds", "[chug][cli][HumanEta]") {
  CHECK(HumanEta(std::nullopt) == "unknown");
  CHECK(HumanEta(absl::Milliseconds(999)) == "0");
  CHECK(HumanEta(absl::Milliseconds(90'500)) == "1m30s");
  CHECK(HumanEta(absl::Hours(2) + absl::Minutes(5) + absl::Seconds(3)) == "2h5m3s");
  CHECK(HumanEta(absl::InfiniteDuration()) == "inf");
}
