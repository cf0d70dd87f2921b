#include "chug/base/timer.h"

#include <chrono>
#include <thread>

#include "absl/time/time.h"
#include "catch2/catch_test_macros.hpp"

TEST_CASE("Elapsed span is signed and exact to the nanosecond", "[chug][base][Timer]") {
  const chug::MonoTime start{};
  const auto later = start + std::chrono::microseconds(1500);

  CHECK(chug::ElapsedBetween(start, later) == absl::Microseconds(1500));
  CHECK(chug::ElapsedBetween(later, start) == -absl::Microseconds(1500));
  CHECK(chug::ElapsedBetween(start, start) == absl::ZeroDuration());
}

TEST_CASE("Timer measures monotonic runtime since start or reset", "[chug][base][Timer]") {
  chug::Timer timer;
  std::this_thread::sleep_for(std::chrono::milliseconds(5));

  const auto first = timer.Runtime();
  CHECK(first >= absl::Milliseconds(5));
  CHECK(timer.Runtime() >= first);
  CHECK_FALSE(timer.HumanRuntime().empty());

  timer.Reset();
  CHECK(timer.Runtime() < first);
}
