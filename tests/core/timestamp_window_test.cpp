#include "chug/core/timestamp_window.h"

#include <algorithm>
#include <chrono>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "chug/base/timer.h"
#include "chug/base/types.h"

using chug::MonoTime;
using chug::core::TimestampWindow;

namespace {

inline auto MillisFromEpoch(const usize millis) -> MonoTime {
  return MonoTime{} + std::chrono::milliseconds(static_cast<i64>(millis));
}

inline auto Contents(const TimestampWindow& window) -> std::vector<MonoTime> {
  return {window.begin(), window.end()};
}

}  // namespace

TEST_CASE("Fresh window is empty with the requested capacity", "[chug][core][TimestampWindow]") {
  const TimestampWindow window(10);
  CHECK(window.Length() == 0);
  CHECK(window.Capacity() == 10);
  CHECK(window.IsEmpty());
  CHECK_FALSE(window.IsFull());
  CHECK(window.begin() == window.end());
}

TEST_CASE("Window length grows to capacity and then holds steady", "[chug][core][TimestampWindow]") {
  static constexpr usize CAPACITY = 10;
  TimestampWindow window(CAPACITY);

  for (usize idx = 0; idx < CAPACITY; ++idx) {
    window.Insert(MillisFromEpoch(idx));
    REQUIRE(window.Length() == idx + 1);
  }

  REQUIRE(window.IsFull());

  for (usize idx = CAPACITY; idx < 3 * CAPACITY; ++idx) {
    window.Insert(MillisFromEpoch(idx));
    REQUIRE(window.Length() == CAPACITY);
  }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
TEST_CASE("Window keeps only the most recent timestamps, oldest first", "[chug][core][TimestampWindow]") {
  for (usize capacity = 0; capacity <= 7; ++capacity) {
    TimestampWindow window(capacity);
    std::vector<MonoTime> inserted;

    for (usize idx = 0; idx < 25; ++idx) {
      const auto timestamp = MillisFromEpoch(idx * 3);
      window.Insert(timestamp);
      inserted.push_back(timestamp);

      const auto num_kept = std::min(capacity, inserted.size());
      const std::vector<MonoTime> expected(inserted.end() - static_cast<isize>(num_kept), inserted.end());
      REQUIRE(window.Length() <= capacity);
      REQUIRE(Contents(window) == expected);

      if (num_kept > 0) {
        REQUIRE(window.Newest() == timestamp);
        REQUIRE(window.Oldest() == expected.front());
        REQUIRE(window[num_kept - 1] == timestamp);
      }
    }
  }
}

TEST_CASE("Zero capacity window discards every insert", "[chug][core][TimestampWindow]") {
  TimestampWindow window(0);
  for (usize idx = 0; idx < 5; ++idx) {
    window.Insert(MillisFromEpoch(idx));
  }

  CHECK(window.Length() == 0);
  CHECK(window.IsEmpty());
  CHECK(window.IsFull());
  CHECK(window.begin() == window.end());
}

TEST_CASE("Single slot window always holds the newest timestamp", "[chug][core][TimestampWindow]") {
  TimestampWindow window(1);
  window.Insert(MillisFromEpoch(1));
  window.Insert(MillisFromEpoch(2));
  window.Insert(MillisFromEpoch(3));

  REQUIRE(window.Length() == 1);
  CHECK(window.Oldest() == MillisFromEpoch(3));
  CHECK(window.Newest() == MillisFromEpoch(3));
}

TEST_CASE("Copied window is independent of the original", "[chug][core][TimestampWindow]") {
  TimestampWindow original(3);
  original.Insert(MillisFromEpoch(1));
  original.Insert(MillisFromEpoch(2));

  auto copy = original;
  copy.Insert(MillisFromEpoch(3));
  copy.Insert(MillisFromEpoch(4));

  CHECK(Contents(original) == std::vector<MonoTime>{MillisFromEpoch(1), MillisFromEpoch(2)});
  CHECK(Contents(copy) == std::vector<MonoTime>{MillisFromEpoch(2), MillisFromEpoch(3), MillisFromEpoch(4)});
}
