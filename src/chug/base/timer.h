#ifndef SRC_CHUG_BASE_TIMER_H_
#define SRC_CHUG_BASE_TIMER_H_

#include <chrono>
#include <string>

#include "absl/time/time.h"

namespace chug {

using MonoClock = std::chrono::steady_clock;
using MonoTime = MonoClock::time_point;

[[nodiscard]] inline auto MonoNow() -> MonoTime { return MonoClock::now(); }

/// Signed span from `earlier` to `later`, negative if `later` precedes `earlier`
[[nodiscard]] inline auto ElapsedBetween(const MonoTime earlier, const MonoTime later) -> absl::Duration {
  return absl::FromChrono(std::chrono::duration_cast<std::chrono::nanoseconds>(later - earlier));
}

class Timer {
 public:
  Timer() : mStartTime(MonoNow()) {}

  [[nodiscard]] auto Runtime() const -> absl::Duration { return ElapsedBetween(mStartTime, MonoNow()); }
  [[nodiscard]] auto HumanRuntime() const -> std::string { return absl::FormatDuration(Runtime()); }

  void Reset() { mStartTime = MonoNow(); }

 private:
  MonoTime mStartTime;
};

}  // namespace chug

#endif  // SRC_CHUG_BASE_TIMER_H_
