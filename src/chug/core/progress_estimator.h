#ifndef SRC_CHUG_CORE_PROGRESS_ESTIMATOR_H_
#define SRC_CHUG_CORE_PROGRESS_ESTIMATOR_H_

#include <optional>
#include <string>

#include "absl/time/time.h"
#include "chug/base/timer.h"
#include "chug/base/types.h"
#include "chug/core/timestamp_window.h"

namespace chug::core {

class ProgressEstimator {
 public:
  enum class EtaStatus : u8 {
    WARMING_UP = 0,
    ESTIMATING = 1,
    WORK_COMPLETE = 2,
    WORK_OVERRUN = 3,
  };

  struct EtaReport {
    EtaStatus mStatus = EtaStatus::WARMING_UP;
    std::optional<absl::Duration> mRemaining;
  };

  ProgressEstimator(usize window_capacity, usize total_work);

  /// Marks one unit of work as done at the current monotonic time
  void Tick();
  /// Marks one unit of work as done at `timestamp`. A timestamp older than the
  /// newest one already recorded counts as a zero length interval.
  void TickAt(MonoTime timestamp);

  /// Estimated time left until `NumTotal()` units are done. Empty while fewer than two ticks
  /// are in the window, once all work is done, or after more ticks than `NumTotal()`.
  ///
  /// The estimate is mean interval * remaining units, where the mean interval is the sum of
  /// millisecond truncated gaps between consecutive window timestamps divided by the window
  /// length (not by the gap count). The divisor under-estimates the true mean by a factor of
  /// (len - 1) / len and is kept as is so existing consumers see identical numbers.
  ///
  /// Saturates to absl::InfiniteDuration() if the product does not fit in int64 milliseconds.
  [[nodiscard]] auto Eta() const -> std::optional<absl::Duration>;

  /// Same estimate as Eta(), tagged with the reason when no estimate is available.
  /// `mRemaining` is set only for EtaStatus::ESTIMATING.
  [[nodiscard]] auto Report() const -> EtaReport;
  [[nodiscard]] auto Status() const -> EtaStatus { return Report().mStatus; }

  /// Uses the same window length divisor as Eta(), so it reads low by (len - 1) / len
  [[nodiscard]] auto MeanInterval() const -> std::optional<absl::Duration>;
  /// Inverse of MeanInterval(), so it reads high by len / (len - 1) against the true throughput
  [[nodiscard]] auto RatePerSecond() const -> f64;

  [[nodiscard]] auto NumDone() const noexcept -> usize { return mNumDone; }
  [[nodiscard]] auto NumTotal() const noexcept -> usize { return mNumTotal; }
  [[nodiscard]] auto NumRemaining() const noexcept -> usize {
    return mNumDone >= mNumTotal ? 0 : mNumTotal - mNumDone;
  }
  [[nodiscard]] auto PercentDone() const -> f64;

  [[nodiscard]] auto WindowCapacity() const noexcept -> usize { return mWindow.Capacity(); }
  [[nodiscard]] auto Window() const noexcept -> const TimestampWindow& { return mWindow; }

 private:
  TimestampWindow mWindow;
  usize mNumDone = 0;
  usize mNumTotal = 0;

  [[nodiscard]] auto MeanIntervalMillis() const -> std::optional<u64>;
};

[[nodiscard]] auto ToString(ProgressEstimator::EtaStatus status) -> std::string;

}  // namespace chug::core

#endif  // SRC_CHUG_CORE_PROGRESS_ESTIMATOR_H_
