#include "chug/core/progress_estimator.h"

#include <cmath>
#include <limits>

namespace chug::core {

ProgressEstimator::ProgressEstimator(const usize window_capacity, const usize total_work)
    : mWindow(window_capacity), mNumTotal(total_work) {}

void ProgressEstimator::Tick() { TickAt(MonoNow()); }

void ProgressEstimator::TickAt(const MonoTime timestamp) {
  mNumDone++;
  mWindow.Insert(timestamp);
}

auto ProgressEstimator::Eta() const -> std::optional<absl::Duration> { return Report().mRemaining; }

auto ProgressEstimator::Report() const -> EtaReport {
  const auto mean_ms = MeanIntervalMillis();
  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (!mean_ms.has_value()) return {.mStatus = EtaStatus::WARMING_UP, .mRemaining = std::nullopt};

  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (mNumDone > mNumTotal) return {.mStatus = EtaStatus::WORK_OVERRUN, .mRemaining = std::nullopt};

  const auto remaining = static_cast<u64>(mNumTotal - mNumDone);
  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (remaining == 0) return {.mStatus = EtaStatus::WORK_COMPLETE, .mRemaining = std::nullopt};

  static constexpr auto MAX_MILLIS = static_cast<u64>(std::numeric_limits<i64>::max());
  if (*mean_ms != 0 && remaining > MAX_MILLIS / *mean_ms) {
    return {.mStatus = EtaStatus::ESTIMATING, .mRemaining = absl::InfiniteDuration()};
  }

  const auto eta_ms = static_cast<i64>(*mean_ms * remaining);
  return {.mStatus = EtaStatus::ESTIMATING, .mRemaining = absl::Milliseconds(eta_ms)};
}

auto ProgressEstimator::MeanInterval() const -> std::optional<absl::Duration> {
  const auto mean_ms = MeanIntervalMillis();
  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (!mean_ms.has_value()) return std::nullopt;
  return absl::Milliseconds(static_cast<i64>(*mean_ms));
}

auto ProgressEstimator::RatePerSecond() const -> f64 {
  const auto mean_ms = MeanIntervalMillis();
  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (!mean_ms.has_value() || *mean_ms == 0) return 0.0;

  static constexpr f64 MS_TO_SECS = 1e-3;
  static constexpr f64 UNITS_PER_SECOND_CONVERTER = -1.0;
  return std::pow(static_cast<f64>(*mean_ms) * MS_TO_SECS, UNITS_PER_SECOND_CONVERTER);
}

auto ProgressEstimator::PercentDone() const -> f64 {
  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (mNumTotal == 0) return 100.0;
  return 100.0 * (static_cast<f64>(mNumDone) / static_cast<f64>(mNumTotal));
}

auto ProgressEstimator::MeanIntervalMillis() const -> std::optional<u64> {
  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (mWindow.Length() < 2) return std::nullopt;

  u64 sum_gaps_ms = 0;
  auto itr = mWindow.begin();
  MonoTime previous = *itr;
  for (++itr; itr != mWindow.end(); ++itr) {
    // ToInt64Milliseconds truncates toward zero, out of order timestamps add nothing
    const auto gap_ms = absl::ToInt64Milliseconds(ElapsedBetween(previous, *itr));
    // NOLINTNEXTLINE(readability-braces-around-statements)
    if (gap_ms > 0) sum_gaps_ms += static_cast<u64>(gap_ms);
    previous = *itr;
  }

  return sum_gaps_ms / static_cast<u64>(mWindow.Length());
}

auto ToString(const ProgressEstimator::EtaStatus status) -> std::string {
  using ProgressEstimator::EtaStatus::ESTIMATING;
  using ProgressEstimator::EtaStatus::WARMING_UP;
  using ProgressEstimator::EtaStatus::WORK_COMPLETE;
  using ProgressEstimator::EtaStatus::WORK_OVERRUN;

  switch (status) {
    case WARMING_UP:
      return "WARMING_UP";
    case ESTIMATING:
      return "ESTIMATING";
    case WORK_COMPLETE:
      return "WORK_COMPLETE";
    case WORK_OVERRUN:
      return "WORK_OVERRUN";
    default:
      break;
  }

  return "UNKNOWN";
}

}  // namespace chug::core
