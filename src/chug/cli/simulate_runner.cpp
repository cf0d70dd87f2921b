#include "chug/cli/simulate_runner.h"

#include <algorithm>
#include <utility>

#include "absl/time/clock.h"
#include "chug/base/logging.h"
#include "chug/base/timer.h"
#include "chug/base/types.h"
#include "chug/cli/eta_format.h"

namespace chug::cli {

SimulateRunner::SimulateRunner(std::shared_ptr<CliParams> params) : mParamsPtr(std::move(params)) {}

auto SimulateRunner::Run() -> core::ProgressEstimator {
  const auto& params = *mParamsPtr;
  LOG_INFO("Simulating {} unit(s) of ~{}ms work with a rolling window of {} tick(s)", params.mTotalWork,
           params.mWorkMillis, params.mWindowCapacity)
  LOG_DEBUG("Command line: {}", params.mFullCmdLine)

  const Timer timer;
  core::ProgressEstimator estimator(params.mWindowCapacity, params.mTotalWork);
  const auto report_every = std::max<usize>(params.mReportEvery, 1);

  for (usize idx = 0; idx < params.mTotalWork; ++idx) {
    // NOLINTNEXTLINE(readability-braces-around-statements)
    if (idx % report_every == 0) LogProgress(estimator, timer.Runtime());

    absl::SleepFor(NextWorkDuration());
    estimator.Tick();
  }

  const auto total_runtime = absl::FormatDuration(absl::Trunc(timer.Runtime(), absl::Milliseconds(1)));
  LOG_INFO("Successfully completed {} unit(s) | {} | Runtime={}", estimator.NumDone(),
           core::ToString(estimator.Status()), total_runtime)
  return estimator;
}

auto SimulateRunner::NextWorkDuration() -> absl::Duration {
  const auto work_ms = static_cast<f64>(mParamsPtr->mWorkMillis);
  const auto jitter_pct = mParamsPtr->mJitterPercent;
  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (jitter_pct <= 0.0 || work_ms <= 0.0) return absl::Milliseconds(mParamsPtr->mWorkMillis);

  const auto scale = 1.0 + (absl::Uniform<f64>(absl::IntervalClosedClosed, mJitterGen, -jitter_pct, jitter_pct) / 100.0);
  return absl::Milliseconds(std::max(0.0, work_ms * scale));
}

void SimulateRunner::LogProgress(const core::ProgressEstimator& estimator, const absl::Duration elapsed) const {
  const auto report = estimator.Report();
  const auto elapsed_rt = absl::FormatDuration(absl::Trunc(elapsed, absl::Seconds(1)));

  LOG_INFO("Progress: {:>8.4f}% | Elapsed: {} | {} ({}) @ {:.2f}/s | {} of {} done", estimator.PercentDone(),
           elapsed_rt, FormatEta(report.mRemaining), HumanEta(report.mRemaining), estimator.RatePerSecond(),
           estimator.NumDone(), estimator.NumTotal())
  LOG_DEBUG("Estimator status: {} | window {}/{}", core::ToString(report.mStatus), estimator.Window().Length(),
            estimator.WindowCapacity())
}

}  // namespace chug::cli
