#ifndef SRC_CHUG_CLI_SIMULATE_RUNNER_H_
#define SRC_CHUG_CLI_SIMULATE_RUNNER_H_

#include <memory>

#include "absl/random/random.h"
#include "absl/time/time.h"
#include "chug/cli/cli_params.h"
#include "chug/core/progress_estimator.h"

namespace chug::cli {

/// Drives a ProgressEstimator through a simulated work loop and logs the ETA after every
/// `mReportEvery` units. Each unit sleeps for `mWorkMillis` with optional uniform jitter.
class SimulateRunner {
 public:
  explicit SimulateRunner(std::shared_ptr<CliParams> params);

  /// Returns the estimator as it stands after the final tick
  [[nodiscard]] auto Run() -> core::ProgressEstimator;

 private:
  std::shared_ptr<CliParams> mParamsPtr;
  absl::BitGen mJitterGen;

  [[nodiscard]] auto NextWorkDuration() -> absl::Duration;
  void LogProgress(const core::ProgressEstimator& estimator, absl::Duration elapsed) const;
};

}  // namespace chug::cli

#endif  // SRC_CHUG_CLI_SIMULATE_RUNNER_H_
