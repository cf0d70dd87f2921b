#ifndef SRC_CHUG_CLI_CLI_PARAMS_H_
#define SRC_CHUG_CLI_CLI_PARAMS_H_

#include <string>

#include "chug/base/types.h"

namespace chug::cli {

class CliParams {
 public:
  CliParams() = default;

  static constexpr usize DEFAULT_WINDOW_CAPACITY = 10;
  static constexpr u32 DEFAULT_WORK_MILLIS = 50;

  // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
  std::string mFullCmdLine;

  usize mTotalWork = 0;
  usize mWindowCapacity = DEFAULT_WINDOW_CAPACITY;
  u32 mWorkMillis = DEFAULT_WORK_MILLIS;
  f64 mJitterPercent = 0.0;
  usize mReportEvery = 1;

  bool mEnableVerboseLogging = false;
  // NOLINTEND(misc-non-private-member-variables-in-classes)
};

}  // namespace chug::cli

#endif  // SRC_CHUG_CLI_CLI_PARAMS_H_
