#include "chug/cli/cli_interface.h"

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "chug/base/logging.h"
#include "chug/base/types.h"
#include "chug/base/version.h"
#include "chug/cli/simulate_runner.h"
#include "spdlog/fmt/fmt.h"
#include "spdlog/fmt/ostr.h"

namespace {

inline auto MakeCmdLine(const int argc, const char** argv) -> std::string {
  std::string result;
  absl::StrAppend(&result, argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  for (auto idx = 1; idx < argc; ++idx) {
    absl::StrAppend(&result, " ", argv[idx]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  return result;
}

}  // namespace

// clang-format off
  static constexpr auto FIGLET_CHUG_LOGO = R"raw(
       _
      | |
   ___| |__  _   _  __ _
  / __| '_ \| | | |/ _` |
 | (__| | | | |_| | (_| |
  \___|_| |_|\__,_|\__, |
                    __/ |
                   |___/

)raw";
// clang-format on

static constexpr auto APP_NAME_FMT_STR = "Chug, {}\nRolling window time remaining estimator\n";

namespace chug::cli {

CliInterface::CliInterface()
    : mCliApp(fmt::format(APP_NAME_FMT_STR, ChugFullVersion())), mParamsPtr(std::make_shared<CliParams>()) {
  mCliApp.require_subcommand(1);
  SimulateSubcmd(&mCliApp, mParamsPtr);

  static const auto version_printer = [](const usize count) -> void {
    if (count > 0) {
      fmt::print(std::cout, "Chug {}\n", ChugFullVersion());
      std::exit(EXIT_SUCCESS);
    }
  };

  const auto help_printer = [this](const usize count) -> void {
    if (count > 0) {
      fmt::print(std::cerr, "{}", this->mCliApp.help(this->mCliApp.get_name(), CLI::AppFormatMode::Normal));
      std::exit(EXIT_SUCCESS);
    }
  };

  mCliApp.set_help_flag();
  mCliApp.failure_message(CLI::FailureMessage::help);
  static constexpr usize DEFAULT_TERMINAL_FORMATTER_WIDTH = 50;
  mCliApp.get_formatter()->column_width(DEFAULT_TERMINAL_FORMATTER_WIDTH);
  mCliApp.add_flag_function("-v,--version", version_printer, "Print Chug version information")->group("Flags");
  mCliApp.add_flag_function("-h,--help", help_printer, "Print this help message and exit")->group("Flags");
}

auto CliInterface::RunMain(const int argc, const char** argv) -> int {
  try {
    mParamsPtr->mFullCmdLine = MakeCmdLine(argc, argv);
    mCliApp.parse(argc, argv);
  } catch (const CLI::ParseError& err) {
    return mCliApp.exit(err);
  }

  return EXIT_SUCCESS;
}

void CliInterface::SimulateSubcmd(CLI::App* app, std::shared_ptr<CliParams>& params) {
  auto* subcmd = app->add_subcommand("simulate", "Estimate the time remaining for a simulated unit-counted task");
  subcmd->option_defaults()->always_capture_default();

  static constexpr usize MAX_TOTAL_WORK = 10'000'000;
  static constexpr usize MAX_WINDOW_CAPACITY = 100'000;
  static constexpr u32 MAX_WORK_MILLIS = 60'000;
  static constexpr f64 MAX_JITTER_PCT = 100.0;

  // Required
  subcmd->add_option("-n,--total-work", params->mTotalWork, "Total number of units of work to complete")
      ->required(true)
      ->group("Required")
      ->check(CLI::Range(usize(0), MAX_TOTAL_WORK));

  // Parameters
  subcmd->add_option("-w,--window", params->mWindowCapacity, "Number of most recent ticks used for the estimate")
      ->group("Parameters")
      ->check(CLI::Range(usize(0), MAX_WINDOW_CAPACITY));
  subcmd->add_option("-d,--work-ms", params->mWorkMillis, "Simulated milliseconds of work per unit")
      ->group("Parameters")
      ->check(CLI::Range(u32(0), MAX_WORK_MILLIS));
  subcmd->add_option("-j,--jitter-pct", params->mJitterPercent, "Uniform random jitter applied to each unit")
      ->group("Parameters")
      ->check(CLI::Range(0.0, MAX_JITTER_PCT));
  subcmd->add_option("-e,--report-every", params->mReportEvery, "Log progress every N units")
      ->group("Parameters")
      ->check(CLI::Range(usize(1), MAX_TOTAL_WORK));

  // Feature flags
  subcmd->add_flag("--verbose", params->mEnableVerboseLogging, "Turn on verbose logging")->group("Flags");

  subcmd->callback([params]() {
    // NOLINTBEGIN(readability-braces-around-statements)
    if (static_cast<bool>(isatty(fileno(stderr)))) fmt::print(std::cerr, FIGLET_CHUG_LOGO);
    if (params->mEnableVerboseLogging) SetChugLoggerLevel(spdlog::level::debug);
    // NOLINTEND(readability-braces-around-statements)

    LOG_INFO("Starting Chug {}", ChugFullVersion())
    SimulateRunner simulate_runner(params);
    const auto final_state = simulate_runner.Run();
    LOG_DEBUG("Final mean interval over {} tick(s): {}", final_state.Window().Length(),
              absl::FormatDuration(final_state.MeanInterval().value_or(absl::ZeroDuration())))
  });
}

}  // namespace chug::cli
