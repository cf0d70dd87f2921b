#ifndef SRC_CHUG_CLI_CLI_INTERFACE_H_
#define SRC_CHUG_CLI_CLI_INTERFACE_H_

#include <memory>

#include "CLI/CLI.hpp"
#include "chug/cli/cli_params.h"

namespace chug::cli {

class CliInterface {
 public:
  CliInterface();

  [[nodiscard]] auto RunMain(int argc, const char** argv) -> int;
  [[nodiscard]] auto Params() const -> const CliParams& { return *mParamsPtr; }

 private:
  CLI::App mCliApp;
  std::shared_ptr<CliParams> mParamsPtr;

  static void SimulateSubcmd(CLI::App* app, std::shared_ptr<CliParams>& params);
};

}  // namespace chug::cli

#endif  // SRC_CHUG_CLI_CLI_INTERFACE_H_
