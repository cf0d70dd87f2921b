#ifndef SRC_CHUG_BASE_VERSION_H_
#define SRC_CHUG_BASE_VERSION_H_

#include <string>

#include "chug_version.h"
#include "spdlog/fmt/fmt.h"

static constexpr auto CHUG_VERSION_TAG = chug::VersionTag;
static constexpr auto CHUG_GIT_BRANCH = chug::GitBranch;
static constexpr auto CHUG_GIT_REVISION = chug::GitRevision;

[[nodiscard]] inline auto ChugFullVersion() -> std::string {
  static const auto result = fmt::format("{}-{}-{}", CHUG_VERSION_TAG, CHUG_GIT_BRANCH, CHUG_GIT_REVISION);
  return result;
}

#endif  // SRC_CHUG_BASE_VERSION_H_
