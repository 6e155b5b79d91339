#pragma once

#include <string_view>

#ifndef SCORE_SEAL_APP_VERSION
#define SCORE_SEAL_APP_VERSION "0.3.0"
#endif

#ifndef SCORE_SEAL_BUILD_RELEASE
#define SCORE_SEAL_BUILD_RELEASE "Integrity Core"
#endif

namespace seal {

inline constexpr std::string_view kAppDisplayName = "Score Seal";
inline constexpr std::string_view kAppVersion = SCORE_SEAL_APP_VERSION;
inline constexpr std::string_view kBuildRelease = SCORE_SEAL_BUILD_RELEASE;

}  // namespace seal
