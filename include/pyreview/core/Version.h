#pragma once

namespace pyreview {

inline constexpr const char *kToolVersion = "0.3.0";

} // namespace pyreview
