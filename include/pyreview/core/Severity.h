#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pyreview {

enum class Severity : uint8_t {
    Low    = 0,
    Medium = 1,
    High   = 2,
};

constexpr std::string_view severityToString(Severity s) {
    switch (s) {
        case Severity::Low:    return "LOW";
        case Severity::Medium: return "MEDIUM";
        case Severity::High:   return "HIGH";
    }
    return "UNKNOWN";
}

constexpr std::optional<Severity> severityFromString(std::string_view s) {
    if (s == "LOW")    return Severity::Low;
    if (s == "MEDIUM") return Severity::Medium;
    if (s == "HIGH")   return Severity::High;
    return std::nullopt;
}

constexpr bool operator>=(Severity a, Severity b) {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b);
}

} // namespace pyreview
