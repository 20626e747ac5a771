#pragma once

#include "pyreview/core/Rule.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pyreview {

struct Config;

using RuleFactory = std::unique_ptr<Rule> (*)(std::string filePath,
                                              const Config &cfg);

struct RuleEntry {
    const RuleDescriptor *descriptor;
    RuleFactory           create;
};

// Ordered, immutable list of rules. Diagnostics from one file come out in
// this order.
class RuleRegistry {
public:
    explicit RuleRegistry(std::vector<RuleEntry> entries)
        : entries_(std::move(entries)) {}

    // Process-wide list of the built-in rules, built on first use.
    static const RuleRegistry &builtin();

    const std::vector<RuleEntry> &entries() const { return entries_; }

    const RuleDescriptor *findByID(std::string_view id) const;

    // Fresh instances for one file, skipping rules disabled in `cfg`.
    std::vector<std::unique_ptr<Rule>>
    instantiate(const std::string &filePath, const Config &cfg) const;

private:
    std::vector<RuleEntry> entries_;
};

// Defines the entry point a rule .cpp exposes to the registry.
#define PYREVIEW_DEFINE_RULE_ENTRY(RuleClass)                                  \
    ::pyreview::RuleEntry RuleClass##Entry() {                                 \
        return {&RuleClass::kDescriptor,                                       \
                [](std::string file, const ::pyreview::Config &cfg)            \
                    -> std::unique_ptr<::pyreview::Rule> {                     \
                    return std::make_unique<RuleClass>(std::move(file), cfg);  \
                }};                                                            \
    }

} // namespace pyreview
