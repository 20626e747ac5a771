#include "pyreview/core/Config.h"

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <string>
#include <vector>

namespace llvm {
namespace yaml {

template <>
struct ScalarEnumerationTraits<pyreview::Severity> {
    static void enumeration(IO &io, pyreview::Severity &sev) {
        io.enumCase(sev, "LOW",    pyreview::Severity::Low);
        io.enumCase(sev, "MEDIUM", pyreview::Severity::Medium);
        io.enumCase(sev, "HIGH",   pyreview::Severity::High);
    }
};

template <>
struct MappingTraits<pyreview::Config> {
    static void mapping(IO &io, pyreview::Config &cfg) {
        io.mapOptional("long_function_max_lines", cfg.longFunctionMaxLines);
        io.mapOptional("max_parameters",          cfg.maxParameters);
        io.mapOptional("max_nesting_depth",       cfg.maxNestingDepth);
        io.mapOptional("large_file_max_lines",    cfg.largeFileMaxLines);
        // Sequences are yamlized in place, so read into a fresh vector rather
        // than appending to the built-in denylist.
        std::vector<std::string> deprecated;
        io.mapOptional("deprecated_modules",      deprecated);
        if (!deprecated.empty())
            cfg.deprecatedModules = std::move(deprecated);
        io.mapOptional("disabled_rules",          cfg.disabledRules);
        io.mapOptional("min_severity",            cfg.minSeverity);
        io.mapOptional("output_file",             cfg.outputFile);
        io.mapOptional("output_format",           cfg.outputFormat);
        io.mapOptional("jobs",                    cfg.jobs);
        io.mapOptional("max_files",               cfg.maxFiles);
        io.mapOptional("verbose",                 cfg.verbose);
    }
};

} // namespace yaml
} // namespace llvm

namespace pyreview {

bool Config::isRuleDisabled(const std::string &id) const {
    return std::find(disabledRules.begin(), disabledRules.end(), id) !=
           disabledRules.end();
}

Config Config::defaults() {
    return Config{};
}

Config Config::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        llvm::errs() << "pyreview: warning: cannot open config '"
                     << path << "', using defaults\n";
        return defaults();
    }

    Config cfg = defaults();
    llvm::yaml::Input yin(bufOrErr.get()->getBuffer());
    yin >> cfg;

    if (yin.error()) {
        llvm::errs() << "pyreview: warning: config parse error in '"
                     << path << "', using defaults\n";
        return defaults();
    }

    return cfg;
}

} // namespace pyreview
