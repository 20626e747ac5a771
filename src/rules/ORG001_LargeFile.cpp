#include "pyreview/core/Config.h"
#include "pyreview/core/Rule.h"
#include "pyreview/core/RuleRegistry.h"
#include "pyreview/rules/BuiltinRules.h"
#include "pyreview/syntax/SourceText.h"

#include <sstream>

namespace pyreview {

namespace {

class ORG001_LargeFile : public Rule {
public:
    static constexpr RuleDescriptor kDescriptor{
        "ORG_001", "Organization", Severity::Medium,
        "File is longer than the configured line budget."};

    ORG001_LargeFile(std::string filePath, const Config &cfg)
        : Rule(kDescriptor, std::move(filePath)),
          maxLines_(cfg.largeFileMaxLines) {}

    // Counts raw lines, so it runs even when the file does not parse.
    bool requiresTree() const override { return false; }

    void checkSource(const SourceText &source) override {
        unsigned lines = source.lineCount();
        if (lines <= maxLines_)
            return;

        std::ostringstream msg;
        msg << "File too large (" << lines << " lines)";
        report(msg.str(), 1);
    }

private:
    unsigned maxLines_;
};

} // anonymous namespace

PYREVIEW_DEFINE_RULE_ENTRY(ORG001_LargeFile)

} // namespace pyreview
