#include "pyreview/output/OutputFormatter.h"

#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>

namespace pyreview {

namespace {

// json::Value asserts on invalid UTF-8; paths and messages can carry raw
// bytes from the file system, so those are replaced with U+FFFD first.
std::string jsonText(const std::string &s) {
    if (llvm::json::isUTF8(s))
        return s;
    return llvm::json::fixUTF8(s);
}

} // anonymous namespace

std::string JSONOutputFormatter::format(const std::vector<Diagnostic> &diagnostics) {
    std::string out;
    llvm::raw_string_ostream os(out);
    {
        llvm::json::OStream J(os, /*IndentSize=*/2);
        J.array([&] {
            for (const auto &d : diagnostics) {
                J.object([&] {
                    J.attribute("file", jsonText(d.location.file));
                    J.attribute("rule_id", jsonText(d.ruleID));
                    J.attribute("category", jsonText(d.category));
                    J.attribute("severity",
                                std::string(severityToString(d.severity)));
                    J.attribute("message", jsonText(d.message));
                    J.attribute("line", static_cast<int64_t>(d.location.line));
                });
            }
        });
    }
    os << "\n";
    os.flush();
    return out;
}

std::unique_ptr<OutputFormatter> createFormatter(std::string_view name) {
    if (name == "json")
        return std::make_unique<JSONOutputFormatter>();
    if (name == "cli")
        return std::make_unique<CLIOutputFormatter>();
    return nullptr;
}

} // namespace pyreview
