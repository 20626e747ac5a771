#include "pyreview/analysis/BatchAnalyzer.h"
#include "pyreview/analysis/ReportSink.h"
#include "pyreview/analysis/SourceDiscovery.h"
#include "pyreview/core/Config.h"
#include "pyreview/core/Diagnostic.h"
#include "pyreview/core/RuleRegistry.h"
#include "pyreview/core/Severity.h"
#include "pyreview/core/Version.h"
#include "pyreview/output/OutputFormatter.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <memory>
#include <string>
#include <vector>

static llvm::cl::OptionCategory PyreviewCat("pyreview options");

static llvm::cl::opt<std::string> InputPath(
    llvm::cl::Positional,
    llvm::cl::desc("<file or directory to analyze>"),
    llvm::cl::Required,
    llvm::cl::cat(PyreviewCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write the report to <file> (default: report.json)"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(PyreviewCat));

static llvm::cl::alias OutputFileShort(
    "o",
    llvm::cl::desc("Alias for --output"),
    llvm::cl::aliasopt(OutputFile));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Report format (json|cli)"),
    llvm::cl::cat(PyreviewCat));

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to pyreview.yaml"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(PyreviewCat));

static llvm::cl::opt<unsigned> Jobs(
    "jobs",
    llvm::cl::desc("Files analyzed in parallel (0 = one per hardware thread)"),
    llvm::cl::cat(PyreviewCat));

static llvm::cl::alias JobsShort(
    "j",
    llvm::cl::desc("Alias for --jobs"),
    llvm::cl::aliasopt(Jobs));

static llvm::cl::opt<unsigned> MaxFiles(
    "max-files",
    llvm::cl::desc("Stop submitting files after this many (0 = no limit)"),
    llvm::cl::cat(PyreviewCat));

static llvm::cl::opt<std::string> MinSev(
    "min-severity",
    llvm::cl::desc("Minimum severity to report (LOW|MEDIUM|HIGH)"),
    llvm::cl::cat(PyreviewCat));

static llvm::cl::list<std::string> DisabledRules(
    "disable-rule",
    llvm::cl::desc("Skip the rule with this ID (repeatable)"),
    llvm::cl::value_desc("rule-id"),
    llvm::cl::cat(PyreviewCat));

static llvm::cl::opt<bool> Verbose(
    "verbose",
    llvm::cl::desc("Log per-file progress and skipped parses"),
    llvm::cl::cat(PyreviewCat));

static void printVersion(llvm::raw_ostream &OS) {
    OS << "pyreview " << pyreview::kToolVersion << "\n";
}

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(PyreviewCat);
    llvm::cl::SetVersionPrinter(printVersion);
    llvm::cl::ParseCommandLineOptions(argc, argv,
                                      "pyreview - Python codebase quality reviewer\n");

    // Load config.
    pyreview::Config cfg = ConfigPath.empty()
        ? pyreview::Config::defaults()
        : pyreview::Config::loadFromFile(ConfigPath);

    // CLI overrides.
    if (!OutputFile.empty())
        cfg.outputFile = OutputFile;
    if (!OutputFormat.empty())
        cfg.outputFormat = OutputFormat;
    if (Jobs.getNumOccurrences())
        cfg.jobs = Jobs;
    if (MaxFiles.getNumOccurrences())
        cfg.maxFiles = MaxFiles;
    if (Verbose)
        cfg.verbose = true;
    if (!MinSev.empty()) {
        auto sev = pyreview::severityFromString(MinSev.getValue());
        if (!sev) {
            llvm::errs() << "pyreview: error: unknown severity '" << MinSev
                         << "' (expected LOW, MEDIUM or HIGH)\n";
            return 1;
        }
        cfg.minSeverity = *sev;
    }

    const auto &registry = pyreview::RuleRegistry::builtin();
    for (const auto &id : DisabledRules) {
        if (!registry.findByID(id))
            llvm::errs() << "pyreview: warning: unknown rule '" << id
                         << "' in --disable-rule\n";
        cfg.disabledRules.push_back(id);
    }

    std::unique_ptr<pyreview::OutputFormatter> formatter =
        pyreview::createFormatter(cfg.outputFormat);
    if (!formatter) {
        llvm::errs() << "pyreview: error: unknown format '" << cfg.outputFormat
                     << "' (expected json or cli)\n";
        return 1;
    }

    // Discover sources.
    auto filesOrErr = pyreview::collectSourceFiles(InputPath);
    if (!filesOrErr) {
        llvm::errs() << "pyreview: error: " << llvm::toString(filesOrErr.takeError())
                     << "\n";
        return 1;
    }
    const std::vector<std::string> &files = *filesOrErr;

    // Run analysis.
    pyreview::ReportSink sink(cfg.minSeverity);
    pyreview::BatchAnalyzer batch(cfg, registry);
    pyreview::BatchStats stats = batch.run(files, sink);

    if (cfg.verbose)
        llvm::errs() << "pyreview: note: analyzed " << stats.analyzed
                     << " file(s)\n";

    // Emit.
    std::error_code EC;
    llvm::raw_fd_ostream out(cfg.outputFile, EC, llvm::sys::fs::OF_Text);
    if (EC) {
        llvm::errs() << "pyreview: error: cannot open output file '"
                     << cfg.outputFile << "': " << EC.message() << "\n";
        return 1;
    }
    out << formatter->format(sink.diagnostics());
    out.close();
    if (out.has_error()) {
        llvm::errs() << "pyreview: error: cannot write output file '"
                     << cfg.outputFile << "': " << out.error().message() << "\n";
        out.clear_error();
        return 1;
    }

    llvm::outs() << "Analysis complete. Report saved to " << cfg.outputFile
                 << "\n";
    llvm::outs() << "Issues found: " << sink.size() << "\n";
    return 0;
}
