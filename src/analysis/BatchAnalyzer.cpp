#include "pyreview/analysis/BatchAnalyzer.h"

#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <functional>
#include <future>
#include <semaphore>
#include <thread>

namespace pyreview {

unsigned BatchAnalyzer::workerCount(size_t fileCount) const {
    unsigned jobs = config_.jobs;
    if (jobs == 0)
        jobs = std::max(1u, std::thread::hardware_concurrency());
    return std::max(1u, std::min(jobs, static_cast<unsigned>(fileCount)));
}

BatchStats BatchAnalyzer::run(const std::vector<std::string> &files,
                              ReportSink &sink) const {
    BatchStats stats;

    size_t budget = files.size();
    if (config_.maxFiles > 0 && config_.maxFiles < budget) {
        budget = config_.maxFiles;
        stats.skipped = static_cast<unsigned>(files.size() - budget);
        llvm::errs() << "pyreview: warning: file budget reached, skipping "
                     << stats.skipped << " file(s)\n";
    }

    unsigned workers = workerCount(budget);
    if (workers <= 1) {
        for (size_t i = 0; i < budget; ++i) {
            if (config_.verbose)
                llvm::errs() << "pyreview: note: analyzing " << files[i] << "\n";
            FileResult result = analyzer_.analyzeFile(files[i]);
            result.printMessages(llvm::errs());
            sink.add(std::move(result.diagnostics));
            ++stats.analyzed;
        }
        return stats;
    }

    // A slot is taken before each launch and returned when the task ends,
    // so at most `workers` analyses run at once.
    std::counting_semaphore<> sem(workers);
    std::vector<std::future<FileResult>> futures;
    futures.reserve(budget);

    for (size_t i = 0; i < budget; ++i) {
        sem.acquire();
        futures.push_back(std::async(std::launch::async,
            [this, &sem](const std::string &path) {
                FileResult result = analyzer_.analyzeFile(path);
                sem.release();
                return result;
            },
            std::cref(files[i])));
    }

    // Workers never log; their messages are printed here, in file order.
    for (auto &f : futures) {
        FileResult result = f.get();
        result.printMessages(llvm::errs());
        sink.add(std::move(result.diagnostics));
        ++stats.analyzed;
    }
    return stats;
}

} // namespace pyreview
