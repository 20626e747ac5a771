#include "pyreview/analysis/SourceDiscovery.h"

#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <system_error>

namespace pyreview {

bool isPythonSource(llvm::StringRef path) {
    return path.endswith(".py");
}

llvm::Expected<std::vector<std::string>> collectSourceFiles(llvm::StringRef root) {
    std::vector<std::string> files;

    llvm::sys::fs::file_status status;
    if (std::error_code EC = llvm::sys::fs::status(root, status))
        return llvm::createStringError(EC, "cannot access '%s': %s",
                                       root.str().c_str(),
                                       EC.message().c_str());

    if (llvm::sys::fs::is_regular_file(status)) {
        if (isPythonSource(root))
            files.push_back(root.str());
        return files;
    }

    if (!llvm::sys::fs::is_directory(status))
        return files;

    std::error_code EC;
    llvm::sys::fs::recursive_directory_iterator it(root, EC,
                                                  /*follow_symlinks=*/false);
    llvm::sys::fs::recursive_directory_iterator end;
    if (EC)
        return llvm::createStringError(EC, "cannot read directory '%s': %s",
                                       root.str().c_str(),
                                       EC.message().c_str());

    for (; it != end; it.increment(EC)) {
        if (EC) {
            llvm::errs() << "pyreview: warning: error walking '" << root
                         << "': " << EC.message() << "\n";
            EC.clear();
            continue;
        }

        const std::string &path = it->path();
        if (!isPythonSource(path))
            continue;

        // Symlinked files count; symlinked directories are never entered.
        auto type = it->type();
        if (type == llvm::sys::fs::file_type::regular_file ||
            ((type == llvm::sys::fs::file_type::symlink_file ||
              type == llvm::sys::fs::file_type::type_unknown) &&
             llvm::sys::fs::is_regular_file(path)))
            files.push_back(path);
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace pyreview
