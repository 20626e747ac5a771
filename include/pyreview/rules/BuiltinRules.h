#pragma once

#include "pyreview/core/RuleRegistry.h"

namespace pyreview {

// Built-in rules in registry order. The whole-file rule comes first so its
// finding leads each file's output.
#define PYREVIEW_BUILTIN_RULES(X)                                              \
    X(ORG001_LargeFile)                                                        \
    X(MAINT001_LongFunction)                                                   \
    X(DEPR001_DeprecatedImport)                                                \
    X(MAINT002_TooManyParameters)                                              \
    X(SMELL001_DeepNesting)

#define PYREVIEW_DECLARE_RULE_ENTRY(RuleClass) RuleEntry RuleClass##Entry();
PYREVIEW_BUILTIN_RULES(PYREVIEW_DECLARE_RULE_ENTRY)
#undef PYREVIEW_DECLARE_RULE_ENTRY

} // namespace pyreview
