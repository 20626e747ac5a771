#include "pyreview/core/RuleRegistry.h"
#include "pyreview/core/Config.h"
#include "pyreview/rules/BuiltinRules.h"

#include <algorithm>

namespace pyreview {

const RuleRegistry &RuleRegistry::builtin() {
#define PYREVIEW_ENTRY(RuleClass) RuleClass##Entry(),
    static const RuleRegistry registry({PYREVIEW_BUILTIN_RULES(PYREVIEW_ENTRY)});
#undef PYREVIEW_ENTRY
    return registry;
}

const RuleDescriptor *RuleRegistry::findByID(std::string_view id) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const RuleEntry &e) {
                               return e.descriptor->id == id;
                           });
    return (it != entries_.end()) ? it->descriptor : nullptr;
}

std::vector<std::unique_ptr<Rule>>
RuleRegistry::instantiate(const std::string &filePath, const Config &cfg) const {
    std::vector<std::unique_ptr<Rule>> rules;
    rules.reserve(entries_.size());
    for (const auto &entry : entries_) {
        if (cfg.isRuleDisabled(std::string(entry.descriptor->id)))
            continue;
        rules.push_back(entry.create(filePath, cfg));
    }
    return rules;
}

} // namespace pyreview
