#include "vdl/warnings.hpp"

#include <algorithm>
#include <cctype>

namespace vdl {

WarningAction WarningCollector::emit(Warning warning,
                                     const std::unordered_map<std::string, std::string>& fields) {
    std::string key = warning_to_string(warning);
    WarningAction action = get_effective_action(key);

    // Warnings with action "ignore" are still collected but marked
    warnings_.push_back({key, fields, action});
    return action;
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    std::string lower_key = key;
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = policy_.find(lower_key);
    if (it != policy_.end()) {
        return it->second;
    }

    // Default: warn
    return WarningAction::Warn;
}

} // namespace vdl
