#include "arsc/warnings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <map>

#include <spdlog/spdlog.h>

namespace arsc {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Render fields in a stable order for log lines
std::string describe(const std::unordered_map<std::string, std::string>& fields) {
    std::map<std::string, std::string> sorted(fields.begin(), fields.end());
    std::string out;
    for (const auto& [key, value] : sorted) {
        if (!out.empty()) out += " ";
        out += key + "=" + value;
    }
    return out;
}

} // namespace

namespace warnings {

std::string hex(uint32_t value) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%x", value);
    return buffer;
}

} // namespace warnings

// ============================================================================
// WarningCollector Implementation
// ============================================================================

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    std::string key = warning_to_string(warning);
    WarningAction action = get_effective_action(key);

    switch (action) {
        case WarningAction::Error:
            spdlog::error("{}: {}", key, describe(fields));
            break;
        case WarningAction::Ignore:
            spdlog::debug("{}: {}", key, describe(fields));
            break;
        case WarningAction::Warn:
            spdlog::warn("{}: {}", key, describe(fields));
            break;
    }

    // Ignored warnings are still collected but marked
    warnings_.push_back({key, fields, action});
}

WarningAction WarningCollector::action_for(Warning warning) const {
    return get_effective_action(warning_to_string(warning));
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
    auto it = policy_.find(to_lower(key));
    return it == policy_.end() ? WarningAction::Warn : it->second;
}

} // namespace arsc
