// src/regime/regime_history.cpp

#include "riskgate/regime/regime_history.hpp"
#include <algorithm>
#include "riskgate/core/time_utils.hpp"

namespace riskgate {

nlohmann::json RegimeHistoryEntry::to_json() const {
    nlohmann::json j = state.to_json();
    j["timestamp"] = core::to_iso8601(timestamp);
    return j;
}

void RegimeHistory::record(const std::string& symbol, const RegimeState& state,
                           Timestamp timestamp) {
    auto& history = entries_[symbol];
    history.push_back({timestamp, state});
    if (history.size() > kMaxEntries) {
        history.erase(history.begin(), history.end() - static_cast<long>(kTrimTo));
    }
}

std::optional<RegimeHistoryEntry> RegimeHistory::latest(const std::string& symbol) const {
    auto it = entries_.find(symbol);
    if (it == entries_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::vector<RegimeHistoryEntry> RegimeHistory::get_history(const std::string& symbol,
                                                           size_t limit) const {
    auto it = entries_.find(symbol);
    if (it == entries_.end()) {
        return {};
    }
    const auto& history = it->second;
    size_t count = std::min(limit, history.size());
    return std::vector<RegimeHistoryEntry>(history.end() - static_cast<long>(count),
                                           history.end());
}

size_t RegimeHistory::size(const std::string& symbol) const {
    auto it = entries_.find(symbol);
    return it == entries_.end() ? 0 : it->second.size();
}

std::vector<std::string> RegimeHistory::symbols() const {
    std::vector<std::string> names;
    for (const auto& [symbol, history] : entries_) {
        if (!history.empty()) {
            names.push_back(symbol);
        }
    }
    return names;
}

nlohmann::json RegimeHistory::to_json(const std::string& symbol, size_t limit) const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& entry : get_history(symbol, limit)) {
        j.push_back(entry.to_json());
    }
    return j;
}

}  // namespace riskgate
