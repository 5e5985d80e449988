// include/riskgate/regime/regime_history.hpp
#pragma once

#include <deque>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "riskgate/core/types.hpp"
#include "riskgate/regime/regime_types.hpp"

namespace riskgate {

struct RegimeHistoryEntry {
    Timestamp timestamp;
    RegimeState state;

    nlohmann::json to_json() const;
};

/**
 * @brief Per-symbol log of detected regimes
 *
 * Each symbol keeps at most kMaxEntries entries; once exceeded the log is
 * cut back to the newest kTrimTo.
 */
class RegimeHistory {
public:
    static constexpr size_t kMaxEntries = 1000;
    static constexpr size_t kTrimTo = 500;

    void record(const std::string& symbol, const RegimeState& state, Timestamp timestamp);

    std::optional<RegimeHistoryEntry> latest(const std::string& symbol) const;

    /**
     * @brief Most recent entries, oldest first
     * @param limit Maximum number of entries returned
     */
    std::vector<RegimeHistoryEntry> get_history(const std::string& symbol,
                                                size_t limit = 100) const;

    size_t size(const std::string& symbol) const;

    std::vector<std::string> symbols() const;

    nlohmann::json to_json(const std::string& symbol, size_t limit = 100) const;

private:
    std::map<std::string, std::deque<RegimeHistoryEntry>> entries_;
};

}  // namespace riskgate
