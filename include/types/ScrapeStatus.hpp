#pragma once

#include "types/Target.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace kv::types {

// Runtime bookkeeping for one target. Lives only in memory and is rebuilt
// on every load; it survives reconciliations for as long as the target's
// hash keeps being assigned to this shard.
struct ScrapeStatus {
    enum class Health : uint8_t {
        Unknown,
        Up,
        Down
    };

    Target::State state{Target::State::Normal};

    // Scrape attempts since the entry was created or since the target last
    // went from Normal to InTransfer
    uint64_t scrape_times{0};

    int64_t series{0};

    Health health{Health::Unknown};
    std::string last_error;
    std::optional<std::chrono::system_clock::time_point> last_scrape;
    double last_scrape_duration{0};  // seconds

    ScrapeStatus() = default;
    explicit ScrapeStatus(int64_t series);

    void setScrapeErr(std::chrono::system_clock::time_point start,
                      std::chrono::system_clock::time_point end,
                      const std::string& err);

    bool operator==(const ScrapeStatus&) const = default;
};

// target hash -> status
using StatusMap = std::unordered_map<uint64_t, ScrapeStatus>;

}
