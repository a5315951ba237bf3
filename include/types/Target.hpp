#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace kv::types {

struct Target {
    // Lifecycle of a target assignment on this shard. A target enters
    // InTransfer while the coordinator migrates it to another shard.
    enum class State : uint8_t {
        Normal,
        InTransfer
    };

    // Stable identity, computed upstream from the target's origin labels and URL
    uint64_t hash{0};

    // Labels after relabeling; __scheme__, __address__ and __metrics_path__
    // make up the scrape URL
    std::map<std::string, std::string> labels;

    // Reference series count, possibly an estimate from target exploration
    int64_t series{0};

    // Series actually observed by the last scrape
    int64_t total_series{0};

    State state{State::Normal};

    Target() = default;
    Target(uint64_t hash, int64_t series, State state = State::Normal);

    [[nodiscard]] std::string noParamURL() const;

    bool operator==(const Target&) const = default;

    static std::string_view toString(State state) noexcept;
    // An empty string is Normal; older snapshots leave the state unset
    static bool tryParseState(std::string_view in, State& out) noexcept;
};

// job name -> targets of that job, in the order the coordinator sent them
using TargetMap = std::map<std::string, std::vector<Target>>;

void to_json(nlohmann::json& j, const Target& t);
void from_json(const nlohmann::json& j, Target& t);

nlohmann::json targetMapToJson(const TargetMap& targets);

// Tolerates a null map and null per-job lists, both read as empty
TargetMap targetMapFromJson(const nlohmann::json& j);

std::string to_string(Target::State state);

}
