#pragma once

#include "types/ScrapeStatus.hpp"
#include "types/Target.hpp"

#include <chrono>
#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace kv::types {

// Everything a shard knows about its assignment.
struct TargetsInfo {
    // All targets this shard is scraping
    TargetMap targets;

    // When the shard last became idle; set if and only if status is empty
    std::optional<std::chrono::system_clock::time_point> idle_at;

    // Runtime status of every target in `targets`, never persisted
    StatusMap status;
};

// Serializes Targets and IdleAt only
void to_json(nlohmann::json& j, const TargetsInfo& info);
void from_json(const nlohmann::json& j, TargetsInfo& info);

}
