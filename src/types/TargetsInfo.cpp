#include "types/TargetsInfo.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace kv::types;
using namespace kv::util;

void kv::types::to_json(nlohmann::json& j, const TargetsInfo& info) {
    j = {
        {"Targets", targetMapToJson(info.targets)},
        {"IdleAt", info.idle_at ? nlohmann::json(toRfc3339(*info.idle_at)) : nlohmann::json(nullptr)}
    };
}

void kv::types::from_json(const nlohmann::json& j, TargetsInfo& info) {
    if (!j.is_object()) throw std::invalid_argument("Snapshot must be a JSON object");

    info.targets = targetMapFromJson(j.contains("Targets") ? j.at("Targets") : nlohmann::json());

    info.idle_at.reset();
    if (j.contains("IdleAt") && !j.at("IdleAt").is_null())
        info.idle_at = parseRfc3339(j.at("IdleAt").get<std::string>());

    info.status.clear();
}
