#include "types/Target.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace kv::types;

namespace {
    std::string labelOr(const std::map<std::string, std::string>& labels,
                        const std::string& key, const std::string& def) {
        const auto it = labels.find(key);
        return it == labels.end() || it->second.empty() ? def : it->second;
    }
}

Target::Target(const uint64_t hash, const int64_t series, const State state)
    : hash(hash), series(series), state(state) {}

std::string Target::noParamURL() const {
    return labelOr(labels, "__scheme__", "http") + "://" +
           labelOr(labels, "__address__", "") +
           labelOr(labels, "__metrics_path__", "/metrics");
}

std::string_view Target::toString(const State state) noexcept {
    switch (state) {
        case State::Normal:     return "normal";
        case State::InTransfer: return "in_transfer";
    }
    return "unknown";
}

bool Target::tryParseState(const std::string_view in, State& out) noexcept {
    if (in == "normal" || in.empty()) { out = State::Normal; return true; }
    if (in == "in_transfer") { out = State::InTransfer; return true; }
    return false;
}

std::string kv::types::to_string(const Target::State state) {
    return std::string(Target::toString(state));
}

void kv::types::to_json(nlohmann::json& j, const Target& t) {
    j = {
        {"Hash", t.hash},
        {"Labels", t.labels},
        {"Series", t.series},
        {"TotalSeries", t.total_series},
        {"State", to_string(t.state)}
    };
}

void kv::types::from_json(const nlohmann::json& j, Target& t) {
    j.at("Hash").get_to(t.hash);

    if (j.contains("Labels") && !j.at("Labels").is_null()) j.at("Labels").get_to(t.labels);
    else t.labels.clear();

    t.series = j.value("Series", static_cast<int64_t>(0));
    t.total_series = j.value("TotalSeries", static_cast<int64_t>(0));

    t.state = Target::State::Normal;
    if (j.contains("State") && !j.at("State").is_null()) {
        const auto str = j.at("State").get<std::string>();
        if (!Target::tryParseState(str, t.state))
            throw std::invalid_argument("Unknown target state: " + str);
    }
}

nlohmann::json kv::types::targetMapToJson(const TargetMap& targets) {
    auto j = nlohmann::json::object();
    for (const auto& [job, list] : targets) j[job] = list;
    return j;
}

TargetMap kv::types::targetMapFromJson(const nlohmann::json& j) {
    TargetMap targets;
    if (j.is_null()) return targets;
    if (!j.is_object()) throw std::invalid_argument("Targets must be a JSON object keyed by job name");

    for (const auto& [job, list] : j.items()) {
        auto& out = targets[job];
        if (list.is_null()) continue;
        list.get_to(out);
    }
    return targets;
}
