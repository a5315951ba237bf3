#include "store/Format.hpp"

#include <nlohmann/json.hpp>

using namespace kv::store;
using namespace kv::types;

CurrentFormat::CurrentFormat(std::string fileName) : fileName_(std::move(fileName)) {}

TargetsInfo CurrentFormat::parse(const nlohmann::json& j) const {
    return j.get<TargetsInfo>();
}

std::string CurrentFormat::serialize(const TargetsInfo& info) {
    return nlohmann::json(info).dump();
}

LegacyFormat::LegacyFormat(std::string fileName) : fileName_(std::move(fileName)) {}

TargetsInfo LegacyFormat::parse(const nlohmann::json& j) const {
    TargetsInfo info;
    info.targets = targetMapFromJson(j);
    return info;
}
