#pragma once

#include "types/TargetsInfo.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace kv::store {

// One on-disk representation of a shard snapshot. The store tries formats
// in priority order and uses the first whose file exists.
class SnapshotFormat {
public:
    virtual ~SnapshotFormat() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual const std::string& fileName() const = 0;

    // Throws on malformed input
    [[nodiscard]] virtual types::TargetsInfo parse(const nlohmann::json& j) const = 0;
};

// {"Targets": {<job>: [...]}, "IdleAt": <RFC3339|null>}
class CurrentFormat final : public SnapshotFormat {
public:
    explicit CurrentFormat(std::string fileName = "kvass-shard.json");

    [[nodiscard]] std::string_view name() const override { return "current"; }
    [[nodiscard]] const std::string& fileName() const override { return fileName_; }
    [[nodiscard]] types::TargetsInfo parse(const nlohmann::json& j) const override;

    [[nodiscard]] static std::string serialize(const types::TargetsInfo& info);

private:
    std::string fileName_;
};

// {<job>: [...]}, targets only. Read for migration, never written.
class LegacyFormat final : public SnapshotFormat {
public:
    explicit LegacyFormat(std::string fileName = "targets.json");

    [[nodiscard]] std::string_view name() const override { return "legacy"; }
    [[nodiscard]] const std::string& fileName() const override { return fileName_; }
    [[nodiscard]] types::TargetsInfo parse(const nlohmann::json& j) const override;

private:
    std::string fileName_;
};

}
