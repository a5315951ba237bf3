#pragma once

#include "store/Format.hpp"
#include "types/TargetsInfo.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace kv::config { struct SidecarConfig; }

namespace kv::store {

class SnapshotStore {
public:
    // formats[0] is the format save() writes
    SnapshotStore(std::filesystem::path storeDir,
                  std::vector<std::unique_ptr<SnapshotFormat>> formats,
                  bool atomicWrites = true);

    // Current format first, legacy as fallback
    explicit SnapshotStore(const config::SidecarConfig& cfg);

    // std::nullopt when no known snapshot file exists
    [[nodiscard]] std::optional<types::TargetsInfo> load() const;

    void save(const types::TargetsInfo& info) const;

    [[nodiscard]] std::filesystem::path currentPath() const;

private:
    std::filesystem::path storeDir_;
    std::vector<std::unique_ptr<SnapshotFormat>> formats_;
    bool atomicWrites_;
};

}
