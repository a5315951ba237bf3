#include "store/SnapshotStore.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <stdexcept>
#include <system_error>
#include <nlohmann/json.hpp>

using namespace kv::store;
using namespace kv::types;
using namespace kv::logging;

namespace fs = std::filesystem;

SnapshotStore::SnapshotStore(fs::path storeDir,
                             std::vector<std::unique_ptr<SnapshotFormat>> formats,
                             const bool atomicWrites)
    : storeDir_(std::move(storeDir)), formats_(std::move(formats)), atomicWrites_(atomicWrites) {
    if (formats_.empty()) throw std::invalid_argument("SnapshotStore requires at least one format");
}

namespace {
    std::vector<std::unique_ptr<SnapshotFormat>> defaultFormats(const kv::config::SidecarConfig& cfg) {
        std::vector<std::unique_ptr<SnapshotFormat>> formats;
        formats.push_back(std::make_unique<CurrentFormat>(cfg.store_file_name));
        formats.push_back(std::make_unique<LegacyFormat>(cfg.legacy_store_file_name));
        return formats;
    }
}

SnapshotStore::SnapshotStore(const config::SidecarConfig& cfg)
    : SnapshotStore(cfg.store_dir, defaultFormats(cfg), cfg.atomic_writes) {}

std::optional<TargetsInfo> SnapshotStore::load() const {
    for (const auto& format : formats_) {
        const auto path = storeDir_ / format->fileName();

        std::error_code ec;
        const auto st = fs::status(path, ec);
        if (st.type() == fs::file_type::not_found) {
            LogRegistry::store()->debug("[SnapshotStore] No {} snapshot at {}", format->name(), path.string());
            continue;
        }
        if (ec) throw std::runtime_error("load " + format->fileName() + " failed: " + ec.message());

        std::string data;
        try {
            data = util::readFileToString(path);
        } catch (const std::exception& e) {
            throw std::runtime_error("load " + format->fileName() + " failed: " + e.what());
        }

        TargetsInfo info;
        try {
            info = format->parse(nlohmann::json::parse(data));
        } catch (const std::exception& e) {
            throw std::runtime_error("unmarshal " + format->fileName() + ": " + e.what());
        }

        if (format.get() != formats_.front().get())
            LogRegistry::store()->info("[SnapshotStore] Migrating {} snapshot {}", format->name(), path.string());
        return info;
    }

    return std::nullopt;
}

void SnapshotStore::save(const TargetsInfo& info) const {
    fs::create_directories(storeDir_);

    const auto path = currentPath();
    const auto data = CurrentFormat::serialize(info);

    if (atomicWrites_) util::writeFileAtomic(path, data);
    else util::writeFile(path, data);

    LogRegistry::store()->debug("[SnapshotStore] Saved {} bytes to {}", data.size(), path.string());
}

fs::path SnapshotStore::currentPath() const {
    return storeDir_ / formats_.front()->fileName();
}
