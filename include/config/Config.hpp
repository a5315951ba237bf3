#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace kv::config {

struct SidecarConfig {
    std::filesystem::path store_dir = "/var/lib/kvass";
    std::string store_file_name = "kvass-shard.json";
    std::string legacy_store_file_name = "targets.json";  // read-only, migrated on load
    bool atomic_writes = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum kvass   = spdlog::level::info;   // Startup/shutdown
    spdlog::level::level_enum sidecar = spdlog::level::info;   // Target updates and transfers
    spdlog::level::level_enum store   = spdlog::level::warn;   // Snapshot I/O failures, migrations
    spdlog::level::level_enum metrics = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/kvass";
    LogLevelsConfig levels;
};

struct Config {
    SidecarConfig sidecar;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

}
