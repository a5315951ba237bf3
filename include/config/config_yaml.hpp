#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace kv::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SidecarConfig> {
    static Node encode(const SidecarConfig& rhs) {
        Node node;
        node["store_dir"] = rhs.store_dir.string();
        node["store_file_name"] = rhs.store_file_name;
        node["legacy_store_file_name"] = rhs.legacy_store_file_name;
        node["atomic_writes"] = rhs.atomic_writes;
        return node;
    }

    static bool decode(const Node& node, SidecarConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.store_dir = node["store_dir"].as<std::string>("/var/lib/kvass");
        rhs.store_file_name = node["store_file_name"].as<std::string>("kvass-shard.json");
        rhs.legacy_store_file_name = node["legacy_store_file_name"].as<std::string>("targets.json");
        rhs.atomic_writes = node["atomic_writes"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["kvass"]   = to_std_string(spdlog::level::to_string_view(rhs.kvass));
        node["sidecar"] = to_std_string(spdlog::level::to_string_view(rhs.sidecar));
        node["store"]   = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["metrics"] = to_std_string(spdlog::level::to_string_view(rhs.metrics));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.kvass = spdlog::level::from_str(node["kvass"].as<std::string>("info"));
        rhs.sidecar = spdlog::level::from_str(node["sidecar"].as<std::string>("info"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("warn"));
        rhs.metrics = spdlog::level::from_str(node["metrics"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/kvass");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
