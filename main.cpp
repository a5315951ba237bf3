#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "sidecar/TargetsManager.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <prometheus/registry.h>

using namespace kv::config;
using namespace kv::logging;
using namespace kv::sidecar;
using namespace kv::types;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/kvass/config.yaml";
}

int main(int argc, char** argv) {
    const std::filesystem::path configPath = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

    try {
        ConfigRegistry::init(std::filesystem::exists(configPath) ? loadConfig(configPath) : Config{});
        LogRegistry::init(ConfigRegistry::get().logging.log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to initialize kvass-sidecar: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        if (!std::filesystem::exists(configPath))
            LogRegistry::kvass()->warn("[*] No config at {}, using defaults", configPath.string());

        const auto registry = std::make_shared<prometheus::Registry>();
        TargetsManager manager(ConfigRegistry::get().sidecar, registry);

        manager.addUpdateCallbacks([](const TargetMap& targets) {
            std::size_t n = 0;
            for (const auto& [_, list] : targets) n += list.size();
            LogRegistry::sidecar()->info("[*] Target set updated: {} jobs, {} targets", targets.size(), n);
        });

        LogRegistry::kvass()->info("[*] Loading shard snapshot from {}", ConfigRegistry::get().sidecar.store_dir.string());
        manager.load();

        const auto info = manager.targetsInfo();
        if (info.idle_at) LogRegistry::kvass()->info("[*] Shard is idle");
        LogRegistry::kvass()->info("[✓] kvass-sidecar started, tracking {} targets", info.status.size());

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::seconds(1));

        LogRegistry::kvass()->info("[✓] kvass-sidecar shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        LogRegistry::kvass()->error("[-] kvass-sidecar failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
