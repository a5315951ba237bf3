#include "sidecar/TargetsManager.hpp"
#include "logging/LogRegistry.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>
#include <prometheus/registry.h>

using namespace kv::sidecar;
using namespace kv::types;
using namespace kv::logging;

namespace fs = std::filesystem;

namespace {
    prometheus::Registry& requireRegistry(const std::shared_ptr<prometheus::Registry>& registry) {
        if (!registry) throw std::invalid_argument("TargetsManager requires a metrics registry");
        return *registry;
    }

    // Records the outcome of an update when it goes out of scope, whether the
    // update returned normally or threw.
    class UpdateOutcome {
    public:
        UpdateOutcome(kv::metrics::TargetsMetrics& metrics, const StatusMap& status)
            : metrics_(metrics), status_(status), uncaught_(std::uncaught_exceptions()) {}

        ~UpdateOutcome() { metrics_.record(std::uncaught_exceptions() == uncaught_, status_.size()); }

        UpdateOutcome(const UpdateOutcome&) = delete;
        UpdateOutcome& operator=(const UpdateOutcome&) = delete;

    private:
        kv::metrics::TargetsMetrics& metrics_;
        const StatusMap& status_;
        int uncaught_;
    };

    std::size_t countTargets(const TargetMap& targets) {
        std::size_t n = 0;
        for (const auto& [_, list] : targets) n += list.size();
        return n;
    }
}

TargetsManager::TargetsManager(config::SidecarConfig cfg,
                               std::shared_ptr<prometheus::Registry> registry,
                               Clock clock)
    : cfg_(std::move(cfg)),
      registry_(std::move(registry)),
      store_(cfg_),
      idleTracker_(std::move(clock)),
      metrics_(requireRegistry(registry_)) {}

void TargetsManager::load() {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    fs::create_directories(cfg_.store_dir, ec);
    if (ec) LogRegistry::store()->warn("[TargetsManager] Cannot create store dir {}: {}", cfg_.store_dir.string(), ec.message());

    if (auto loaded = store_.load()) {
        targets_.targets = std::move(loaded->targets);
        targets_.idle_at = loaded->idle_at;
        LogRegistry::sidecar()->info("[TargetsManager] Loaded {} targets in {} jobs from {}",
                                     countTargets(targets_.targets), targets_.targets.size(), cfg_.store_dir.string());
    } else {
        LogRegistry::sidecar()->info("[TargetsManager] No snapshot in {}, starting empty", cfg_.store_dir.string());
    }

    auto desired = targets_.targets;
    updateTargetsLocked(std::move(desired));
}

void TargetsManager::updateTargets(TargetMap targets) {
    std::lock_guard lock(mutex_);
    updateTargetsLocked(std::move(targets));
}

void TargetsManager::updateTargetsLocked(TargetMap targets) {
    UpdateOutcome outcome(metrics_, targets_.status);

    targets_.targets = std::move(targets);
    auto result = reconciler_.reconcile(targets_.targets, targets_.status);
    targets_.status = std::move(result.status);
    idleTracker_.observe(targets_);

    LogRegistry::sidecar()->debug("[TargetsManager] Tracking {} targets, {} starting transfer",
                                  targets_.status.size(), result.transfers.size());

    try {
        callbacks_.dispatch(targets_.targets);
    } catch (const std::exception& e) {
        LogRegistry::sidecar()->error("[TargetsManager] Update callback failed: {}", e.what());
        throw std::runtime_error(std::string("do callbacks: ") + e.what());
    }

    try {
        store_.save(targets_);
    } catch (const std::exception& e) {
        LogRegistry::store()->error("[TargetsManager] Failed to save {}: {}", store_.currentPath().string(), e.what());
        throw std::runtime_error(std::string("save targets to file: ") + e.what());
    }
}

TargetsInfo TargetsManager::targetsInfo() const {
    std::lock_guard lock(mutex_);
    return targets_;
}

bool TargetsManager::recordScrape(const uint64_t hash,
                                  const std::chrono::system_clock::time_point start,
                                  const std::chrono::system_clock::time_point end,
                                  const std::string& err) {
    std::lock_guard lock(mutex_);
    const auto it = targets_.status.find(hash);
    if (it == targets_.status.end()) return false;
    it->second.setScrapeErr(start, end, err);
    return true;
}
