#pragma once

#include "config/Config.hpp"
#include "metrics/TargetsMetrics.hpp"
#include "sidecar/CallbackDispatcher.hpp"
#include "sidecar/IdleTracker.hpp"
#include "sidecar/Reconciler.hpp"
#include "store/SnapshotStore.hpp"
#include "types/TargetsInfo.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace kv::sidecar {

// Owns the set of targets assigned to this shard and their runtime status.
//
// Every update replaces the whole target set, recomputes status and idle
// state, runs the update callbacks and then persists the snapshot. State is
// applied in memory before callbacks and persistence; a failure in either of
// those surfaces to the caller but leaves the new state in place.
//
// All public methods are serialized on an internal mutex. Callbacks run with
// that mutex held and must not call back into the manager.
class TargetsManager {
public:
    TargetsManager(config::SidecarConfig cfg,
                   std::shared_ptr<prometheus::Registry> registry,
                   Clock clock = std::chrono::system_clock::now);

    // Reads the last snapshot (migrating the legacy file if that is all
    // there is) and runs it through one update.
    void load();

    template <typename... Fns>
    void addUpdateCallbacks(Fns&&... fns) {
        std::lock_guard lock(mutex_);
        callbacks_.add(std::forward<Fns>(fns)...);
    }

    void updateTargets(types::TargetMap targets);

    // Copy of the current state
    [[nodiscard]] types::TargetsInfo targetsInfo() const;

    // Records one scrape attempt for a tracked target; false if the hash is
    // not assigned to this shard.
    bool recordScrape(uint64_t hash,
                      std::chrono::system_clock::time_point start,
                      std::chrono::system_clock::time_point end,
                      const std::string& err);

    [[nodiscard]] std::filesystem::path storePath() const { return store_.currentPath(); }

private:
    config::SidecarConfig cfg_;
    std::shared_ptr<prometheus::Registry> registry_;
    store::SnapshotStore store_;
    Reconciler reconciler_;
    IdleTracker idleTracker_;
    CallbackDispatcher callbacks_;
    metrics::TargetsMetrics metrics_;
    types::TargetsInfo targets_;
    mutable std::mutex mutex_;

    void updateTargetsLocked(types::TargetMap targets);
};

}
