#include "metrics/TargetsMetrics.hpp"
#include "logging/LogRegistry.hpp"

using namespace kv::metrics;
using namespace kv::logging;

namespace {
    prometheus::Family<prometheus::Counter>& updatedFamily(prometheus::Registry& registry) {
        return prometheus::BuildCounter()
            .Name("kvass_sidecar_targets_updated_total")
            .Help("Target set updates received by this shard, by outcome")
            .Register(registry);
    }

    prometheus::Family<prometheus::Gauge>& targetsFamily(prometheus::Registry& registry) {
        return prometheus::BuildGauge()
            .Name("kvass_sidecar_targets_total")
            .Help("Targets currently tracked by this shard")
            .Register(registry);
    }
}

TargetsMetrics::TargetsMetrics(prometheus::Registry& registry)
    : log_(LogRegistry::metrics()),
      updatedSuccess_(updatedFamily(registry).Add({{"success", "true"}})),
      updatedFailure_(updatedFamily(registry).Add({{"success", "false"}})),
      targets_(targetsFamily(registry).Add({})) {
    log_->debug("[TargetsMetrics] Registered kvass_sidecar_targets_updated_total and kvass_sidecar_targets_total");
}

void TargetsMetrics::record(const bool success, const std::size_t trackedTargets) {
    (success ? updatedSuccess_ : updatedFailure_).Increment();
    targets_.Set(static_cast<double>(trackedTargets));
    log_->debug("[TargetsMetrics] update success={} tracked={}", success, trackedTargets);
}

double TargetsMetrics::updatedTotal(const bool success) const {
    return (success ? updatedSuccess_ : updatedFailure_).Value();
}

double TargetsMetrics::targetsTotal() const {
    return targets_.Value();
}
