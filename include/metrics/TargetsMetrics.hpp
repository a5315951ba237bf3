#pragma once

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

namespace kv::metrics {

// kvass_sidecar_targets_updated_total{success} and kvass_sidecar_targets_total.
// Families already present in the registry are reused.
class TargetsMetrics {
public:
    explicit TargetsMetrics(prometheus::Registry& registry);

    void record(bool success, std::size_t trackedTargets);

    [[nodiscard]] double updatedTotal(bool success) const;
    [[nodiscard]] double targetsTotal() const;

private:
    std::shared_ptr<spdlog::logger> log_;
    prometheus::Counter& updatedSuccess_;
    prometheus::Counter& updatedFailure_;
    prometheus::Gauge& targets_;
};

}
