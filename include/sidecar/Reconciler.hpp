#pragma once

#include "types/ScrapeStatus.hpp"
#include "types/Target.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace kv::sidecar {

struct Transfer {
    std::string job;
    uint64_t hash{0};
    std::string url;
};

struct ReconcileResult {
    types::StatusMap status;
    std::vector<Transfer> transfers;  // Normal -> InTransfer in this round
};

class Reconciler {
public:
    // Builds the status table for `desired`. Entries of `previous` whose hash
    // is still desired keep their counters; the rest are dropped. A target
    // that starts transferring gets its attempt counter reset.
    [[nodiscard]] ReconcileResult reconcile(const types::TargetMap& desired,
                                            const types::StatusMap& previous) const;

    [[nodiscard]] static bool beginsTransfer(types::Target::State from, types::Target::State to) noexcept;
};

}
