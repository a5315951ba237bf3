#include "sidecar/Reconciler.hpp"
#include "logging/LogRegistry.hpp"

using namespace kv::sidecar;
using namespace kv::types;
using namespace kv::logging;

ReconcileResult Reconciler::reconcile(const TargetMap& desired, const StatusMap& previous) const {
    ReconcileResult result;

    for (const auto& [job, targets] : desired) {
        for (const auto& tar : targets) {
            auto it = result.status.find(tar.hash);
            if (it == result.status.end()) {
                const auto prev = previous.find(tar.hash);
                if (prev == previous.end()) {
                    // Fresh entries start Normal, so a target first seen in
                    // transfer is announced like any other transition
                    it = result.status.emplace(tar.hash, ScrapeStatus(tar.series)).first;
                } else {
                    it = result.status.emplace(tar.hash, prev->second).first;
                }
            }

            auto& status = it->second;
            if (beginsTransfer(status.state, tar.state)) {
                LogRegistry::sidecar()->info("{}/{} begin transfer", job, tar.noParamURL());
                status.scrape_times = 0;
                result.transfers.push_back({job, tar.hash, tar.noParamURL()});
            }

            status.state = tar.state;
        }
    }

    return result;
}

bool Reconciler::beginsTransfer(const Target::State from, const Target::State to) noexcept {
    switch (from) {
        case Target::State::Normal:
            return to == Target::State::InTransfer;
        case Target::State::InTransfer:
            return false;
    }
    return false;
}
