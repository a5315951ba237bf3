#include "sidecar/IdleTracker.hpp"

using namespace kv::sidecar;
using namespace kv::types;

IdleTracker::IdleTracker(Clock clock) : clock_(std::move(clock)) {}

void IdleTracker::observe(TargetsInfo& info) const {
    if (info.status.empty() && !info.idle_at) info.idle_at = clock_();
    if (!info.status.empty()) info.idle_at.reset();
}
