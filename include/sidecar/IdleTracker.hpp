#pragma once

#include "types/TargetsInfo.hpp"

#include <chrono>
#include <functional>

namespace kv::sidecar {

using Clock = std::function<std::chrono::system_clock::time_point()>;

class IdleTracker {
public:
    explicit IdleTracker(Clock clock = std::chrono::system_clock::now);

    // Stamps idle_at when the shard has just run out of targets, keeps an
    // existing stamp while it stays empty, clears it once targets return.
    void observe(types::TargetsInfo& info) const;

private:
    Clock clock_;
};

}
