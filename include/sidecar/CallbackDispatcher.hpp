#pragma once

#include "types/Target.hpp"

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace kv::sidecar {

// Signals failure by throwing
using UpdateCallback = std::function<void(const types::TargetMap&)>;

class CallbackDispatcher {
public:
    template <typename... Fns>
    void add(Fns&&... fns) {
        (callbacks_.emplace_back(std::forward<Fns>(fns)), ...);
    }

    // Runs callbacks in registration order; the first exception stops the
    // dispatch and propagates to the caller.
    void dispatch(const types::TargetMap& targets) const;

    [[nodiscard]] std::size_t size() const { return callbacks_.size(); }

private:
    std::vector<UpdateCallback> callbacks_;
};

}
