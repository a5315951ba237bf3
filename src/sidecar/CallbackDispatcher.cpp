#include "sidecar/CallbackDispatcher.hpp"

using namespace kv::sidecar;

void CallbackDispatcher::dispatch(const types::TargetMap& targets) const {
    for (const auto& call : callbacks_) call(targets);
}
