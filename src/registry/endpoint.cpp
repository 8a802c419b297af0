/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "endpoint.h"
#include "util/log.h"

namespace objreg {
namespace registry {

LocalEndpoint::LocalEndpoint(EndpointId id, ProcessId process_id)
    : id_(id), process_id_(process_id) {}

SubscriptionId LocalEndpoint::on_destroyed(DestroyedListener listener) {
    SubscriptionId sub = ++next_subscription_;
    destroyed_.emplace(sub, std::move(listener));
    return sub;
}

SubscriptionId LocalEndpoint::on_process_changed(ProcessChangedListener listener) {
    SubscriptionId sub = ++next_subscription_;
    changed_.emplace(sub, std::move(listener));
    return sub;
}

bool LocalEndpoint::unsubscribe(SubscriptionId subscription) {
    return destroyed_.erase(subscription) > 0 || changed_.erase(subscription) > 0;
}

template<class Listener>
std::vector<SubscriptionId> LocalEndpoint::snapshot(
    const std::map<SubscriptionId, Listener>& listeners) {
    std::vector<SubscriptionId> subs;
    subs.reserve(listeners.size());
    for (const auto& [sub, listener] : listeners) {
        subs.push_back(sub);
    }
    return subs;
}

void LocalEndpoint::emit_destroyed(ProcessId process_id) {
    debug() << "[LocalEndpoint] Endpoint " << id_ << " destroyed process " << process_id;

    for (SubscriptionId sub : snapshot(destroyed_)) {
        auto it = destroyed_.find(sub);
        if (it == destroyed_.end()) {
            continue;  // Removed by an earlier listener
        }
        // Copy: the listener may unsubscribe itself while running
        DestroyedListener listener = it->second;
        listener(process_id);
    }
}

void LocalEndpoint::emit_process_changed(ProcessId old_process_id, ProcessId new_process_id) {
    debug() << "[LocalEndpoint] Endpoint " << id_ << " swapped process "
            << old_process_id << " -> " << new_process_id;

    process_id_ = new_process_id;

    for (SubscriptionId sub : snapshot(changed_)) {
        auto it = changed_.find(sub);
        if (it == changed_.end()) {
            continue;
        }
        ProcessChangedListener listener = it->second;
        listener(old_process_id, new_process_id);
    }
}

} // namespace registry
} // namespace objreg
