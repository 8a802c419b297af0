/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Endpoint: a peer context that references registry handles.
 *
 * An endpoint has a stable id and a backing process that can be replaced
 * underneath it. It reports two lifecycle events:
 *   destroyed(process)              - the backing process went away
 *   process_changed(old, new)       - the backing process was swapped
 *
 * Listeners are identified by the SubscriptionId returned at subscribe
 * time and removed with unsubscribe().
 */

#pragma once

#include "types.h"

#include <functional>
#include <map>
#include <vector>

namespace objreg {
namespace registry {

using DestroyedListener = std::function<void(ProcessId)>;
using ProcessChangedListener = std::function<void(ProcessId, ProcessId)>;

class Endpoint {
public:
    virtual ~Endpoint() = default;

    virtual EndpointId id() const = 0;
    virtual ProcessId current_process_id() const = 0;

    virtual SubscriptionId on_destroyed(DestroyedListener listener) = 0;
    virtual SubscriptionId on_process_changed(ProcessChangedListener listener) = 0;

    // Returns false if the subscription was unknown or already removed
    virtual bool unsubscribe(SubscriptionId subscription) = 0;
};

/**
 * In-process endpoint driven directly by the host.
 *
 * Emission runs listeners synchronously on the calling thread. A listener
 * may unsubscribe itself or any other listener while being dispatched;
 * listeners removed mid-dispatch are not called.
 */
class LocalEndpoint : public Endpoint {
public:
    LocalEndpoint(EndpointId id, ProcessId process_id);

    EndpointId id() const override { return id_; }
    ProcessId current_process_id() const override { return process_id_; }

    SubscriptionId on_destroyed(DestroyedListener listener) override;
    SubscriptionId on_process_changed(ProcessChangedListener listener) override;
    bool unsubscribe(SubscriptionId subscription) override;

    void set_process_id(ProcessId process_id) { process_id_ = process_id; }

    // Notify that `process_id` has been destroyed
    void emit_destroyed(ProcessId process_id);

    // Swap the backing process, then notify
    void emit_process_changed(ProcessId old_process_id, ProcessId new_process_id);

    size_t listener_count() const { return destroyed_.size() + changed_.size(); }

private:
    template<class Listener>
    static std::vector<SubscriptionId> snapshot(const std::map<SubscriptionId, Listener>& listeners);

    EndpointId id_;
    ProcessId process_id_;
    SubscriptionId next_subscription_ = kNoSubscription;

    // Ordered by subscription id so dispatch follows subscription order
    std::map<SubscriptionId, DestroyedListener> destroyed_;
    std::map<SubscriptionId, ProcessChangedListener> changed_;
};

} // namespace registry
} // namespace objreg
