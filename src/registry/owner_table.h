/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * OwnerTable: which handles each (endpoint, process) pair references,
 * and under which context id.
 */

#pragma once

#include "types.h"
#include "endpoint.h"

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace objreg {
namespace registry {

/**
 * Lifecycle subscriptions held on behalf of one owner.
 * Both tokens are scoped to the process observed when subscribing.
 */
struct OwnerSubscriptions {
    std::weak_ptr<Endpoint> endpoint;
    ProcessId process_id = 0;
    SubscriptionId destroyed = kNoSubscription;
    SubscriptionId process_changed = kNoSubscription;

    // Unsubscribe whatever is still live. Safe to call repeatedly.
    void dispose();
};

struct OwnerRecord {
    ContextId context_id;
    std::unordered_set<Handle> handles;
    OwnerSubscriptions subscriptions;

    OwnerRecord() = default;
    explicit OwnerRecord(ContextId ctx) : context_id(std::move(ctx)) {}
};

class OwnerTable {
public:
    OwnerRecord* find(const OwnerKey& key);
    const OwnerRecord* find(const OwnerKey& key) const;

    // Create an empty record; an existing record for key is replaced.
    OwnerRecord& create(const OwnerKey& key, const ContextId& context_id);

    // Put a record extracted from another key under `key`
    OwnerRecord& insert(const OwnerKey& key, OwnerRecord record);

    // Remove and return the record, if any
    std::optional<OwnerRecord> extract(const OwnerKey& key);

    bool erase(const OwnerKey& key);

    size_t size() const { return owners_.size(); }
    std::vector<OwnerKey> keys() const;

    // Dispose every owner's subscriptions (registry shutdown)
    void dispose_all_subscriptions();

private:
    std::unordered_map<OwnerKey, OwnerRecord, OwnerKeyHash> owners_;
};

} // namespace registry
} // namespace objreg
