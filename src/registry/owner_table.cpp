/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "owner_table.h"

namespace objreg {
namespace registry {

void OwnerSubscriptions::dispose() {
    if (auto ep = endpoint.lock()) {
        if (destroyed != kNoSubscription) {
            ep->unsubscribe(destroyed);
        }
        if (process_changed != kNoSubscription) {
            ep->unsubscribe(process_changed);
        }
    }
    destroyed = kNoSubscription;
    process_changed = kNoSubscription;
}

OwnerRecord* OwnerTable::find(const OwnerKey& key) {
    auto it = owners_.find(key);
    return it == owners_.end() ? nullptr : &it->second;
}

const OwnerRecord* OwnerTable::find(const OwnerKey& key) const {
    auto it = owners_.find(key);
    return it == owners_.end() ? nullptr : &it->second;
}

OwnerRecord& OwnerTable::create(const OwnerKey& key, const ContextId& context_id) {
    return insert(key, OwnerRecord(context_id));
}

OwnerRecord& OwnerTable::insert(const OwnerKey& key, OwnerRecord record) {
    auto it = owners_.find(key);
    if (it != owners_.end()) {
        it->second.subscriptions.dispose();
        it->second = std::move(record);
        return it->second;
    }
    return owners_.emplace(key, std::move(record)).first->second;
}

std::optional<OwnerRecord> OwnerTable::extract(const OwnerKey& key) {
    auto node = owners_.extract(key);
    if (node.empty()) {
        return std::nullopt;
    }
    return std::move(node.mapped());
}

bool OwnerTable::erase(const OwnerKey& key) {
    return owners_.erase(key) > 0;
}

std::vector<OwnerKey> OwnerTable::keys() const {
    std::vector<OwnerKey> result;
    result.reserve(owners_.size());
    for (const auto& [key, record] : owners_) {
        result.push_back(key);
    }
    return result;
}

void OwnerTable::dispose_all_subscriptions() {
    for (auto& [key, record] : owners_) {
        record.subscriptions.dispose();
    }
}

} // namespace registry
} // namespace objreg
