/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "migration_table.h"
#include "util/log.h"

#include <algorithm>

namespace objreg {
namespace registry {

void MigrationTable::record(const ContextId& context_id,
                            const OwnerKey& old_key,
                            const OwnerKey& new_key) {
    auto it = pending_.find(context_id);
    if (it != pending_.end()) {
        debug() << "[MigrationTable] Context " << context_id << " swapped again before confirming ("
                << it->second.new_owner_key.to_string() << " superseded by " << new_key.to_string() << ")";
        it->second = Migration{old_key, new_key};
        return;
    }
    pending_.emplace(context_id, Migration{old_key, new_key});
}

const Migration* MigrationTable::find(const ContextId& context_id) const {
    auto it = pending_.find(context_id);
    return it == pending_.end() ? nullptr : &it->second;
}

bool MigrationTable::erase(const ContextId& context_id) {
    return pending_.erase(context_id) > 0;
}

std::vector<ContextId> MigrationTable::contexts() const {
    std::vector<ContextId> result;
    result.reserve(pending_.size());
    for (const auto& [ctx, migration] : pending_) {
        result.push_back(ctx);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace registry
} // namespace objreg
