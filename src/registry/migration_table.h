/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * MigrationTable: process swaps awaiting their confirming registration.
 *
 * A swap is reported before the context running in the new process has
 * registered anything. The entry bridges that gap, keyed by the context
 * id that was live in the old process.
 */

#pragma once

#include "types.h"

#include <optional>
#include <unordered_map>
#include <vector>

namespace objreg {
namespace registry {

struct Migration {
    OwnerKey old_owner_key;
    OwnerKey new_owner_key;
};

class MigrationTable {
public:
    // Later swaps of the same context replace earlier ones
    void record(const ContextId& context_id, const OwnerKey& old_key, const OwnerKey& new_key);

    const Migration* find(const ContextId& context_id) const;
    bool erase(const ContextId& context_id);

    size_t size() const { return pending_.size(); }
    std::vector<ContextId> contexts() const;

private:
    std::unordered_map<ContextId, Migration> pending_;
};

} // namespace registry
} // namespace objreg
