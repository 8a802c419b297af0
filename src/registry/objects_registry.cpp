/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * ObjectsRegistry implementation.
 */

#include "objects_registry.h"
#include "util/log.h"

#include <algorithm>

namespace objreg {
namespace registry {

ObjectsRegistry::ObjectsRegistry(const RegistryConfig& config,
                                 std::unique_ptr<IdentityTagStore> tags)
    : config_(config),
      tags_(tags ? std::move(tags) : std::make_unique<WeakIdentityTagStore>()),
      store_(*tags_, config_.max_handle) {
}

ObjectsRegistry::~ObjectsRegistry() {
    // Listeners capture this; none may outlive the registry
    owners_.dispose_all_subscriptions();
}

OwnerKey ObjectsRegistry::owner_key_for(const Endpoint& endpoint,
                                        std::optional<ProcessId> process_id) {
    return OwnerKey(endpoint.id(), process_id ? *process_id : endpoint.current_process_id());
}

// ============================================================================
// Registration
// ============================================================================

Handle ObjectsRegistry::add(const std::shared_ptr<Endpoint>& endpoint,
                            const ContextId& context_id,
                            const ObjectPtr& object,
                            std::optional<ProcessId> process_id) {
    if (!endpoint) {
        throw std::invalid_argument("ObjectsRegistry::add: null endpoint");
    }

    Handle handle = store_.allocate_or_find(object);

    std::vector<Handle> released;
    try {
        OwnerKey owner_key = owner_key_for(*endpoint, process_id);
        OwnerRecord& owner = resolve_owner(endpoint, owner_key, context_id, released);

        // Each owner counts once per handle
        if (owner.handles.insert(handle).second) {
            store_.reference(handle);
        }
    } catch (...) {
        store_.discard_if_unreferenced(handle);
        throw;
    }

    // Only now, so releasing a discarded owner cannot free `handle`
    for (Handle h : released) {
        store_.dereference(h);
    }

    return handle;
}

OwnerRecord& ObjectsRegistry::resolve_owner(const std::shared_ptr<Endpoint>& endpoint,
                                            const OwnerKey& owner_key,
                                            const ContextId& context_id,
                                            std::vector<Handle>& released) {
    OwnerRecord* owner = owners_.find(owner_key);

    if (!owner) {
        // First registration from the new process of a swap that kept its
        // context: carry the old owner's references over unchanged.
        const Migration* migration = migrations_.find(context_id);
        if (migration && migration->new_owner_key == owner_key) {
            OwnerKey old_key = migration->old_owner_key;
            const OwnerRecord* old_owner = owners_.find(old_key);
            if (old_owner && old_owner->context_id == context_id) {
                auto moved = owners_.extract(old_key);
                moved->subscriptions.dispose();
                migrations_.erase(context_id);

                OwnerRecord& record = owners_.insert(owner_key, std::move(*moved));
                subscribe(record, owner_key, endpoint);

                debug() << "[ObjectsRegistry] Migrated owner " << old_key.to_string()
                        << " -> " << owner_key.to_string() << " (context " << context_id
                        << ", " << record.handles.size() << " handles)";
                return record;
            }
        }

        OwnerRecord& record = owners_.create(owner_key, context_id);
        subscribe(record, owner_key, endpoint);
        debug() << "[ObjectsRegistry] New owner " << owner_key.to_string()
                << " (context " << context_id << ")";
        return record;
    }

    if (owner->context_id == context_id) {
        return *owner;
    }

    // The swap was reported before the new process produced its context
    // id, so the registration arrives under the old key with a new id.
    const Migration* migration = migrations_.find(owner->context_id);
    if (migration && migration->old_owner_key == owner_key) {
        OwnerKey new_key = migration->new_owner_key;
        migrations_.erase(owner->context_id);

        auto discarded = owners_.extract(owner_key);
        discarded->subscriptions.dispose();
        released.insert(released.end(), discarded->handles.begin(), discarded->handles.end());

        if (auto stale = owners_.extract(new_key)) {
            stale->subscriptions.dispose();
            released.insert(released.end(), stale->handles.begin(), stale->handles.end());
        }

        OwnerRecord& record = owners_.create(new_key, context_id);
        subscribe(record, new_key, endpoint);

        debug() << "[ObjectsRegistry] Confirmed migration " << owner_key.to_string()
                << " -> " << new_key.to_string() << " (context " << context_id << ")";
        return record;
    }

    // Reloaded in the same process (no swap)
    debug() << "[ObjectsRegistry] Owner " << owner_key.to_string() << " reloaded: context "
            << owner->context_id << " -> " << context_id;

    owner->context_id = context_id;
    if (config_.purge_on_reload) {
        released.insert(released.end(), owner->handles.begin(), owner->handles.end());
        owner->handles.clear();
    }
    owner->subscriptions.dispose();
    subscribe(*owner, owner_key, endpoint);
    return *owner;
}

ObjectPtr ObjectsRegistry::get(Handle handle) const {
    return store_.get(handle);
}

void ObjectsRegistry::remove(const Endpoint& endpoint,
                             const ContextId& context_id,
                             Handle handle,
                             std::optional<ProcessId> process_id) {
    OwnerKey owner_key = owner_key_for(endpoint, process_id);
    OwnerRecord* owner = owners_.find(owner_key);

    if (!owner || owner->context_id != context_id) {
        trace() << "[ObjectsRegistry] Ignoring remove of " << handle << " from "
                << owner_key.to_string() << " (context " << context_id << ")";
        return;
    }

    if (owner->handles.erase(handle) > 0) {
        store_.dereference(handle);
    }
}

void ObjectsRegistry::clear(const OwnerKey& owner_key, const ContextId& context_id) {
    OwnerRecord* owner = owners_.find(owner_key);

    if (!owner || owner->context_id != context_id) {
        trace() << "[ObjectsRegistry] Ignoring clear of " << owner_key.to_string()
                << " (context " << context_id << ")";
        return;
    }

    auto record = owners_.extract(owner_key);
    record->subscriptions.dispose();
    migrations_.erase(context_id);

    for (Handle h : record->handles) {
        store_.dereference(h);
    }

    debug() << "[ObjectsRegistry] Cleared owner " << owner_key.to_string() << " ("
            << record->handles.size() << " handles released)";
}

// ============================================================================
// Lifecycle listeners
// ============================================================================

void ObjectsRegistry::subscribe(OwnerRecord& owner,
                                const OwnerKey& owner_key,
                                const std::shared_ptr<Endpoint>& endpoint) {
    std::weak_ptr<Endpoint> weak = endpoint;
    const ContextId context_id = owner.context_id;
    const ProcessId scoped = owner_key.process_id;

    owner.subscriptions.endpoint = weak;
    owner.subscriptions.process_id = scoped;

    // The token is only known once subscribe returns
    auto destroyed_token = std::make_shared<SubscriptionId>(kNoSubscription);
    owner.subscriptions.destroyed = endpoint->on_destroyed(
        [this, weak, owner_key, context_id, scoped, destroyed_token](ProcessId reported) {
            if (reported != scoped) return;
            on_destroyed(weak, owner_key, context_id, *destroyed_token);
        });
    *destroyed_token = owner.subscriptions.destroyed;

    auto changed_token = std::make_shared<SubscriptionId>(kNoSubscription);
    owner.subscriptions.process_changed = endpoint->on_process_changed(
        [this, weak, owner_key, context_id, scoped, changed_token](ProcessId old_process, ProcessId new_process) {
            if (old_process != scoped) return;
            on_process_changed(weak, owner_key, context_id, new_process, *changed_token);
        });
    *changed_token = owner.subscriptions.process_changed;
}

void ObjectsRegistry::on_destroyed(const std::weak_ptr<Endpoint>& endpoint,
                                   const OwnerKey& owner_key,
                                   const ContextId& context_id,
                                   SubscriptionId self) {
    unsubscribe(endpoint, self);
    if (OwnerRecord* owner = owners_.find(owner_key)) {
        if (owner->subscriptions.destroyed == self) {
            owner->subscriptions.destroyed = kNoSubscription;
        }
    }

    debug() << "[ObjectsRegistry] Process of owner " << owner_key.to_string()
            << " destroyed (context " << context_id << ")";
    clear(owner_key, context_id);
}

void ObjectsRegistry::on_process_changed(const std::weak_ptr<Endpoint>& endpoint,
                                         const OwnerKey& owner_key,
                                         const ContextId& context_id,
                                         ProcessId new_process_id,
                                         SubscriptionId self) {
    OwnerRecord* owner = owners_.find(owner_key);
    if (!owner) {
        return;
    }

    OwnerKey new_key(owner_key.endpoint_id, new_process_id);
    migrations_.record(context_id, owner_key, new_key);

    unsubscribe(endpoint, self);
    if (owner->subscriptions.process_changed == self) {
        owner->subscriptions.process_changed = kNoSubscription;
    }

    debug() << "[ObjectsRegistry] Owner " << owner_key.to_string() << " swapping to "
            << new_key.to_string() << " (context " << context_id << ")";

    // Entries whose confirming registration never arrives are kept
    size_t pending = migrations_.size();
    if (config_.migration_warn_threshold > 0 && pending % config_.migration_warn_threshold == 0) {
        warn() << "[ObjectsRegistry] " << pending << " process swaps are awaiting confirmation";
    }
}

void ObjectsRegistry::unsubscribe(const std::weak_ptr<Endpoint>& endpoint, SubscriptionId sub) {
    if (sub == kNoSubscription) return;
    if (auto ep = endpoint.lock()) {
        ep->unsubscribe(sub);
    }
}

// ============================================================================
// Metrics
// ============================================================================

std::vector<Handle> ObjectsRegistry::owner_handles(const OwnerKey& owner_key) const {
    std::vector<Handle> result;
    if (const OwnerRecord* owner = owners_.find(owner_key)) {
        result.assign(owner->handles.begin(), owner->handles.end());
        std::sort(result.begin(), result.end());
    }
    return result;
}

std::optional<ContextId> ObjectsRegistry::owner_context(const OwnerKey& owner_key) const {
    if (const OwnerRecord* owner = owners_.find(owner_key)) {
        return owner->context_id;
    }
    return std::nullopt;
}

std::optional<Migration> ObjectsRegistry::pending_migration(const ContextId& context_id) const {
    if (const Migration* migration = migrations_.find(context_id)) {
        return *migration;
    }
    return std::nullopt;
}

} // namespace registry
} // namespace objreg
