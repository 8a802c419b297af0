/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * ObjectsRegistry: exposes objects to peer endpoints by handle and
 * releases each object once every endpoint referencing it has let go.
 *
 * This class provides:
 * - Stable handles: registering the same object again returns its handle
 * - Per-owner reference tracking (an owner is an endpoint as backed by one
 *   process), counting each owner at most once per handle
 * - Cleanup when an endpoint's process is destroyed
 * - Reconciliation when an endpoint's process is swapped before the
 *   context running in the new process has registered anything
 *
 * Usage:
 *   ObjectsRegistry registry;
 *   Handle h = registry.add(endpoint, "ctx-1", object);
 *   auto obj = registry.get_as<Widget>(h);
 *   registry.remove(*endpoint, "ctx-1", h);
 *
 * Thread-safety:
 *   None. All calls and all endpoint notifications must arrive on the
 *   host's dispatch thread, one at a time.
 */

#pragma once

#include "types.h"
#include "endpoint.h"
#include "handle_store.h"
#include "identity_tags.h"
#include "migration_table.h"
#include "owner_table.h"
#include "registry_config.h"

#include <memory>
#include <optional>
#include <vector>

namespace objreg {
namespace registry {

class ObjectsRegistry {
public:
    explicit ObjectsRegistry(const RegistryConfig& config = RegistryConfig::defaults(),
                             std::unique_ptr<IdentityTagStore> tags = nullptr);
    ~ObjectsRegistry();

    // Disable copy/move: listeners capture this
    ObjectsRegistry(const ObjectsRegistry&) = delete;
    ObjectsRegistry& operator=(const ObjectsRegistry&) = delete;
    ObjectsRegistry(ObjectsRegistry&&) = delete;
    ObjectsRegistry& operator=(ObjectsRegistry&&) = delete;

    // ========== Registration ==========

    /**
     * Register an object on behalf of an endpoint and return its handle.
     *
     * @param endpoint   Endpoint making the reference
     * @param context_id Context the endpoint is currently running
     * @param object     Object to expose
     * @param process_id Backing process to address; defaults to the
     *                   endpoint's current one
     * @return Handle, the existing one if the object is already registered
     * @throws std::invalid_argument for a null endpoint or object
     * @throws HandleExhaustedError when no handle can be issued
     */
    Handle add(const std::shared_ptr<Endpoint>& endpoint,
               const ContextId& context_id,
               const ObjectPtr& object,
               std::optional<ProcessId> process_id = std::nullopt);

    /**
     * Look up an object. nullptr if the handle is unknown or released.
     */
    ObjectPtr get(Handle handle) const;

    template<class T>
    std::shared_ptr<T> get_as(Handle handle) const {
        return std::static_pointer_cast<T>(get(handle));
    }

    /**
     * Drop one endpoint's reference to a handle. Ignored when the endpoint
     * has no owner record or is running a different context.
     */
    void remove(const Endpoint& endpoint,
                const ContextId& context_id,
                Handle handle,
                std::optional<ProcessId> process_id = std::nullopt);

    /**
     * Drop every reference held by an owner and forget the owner.
     * Ignored when the owner is unknown or its context id differs.
     */
    void clear(const OwnerKey& owner_key, const ContextId& context_id);

    static OwnerKey owner_key_for(const Endpoint& endpoint,
                                  std::optional<ProcessId> process_id = std::nullopt);

    // ========== Metrics ==========

    size_t handle_count() const { return store_.size(); }
    size_t owner_count() const { return owners_.size(); }
    size_t pending_migration_count() const { return migrations_.size(); }
    uint32_t reference_count(Handle handle) const { return store_.reference_count(handle); }

    // Sorted handles referenced by an owner; empty if unknown
    std::vector<Handle> owner_handles(const OwnerKey& owner_key) const;
    std::optional<ContextId> owner_context(const OwnerKey& owner_key) const;
    std::optional<Migration> pending_migration(const ContextId& context_id) const;

    const RegistryConfig& config() const { return config_; }

private:
    // Find or create the owner the handle is recorded under. Handles that
    // must be dereferenced once the new reference is in place are appended
    // to `released`.
    OwnerRecord& resolve_owner(const std::shared_ptr<Endpoint>& endpoint,
                               const OwnerKey& owner_key,
                               const ContextId& context_id,
                               std::vector<Handle>& released);

    // Subscribe both lifecycle listeners for `owner_key`
    void subscribe(OwnerRecord& owner,
                   const OwnerKey& owner_key,
                   const std::shared_ptr<Endpoint>& endpoint);

    void on_destroyed(const std::weak_ptr<Endpoint>& endpoint,
                      const OwnerKey& owner_key,
                      const ContextId& context_id,
                      SubscriptionId self);

    void on_process_changed(const std::weak_ptr<Endpoint>& endpoint,
                            const OwnerKey& owner_key,
                            const ContextId& context_id,
                            ProcessId new_process_id,
                            SubscriptionId self);

    static void unsubscribe(const std::weak_ptr<Endpoint>& endpoint, SubscriptionId sub);

    RegistryConfig config_;
    std::unique_ptr<IdentityTagStore> tags_;
    HandleStore store_;
    OwnerTable owners_;
    MigrationTable migrations_;
};

} // namespace registry
} // namespace objreg
