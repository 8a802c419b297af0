/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * IdentityTagStore: remembers which handle an object instance was
 * registered under, so registering it again is idempotent.
 */

#pragma once

#include "types.h"

#include <map>
#include <optional>

namespace objreg {
namespace registry {

class IdentityTagStore {
public:
    virtual ~IdentityTagStore() = default;

    virtual std::optional<Handle> get_tag(const ObjectPtr& object) const = 0;
    virtual void set_tag(const ObjectPtr& object, Handle handle) = 0;
    virtual void clear_tag(const ObjectPtr& object) = 0;
};

/**
 * Side table keyed by object identity (control block, not address).
 * Holds weak references only, so a tag never keeps an object alive and
 * a recycled address can never inherit a dead object's handle.
 */
class WeakIdentityTagStore : public IdentityTagStore {
public:
    std::optional<Handle> get_tag(const ObjectPtr& object) const override;
    void set_tag(const ObjectPtr& object, Handle handle) override;
    void clear_tag(const ObjectPtr& object) override;

    size_t size() const { return tags_.size(); }

    // Drop tags whose object has been destroyed. Returns number dropped.
    size_t purge_expired();

private:
    std::map<std::weak_ptr<void>, Handle, std::owner_less<std::weak_ptr<void>>> tags_;
};

} // namespace registry
} // namespace objreg
