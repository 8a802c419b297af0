/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "identity_tags.h"

namespace objreg {
namespace registry {

std::optional<Handle> WeakIdentityTagStore::get_tag(const ObjectPtr& object) const {
    if (!object) return std::nullopt;

    auto it = tags_.find(std::weak_ptr<void>(object));
    if (it == tags_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void WeakIdentityTagStore::set_tag(const ObjectPtr& object, Handle handle) {
    if (!object) return;
    tags_[std::weak_ptr<void>(object)] = handle;
}

void WeakIdentityTagStore::clear_tag(const ObjectPtr& object) {
    if (!object) return;
    tags_.erase(std::weak_ptr<void>(object));
}

size_t WeakIdentityTagStore::purge_expired() {
    size_t dropped = 0;
    for (auto it = tags_.begin(); it != tags_.end(); ) {
        if (it->first.expired()) {
            it = tags_.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    return dropped;
}

} // namespace registry
} // namespace objreg
