/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "handle_store.h"
#include "util/log.h"

namespace objreg {
namespace registry {

HandleStore::HandleStore(IdentityTagStore& tags, Handle max_handle)
    : tags_(tags), max_handle_(max_handle) {
    if (max_handle_ == kInvalidHandle) {
        throw std::invalid_argument("HandleStore: max_handle must be at least 1");
    }
}

Handle HandleStore::allocate_or_find(const ObjectPtr& object) {
    if (!object) {
        throw std::invalid_argument("HandleStore: cannot register a null object");
    }

    if (auto tag = tags_.get_tag(object)) {
        auto it = entries_.find(*tag);
        if (it != entries_.end() && it->second.object == object) {
            return *tag;
        }
        // Tag outlived its entry; fall through and issue a fresh handle
        tags_.clear_tag(object);
    }

    if (next_id_ >= max_handle_) {
        error() << "[HandleStore] Handle counter exhausted at " << max_handle_;
        throw HandleExhaustedError(max_handle_);
    }

    Handle id = ++next_id_;
    entries_.emplace(id, HandleEntry(object));
    tags_.set_tag(object, id);

    trace() << "[HandleStore] Allocated handle " << id;
    return id;
}

ObjectPtr HandleStore::get(Handle handle) const {
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second.object;
}

bool HandleStore::reference(Handle handle) {
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return false;
    }
    it->second.count++;
    return true;
}

void HandleStore::dereference(Handle handle) {
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return;
    }

    if (it->second.count > 0) {
        it->second.count--;
    }
    if (it->second.count == 0) {
        erase_entry(it);
    }
}

void HandleStore::discard_if_unreferenced(Handle handle) {
    auto it = entries_.find(handle);
    if (it != entries_.end() && it->second.count == 0) {
        erase_entry(it);
    }
}

uint32_t HandleStore::reference_count(Handle handle) const {
    auto it = entries_.find(handle);
    return it == entries_.end() ? 0 : it->second.count;
}

void HandleStore::erase_entry(std::unordered_map<Handle, HandleEntry>::iterator it) {
    // Clear the tag before the entry (and possibly the last strong
    // reference) goes away
    tags_.clear_tag(it->second.object);
    trace() << "[HandleStore] Freed handle " << it->first;
    entries_.erase(it);
}

} // namespace registry
} // namespace objreg
