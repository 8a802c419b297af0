/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * HandleStore: ref-counted table of exposed objects
 *
 * An entry lives from the first allocate_or_find() of an object until the
 * dereference() that brings its count back to zero. The object's identity
 * tag is cleared in that same call, so registering the object afterwards
 * yields a fresh, strictly greater handle.
 */

#pragma once

#include "types.h"
#include "identity_tags.h"

#include <stdexcept>
#include <unordered_map>

namespace objreg {
namespace registry {

class HandleExhaustedError : public std::runtime_error {
public:
    explicit HandleExhaustedError(Handle max_handle)
        : std::runtime_error("Handle counter exhausted at " + std::to_string(max_handle)) {}
};

struct HandleEntry {
    ObjectPtr object;
    uint32_t count = 0;             // Number of owners referencing this handle

    HandleEntry() = default;
    explicit HandleEntry(ObjectPtr obj) : object(std::move(obj)) {}
};

class HandleStore {
public:
    HandleStore(IdentityTagStore& tags, Handle max_handle);

    HandleStore(const HandleStore&) = delete;
    HandleStore& operator=(const HandleStore&) = delete;

    // Returns the object's live handle, or allocates one with count 0.
    // Throws std::invalid_argument on null, HandleExhaustedError when the
    // counter has reached max_handle.
    Handle allocate_or_find(const ObjectPtr& object);

    // nullptr when the handle is unknown or already freed
    ObjectPtr get(Handle handle) const;

    // Increment a live entry. Returns false for unknown handles.
    bool reference(Handle handle);

    // Decrement; frees the entry and clears the tag at zero.
    // Unknown handles are ignored (double release).
    void dereference(Handle handle);

    // Free an entry that no owner ever referenced
    void discard_if_unreferenced(Handle handle);

    bool contains(Handle handle) const { return entries_.count(handle) != 0; }
    uint32_t reference_count(Handle handle) const;
    size_t size() const { return entries_.size(); }
    Handle last_handle() const { return next_id_; }

private:
    void erase_entry(std::unordered_map<Handle, HandleEntry>::iterator it);

    IdentityTagStore& tags_;
    std::unordered_map<Handle, HandleEntry> entries_;
    Handle next_id_ = kInvalidHandle;
    Handle max_handle_;
};

} // namespace registry
} // namespace objreg
