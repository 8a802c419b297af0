/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Identifier types shared by the registry tables.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace objreg {
namespace registry {

using Handle = uint64_t;
using EndpointId = int32_t;
using ProcessId = int32_t;
using ContextId = std::string;
using SubscriptionId = uint64_t;

// Registered objects are type-erased; the store shares ownership
using ObjectPtr = std::shared_ptr<void>;

constexpr Handle kInvalidHandle = 0;
constexpr SubscriptionId kNoSubscription = 0;

/**
 * Identity of one endpoint as backed by one process.
 * The same endpoint gets a new key whenever its process is swapped.
 */
struct OwnerKey {
    EndpointId endpoint_id = 0;
    ProcessId process_id = 0;

    OwnerKey() = default;
    OwnerKey(EndpointId endpoint, ProcessId process)
        : endpoint_id(endpoint), process_id(process) {}

    bool operator==(const OwnerKey& o) const {
        return endpoint_id == o.endpoint_id && process_id == o.process_id;
    }
    bool operator!=(const OwnerKey& o) const { return !(*this == o); }

    // "<endpoint>-<process>"
    std::string to_string() const {
        return std::to_string(endpoint_id) + "-" + std::to_string(process_id);
    }
};

struct OwnerKeyHash {
    size_t operator()(const OwnerKey& k) const noexcept {
        uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(k.endpoint_id)) << 32) |
                          static_cast<uint32_t>(k.process_id);
        return std::hash<uint64_t>{}(packed);
    }
};

} // namespace registry
} // namespace objreg
