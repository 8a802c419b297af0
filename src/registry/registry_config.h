/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>
#include "config.h"  // For defaults
#include "types.h"

namespace objreg {
namespace registry {

/**
 * Runtime configuration for an ObjectsRegistry
 */
struct RegistryConfig {
    // Highest handle the counter may issue before allocation fails
    Handle max_handle             = OBJREG_MAX_HANDLE;

    // On a reload without process swap, release the handles the owner
    // acquired under its previous context id
    bool purge_on_reload          = OBJREG_PURGE_ON_RELOAD;

    // Warn each time pending migrations reach a multiple of this
    size_t migration_warn_threshold = OBJREG_MIGRATION_WARN_THRESHOLD;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static RegistryConfig defaults() {
        RegistryConfig cfg;

        if (const char* env = std::getenv("OBJREG_MAX_HANDLE")) {
            cfg.max_handle = std::stoull(env);
        }

        if (const char* env = std::getenv("OBJREG_PURGE_ON_RELOAD")) {
            cfg.purge_on_reload = (std::string(env) != "0");
        }

        if (const char* env = std::getenv("OBJREG_MIGRATION_WARN_THRESHOLD")) {
            cfg.migration_warn_threshold = std::stoull(env);
        }

        return cfg;
    }
};

} // namespace registry
} // namespace objreg
