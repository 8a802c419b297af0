/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include "registry/registry_config.h"
#include <cstdlib>
#include <stdexcept>

using namespace objreg::registry;

class RegistryConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        unsetenv("OBJREG_MAX_HANDLE");
        unsetenv("OBJREG_PURGE_ON_RELOAD");
        unsetenv("OBJREG_MIGRATION_WARN_THRESHOLD");
    }
};

TEST_F(RegistryConfigTest, CompiledDefaults) {
    RegistryConfig cfg = RegistryConfig::defaults();
    EXPECT_EQ(cfg.max_handle, 9007199254740992ULL);
    EXPECT_FALSE(cfg.purge_on_reload);
    EXPECT_EQ(cfg.migration_warn_threshold, 64u);
}

TEST_F(RegistryConfigTest, EnvironmentOverrides) {
    setenv("OBJREG_MAX_HANDLE", "1000", 1);
    setenv("OBJREG_PURGE_ON_RELOAD", "1", 1);
    setenv("OBJREG_MIGRATION_WARN_THRESHOLD", "8", 1);

    RegistryConfig cfg = RegistryConfig::defaults();
    EXPECT_EQ(cfg.max_handle, 1000u);
    EXPECT_TRUE(cfg.purge_on_reload);
    EXPECT_EQ(cfg.migration_warn_threshold, 8u);

    setenv("OBJREG_PURGE_ON_RELOAD", "0", 1);
    EXPECT_FALSE(RegistryConfig::defaults().purge_on_reload);
}

TEST_F(RegistryConfigTest, MalformedNumberThrows) {
    setenv("OBJREG_MAX_HANDLE", "lots", 1);
    EXPECT_THROW(RegistryConfig::defaults(), std::invalid_argument);
}
