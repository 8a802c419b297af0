/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Tests for ObjectsRegistry registration, lookup, removal and clearing
 */

#include <gtest/gtest.h>
#include "registry/objects_registry.h"
#include <string>

using namespace objreg::registry;

struct Widget {
    explicit Widget(std::string n) : name(std::move(n)) {}
    std::string name;
};

class ObjectsRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_unique<ObjectsRegistry>(RegistryConfig());
        e1 = std::make_shared<LocalEndpoint>(1, 100);
        e2 = std::make_shared<LocalEndpoint>(2, 300);
        x = std::make_shared<Widget>("x");
        y = std::make_shared<Widget>("y");
    }

    void TearDown() override {
        registry.reset();
    }

    std::unique_ptr<ObjectsRegistry> registry;
    std::shared_ptr<LocalEndpoint> e1;
    std::shared_ptr<LocalEndpoint> e2;
    std::shared_ptr<Widget> x;
    std::shared_ptr<Widget> y;
};

TEST_F(ObjectsRegistryTest, AddReturnsHandleStartingAtOne) {
    Handle h = registry->add(e1, "ctxA", x);
    EXPECT_EQ(h, 1u);
    EXPECT_EQ(registry->reference_count(h), 1u);
    EXPECT_EQ(registry->owner_count(), 1u);

    auto w = registry->get_as<Widget>(h);
    ASSERT_NE(w, nullptr);
    EXPECT_EQ(w->name, "x");
}

TEST_F(ObjectsRegistryTest, RepeatedAddIsIdempotent) {
    Handle h1 = registry->add(e1, "ctxA", x);
    Handle h2 = registry->add(e1, "ctxA", x);
    Handle h3 = registry->add(e1, "ctxA", x);

    EXPECT_EQ(h1, h2);
    EXPECT_EQ(h2, h3);
    EXPECT_EQ(registry->reference_count(h1), 1u);
    EXPECT_EQ(registry->handle_count(), 1u);
}

TEST_F(ObjectsRegistryTest, DistinctOwnersCountSeparately) {
    Handle h = registry->add(e1, "ctxA", x);
    EXPECT_EQ(registry->add(e2, "ctxB", x), h);
    EXPECT_EQ(registry->reference_count(h), 2u);

    registry->remove(*e1, "ctxA", h);
    EXPECT_EQ(registry->reference_count(h), 1u);
    EXPECT_EQ(registry->get(h), x);

    registry->remove(*e2, "ctxB", h);
    EXPECT_EQ(registry->get(h), nullptr);
}

TEST_F(ObjectsRegistryTest, GetUnknownHandle) {
    EXPECT_EQ(registry->get(1), nullptr);
    EXPECT_EQ(registry->get_as<Widget>(77), nullptr);
}

TEST_F(ObjectsRegistryTest, ReleasedObjectGetsGreaterHandle) {
    Handle h = registry->add(e1, "ctxA", x);
    registry->remove(*e1, "ctxA", h);
    EXPECT_EQ(registry->get(h), nullptr);

    Handle again = registry->add(e1, "ctxA", x);
    EXPECT_GT(again, h);
    EXPECT_EQ(registry->reference_count(again), 1u);
}

TEST_F(ObjectsRegistryTest, RemoveWithWrongContextIsIgnored) {
    Handle h = registry->add(e1, "ctxA", x);

    registry->remove(*e1, "ctxB", h);
    EXPECT_EQ(registry->reference_count(h), 1u);

    registry->remove(*e2, "ctxA", h);  // Endpoint never registered
    EXPECT_EQ(registry->reference_count(h), 1u);
    EXPECT_EQ(registry->owner_handles(ObjectsRegistry::owner_key_for(*e1)),
              std::vector<Handle>{h});
}

TEST_F(ObjectsRegistryTest, DoubleRemoveIsNoop) {
    Handle h = registry->add(e1, "ctxA", x);
    EXPECT_EQ(h, 1u);

    registry->remove(*e1, "ctxA", 1);
    EXPECT_EQ(registry->get(1), nullptr);
    EXPECT_EQ(registry->handle_count(), 0u);

    EXPECT_NO_THROW(registry->remove(*e1, "ctxA", 1));
    EXPECT_EQ(registry->get(1), nullptr);
}

TEST_F(ObjectsRegistryTest, DoubleRemoveDoesNotStealAnotherOwnersCount) {
    Handle hx = registry->add(e1, "ctxA", x);
    registry->add(e2, "ctxB", x);
    Handle hy = registry->add(e1, "ctxA", y);

    registry->remove(*e1, "ctxA", hx);
    registry->remove(*e1, "ctxA", hx);

    EXPECT_EQ(registry->reference_count(hx), 1u);
    EXPECT_EQ(registry->get(hx), x);
    EXPECT_EQ(registry->reference_count(hy), 1u);
}

TEST_F(ObjectsRegistryTest, ClearReleasesEveryHandleOnce) {
    Handle hx = registry->add(e1, "ctxA", x);
    Handle hy = registry->add(e1, "ctxA", y);
    registry->add(e2, "ctxB", y);

    OwnerKey key = ObjectsRegistry::owner_key_for(*e1);
    registry->clear(key, "ctxA");

    EXPECT_EQ(registry->get(hx), nullptr);
    EXPECT_EQ(registry->get(hy), y);
    EXPECT_EQ(registry->reference_count(hy), 1u);
    EXPECT_EQ(registry->owner_count(), 1u);
    EXPECT_FALSE(registry->owner_context(key).has_value());
}

TEST_F(ObjectsRegistryTest, ClearWithWrongContextIsIgnored) {
    Handle h = registry->add(e1, "ctxA", x);

    registry->clear(ObjectsRegistry::owner_key_for(*e1), "ctxZ");
    registry->clear(OwnerKey(9, 9), "ctxA");

    EXPECT_EQ(registry->reference_count(h), 1u);
    EXPECT_EQ(registry->owner_count(), 1u);
}

TEST_F(ObjectsRegistryTest, ClearRemovesListeners) {
    registry->add(e1, "ctxA", x);
    EXPECT_EQ(e1->listener_count(), 2u);

    registry->clear(ObjectsRegistry::owner_key_for(*e1), "ctxA");
    EXPECT_EQ(e1->listener_count(), 0u);
}

TEST_F(ObjectsRegistryTest, ReleasedObjectIsDestroyed) {
    std::weak_ptr<Widget> watch = x;
    Handle h = registry->add(e1, "ctxA", x);
    x.reset();
    EXPECT_FALSE(watch.expired());

    registry->remove(*e1, "ctxA", h);
    EXPECT_TRUE(watch.expired());
}

TEST_F(ObjectsRegistryTest, NullArgumentsRejected) {
    EXPECT_THROW(registry->add(nullptr, "ctxA", x), std::invalid_argument);
    EXPECT_THROW(registry->add(e1, "ctxA", nullptr), std::invalid_argument);
    EXPECT_EQ(registry->owner_count(), 0u);
    EXPECT_EQ(registry->handle_count(), 0u);
}

TEST_F(ObjectsRegistryTest, ExhaustionLeavesRegistryConsistent) {
    RegistryConfig config;
    config.max_handle = 1;
    ObjectsRegistry small(config);

    Handle h = small.add(e1, "ctxA", x);
    EXPECT_THROW(small.add(e1, "ctxA", y), HandleExhaustedError);

    EXPECT_EQ(small.handle_count(), 1u);
    EXPECT_EQ(small.owner_handles(ObjectsRegistry::owner_key_for(*e1)), std::vector<Handle>{h});

    // Existing registrations keep working
    EXPECT_EQ(small.add(e2, "ctxB", x), h);
    EXPECT_EQ(small.reference_count(h), 2u);
}

TEST_F(ObjectsRegistryTest, ExplicitProcessIdAddressesOwner) {
    Handle h = registry->add(e1, "ctxA", x, 555);
    OwnerKey explicit_key(1, 555);

    EXPECT_EQ(registry->owner_handles(explicit_key), std::vector<Handle>{h});
    EXPECT_TRUE(registry->owner_handles(ObjectsRegistry::owner_key_for(*e1)).empty());

    registry->remove(*e1, "ctxA", h);  // Current process has no owner
    EXPECT_EQ(registry->reference_count(h), 1u);

    registry->remove(*e1, "ctxA", h, 555);
    EXPECT_EQ(registry->get(h), nullptr);
}

TEST_F(ObjectsRegistryTest, DestructionUnsubscribesFromLiveEndpoints) {
    registry->add(e1, "ctxA", x);
    registry->add(e2, "ctxB", y);
    EXPECT_EQ(e1->listener_count(), 2u);

    registry.reset();
    EXPECT_EQ(e1->listener_count(), 0u);
    EXPECT_EQ(e2->listener_count(), 0u);

    // Late events reach nobody
    e1->emit_destroyed(100);
}

TEST_F(ObjectsRegistryTest, CustomTagStore) {
    auto tags = std::make_unique<WeakIdentityTagStore>();
    WeakIdentityTagStore* raw = tags.get();
    ObjectsRegistry custom(RegistryConfig(), std::move(tags));

    Handle h = custom.add(e1, "ctxA", x);
    EXPECT_EQ(*raw->get_tag(x), h);

    custom.remove(*e1, "ctxA", h);
    EXPECT_FALSE(raw->get_tag(x).has_value());
}
