/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include "registry/owner_table.h"
#include "registry/endpoint.h"

using namespace objreg::registry;

TEST(OwnerKeyTest, FormatAndEquality) {
    OwnerKey a(3, 1200);
    EXPECT_EQ(a.to_string(), "3-1200");
    EXPECT_EQ(a, OwnerKey(3, 1200));
    EXPECT_NE(a, OwnerKey(3, 1201));
    EXPECT_NE(a, OwnerKey(4, 1200));
    EXPECT_NE(OwnerKeyHash{}(OwnerKey(1, 2)), OwnerKeyHash{}(OwnerKey(2, 1)));
}

TEST(OwnerTableTest, CreateFindErase) {
    OwnerTable table;
    OwnerKey key(1, 100);

    EXPECT_EQ(table.find(key), nullptr);

    OwnerRecord& rec = table.create(key, "ctx");
    rec.handles.insert(5);
    ASSERT_NE(table.find(key), nullptr);
    EXPECT_EQ(table.find(key)->context_id, "ctx");
    EXPECT_EQ(table.find(key)->handles.count(5), 1u);

    EXPECT_TRUE(table.erase(key));
    EXPECT_FALSE(table.erase(key));
    EXPECT_EQ(table.size(), 0u);
}

TEST(OwnerTableTest, ExtractAndInsertMovesHandles) {
    OwnerTable table;
    OwnerKey old_key(1, 100);
    OwnerKey new_key(1, 200);

    table.create(old_key, "ctx").handles = {1, 2, 3};

    auto moved = table.extract(old_key);
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(table.find(old_key), nullptr);
    EXPECT_FALSE(table.extract(old_key).has_value());

    table.insert(new_key, std::move(*moved));
    ASSERT_NE(table.find(new_key), nullptr);
    EXPECT_EQ(table.find(new_key)->handles.size(), 3u);
    EXPECT_EQ(table.size(), 1u);
}

TEST(OwnerTableTest, DisposeUnsubscribesLiveEndpoint) {
    auto endpoint = std::make_shared<LocalEndpoint>(1, 100);
    OwnerTable table;
    OwnerRecord& rec = table.create(OwnerKey(1, 100), "ctx");

    rec.subscriptions.endpoint = endpoint;
    rec.subscriptions.destroyed = endpoint->on_destroyed([](ProcessId) {});
    rec.subscriptions.process_changed = endpoint->on_process_changed([](ProcessId, ProcessId) {});
    EXPECT_EQ(endpoint->listener_count(), 2u);

    table.dispose_all_subscriptions();
    EXPECT_EQ(endpoint->listener_count(), 0u);
    EXPECT_EQ(rec.subscriptions.destroyed, kNoSubscription);

    // Second dispose is harmless
    rec.subscriptions.dispose();
}

TEST(OwnerTableTest, DisposeAfterEndpointGone) {
    OwnerTable table;
    OwnerRecord& rec = table.create(OwnerKey(1, 100), "ctx");
    {
        auto endpoint = std::make_shared<LocalEndpoint>(1, 100);
        rec.subscriptions.endpoint = endpoint;
        rec.subscriptions.destroyed = endpoint->on_destroyed([](ProcessId) {});
    }
    rec.subscriptions.dispose();
    EXPECT_EQ(rec.subscriptions.destroyed, kNoSubscription);
}

TEST(OwnerTableTest, InsertOverExistingDisposesOldSubscriptions) {
    auto endpoint = std::make_shared<LocalEndpoint>(1, 100);
    OwnerTable table;
    OwnerKey key(1, 100);

    OwnerRecord& rec = table.create(key, "old");
    rec.subscriptions.endpoint = endpoint;
    rec.subscriptions.destroyed = endpoint->on_destroyed([](ProcessId) {});

    table.create(key, "new");
    EXPECT_EQ(endpoint->listener_count(), 0u);
    EXPECT_EQ(table.find(key)->context_id, "new");
    EXPECT_EQ(table.keys().size(), 1u);
}
