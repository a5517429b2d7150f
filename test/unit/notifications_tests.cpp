// Copyright (c) 2024 FoldChain
// Unit tests for ChainNotifications subscriptions

#include <catch2/catch_test_macros.hpp>
#include "notifications.hpp"
#include "chain/block_index.hpp"
#include <utility>
#include <vector>

using namespace foldchain;

TEST_CASE("ChainNotifications - Delivery", "[notifications]") {
    ChainNotifications notifications;
    chain::CBlockIndex index;
    index.nHeight = 7;

    SECTION("Each event reaches its subscribers") {
        int connected = 0, disconnected = 0, finalized = 0, orphaned = 0;
        int tip_height = -1;

        auto s1 = notifications.SubscribeBlockConnected(
            [&](const CBlockHeader&, const chain::CBlockIndex* p) { connected += p->nHeight; });
        auto s2 = notifications.SubscribeBlockDisconnected(
            [&](const CBlockHeader&, const chain::CBlockIndex*) { disconnected++; });
        auto s3 = notifications.SubscribeChainTip(
            [&](const chain::CBlockIndex*, int height) { tip_height = height; });
        auto s4 = notifications.SubscribeBlockFinalized(
            [&](const chain::CBlockIndex*) { finalized++; });
        auto s5 = notifications.SubscribeBlockOrphaned(
            [&](const chain::CBlockIndex*) { orphaned++; });

        CBlockHeader header;
        notifications.NotifyBlockConnected(header, &index);
        notifications.NotifyBlockDisconnected(header, &index);
        notifications.NotifyChainTip(&index, 7);
        notifications.NotifyBlockFinalized(&index);
        notifications.NotifyBlockOrphaned(&index);
        notifications.NotifyBlockOrphaned(&index);

        REQUIRE(connected == 7);
        REQUIRE(disconnected == 1);
        REQUIRE(tip_height == 7);
        REQUIRE(finalized == 1);
        REQUIRE(orphaned == 2);
    }

    SECTION("Several subscribers to one event") {
        int calls = 0;
        auto a = notifications.SubscribeBlockFinalized([&](const chain::CBlockIndex*) { calls++; });
        auto b = notifications.SubscribeBlockFinalized([&](const chain::CBlockIndex*) { calls++; });
        notifications.NotifyBlockFinalized(&index);
        REQUIRE(calls == 2);
    }
}

TEST_CASE("ChainNotifications - Subscription lifetime", "[notifications]") {
    ChainNotifications notifications;
    chain::CBlockIndex index;
    int calls = 0;

    SECTION("Dropping the subscription unsubscribes") {
        {
            auto sub = notifications.SubscribeBlockOrphaned([&](const chain::CBlockIndex*) { calls++; });
            notifications.NotifyBlockOrphaned(&index);
        }
        notifications.NotifyBlockOrphaned(&index);
        REQUIRE(calls == 1);
    }

    SECTION("Explicit Unsubscribe is idempotent") {
        auto sub = notifications.SubscribeBlockOrphaned([&](const chain::CBlockIndex*) { calls++; });
        sub.Unsubscribe();
        sub.Unsubscribe();
        notifications.NotifyBlockOrphaned(&index);
        REQUIRE(calls == 0);
    }

    SECTION("Moved subscription stays active") {
        ChainNotifications::Subscription outer;
        {
            auto inner = notifications.SubscribeBlockOrphaned([&](const chain::CBlockIndex*) { calls++; });
            outer = std::move(inner);
        }
        notifications.NotifyBlockOrphaned(&index);
        REQUIRE(calls == 1);
        outer.Unsubscribe();
        notifications.NotifyBlockOrphaned(&index);
        REQUIRE(calls == 1);
    }

    SECTION("Independent instances do not share subscribers") {
        ChainNotifications other;
        auto sub = notifications.SubscribeBlockOrphaned([&](const chain::CBlockIndex*) { calls++; });
        other.NotifyBlockOrphaned(&index);
        REQUIRE(calls == 0);
    }
}
