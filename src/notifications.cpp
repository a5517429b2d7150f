// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "notifications.hpp"
#include <algorithm>

namespace foldchain {

// ============================================================================
// ChainNotifications::Subscription
// ============================================================================

ChainNotifications::Subscription::Subscription(ChainNotifications* owner, size_t id)
    : owner_(owner), id_(id), active_(true)
{
}

ChainNotifications::Subscription::~Subscription()
{
    Unsubscribe();
}

ChainNotifications::Subscription::Subscription(Subscription&& other) noexcept
    : owner_(other.owner_)
    , id_(other.id_)
    , active_(other.active_)
{
    other.owner_ = nullptr;
    other.active_ = false;
}

ChainNotifications::Subscription& ChainNotifications::Subscription::operator=(Subscription&& other) noexcept
{
    if (this != &other) {
        Unsubscribe();
        owner_ = other.owner_;
        id_ = other.id_;
        active_ = other.active_;
        other.owner_ = nullptr;
        other.active_ = false;
    }
    return *this;
}

void ChainNotifications::Subscription::Unsubscribe()
{
    if (active_ && owner_) {
        owner_->Unsubscribe(id_);
        active_ = false;
    }
}

// ============================================================================
// ChainNotifications
// ============================================================================

ChainNotifications::Subscription ChainNotifications::Add(CallbackEntry entry)
{
    std::lock_guard<std::mutex> lock(mutex_);
    entry.id = next_id_++;
    const size_t id = entry.id;
    callbacks_.push_back(std::move(entry));
    return Subscription(this, id);
}

ChainNotifications::Subscription ChainNotifications::SubscribeBlockConnected(BlockConnectedCallback callback)
{
    CallbackEntry entry{};
    entry.block_connected = std::move(callback);
    return Add(std::move(entry));
}

ChainNotifications::Subscription ChainNotifications::SubscribeBlockDisconnected(BlockDisconnectedCallback callback)
{
    CallbackEntry entry{};
    entry.block_disconnected = std::move(callback);
    return Add(std::move(entry));
}

ChainNotifications::Subscription ChainNotifications::SubscribeChainTip(ChainTipCallback callback)
{
    CallbackEntry entry{};
    entry.chain_tip = std::move(callback);
    return Add(std::move(entry));
}

ChainNotifications::Subscription ChainNotifications::SubscribeBlockFinalized(BlockFinalizedCallback callback)
{
    CallbackEntry entry{};
    entry.block_finalized = std::move(callback);
    return Add(std::move(entry));
}

ChainNotifications::Subscription ChainNotifications::SubscribeBlockOrphaned(BlockOrphanedCallback callback)
{
    CallbackEntry entry{};
    entry.block_orphaned = std::move(callback);
    return Add(std::move(entry));
}

void ChainNotifications::NotifyBlockConnected(const CBlockHeader& block, const chain::CBlockIndex* pindex)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : callbacks_) {
        if (entry.block_connected) {
            entry.block_connected(block, pindex);
        }
    }
}

void ChainNotifications::NotifyBlockDisconnected(const CBlockHeader& block, const chain::CBlockIndex* pindex)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : callbacks_) {
        if (entry.block_disconnected) {
            entry.block_disconnected(block, pindex);
        }
    }
}

void ChainNotifications::NotifyChainTip(const chain::CBlockIndex* pindexNew, int height)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : callbacks_) {
        if (entry.chain_tip) {
            entry.chain_tip(pindexNew, height);
        }
    }
}

void ChainNotifications::NotifyBlockFinalized(const chain::CBlockIndex* pindex)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : callbacks_) {
        if (entry.block_finalized) {
            entry.block_finalized(pindex);
        }
    }
}

void ChainNotifications::NotifyBlockOrphaned(const chain::CBlockIndex* pindex)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : callbacks_) {
        if (entry.block_orphaned) {
            entry.block_orphaned(pindex);
        }
    }
}

void ChainNotifications::Unsubscribe(size_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                           [id](const CallbackEntry& entry) { return entry.id == id; });
    if (it != callbacks_.end()) {
        callbacks_.erase(it);
    }
}

} // namespace foldchain
