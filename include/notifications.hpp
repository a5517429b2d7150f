// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_NOTIFICATIONS_HPP
#define FOLDCHAIN_NOTIFICATIONS_HPP

#include "primitives/block.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace foldchain {

namespace chain {
class CBlockIndex;
}

/**
 * ChainNotifications - chain event fan-out
 *
 * Each ChainstateManager owns one instance, so independent chainstates in
 * the same process never see each other's events.
 *
 * Subscriptions are RAII: dropping the Subscription unsubscribes. Callbacks
 * run synchronously on the thread that changed the chain, with the
 * notification mutex held; they must not subscribe or unsubscribe.
 */
class ChainNotifications {
public:
  using BlockConnectedCallback =
      std::function<void(const CBlockHeader &, const chain::CBlockIndex *)>;
  using BlockDisconnectedCallback =
      std::function<void(const CBlockHeader &, const chain::CBlockIndex *)>;
  using ChainTipCallback =
      std::function<void(const chain::CBlockIndex *, int height)>;
  using BlockFinalizedCallback =
      std::function<void(const chain::CBlockIndex *)>;
  using BlockOrphanedCallback =
      std::function<void(const chain::CBlockIndex *)>;

  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class ChainNotifications;
    Subscription(ChainNotifications *owner, size_t id);

    ChainNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  ChainNotifications() = default;

  ChainNotifications(const ChainNotifications &) = delete;
  ChainNotifications &operator=(const ChainNotifications &) = delete;

  [[nodiscard]] Subscription
  SubscribeBlockConnected(BlockConnectedCallback callback);
  [[nodiscard]] Subscription
  SubscribeBlockDisconnected(BlockDisconnectedCallback callback);
  [[nodiscard]] Subscription SubscribeChainTip(ChainTipCallback callback);
  [[nodiscard]] Subscription
  SubscribeBlockFinalized(BlockFinalizedCallback callback);
  [[nodiscard]] Subscription
  SubscribeBlockOrphaned(BlockOrphanedCallback callback);

  void NotifyBlockConnected(const CBlockHeader &block,
                            const chain::CBlockIndex *pindex);
  void NotifyBlockDisconnected(const CBlockHeader &block,
                               const chain::CBlockIndex *pindex);
  void NotifyChainTip(const chain::CBlockIndex *pindexNew, int height);
  void NotifyBlockFinalized(const chain::CBlockIndex *pindex);
  void NotifyBlockOrphaned(const chain::CBlockIndex *pindex);

private:
  struct CallbackEntry {
    size_t id;
    BlockConnectedCallback block_connected;
    BlockDisconnectedCallback block_disconnected;
    ChainTipCallback chain_tip;
    BlockFinalizedCallback block_finalized;
    BlockOrphanedCallback block_orphaned;
  };

  Subscription Add(CallbackEntry entry);
  void Unsubscribe(size_t id);

  std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1};
};

} // namespace foldchain

#endif // FOLDCHAIN_NOTIFICATIONS_HPP
