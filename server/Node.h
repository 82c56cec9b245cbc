#ifndef SY_LEDGER_NODE_H
#define SY_LEDGER_NODE_H

#include "../consensus/ConsensusEngine.h"
#include "../ledger/Block.h"
#include "../ledger/Chain.h"
#include "../ledger/Mempool.h"
#include "../ledger/Transaction.h"
#include "../network/PeerNetwork.h"
#include "Module.h"
#include "ProofSystem.hpp"
#include "ResultOrError.hpp"
#include "Signer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sy {

/**
 * Node - owns one chain and one mempool and orchestrates mining and
 * conflict resolution over a PeerNetwork.
 *
 * Concurrency:
 * - mutex_ guards chain_ and mempool_. Every public operation takes it
 *   briefly; no network call and no proof-of-work search runs under it.
 * - miningMutex_ allows one proof-of-work search at a time.
 * - A chain replacement (resolveConflicts, receiveChain) cancels the search
 *   in flight, whose result could no longer be appended, and drops pending
 *   transactions the new blocks already seal.
 */
class Node : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Error codes
  static constexpr const int32_t E_INVALID_AMOUNT = 1;
  static constexpr const int32_t E_DUPLICATE_TRANSACTION = 2;
  static constexpr const int32_t E_CHAIN_LINKAGE = 3;
  static constexpr const int32_t E_MALFORMED_RECORD = 4;
  static constexpr const int32_t E_MINING_CANCELLED = 5;
  static constexpr const int32_t E_REJECTED_BY_HOOK = 6;
  static constexpr const int32_t E_INVALID_ADDRESS = 7;
  static constexpr const int32_t E_CONFIG = 8;
  static constexpr const int32_t E_BALANCE_OVERFLOW = 9;

  constexpr static const char *REWARD_SENDER = "network";
  constexpr static int64_t REWARD_AMOUNT = 1;
  constexpr static const char *EVENT_CHAIN_UPDATE = "chain_update";
  constexpr static const char *EVENT_NEW_TRANSACTION = "new_transaction";
  constexpr static uint32_t DEFAULT_DIFFICULTY = 4;

  struct Config {
    std::string address;                        // identity, default reward recipient
    uint32_t difficulty{ DEFAULT_DIFFICULTY }; // leading zero nibbles
  };

  /**
   * Evidence attached to a submission and checked by the capability hooks.
   */
  struct Attestation {
    std::string signature;
    std::string proof;
  };

  /**
   * Construct with no-op signing and proof hooks.
   */
  explicit Node(network::PeerNetwork &network);
  Node(network::PeerNetwork &network, std::shared_ptr<iii::Signer> spSigner,
       std::shared_ptr<iii::ProofSystem> spProofSystem);
  ~Node() override = default;

  Roe<void> init(const Config &config);
  const Config &getConfig() const { return config_; }

  // ----------------- accessors -------------------------------------
  Chain getChain() const;
  size_t getChainLength() const;
  std::vector<Transaction> getPendingTransactions() const;
  size_t getPendingCount() const;
  Roe<int64_t> getBalance(const std::string &address) const;
  std::vector<std::string> getPeers() const;

  /**
   * Taxonomy name of a Node error code, as used on the wire
   * (e.g. "InvalidAmount").
   */
  static std::string getErrorName(int32_t code);

  // ----------------- methods -------------------------------------
  Roe<void> submitTransaction(const std::string &sender,
                              const std::string &recipient, int64_t amount);

  /**
   * Check the hooks, queue the transaction and gossip it to peers as a
   * new_transaction event.
   */
  Roe<void> submitTransaction(const Transaction &tx,
                              const Attestation &attestation = {});

  /**
   * Drain the mempool into a new block, seal it and append it, then queue
   * the reward and announce the chain to peers.
   * @return The appended block
   */
  Roe<Block> mine();
  Roe<Block> mine(const std::string &minerAddress);

  /**
   * Fetch peer chains and let the fork-choice rule decide.
   * @return true if the local chain was replaced
   */
  bool resolveConflicts();

  /**
   * Consider a chain announced by a peer.
   * @return true if the local chain was replaced
   */
  bool receiveChain(const Chain &candidate);

  void cancelMining();

  /**
   * Cancel the search in flight and refuse every later mine() call until
   * the next init().
   */
  void shutdown();

  Roe<void> registerPeer(const std::string &address);

private:
  bool adopt(const std::vector<Chain> &candidates);

  // Put transactions back at the front of the pool, skipping those sealed
  // by blocks appended after baseHash. Caller holds mutex_.
  void restorePending(const std::vector<Transaction> &txes,
                      const std::string &baseHash);

  Config config_;
  network::PeerNetwork &network_;
  std::shared_ptr<iii::Signer> spSigner_;
  std::shared_ptr<iii::ProofSystem> spProofSystem_;
  consensus::ConsensusEngine engine_;

  mutable std::mutex mutex_;
  Chain chain_;
  Mempool mempool_;

  std::mutex miningMutex_;
  std::atomic<bool> cancelMining_{ false };
  std::atomic<bool> stopping_{ false };
};

} // namespace sy

#endif // SY_LEDGER_NODE_H
