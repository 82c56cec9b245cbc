#include "Node.h"
#include "Capabilities.h"
#include "Utilities.h"

#include <algorithm>
#include <unordered_set>

namespace sy {

namespace {

// Identity hashes of the transactions in blocks after the one named baseHash.
// Every block counts when baseHash is no longer part of the chain.
std::unordered_set<std::string> sealedSince(const Chain &chain,
                                            const std::string &baseHash) {
  std::unordered_set<std::string> sealed;
  const auto &blocks = chain.blocks();
  for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
    if (it->hash == baseHash) {
      break;
    }
    for (const auto &tx : it->transactions) {
      sealed.insert(tx.getIdentityHash());
    }
  }
  return sealed;
}

} // namespace

Node::Node(network::PeerNetwork &network)
    : Node(network, std::make_shared<NoopSigner>(),
           std::make_shared<NoopProofSystem>()) {}

Node::Node(network::PeerNetwork &network, std::shared_ptr<iii::Signer> spSigner,
           std::shared_ptr<iii::ProofSystem> spProofSystem)
    : Module("node"), network_(network), spSigner_(std::move(spSigner)),
      spProofSystem_(std::move(spProofSystem)) {
  engine_.redirectLogger(log().getFullName());
}

Node::Roe<void> Node::init(const Config &config) {
  if (config.address.empty()) {
    return Error(E_CONFIG, "Node address must not be empty");
  }
  if (!spSigner_ || !spProofSystem_) {
    return Error(E_CONFIG, "Signer and proof system hooks are required");
  }
  config_ = config;
  stopping_ = false;

  consensus::ConsensusEngine::Config engineConfig;
  engineConfig.difficulty = config_.difficulty;
  engine_.init(engineConfig);

  log().info << "Node " << config_.address << " initialized, difficulty "
             << config_.difficulty;
  return {};
}

Chain Node::getChain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_;
}

size_t Node::getChainLength() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.length();
}

std::vector<Transaction> Node::getPendingTransactions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mempool_.snapshot();
}

size_t Node::getPendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mempool_.size();
}

Node::Roe<int64_t> Node::getBalance(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto balance = chain_.getBalance(address);
  if (!balance) {
    log().error << balance.error().message;
    return Error(E_BALANCE_OVERFLOW, balance.error().message);
  }
  return balance.value();
}

std::vector<std::string> Node::getPeers() const { return network_.getPeers(); }

std::string Node::getErrorName(int32_t code) {
  switch (code) {
  case E_INVALID_AMOUNT:
    return "InvalidAmount";
  case E_DUPLICATE_TRANSACTION:
    return "DuplicateTransaction";
  case E_CHAIN_LINKAGE:
    return "ChainLinkageError";
  case E_MALFORMED_RECORD:
    return "MalformedRecord";
  case E_MINING_CANCELLED:
    return "MiningCancelled";
  case E_REJECTED_BY_HOOK:
    return "RejectedByHook";
  case E_INVALID_ADDRESS:
    return "InvalidAddress";
  case E_CONFIG:
    return "ConfigError";
  case E_BALANCE_OVERFLOW:
    return "BalanceOverflow";
  default:
    return "UnknownError";
  }
}

Node::Roe<void> Node::submitTransaction(const std::string &sender,
                                        const std::string &recipient,
                                        int64_t amount) {
  auto txResult = Transaction::create(sender, recipient, amount);
  if (!txResult) {
    log().warning << "Rejected transaction " << sender << " -> " << recipient
                  << ": " << txResult.error().message;
    return Error(E_INVALID_AMOUNT, txResult.error().message);
  }
  return submitTransaction(txResult.value());
}

Node::Roe<void> Node::submitTransaction(const Transaction &tx,
                                        const Attestation &attestation) {
  if (tx.getAmount() <= 0) {
    return Error(E_INVALID_AMOUNT, "Amount must be positive");
  }

  const std::string &id = tx.getIdentityHash();
  if (!spSigner_->verify(id, attestation.signature, tx.getSender())) {
    log().warning << "Signature check failed for transaction " << id;
    return Error(E_REJECTED_BY_HOOK, "Signature verification failed");
  }
  if (!spProofSystem_->verify(id, attestation.proof)) {
    log().warning << "Proof check failed for transaction " << id;
    return Error(E_REJECTED_BY_HOOK, "Proof verification failed");
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = mempool_.add(tx);
    if (!result) {
      log().debug << "Rejected transaction: " << result.error().message;
      return Error(E_DUPLICATE_TRANSACTION, result.error().message);
    }

    log().debug << "Accepted transaction " << id << " (" << tx.getSender()
                << " -> " << tx.getRecipient() << ": " << tx.getAmount()
                << "), pending " << mempool_.size();
  }

  // Peers answer a transaction they already hold with a duplicate error,
  // which ends the relay.
  nlohmann::json payload = tx.toJson();
  payload["signature"] = attestation.signature;
  payload["proof"] = attestation.proof;
  network_.broadcast(EVENT_NEW_TRANSACTION, payload);
  return {};
}

Node::Roe<Block> Node::mine() { return mine(config_.address); }

Node::Roe<Block> Node::mine(const std::string &minerAddress) {
  if (minerAddress.empty()) {
    return Error(E_INVALID_ADDRESS, "Miner address must not be empty");
  }

  std::lock_guard<std::mutex> miningLock(miningMutex_);
  cancelMining_ = false;
  // Checked after the reset so a shutdown racing this call is not lost
  if (stopping_) {
    return Error(E_MINING_CANCELLED, "Node is shutting down");
  }

  std::vector<Transaction> drained;
  Block block;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drained = mempool_.drain();
    const Block &tip = chain_.latest();
    // Keep timestamps non-decreasing along the chain
    int64_t timestamp = std::max(utl::getCurrentTimeMs(), tip.timestamp);
    block = Block(chain_.length(), drained, tip.hash, timestamp);
  }

  log().info << "Mining block " << block.index << " with " << drained.size()
             << " transactions at difficulty " << config_.difficulty;

  auto mined = block.mine(config_.difficulty, cancelMining_);
  if (!mined) {
    std::lock_guard<std::mutex> lock(mutex_);
    restorePending(drained, block.previousHash);
    log().info << "Mining of block " << block.index
               << " cancelled, transactions returned to pool";
    return Error(E_MINING_CANCELLED, mined.error().message);
  }

  Chain snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto appended = chain_.append(block);
    if (!appended) {
      restorePending(drained, block.previousHash);
      log().error << "Mined block " << block.index
                  << " does not fit the local chain: "
                  << appended.error().message;
      return Error(E_CHAIN_LINKAGE, appended.error().message);
    }

    auto reward = Transaction::create(REWARD_SENDER, minerAddress, REWARD_AMOUNT);
    auto queued = mempool_.add(reward.value());
    if (!queued) {
      log().debug << "Reward already pending for " << minerAddress;
    }
    snapshot = chain_;
  }

  log().info << "Mined block " << block.index << " hash " << block.hash
             << " nonce " << block.nonce;

  network_.broadcast(EVENT_CHAIN_UPDATE, snapshot.toJson());
  return block;
}

bool Node::resolveConflicts() {
  std::vector<Chain> candidates = network_.fetchChains();
  log().debug << "Resolving against " << candidates.size()
              << " peer chains";
  return adopt(candidates);
}

bool Node::receiveChain(const Chain &candidate) {
  return adopt({ candidate });
}

bool Node::adopt(const std::vector<Chain> &candidates) {
  consensus::ConsensusEngine::Resolution resolution;
  size_t pruned = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string previousTip = chain_.latest().hash;
    resolution = engine_.resolve(chain_, candidates);
    if (resolution.changed) {
      for (const auto &id : sealedSince(chain_, previousTip)) {
        if (mempool_.remove(id)) {
          ++pruned;
        }
      }
    }
  }

  if (resolution.changed) {
    cancelMining();
    log().info << "Local chain replaced, length now " << resolution.length
               << ", " << pruned << " sealed transactions left the pool";
  }
  return resolution.changed;
}

void Node::cancelMining() { cancelMining_ = true; }

void Node::shutdown() {
  stopping_ = true;
  cancelMining_ = true;
}

Node::Roe<void> Node::registerPeer(const std::string &address) {
  auto result = network_.registerPeer(address);
  if (!result) {
    return Error(E_INVALID_ADDRESS, result.error().message);
  }
  return {};
}

void Node::restorePending(const std::vector<Transaction> &txes,
                          const std::string &baseHash) {
  std::unordered_set<std::string> sealed = sealedSince(chain_, baseHash);
  std::vector<Transaction> restored;
  for (const auto &tx : txes) {
    if (sealed.count(tx.getIdentityHash()) == 0) {
      restored.push_back(tx);
    }
  }
  std::vector<Transaction> later = mempool_.drain();
  restored.insert(restored.end(), later.begin(), later.end());
  for (const auto &tx : restored) {
    auto result = mempool_.add(tx);
    if (!result) {
      log().debug << "Dropped duplicate on restore: " << result.error().message;
    }
  }
}

} // namespace sy
