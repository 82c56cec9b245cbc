#include "Mempool.h"
#include <gtest/gtest.h>

namespace {

sy::Transaction makeTx(const std::string &from, const std::string &to,
                       int64_t amount) {
  return sy::Transaction::create(from, to, amount).value();
}

} // namespace

TEST(MempoolTest, StartsEmpty) {
  sy::Mempool pool;
  EXPECT_EQ(pool.size(), 0);
  EXPECT_TRUE(pool.empty());
  EXPECT_TRUE(pool.drain().empty());
}

TEST(MempoolTest, AddsUniqueTransactions) {
  sy::Mempool pool;
  auto tx = makeTx("Alice", "Bob", 10);
  ASSERT_TRUE(pool.add(tx).isOk());
  ASSERT_TRUE(pool.add(makeTx("Alice", "Bob", 11)).isOk());
  EXPECT_EQ(pool.size(), 2);
  EXPECT_TRUE(pool.contains(tx.getIdentityHash()));
}

TEST(MempoolTest, RejectsDuplicateIdentity) {
  sy::Mempool pool;
  ASSERT_TRUE(pool.add(makeTx("Alice", "Bob", 10)).isOk());

  auto result = pool.add(makeTx("Alice", "Bob", 10));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, sy::Mempool::E_DUPLICATE);
  EXPECT_EQ(pool.size(), 1);
}

TEST(MempoolTest, DrainReturnsSubmissionOrderAndEmpties) {
  sy::Mempool pool;
  std::vector<sy::Transaction> submitted = {
    makeTx("c", "d", 3), makeTx("a", "b", 1), makeTx("e", "f", 2)
  };
  for (const auto &tx : submitted) {
    ASSERT_TRUE(pool.add(tx).isOk());
  }

  auto drained = pool.drain();
  ASSERT_EQ(drained.size(), submitted.size());
  for (size_t i = 0; i < submitted.size(); ++i) {
    EXPECT_EQ(drained[i].getIdentityHash(), submitted[i].getIdentityHash());
  }
  EXPECT_EQ(pool.size(), 0);

  // Drained transactions may be submitted again
  EXPECT_TRUE(pool.add(submitted[0]).isOk());
}

TEST(MempoolTest, SnapshotLeavesPoolIntact) {
  sy::Mempool pool;
  ASSERT_TRUE(pool.add(makeTx("Alice", "Bob", 10)).isOk());
  auto snapshot = pool.snapshot();
  EXPECT_EQ(snapshot.size(), 1);
  EXPECT_EQ(pool.size(), 1);
}

TEST(MempoolTest, RemoveKeepsOrderOfTheRest) {
  sy::Mempool pool;
  auto middle = makeTx("Bob", "Carol", 2);
  ASSERT_TRUE(pool.add(makeTx("Alice", "Bob", 1)).isOk());
  ASSERT_TRUE(pool.add(middle).isOk());
  ASSERT_TRUE(pool.add(makeTx("Carol", "Dave", 3)).isOk());

  EXPECT_TRUE(pool.remove(middle.getIdentityHash()));
  EXPECT_FALSE(pool.remove(middle.getIdentityHash()));
  EXPECT_FALSE(pool.contains(middle.getIdentityHash()));

  auto rest = pool.snapshot();
  ASSERT_EQ(rest.size(), 2);
  EXPECT_EQ(rest[0].getSender(), "Alice");
  EXPECT_EQ(rest[1].getSender(), "Carol");

  // A removed transaction may be queued again
  EXPECT_TRUE(pool.add(middle).isOk());
}
