#include "jobflow/store/memory_store.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace jobflow;

namespace {

auto record(std::string id, std::string value) -> Record {
  Record r{std::move(id)};
  r.set_simple("v", std::move(value));
  return r;
}

}  // namespace

class InMemoryStoreTest : public ::testing::Test {
protected:
  InMemoryStore store_;
};

TEST_F(InMemoryStoreTest, Get_Missing_ReturnsEmpty) {
  auto r = store_.get("/c/a");

  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->has_value());
}

TEST_F(InMemoryStoreTest, Set_ThenGet_StartsAtVersionZero) {
  ASSERT_TRUE(store_.set("/c/a", record("a", "1")).has_value());

  auto r = store_.get("/c/a");

  ASSERT_TRUE(r.has_value() && r->has_value());
  EXPECT_EQ((*r)->version, 0);
  EXPECT_EQ((*r)->record.simple("v"), "1");
}

TEST_F(InMemoryStoreTest, Set_Overwrite_BumpsVersion) {
  ASSERT_TRUE(store_.set("/c/a", record("a", "1")).has_value());
  ASSERT_TRUE(store_.set("/c/a", record("a", "2")).has_value());

  auto r = store_.get("/c/a");

  ASSERT_TRUE(r.has_value() && r->has_value());
  EXPECT_EQ((*r)->version, 1);
  EXPECT_EQ((*r)->record.simple("v"), "2");
}

TEST_F(InMemoryStoreTest, TrailingSlash_IsSamePath) {
  ASSERT_TRUE(store_.set("/c/a/", record("a", "1")).has_value());

  auto exists = store_.exists("/c/a");

  ASSERT_TRUE(exists.has_value());
  EXPECT_TRUE(*exists);
}

TEST_F(InMemoryStoreTest, CompareAndSet_CreateOnlyWhenAbsent) {
  EXPECT_TRUE(
      store_.compare_and_set("/c/a", record("a", "1"), kAbsentVersion)
          .has_value());

  auto again = store_.compare_and_set("/c/a", record("a", "2"), kAbsentVersion);

  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), Error::StoreConflict);
  EXPECT_EQ((*store_.read("/c/a"))->simple("v"), "1");
}

TEST_F(InMemoryStoreTest, CompareAndSet_StaleVersion_Conflicts) {
  ASSERT_TRUE(store_.set("/c/a", record("a", "1")).has_value());
  ASSERT_TRUE(store_.compare_and_set("/c/a", record("a", "2"), 0).has_value());

  auto stale = store_.compare_and_set("/c/a", record("a", "3"), 0);

  ASSERT_FALSE(stale.has_value());
  EXPECT_EQ(stale.error(), Error::StoreConflict);
  EXPECT_EQ((*store_.read("/c/a"))->simple("v"), "2");
}

TEST_F(InMemoryStoreTest, CompareAndSet_MissingPathWithVersion_Conflicts) {
  auto r = store_.compare_and_set("/c/a", record("a", "1"), 3);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::StoreConflict);
}

TEST_F(InMemoryStoreTest, Remove_IsRecursive) {
  ASSERT_TRUE(store_.set("/c/wf", record("wf", "1")).has_value());
  ASSERT_TRUE(store_.set("/c/wf/Context", record("Context", "1")).has_value());
  ASSERT_TRUE(store_.set("/c/wf_1", record("wf_1", "1")).has_value());

  ASSERT_TRUE(store_.remove("/c/wf").has_value());

  EXPECT_FALSE(*store_.exists("/c/wf"));
  EXPECT_FALSE(*store_.exists("/c/wf/Context"));
  EXPECT_TRUE(*store_.exists("/c/wf_1"));
}

TEST_F(InMemoryStoreTest, Remove_Missing_Succeeds) {
  EXPECT_TRUE(store_.remove("/nothing/here").has_value());
}

TEST_F(InMemoryStoreTest, Children_AreSortedDirectNames) {
  ASSERT_TRUE(store_.set("/c/b", record("b", "1")).has_value());
  ASSERT_TRUE(store_.set("/c/a/Context", record("Context", "1")).has_value());
  ASSERT_TRUE(store_.set("/c/a/UserContent", record("u", "1")).has_value());
  ASSERT_TRUE(store_.set("/other/x", record("x", "1")).has_value());

  auto names = store_.children("/c");

  ASSERT_TRUE(names.has_value());
  EXPECT_EQ(*names, (std::vector<std::string>{"a", "b"}));
}

TEST_F(InMemoryStoreTest, ConcurrentCompareAndSet_ExactlyOneCreatorWins) {
  constexpr int kThreads = 8;
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([this, i, &winners] {
      if (store_.compare_and_set("/c/race", record("race", std::to_string(i)),
                                 kAbsentVersion)) {
        ++winners;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(store_.size(), 1);
}
