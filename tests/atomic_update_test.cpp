#include "jobflow/store/atomic_update.hpp"
#include "jobflow/store/memory_store.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace jobflow;

namespace {

// Delegates reads to an in-memory store but loses every conditional write.
class AlwaysConflictingStore final : public MetadataStore {
public:
  auto get(std::string_view path)
      -> Result<std::optional<VersionedRecord>> override {
    return inner_.get(path);
  }
  auto set(std::string_view path, const Record& record)
      -> Result<void> override {
    return inner_.set(path, record);
  }
  auto compare_and_set(std::string_view, const Record&, std::int64_t)
      -> Result<void> override {
    ++cas_calls;
    return fail(Error::StoreConflict);
  }
  auto remove(std::string_view path) -> Result<void> override {
    return inner_.remove(path);
  }
  auto children(std::string_view path)
      -> Result<std::vector<std::string>> override {
    return inner_.children(path);
  }

  std::atomic<int> cas_calls{0};

private:
  InMemoryStore inner_;
};

auto increment(std::optional<Record> current)
    -> Result<std::optional<Record>> {
  Record r = current.value_or(Record{"counter"});
  r.set_simple_int("n", r.simple_int("n").value_or(0) + 1);
  return ok(std::optional<Record>{std::move(r)});
}

}  // namespace

class AtomicUpdateTest : public ::testing::Test {
protected:
  InMemoryStore store_;
};

TEST_F(AtomicUpdateTest, MissingRecord_UpdaterSeesNullopt) {
  bool saw_empty = false;

  auto r = update_with_retry(store_, "/c/a", [&](std::optional<Record> cur) {
    saw_empty = !cur.has_value();
    return increment(std::move(cur));
  });

  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(saw_empty);
  EXPECT_EQ((*store_.read("/c/a"))->simple_int("n"), 1);
}

TEST_F(AtomicUpdateTest, UpdaterError_IsReturnedUnchanged) {
  ASSERT_TRUE(update_with_retry(store_, "/c/a", increment).has_value());

  auto r = update_with_retry(
      store_, "/c/a", [](std::optional<Record>) -> Result<std::optional<Record>> {
        return fail(Error::IllegalState);
      });

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::IllegalState);
  EXPECT_EQ((*store_.read("/c/a"))->simple_int("n"), 1);
}

TEST_F(AtomicUpdateTest, Nullopt_SkipsWrite) {
  ASSERT_TRUE(update_with_retry(store_, "/c/a", increment).has_value());

  auto r = update_with_retry(
      store_, "/c/a", [](std::optional<Record>) -> Result<std::optional<Record>> {
        return ok(std::optional<Record>{});
      });

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ((*store_.get("/c/a"))->version, 0);
}

TEST_F(AtomicUpdateTest, ConflictingWriter_UpdaterReruns) {
  ASSERT_TRUE(update_with_retry(store_, "/c/a", increment).has_value());
  int runs = 0;

  auto r = update_with_retry(store_, "/c/a", [&](std::optional<Record> cur) {
    if (++runs == 1) {
      // Someone else gets in between the read and the write.
      Record other{"counter"};
      other.set_simple_int("n", 10);
      EXPECT_TRUE(store_.set("/c/a", other).has_value());
    }
    return increment(std::move(cur));
  });

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(runs, 2);
  EXPECT_EQ((*store_.read("/c/a"))->simple_int("n"), 11);
}

TEST_F(AtomicUpdateTest, ConcurrentIncrements_NoLostUpdates) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kPerThread; ++i) {
        if (!update_with_retry(store_, "/c/counter", increment, 1000)) {
          ++failures;
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ((*store_.read("/c/counter"))->simple_int("n"),
            kThreads * kPerThread);
}

TEST(AtomicUpdateExhaustionTest, AlwaysConflicting_FailsAfterBudget) {
  AlwaysConflictingStore store;

  auto r = update_with_retry(store, "/c/a", increment, 5);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::StoreConflict);
  EXPECT_EQ(store.cas_calls.load(), 5);
  EXPECT_FALSE(*store.exists("/c/a"));
}
