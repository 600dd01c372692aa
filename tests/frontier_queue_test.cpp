#include <gtest/gtest.h>
#include "frontier_queue.hpp"
#include "fingerprint.hpp"
#include "queue_key.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <limits>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using json = nlohmann::json;

class FrontierQueueTest : public ::testing::TestWithParam<StoreBackend> {
protected:
    void SetUp() override { open(); }

    void TearDown() override {
        if (queue_) queue_->close();
    }

    void open() { queue_ = std::make_unique<FrontierQueue>(dir_.path(), GetParam()); }

    void reopen() {
        queue_->close();
        queue_.reset();
        open();
    }

    // Items pushed in one test share a base time so FIFO order does not depend
    // on the clock ticking between pushes.
    CrawlItem item_at(const std::string& url, long long offset_us,
                      CrawlPriority priority = CrawlPriority::Normal) {
        CrawlItem item = url_item(url, "findagrave", priority);
        item.created_at = from_micros(base_us_ + offset_us);
        return item;
    }

    TempDir dir_;
    std::unique_ptr<FrontierQueue> queue_;
    long long base_us_ = to_micros(now_utc());
};

TEST_P(FrontierQueueTest, UsesRequestedBackend) {
    EXPECT_EQ(queue_->backend_id(), backend_name(GetParam()));
    EXPECT_TRUE(queue_->empty());
    EXPECT_FALSE(queue_->pop().has_value());
}

TEST_P(FrontierQueueTest, PriorityBeatsPushOrder) {
    ASSERT_TRUE(queue_->push(item_at("https://x/high", 0, CrawlPriority::High)));
    ASSERT_TRUE(queue_->push(item_at("https://x/critical", 1, CrawlPriority::Critical)));
    ASSERT_TRUE(queue_->push(item_at("https://x/normal", 2, CrawlPriority::Normal)));

    EXPECT_EQ(queue_->pop()->priority, CrawlPriority::Critical);
    EXPECT_EQ(queue_->pop()->priority, CrawlPriority::High);
    EXPECT_EQ(queue_->pop()->priority, CrawlPriority::Normal);
    EXPECT_FALSE(queue_->pop().has_value());
}

TEST_P(FrontierQueueTest, FifoWithinPriority) {
    std::vector<CrawlItem> items = {item_at("https://x/1", 9), item_at("https://x/2", 10), item_at("https://x/3", 100)};
    for (auto it = items.rbegin(); it != items.rend(); ++it) ASSERT_TRUE(queue_->push(*it));

    for (const auto& expected : items) {
        auto got = queue_->pop();
        ASSERT_TRUE(got.has_value());
        EXPECT_EQ(got->item_id, expected.item_id);
    }
}

TEST_P(FrontierQueueTest, DuplicateFingerprintIsRejected) {
    CrawlItem first = url_item("https://x", "a");
    CrawlItem again = url_item("https://x", "a", CrawlPriority::Critical);

    EXPECT_TRUE(queue_->push(first));
    EXPECT_FALSE(queue_->push(again));
    EXPECT_EQ(queue_->size(), 1u);
    EXPECT_EQ(queue_->stats().pending_items, 1u);
    EXPECT_EQ(queue_->stats().unique_fingerprints, 1u);
    EXPECT_TRUE(queue_->is_duplicate(again));

    // Still a duplicate after the first one is done.
    auto popped = queue_->pop();
    ASSERT_TRUE(popped.has_value());
    ASSERT_TRUE(queue_->complete(popped->item_id));
    EXPECT_FALSE(queue_->push(url_item("https://x", "a")));
}

TEST_P(FrontierQueueTest, SkippingDuplicateCheckNeitherReadsNorMarksSeen) {
    EXPECT_TRUE(queue_->push(url_item("https://x", "a"), false));
    EXPECT_TRUE(queue_->push(url_item("https://x", "a"), false));
    EXPECT_EQ(queue_->size(), 2u);
    EXPECT_FALSE(queue_->is_duplicate(url_item("https://x", "a")));
    EXPECT_EQ(queue_->stats().unique_fingerprints, 0u);
}

TEST_P(FrontierQueueTest, KnownItemIdIsRejected) {
    CrawlItem item = url_item("https://x/1");
    ASSERT_TRUE(queue_->push(item));
    CrawlItem same_id = url_item("https://x/2");
    same_id.item_id = item.item_id;
    EXPECT_FALSE(queue_->push(same_id, false));
    EXPECT_EQ(queue_->size(), 1u);
}

TEST_P(FrontierQueueTest, MalformedItemThrows) {
    CrawlItem bad = url_item("");
    EXPECT_THROW(queue_->push(bad), std::invalid_argument);
    EXPECT_EQ(queue_->size(), 0u);
}

TEST_P(FrontierQueueTest, PopPreservesItemAndSetsLease) {
    CrawlItem item = url_item("https://example.org/records/17", "familysearch", CrawlPriority::High);
    item.subject_id = new_uuid();
    item.parent_item_id = new_uuid();
    item.hypothesis = "same person as record 16";
    ASSERT_TRUE(queue_->push(item));

    auto before = now_utc();
    auto got = queue_->pop();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->item_id, item.item_id);
    ASSERT_NE(got->url(), nullptr);
    EXPECT_EQ(*got->url(), *item.url());
    EXPECT_EQ(got->adapter_id, "familysearch");
    EXPECT_EQ(got->subject_id, item.subject_id);
    EXPECT_EQ(got->parent_item_id, item.parent_item_id);
    EXPECT_EQ(got->hypothesis, item.hypothesis);
    EXPECT_EQ(got->created_at, item.created_at);
    ASSERT_TRUE(got->leased_at.has_value());
    EXPECT_GE(*got->leased_at, before);

    FrontierStats s = queue_->stats();
    EXPECT_EQ(s.pending_items, 0u);
    EXPECT_EQ(s.processing_items, 1u);
    EXPECT_EQ(s.total_items, 1u);
}

TEST_P(FrontierQueueTest, PeekDoesNotConsume) {
    ASSERT_TRUE(queue_->push(item_at("https://x/low", 0, CrawlPriority::Low)));
    ASSERT_TRUE(queue_->push(item_at("https://x/high", 1, CrawlPriority::High)));

    auto one = queue_->peek();
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(*one[0].url(), "https://x/high");

    auto all = queue_->peek(10);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(*all[1].url(), "https://x/low");
    EXPECT_EQ(queue_->size(), 2u);
    EXPECT_TRUE(queue_->peek(0).empty());
}

TEST_P(FrontierQueueTest, PeekPagesPastOneScanWindow) {
    std::vector<CrawlItem> items;
    for (int i = 0; i < 40; ++i) items.push_back(item_at("https://x/" + std::to_string(i), i));
    ASSERT_EQ(queue_->push_many(items), 40u);

    auto seen = queue_->peek(35);
    ASSERT_EQ(seen.size(), 35u);
    for (int i = 0; i < 35; ++i) EXPECT_EQ(seen[i].item_id, items[i].item_id);
}

TEST_P(FrontierQueueTest, CompleteSucceedsOnce) {
    ASSERT_TRUE(queue_->push(url_item("https://x")));
    auto got = queue_->pop();
    ASSERT_TRUE(got.has_value());

    EXPECT_TRUE(queue_->complete(got->item_id));
    EXPECT_FALSE(queue_->complete(got->item_id));
    EXPECT_FALSE(queue_->fail(got->item_id));
    EXPECT_EQ(queue_->stats().completed_items, 1u);
    EXPECT_EQ(queue_->stats().processing_items, 0u);
}

TEST_P(FrontierQueueTest, CompleteOrFailRequiresProcessing) {
    CrawlItem item = url_item("https://x");
    ASSERT_TRUE(queue_->push(item));
    EXPECT_FALSE(queue_->complete(item.item_id));
    EXPECT_FALSE(queue_->fail(item.item_id));
    EXPECT_FALSE(queue_->complete(new_uuid()));
    EXPECT_EQ(queue_->size(), 1u);
}

TEST_P(FrontierQueueTest, RetriesExhaustIntoFailed) {
    CrawlItem item = url_item("https://x");
    item.max_retries = 2;
    ASSERT_TRUE(queue_->push(item));

    auto first = queue_->pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(queue_->fail(first->item_id));

    auto second = queue_->pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->item_id, item.item_id);
    EXPECT_EQ(second->retry_count, 1);
    EXPECT_EQ(second->priority, CrawlPriority::Low);
    EXPECT_TRUE(queue_->fail(second->item_id));

    EXPECT_FALSE(queue_->pop().has_value());
    FrontierStats s = queue_->stats();
    EXPECT_EQ(s.failed_items, 1u);
    EXPECT_EQ(s.pending_items, 0u);
    EXPECT_EQ(s.processing_items, 0u);
}

TEST_P(FrontierQueueTest, FailWithoutRequeueGoesStraightToFailed) {
    ASSERT_TRUE(queue_->push(url_item("https://x")));
    auto got = queue_->pop();
    ASSERT_TRUE(got.has_value());
    EXPECT_TRUE(queue_->fail(got->item_id, false));
    EXPECT_TRUE(queue_->empty());
    EXPECT_EQ(queue_->stats().failed_items, 1u);
}

TEST_P(FrontierQueueTest, BackgroundStaysBackground) {
    ASSERT_TRUE(queue_->push(url_item("https://x", "a", CrawlPriority::Background)));
    auto got = queue_->pop();
    ASSERT_TRUE(got.has_value());
    ASSERT_TRUE(queue_->fail(got->item_id));

    auto again = queue_->pop();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->priority, CrawlPriority::Background);
    EXPECT_EQ(again->retry_count, 1);
}

TEST_P(FrontierQueueTest, RecoverStalledIgnoresFreshLease) {
    ASSERT_TRUE(queue_->push(url_item("https://x")));
    ASSERT_TRUE(queue_->pop().has_value());
    EXPECT_EQ(queue_->recover_stalled(300.0), 0u);
    EXPECT_EQ(queue_->stats().processing_items, 1u);
}

TEST_P(FrontierQueueTest, RecoverStalledRequeuesOldLease) {
    ASSERT_TRUE(queue_->push(url_item("https://x", "a", CrawlPriority::High)));
    auto got = queue_->pop();
    ASSERT_TRUE(got.has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(queue_->recover_stalled(0.005), 1u);

    auto again = queue_->pop();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->item_id, got->item_id);
    EXPECT_EQ(again->retry_count, 1);
    EXPECT_EQ(again->priority, CrawlPriority::Normal);
}

TEST_P(FrontierQueueTest, RecoverStalledMovesExhaustedToFailed) {
    CrawlItem item = url_item("https://x");
    item.max_retries = 1;
    ASSERT_TRUE(queue_->push(item));
    ASSERT_TRUE(queue_->pop().has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(queue_->recover_stalled(0.005), 0u);
    EXPECT_EQ(queue_->stats().failed_items, 1u);
    EXPECT_EQ(queue_->stats().processing_items, 0u);
}

TEST_P(FrontierQueueTest, HugeTimeoutNeverRequeuesFreshLease) {
    ASSERT_TRUE(queue_->push(url_item("https://x")));
    auto leased = queue_->pop();
    ASSERT_TRUE(leased.has_value());

    EXPECT_EQ(queue_->recover_stalled(1e13), 0u);
    EXPECT_EQ(queue_->recover_stalled(1e300), 0u);
    EXPECT_EQ(queue_->recover_stalled(std::numeric_limits<double>::infinity()), 0u);

    FrontierStats s = queue_->stats();
    EXPECT_EQ(s.processing_items, 1u);
    EXPECT_EQ(s.pending_items, 0u);
    EXPECT_TRUE(queue_->complete(leased->item_id));
}

TEST_P(FrontierQueueTest, RecoverStalledRejectsNegativeOrNanTimeout) {
    EXPECT_THROW(queue_->recover_stalled(-1.0), std::invalid_argument);
    EXPECT_THROW(queue_->recover_stalled(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
}

TEST_P(FrontierQueueTest, LongPendingWaitDoesNotLookStalled) {
    CrawlItem item = url_item("https://x");
    item.created_at = from_micros(to_micros(now_utc()) - 3600LL * 1000000LL);
    ASSERT_TRUE(queue_->push(item));
    ASSERT_TRUE(queue_->pop().has_value());
    EXPECT_EQ(queue_->recover_stalled(60.0), 0u);
}

TEST_P(FrontierQueueTest, PushManyDedupsAgainstQueueAndItself) {
    ASSERT_TRUE(queue_->push(url_item("https://x/0")));
    std::vector<CrawlItem> batch = {
        url_item("https://x/0"),
        url_item("https://x/1"),
        url_item("https://x/1", "findagrave", CrawlPriority::High),
        url_item("https://x/2"),
    };
    EXPECT_EQ(queue_->push_many(batch), 2u);
    EXPECT_EQ(queue_->size(), 3u);
    EXPECT_EQ(queue_->push_many(batch), 0u);
    EXPECT_EQ(queue_->push_many({}), 0u);
}

TEST_P(FrontierQueueTest, PushManyIsAllOrNothingOnBadInput) {
    std::vector<CrawlItem> batch = {url_item("https://x/1"), url_item("")};
    EXPECT_THROW(queue_->push_many(batch), std::invalid_argument);
    EXPECT_EQ(queue_->size(), 0u);
}

TEST_P(FrontierQueueTest, StatsBreakdown) {
    ASSERT_TRUE(queue_->push(url_item("https://x/1", "census", CrawlPriority::High)));
    ASSERT_TRUE(queue_->push(url_item("https://x/2", "census", CrawlPriority::Low)));
    ASSERT_TRUE(queue_->push(url_item("https://x/3", "", CrawlPriority::Low)));
    ASSERT_TRUE(queue_->push(url_item("https://x/4", "census", CrawlPriority::Critical)));
    auto got = queue_->pop();
    ASSERT_TRUE(got.has_value());
    ASSERT_TRUE(queue_->complete(got->item_id));

    FrontierStats s = queue_->stats();
    EXPECT_EQ(s.total_items, 4u);
    EXPECT_EQ(s.pending_items, 3u);
    EXPECT_EQ(s.completed_items, 1u);
    EXPECT_EQ(s.unique_fingerprints, 4u);
    EXPECT_EQ(s.items_by_priority.at("LOW"), 2u);
    EXPECT_EQ(s.items_by_priority.at("HIGH"), 1u);
    EXPECT_EQ(s.items_by_priority.count("CRITICAL"), 0u);
    EXPECT_EQ(s.items_by_adapter.at("census"), 2u);
    EXPECT_EQ(s.items_by_adapter.at("unknown"), 1u);

    json j = s;
    EXPECT_EQ(j["items_by_adapter"]["census"], 2);
    EXPECT_EQ(j.get<FrontierStats>().pending_items, 3u);
}

TEST_P(FrontierQueueTest, ClearForgetsEverything) {
    ASSERT_TRUE(queue_->push(url_item("https://x")));
    ASSERT_TRUE(queue_->push(url_item("https://y")));
    ASSERT_TRUE(queue_->pop().has_value());
    queue_->clear();

    FrontierStats s = queue_->stats();
    EXPECT_EQ(s.total_items, 0u);
    EXPECT_EQ(s.unique_fingerprints, 0u);
    EXPECT_TRUE(queue_->push(url_item("https://x")));
}

TEST_P(FrontierQueueTest, StateSurvivesReopen) {
    std::vector<CrawlItem> items = {
        item_at("https://x/bg", 0, CrawlPriority::Background),
        item_at("https://x/n1", 1, CrawlPriority::Normal),
        item_at("https://x/n2", 2, CrawlPriority::Normal),
        item_at("https://x/c", 3, CrawlPriority::Critical),
    };
    ASSERT_EQ(queue_->push_many(items), 4u);
    auto leased = queue_->pop();
    ASSERT_TRUE(leased.has_value());
    EXPECT_EQ(leased->item_id, items[3].item_id);

    reopen();

    EXPECT_EQ(queue_->size(), 3u);
    EXPECT_EQ(queue_->stats().processing_items, 1u);
    EXPECT_TRUE(queue_->is_duplicate(items[0]));
    EXPECT_FALSE(queue_->push(url_item("https://x/n1")));

    for (std::size_t i : {1u, 2u, 0u}) {
        auto got = queue_->pop();
        ASSERT_TRUE(got.has_value());
        EXPECT_EQ(got->item_id, items[i].item_id);
    }
    EXPECT_TRUE(queue_->complete(leased->item_id));
}

TEST_P(FrontierQueueTest, SecondOpenFailsFast) {
    EXPECT_THROW({ FrontierQueue second(dir_.path(), GetParam()); }, ConfigError);
}

TEST_P(FrontierQueueTest, ConcurrentPoppersNeverShareAnItem) {
    constexpr int kItems = 120;
    std::vector<CrawlItem> items;
    for (int i = 0; i < kItems; ++i) items.push_back(item_at("https://x/" + std::to_string(i), i));
    ASSERT_EQ(queue_->push_many(items), static_cast<std::size_t>(kItems));

    std::mutex mu;
    std::multiset<std::string> popped;
    std::vector<std::thread> workers;
    for (int t = 0; t < 6; ++t) {
        workers.emplace_back([&] {
            while (auto item = queue_->pop()) {
                std::lock_guard<std::mutex> lock(mu);
                popped.insert(item->item_id);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(popped.size(), static_cast<std::size_t>(kItems));
    for (const auto& item : items) EXPECT_EQ(popped.count(item.item_id), 1u);
    EXPECT_EQ(queue_->stats().processing_items, static_cast<std::size_t>(kItems));
}

TEST_P(FrontierQueueTest, ConcurrentPushesOfOneTargetAddOnce) {
    std::atomic<std::size_t> added{0};
    std::vector<std::thread> producers;
    for (int t = 0; t < 6; ++t) {
        producers.emplace_back([&] {
            if (queue_->push(url_item("https://x/same"))) ++added;
            added += queue_->push_many({url_item("https://x/batch"), url_item("https://x/same")});
        });
    }
    for (auto& p : producers) p.join();

    EXPECT_EQ(added.load(), 2u);
    EXPECT_EQ(queue_->size(), 2u);
}

INSTANTIATE_TEST_SUITE_P(Backends, FrontierQueueTest,
                         ::testing::Values(StoreBackend::Sqlite, StoreBackend::Snapshot),
                         [](const ::testing::TestParamInfo<StoreBackend>& info) {
                             return std::string(backend_name(info.param));
                         });

TEST(FrontierQueueOrphanTest, PopHealsQueueKeyWithoutBody) {
    TempDir dir;
    auto store = open_state_store(dir.path(), StoreBackend::Sqlite);
    StateStore* raw = store.get();
    FrontierQueue queue(std::move(store));

    CrawlItem item = url_item("https://x");
    ASSERT_TRUE(queue.push(item));
    // Sorts ahead of the real item and has no item: record.
    const std::string orphan = encode_queue_key(CrawlPriority::Critical, from_micros(0), new_uuid());
    raw->put(orphan, orphan.substr(orphan.size() - 36));
    EXPECT_EQ(queue.size(), 2u);

    auto got = queue.pop();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->item_id, item.item_id);
    EXPECT_FALSE(raw->get(orphan).has_value());
    EXPECT_EQ(queue.size(), 0u);
}

class FrontierQueueCorruptBodyTest : public ::testing::TestWithParam<StoreBackend> {};

TEST_P(FrontierQueueCorruptBodyTest, UnreadablePendingBodyMovesToFailed) {
    TempDir dir;
    const std::string bad_id = new_uuid();
    const std::string bad_key = encode_queue_key(CrawlPriority::Critical, from_micros(0), bad_id);
    CrawlItem item = url_item("https://x");
    {
        auto store = open_state_store(dir.path(), GetParam());
        StateStore* raw = store.get();
        FrontierQueue queue(std::move(store));
        ASSERT_TRUE(queue.push(item));

        WriteBatch corrupt;
        corrupt.put(item_key(bad_id), "{\"item_id\":");
        corrupt.put(bad_key, bad_id);
        ASSERT_TRUE(raw->write(corrupt));

        // Read paths skip the unreadable body instead of throwing.
        auto peeked = queue.peek(5);
        ASSERT_EQ(peeked.size(), 1u);
        EXPECT_EQ(peeked[0].item_id, item.item_id);
        EXPECT_EQ(queue.stats().items_by_adapter.at("findagrave"), 1u);

        auto got = queue.pop();
        ASSERT_TRUE(got.has_value());
        EXPECT_EQ(got->item_id, item.item_id);
        EXPECT_FALSE(raw->get(bad_key).has_value());
        EXPECT_EQ(raw->get(failed_key(bad_id)), std::optional<std::string>("{\"item_id\":"));
        EXPECT_FALSE(queue.pop().has_value());
        queue.close();
    }

    FrontierQueue reopened(dir.path(), GetParam());
    FrontierStats s = reopened.stats();
    EXPECT_EQ(s.failed_items, 1u);
    EXPECT_EQ(s.processing_items, 1u);
    EXPECT_EQ(s.pending_items, 0u);
}

INSTANTIATE_TEST_SUITE_P(Backends, FrontierQueueCorruptBodyTest,
                         ::testing::Values(StoreBackend::Sqlite, StoreBackend::Snapshot),
                         [](const ::testing::TestParamInfo<StoreBackend>& info) {
                             return std::string(backend_name(info.param));
                         });

TEST(FrontierQueueOrphanTest, NullStoreIsRejected) {
    EXPECT_THROW({ FrontierQueue queue{std::unique_ptr<StateStore>()}; }, ConfigError);
}
