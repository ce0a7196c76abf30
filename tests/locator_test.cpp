#include "core/LocatorFeed.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using petctl::core::Location;
using petctl::core::LocatorFeed;
using petctl::core::LocatorNpcListChangeEvent;
using petctl::core::NpcInfo;
using petctl::core::NpcList;

namespace {

  std::vector<int> ids(const NpcList& npcs) {
    std::vector<int> out;
    for (const auto& n : npcs)
      out.push_back(n.id);
    std::sort(out.begin(), out.end());
    return out;
  }

  class LocatorFeedTest : public ::testing::Test {
  protected:
    void SetUp() override {
      feed.subscribe([this](const LocatorNpcListChangeEvent& e) { events.push_back(e); });
    }

    LocatorFeed feed;
    std::vector<LocatorNpcListChangeEvent> events;
  };

} // namespace

TEST_F(LocatorFeedTest, EmptyBeforeFirstIngest) {
  EXPECT_TRUE(feed.npcs().empty());
  EXPECT_FALSE(feed.ping());
}

TEST_F(LocatorFeedTest, FirstNonEmptySetEmits) {
  EXPECT_TRUE(feed.ingest({ { 1, "A" }, { 2, "B" } }, Location{ 10, 20 }));
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(ids(events[0].npcs), (std::vector<int>{ 1, 2 }));
  EXPECT_EQ(feed.ping(), (Location{ 10, 20 }));
}

TEST_F(LocatorFeedTest, FirstEmptySetIsSilent) {
  EXPECT_FALSE(feed.ingest({}, std::nullopt));
  EXPECT_TRUE(events.empty());
}

TEST_F(LocatorFeedTest, SameMembersDifferentStatsIsSilent) {
  feed.ingest({ { 1, "A", 100.0, 50.0 }, { 2, "B", 100.0, 50.0 } }, std::nullopt);
  events.clear();

  EXPECT_FALSE(feed.ingest({ { 2, "B", 10.0, 0.0 }, { 1, "A", 80.0, 5.0 } }, std::nullopt));
  EXPECT_TRUE(events.empty());

  // snapshot is still replaced
  auto npcs = feed.npcs();
  auto b = std::find_if(npcs.begin(), npcs.end(), [](const NpcInfo& n) { return n.id == 2; });
  ASSERT_NE(b, npcs.end());
  EXPECT_DOUBLE_EQ(b->hp, 10.0);
}

TEST_F(LocatorFeedTest, MembershipChangeEmitsFullNewSet) {
  feed.ingest({ { 1, "A" }, { 2, "B" } }, std::nullopt);
  events.clear();

  EXPECT_TRUE(feed.ingest({ { 1, "A" }, { 3, "C" } }, std::nullopt));
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(ids(events[0].npcs), (std::vector<int>{ 1, 3 }));
}

TEST_F(LocatorFeedTest, GoingEmptyEmits) {
  feed.ingest({ { 1, "A" } }, Location{ 1, 1 });
  events.clear();

  EXPECT_TRUE(feed.clear());
  ASSERT_EQ(events.size(), 1u);
  EXPECT_TRUE(events[0].npcs.empty());
  EXPECT_FALSE(feed.ping());
}

TEST_F(LocatorFeedTest, PingChangeAloneIsSilent) {
  feed.ingest({ { 1, "A" } }, Location{ 1, 1 });
  events.clear();

  EXPECT_FALSE(feed.ingest({ { 1, "A" } }, Location{ 5, 5 }));
  EXPECT_TRUE(events.empty());
  EXPECT_EQ(feed.ping(), (Location{ 5, 5 }));
}

TEST_F(LocatorFeedTest, DuplicateIdsCountOnce) {
  feed.ingest({ { 1, "A" }, { 1, "A-dup" }, { 2, "B" } }, std::nullopt);
  events.clear();

  auto npcs = feed.npcs();
  ASSERT_EQ(npcs.size(), 2u);
  EXPECT_EQ(npcs[0].name, "A");

  EXPECT_FALSE(feed.ingest({ { 1, "A" }, { 2, "B" } }, std::nullopt));
}

TEST_F(LocatorFeedTest, UnsubscribeStopsDelivery) {
  int second = 0;
  auto id = feed.subscribe([&](const LocatorNpcListChangeEvent&) { ++second; });
  feed.ingest({ { 1, "A" } }, std::nullopt);
  feed.unsubscribe(id);
  feed.ingest({ { 2, "B" } }, std::nullopt);

  EXPECT_EQ(second, 1);
  EXPECT_EQ(events.size(), 2u);
}

TEST_F(LocatorFeedTest, ListenerMayReadFeed) {
  std::size_t seen = 0;
  feed.subscribe([&](const LocatorNpcListChangeEvent&) { seen = feed.npcs().size(); });
  feed.ingest({ { 1, "A" }, { 2, "B" } }, std::nullopt);
  EXPECT_EQ(seen, 2u);
}
