#include <gtest/gtest.h>
#include "TopicRouter.hpp"
#include <algorithm>

using namespace rendezvous;

namespace {
    std::vector<uint64_t> sorted(std::vector<uint64_t> ids) {
        std::sort(ids.begin(), ids.end());
        return ids;
    }
}

// ---- SUBSCRIPTIONS ----

TEST(TopicRouterTest, SubscribeIsIdempotent) {
    TopicRouter router;

    EXPECT_TRUE(router.subscribe(1, "t"));
    EXPECT_FALSE(router.subscribe(1, "t"));
    EXPECT_TRUE(router.isSubscribed(1, "t"));
    EXPECT_EQ(router.subscribers("t"), std::vector<uint64_t>({1}));
}

TEST(TopicRouterTest, FanOutListsEverySubscriber) {
    TopicRouter router;
    router.subscribe(TopicRouter::LOCAL_SUBSCRIBER, "t");
    router.subscribe(1, "t");
    router.subscribe(2, "t");
    router.subscribe(3, "other");

    EXPECT_EQ(sorted(router.subscribers("t")), std::vector<uint64_t>({0, 1, 2}));
    EXPECT_TRUE(router.subscribers("nobody").empty());
    EXPECT_EQ(router.topicCount(), 2u);
}

TEST(TopicRouterTest, UnsubscribeDropsEmptyTopics) {
    TopicRouter router;
    router.subscribe(1, "t");

    EXPECT_TRUE(router.unsubscribe(1, "t"));
    EXPECT_FALSE(router.unsubscribe(1, "t"));
    EXPECT_EQ(router.topicCount(), 0u);
}

TEST(TopicRouterTest, RemoveSubscriberReportsTopicsLeft) {
    TopicRouter router;
    router.subscribe(1, "a");
    router.subscribe(1, "b");
    router.subscribe(2, "b");

    auto left = router.removeSubscriber(1);
    std::sort(left.begin(), left.end());
    EXPECT_EQ(left, std::vector<std::string>({"a", "b"}));
    EXPECT_EQ(router.subscribers("b"), std::vector<uint64_t>({2}));
    EXPECT_EQ(router.topicCount(), 1u);
    EXPECT_TRUE(router.removeSubscriber(1).empty());
}

// ---- DE-DUPLICATION ----

TEST(TopicRouterTest, MarkSeenRejectsDuplicates) {
    TopicRouter router;
    EXPECT_TRUE(router.markSeen("m1"));
    EXPECT_FALSE(router.markSeen("m1"));
    EXPECT_TRUE(router.markSeen("m2"));
}

TEST(TopicRouterTest, SeenCacheIsBounded) {
    TopicRouter router(2);
    router.markSeen("m1");
    router.markSeen("m2");
    router.markSeen("m3");

    // m1 was evicted first
    EXPECT_TRUE(router.markSeen("m1"));
    EXPECT_FALSE(router.markSeen("m3"));
}

TEST(TopicRouterTest, MessageIdDependsOnSourceSeqnoAndData) {
    PublishData a{"t", "P1", 1, {1, 2, 3}};
    PublishData sameContentOtherTopic{"u", "P1", 1, {1, 2, 3}};
    PublishData otherSeqno{"t", "P1", 2, {1, 2, 3}};
    PublishData otherSource{"t", "P2", 1, {1, 2, 3}};

    EXPECT_EQ(TopicRouter::messageId(a), TopicRouter::messageId(sameContentOtherTopic));
    EXPECT_NE(TopicRouter::messageId(a), TopicRouter::messageId(otherSeqno));
    EXPECT_NE(TopicRouter::messageId(a), TopicRouter::messageId(otherSource));
    EXPECT_EQ(TopicRouter::messageId(a).size(), 2 * SHA256_HASH_SIZE);
}
