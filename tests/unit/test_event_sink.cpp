#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include "EventSink.h"

using namespace SettleFS;
using namespace std::chrono_literals;

namespace {

DebounceResult eventBatch(const std::string& path) {
    return DebounceResult(std::vector<DebouncedEvent>{DebouncedEvent(path, DebouncedEventKind::Any)});
}

} // namespace

TEST(ChannelSinkTest, DeliversBatchesInOrder) {
    ChannelSink channel;
    channel.handleEvent(eventBatch("/a"));
    channel.handleEvent(DebounceResult(std::vector<Error>{Error("watch lost")}));
    channel.handleEvent(eventBatch("/b"));
    EXPECT_EQ(channel.size(), 3u);

    auto first = channel.tryReceive();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->isOk());
    EXPECT_EQ(first->value()[0].path, "/a");

    auto second = channel.tryReceive();
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(second->isError());
    EXPECT_EQ(second->error()[0].message, "watch lost");

    auto third = channel.tryReceive();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->value()[0].path, "/b");

    EXPECT_FALSE(channel.tryReceive().has_value());
}

TEST(ChannelSinkTest, ReceiveForTimesOutWhenEmpty) {
    ChannelSink channel;
    auto before = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.receiveFor(50ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - before, std::chrono::steady_clock::duration(40ms));
}

TEST(ChannelSinkTest, ReceiveWakesOnBatchFromAnotherThread) {
    ChannelSink channel;
    std::thread producer([&channel]() {
        std::this_thread::sleep_for(30ms);
        channel.handleEvent(eventBatch("/late"));
    });

    auto batch = channel.receive();
    producer.join();

    ASSERT_TRUE(batch.has_value());
    EXPECT_EQ(batch->value()[0].path, "/late");
}

TEST(ChannelSinkTest, CloseWakesReceiverAndDropsLaterBatches) {
    ChannelSink channel;
    channel.handleEvent(eventBatch("/queued"));

    std::thread closer([&channel]() {
        std::this_thread::sleep_for(30ms);
        channel.close();
    });

    // Queued batches survive close
    EXPECT_TRUE(channel.receive().has_value());
    EXPECT_FALSE(channel.receive().has_value());
    closer.join();

    EXPECT_TRUE(channel.isClosed());
    channel.handleEvent(eventBatch("/dropped"));
    EXPECT_EQ(channel.size(), 0u);
}

TEST(CallbackSinkTest, ForwardsToHandler) {
    std::vector<std::string> seen;
    CallbackSink sink([&seen](const DebounceResult& result) {
        for (const auto& event : result.value()) {
            seen.push_back(event.path);
        }
    });

    sink.handleEvent(eventBatch("/x"));
    sink.handleEvent(eventBatch("/y"));
    EXPECT_EQ(seen, (std::vector<std::string>{"/x", "/y"}));
}

TEST(DebouncedEventTest, KindNames) {
    EXPECT_EQ(kindToString(DebouncedEventKind::Any), "Any");
    EXPECT_EQ(kindToString(DebouncedEventKind::AnyContinuous), "AnyContinuous");

    std::ostringstream os;
    os << DebouncedEvent("/p", DebouncedEventKind::AnyContinuous);
    EXPECT_EQ(os.str(), "AnyContinuous(/p)");
}
