#include "ptt_dictation/audio/channel.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <set>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using ptt_dictation::ChannelStatus;
using ptt_dictation::Receiver;
using ptt_dictation::Sender;
using ptt_dictation::make_channel;

TEST(Channel, DeliversInSendOrder) {
    auto channel = make_channel<int>();
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(channel.first.send(i));
    }

    for (int i = 0; i < 5; ++i) {
        int value = -1;
        ASSERT_EQ(channel.second.try_recv(value), ChannelStatus::Ok);
        EXPECT_EQ(value, i);
    }
}

TEST(Channel, TryRecvOnEmptyChannelReportsEmpty) {
    auto channel = make_channel<int>();
    int value = 0;
    EXPECT_EQ(channel.second.try_recv(value), ChannelStatus::Empty);
}

TEST(Channel, RecvForTimesOutWhenNothingArrives) {
    auto channel = make_channel<int>();
    int value = 0;

    const auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(channel.second.recv_for(value, 20ms), ChannelStatus::Timeout);
    EXPECT_GE(std::chrono::steady_clock::now() - begin, 15ms);
}

TEST(Channel, QueuedItemsSurviveSenderDropThenDisconnect) {
    auto channel = make_channel<int>();
    Receiver<int> rx = std::move(channel.second);
    {
        Sender<int> tx = std::move(channel.first);
        tx.send(1);
        tx.send(2);
    }

    int value = 0;
    EXPECT_EQ(rx.recv_for(value, 10ms), ChannelStatus::Ok);
    EXPECT_EQ(value, 1);
    EXPECT_EQ(rx.recv_for(value, 10ms), ChannelStatus::Ok);
    EXPECT_EQ(value, 2);
    EXPECT_EQ(rx.recv_for(value, 10ms), ChannelStatus::Disconnected);
    EXPECT_EQ(rx.try_recv(value), ChannelStatus::Disconnected);
}

TEST(Channel, CopiedSendersKeepChannelOpen) {
    auto channel = make_channel<int>();
    Sender<int> copy = channel.first;
    channel.first = Sender<int>();

    int value = 0;
    EXPECT_EQ(channel.second.try_recv(value), ChannelStatus::Empty);

    copy.send(7);
    copy = Sender<int>();
    EXPECT_EQ(channel.second.try_recv(value), ChannelStatus::Ok);
    EXPECT_EQ(value, 7);
    EXPECT_EQ(channel.second.try_recv(value), ChannelStatus::Disconnected);
}

TEST(Channel, SendFailsOnceReceiverIsGone) {
    auto channel = make_channel<int>();
    channel.second = Receiver<int>();
    EXPECT_FALSE(channel.first.send(1));
}

TEST(Channel, DefaultConstructedEndpointsAreClosed) {
    Sender<int> tx;
    Receiver<int> rx;
    int value = 0;
    EXPECT_FALSE(tx);
    EXPECT_FALSE(tx.send(1));
    EXPECT_EQ(rx.try_recv(value), ChannelStatus::Disconnected);
}

TEST(Channel, DroppingReceiverReleasesQueuedPromises) {
    auto channel = make_channel<std::promise<int>>();
    std::promise<int> reply;
    std::future<int> result = reply.get_future();
    ASSERT_TRUE(channel.first.send(std::move(reply)));

    channel.second = Receiver<std::promise<int>>();

    EXPECT_THROW(result.get(), std::future_error);
}

TEST(Channel, BlockingRecvWakesOnSend) {
    auto channel = make_channel<int>();
    Sender<int> tx = channel.first;

    std::thread producer([tx] {
        std::this_thread::sleep_for(20ms);
        tx.send(42);
    });

    int value = 0;
    EXPECT_EQ(channel.second.recv(value), ChannelStatus::Ok);
    EXPECT_EQ(value, 42);
    producer.join();
}

TEST(Channel, BlockingRecvWakesWhenLastSenderDrops) {
    auto channel = make_channel<int>();
    Receiver<int> rx = std::move(channel.second);

    std::thread producer([tx = std::move(channel.first)]() mutable {
        std::this_thread::sleep_for(20ms);
        tx = Sender<int>();
    });

    int value = 0;
    EXPECT_EQ(rx.recv(value), ChannelStatus::Disconnected);
    producer.join();
}

TEST(Channel, ManyProducersDeliverEverything) {
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 2000;

    auto channel = make_channel<int>();
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([tx = channel.first, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                tx.send(p * kPerProducer + i);
            }
        });
    }
    channel.first = Sender<int>();

    std::set<int> seen;
    std::vector<int> last(kProducers, -1);
    int value = 0;
    while (channel.second.recv_for(value, 1000ms) == ChannelStatus::Ok) {
        const int producer = value / kPerProducer;
        // per-producer order is preserved
        EXPECT_GT(value, last[producer]);
        last[producer] = value;
        seen.insert(value);
    }

    for (auto& t : producers) t.join();
    EXPECT_EQ(seen.size(), static_cast<size_t>(kProducers * kPerProducer));
}

TEST(Channel, BacklogCountsValuesNotYetTaken) {
    auto channel = make_channel<int>();
    Sender<int> copy = channel.first;
    EXPECT_EQ(channel.first.backlog(), 0u);

    channel.first.send(1);
    copy.send(2);
    EXPECT_EQ(channel.first.backlog(), 2u);
    EXPECT_EQ(copy.backlog(), 2u);

    int value = 0;
    ASSERT_EQ(channel.second.try_recv(value), ChannelStatus::Ok);
    EXPECT_EQ(channel.first.backlog(), 1u);
    ASSERT_EQ(channel.second.try_recv(value), ChannelStatus::Ok);
    EXPECT_EQ(channel.first.backlog(), 0u);

    EXPECT_EQ(Sender<int>().backlog(), 0u);
}
