#include <gtest/gtest.h>
#include "rl_replay/core/circular_replay_buffer.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <atomic>
#include <set>
#include <thread>

using namespace rl_replay;
using namespace rl_replay::testing;

using Buffer = core::CircularReplayBuffer<State, Action>;

namespace {

core::ReplayMemoryConfig ring_config(size_t max_size, size_t initial_size = 0) {
    core::ReplayMemoryConfig config;
    config.max_size = max_size;
    config.initial_size = initial_size;
    config.seed = 42;
    return config;
}

} // namespace

TEST(CircularReplayBufferTest, SizeTracksInsertionsUntilCapacity) {
    Buffer buffer(ring_config(5));
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.capacity(), 5u);

    for (size_t i = 1; i <= 12; ++i) {
        buffer.add(make_transition(static_cast<double>(i)));
        EXPECT_EQ(buffer.size(), std::min<size_t>(i, 5));
    }
    EXPECT_TRUE(buffer.full());
    EXPECT_EQ(buffer.get_total_additions(), 12u);
}

TEST(CircularReplayBufferTest, KeepsOnlyMostRecentTransitionsAfterWrap) {
    Buffer buffer(ring_config(5));
    buffer.add(make_stream(12));

    auto snapshot = buffer.snapshot();
    std::multiset<double> stored(snapshot.rewards.begin(), snapshot.rewards.end());
    EXPECT_EQ(stored, (std::multiset<double>{7.0, 8.0, 9.0, 10.0, 11.0}));
    EXPECT_EQ(snapshot.write_index, 2u);

    auto batch = buffer.sample(200);
    for (double reward : batch.rewards) {
        EXPECT_GE(reward, 7.0);
        EXPECT_LE(reward, 11.0);
    }
}

TEST(CircularReplayBufferTest, SampleReturnsAlignedFields) {
    Buffer buffer(ring_config(16));
    buffer.add(make_stream(10));

    auto batch = buffer.sample(64);
    ASSERT_EQ(batch.size(), 64u);
    ASSERT_EQ(batch.actions.size(), 64u);
    ASSERT_EQ(batch.next_states.size(), 64u);
    ASSERT_EQ(batch.absorbing.size(), 64u);
    ASSERT_EQ(batch.last.size(), 64u);

    for (size_t i = 0; i < batch.size(); ++i) {
        const double id = batch.rewards[i];
        EXPECT_EQ(batch.states[i][0], id);
        EXPECT_EQ(batch.actions[i][0], id);
        EXPECT_EQ(batch.next_states[i][0], id + 1.0);
        EXPECT_EQ(static_cast<double>(batch.indices[i]), id);
    }
    EXPECT_EQ(buffer.get_total_samples(), 64u);
}

TEST(CircularReplayBufferTest, SamplingWithReplacementExceedsSize) {
    Buffer buffer(ring_config(8));
    buffer.add(make_transition(3.0));

    auto batch = buffer.sample(5);
    ASSERT_EQ(batch.size(), 5u);
    for (double reward : batch.rewards) {
        EXPECT_EQ(reward, 3.0);
    }
}

TEST(CircularReplayBufferTest, SampleFromEmptyBufferThrows) {
    Buffer buffer(ring_config(8));
    EXPECT_THROW(buffer.sample(1), core::ContractViolation);
}

TEST(CircularReplayBufferTest, InitializedOnceSizeExceedsInitialSize) {
    Buffer buffer(ring_config(10, 3));
    buffer.add(make_stream(3));
    EXPECT_FALSE(buffer.initialized());
    buffer.add(make_transition(3.0));
    EXPECT_TRUE(buffer.initialized());
}

TEST(CircularReplayBufferTest, ResetEmptiesBuffer) {
    Buffer buffer(ring_config(4));
    buffer.add(make_stream(6));
    buffer.reset();

    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_FALSE(buffer.full());
    EXPECT_THROW(buffer.sample(1), core::ContractViolation);

    buffer.add(make_transition(9.0));
    EXPECT_EQ(buffer.sample(1).rewards[0], 9.0);
}

TEST(CircularReplayBufferTest, SameSeedGivesSameSamples) {
    Buffer first(ring_config(32));
    Buffer second(ring_config(32));
    first.add(make_stream(20));
    second.add(make_stream(20));

    EXPECT_EQ(first.sample(16).indices, second.sample(16).indices);

    first.set_random_source(std::make_shared<core::Mt19937RandomSource>(7));
    second.set_random_source(std::make_shared<core::Mt19937RandomSource>(7));
    EXPECT_EQ(first.sample(16).rewards, second.sample(16).rewards);
}

TEST(CircularReplayBufferTest, InvalidConfigurationIsRejected) {
    EXPECT_THROW(Buffer{ring_config(0)}, std::invalid_argument);

    core::ReplayMemoryConfig config = ring_config(4);
    config.epsilon = -1.0;
    EXPECT_THROW(Buffer{config}, std::invalid_argument);
}

TEST(CircularReplayBufferTest, ThreadSafeBufferAcceptsConcurrentWriters) {
    core::ReplayMemoryConfig config = ring_config(1000);
    config.thread_safe = true;
    Buffer buffer(config);

    auto writer = [&buffer](double base) {
        for (int i = 0; i < 400; ++i) {
            buffer.add(make_transition(base + i));
        }
    };
    std::atomic<bool> done{false};
    std::thread reader([&]() {
        size_t last_size = 0;
        while (!done.load()) {
            const size_t current = buffer.size();
            EXPECT_GE(current, last_size);
            EXPECT_LE(current, 800u);
            (void)buffer.initialized();
            (void)buffer.full();
            last_size = current;
        }
    });

    std::thread a(writer, 0.0);
    std::thread b(writer, 1000.0);
    a.join();
    b.join();
    done.store(true);
    reader.join();

    EXPECT_EQ(buffer.size(), 800u);
    EXPECT_FALSE(buffer.full());
    EXPECT_EQ(buffer.get_total_additions(), 800u);
}
