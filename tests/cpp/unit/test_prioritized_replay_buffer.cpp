#include <gtest/gtest.h>
#include "rl_replay/prioritization/prioritized_replay_buffer.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <thread>

using namespace rl_replay;
using namespace rl_replay::testing;

using Buffer = prioritization::PrioritizedReplayBuffer<State, Action>;

namespace {

core::ReplayMemoryConfig per_config(size_t max_size, size_t initial_size = 0, uint64_t seed = 42) {
    core::ReplayMemoryConfig config;
    config.max_size = max_size;
    config.initial_size = initial_size;
    config.alpha = 0.6;
    config.beta = 0.4;
    config.epsilon = 0.01;
    config.seed = seed;
    return config;
}

} // namespace

TEST(PrioritizedReplayBufferTest, MaxPriorityIsOneUntilInitialized) {
    Buffer buffer(per_config(16, 3));
    EXPECT_EQ(buffer.max_priority(), 1.0);

    buffer.add(make_stream(3), {5.0, 2.0, 0.5});
    EXPECT_FALSE(buffer.initialized());
    EXPECT_EQ(buffer.max_priority(), 1.0);

    buffer.add({make_transition(3.0)}, {0.25});
    EXPECT_TRUE(buffer.initialized());
    EXPECT_DOUBLE_EQ(buffer.max_priority(), 5.0);
}

TEST(PrioritizedReplayBufferTest, AddRequiresOnePriorityPerTransition) {
    Buffer buffer(per_config(8));
    EXPECT_THROW(buffer.add(make_stream(3), {1.0, 1.0}), core::ContractViolation);
    EXPECT_EQ(buffer.size(), 0u);
}

TEST(PrioritizedReplayBufferTest, ImportanceWeightsAreNormalizedToOne) {
    Buffer buffer(per_config(64));
    std::vector<double> priorities;
    for (int i = 0; i < 40; ++i) {
        priorities.push_back(0.1 + 0.37 * i);
    }
    buffer.add(make_stream(40), priorities);

    for (int round = 0; round < 20; ++round) {
        auto sample = buffer.sample(16);
        ASSERT_EQ(sample.size(), 16u);
        ASSERT_EQ(sample.leaf_indices.size(), 16u);
        ASSERT_EQ(sample.importance_weights.size(), 16u);

        const double max_weight =
            *std::max_element(sample.importance_weights.begin(), sample.importance_weights.end());
        EXPECT_EQ(max_weight, 1.0);
        for (double weight : sample.importance_weights) {
            EXPECT_GE(weight, 0.0);
        }
    }
}

TEST(PrioritizedReplayBufferTest, ImportanceWeightsFollowSamplingProbability) {
    core::ReplayMemoryConfig config = per_config(2);
    config.beta = 1.0;
    Buffer buffer(config);
    buffer.add(make_stream(2), {1.0, 3.0});

    auto sample = buffer.sample(8);
    std::vector<double> raw;
    for (size_t leaf : sample.leaf_indices) {
        const double p = buffer.get_priority(leaf);
        raw.push_back(1.0 / (2.0 * p / 4.0));
    }
    const double max_raw = *std::max_element(raw.begin(), raw.end());
    for (size_t i = 0; i < raw.size(); ++i) {
        EXPECT_NEAR(sample.importance_weights[i], raw[i] / max_raw, 1e-12);
    }
}

TEST(PrioritizedReplayBufferTest, StratifiedSamplingSpansPriorityRange) {
    // Cumulative ranges: [0,1] [1,3] [3,7] [7,15]; three segments of width 5
    for (uint64_t seed = 0; seed < 25; ++seed) {
        Buffer buffer(per_config(4, 0, seed));
        buffer.add(make_stream(4), {1.0, 2.0, 4.0, 8.0});

        auto sample = buffer.sample(3);
        EXPECT_NE(sample.batch.rewards[0], 3.0);
        EXPECT_GE(sample.batch.rewards[1], 2.0);
        EXPECT_EQ(sample.batch.rewards[2], 3.0);
    }
}

TEST(PrioritizedReplayBufferTest, SampledRowsMatchLeafIndices) {
    Buffer buffer(per_config(8));
    buffer.add(make_stream(8), {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0});

    auto sample = buffer.sample(8);
    for (size_t i = 0; i < sample.size(); ++i) {
        const size_t slot = sample.leaf_indices[i] - (buffer.capacity() - 1);
        EXPECT_EQ(sample.batch.indices[i], slot);
        EXPECT_EQ(sample.batch.rewards[i], static_cast<double>(slot));
        EXPECT_EQ(sample.batch.states[i][0], static_cast<double>(slot));
    }
}

TEST(PrioritizedReplayBufferTest, UpdatePrioritiesAppliesErrorTransform) {
    core::ReplayMemoryConfig config = per_config(2);
    config.alpha = 0.5;
    Buffer buffer(config);
    buffer.add(make_stream(2), {1.0, 1.0});

    // Leaves of a two-slot tree are nodes 1 and 2
    buffer.update_priorities({0.99, -2.99}, {1, 2});
    EXPECT_NEAR(buffer.get_priority(1), 1.0, 1e-12);
    EXPECT_NEAR(buffer.get_priority(2), std::sqrt(3.0), 1e-12);
    EXPECT_NEAR(buffer.total_priority(), 1.0 + std::sqrt(3.0), 1e-12);
    EXPECT_NEAR(buffer.priority_for_error(-2.99), std::sqrt(3.0), 1e-12);
}

TEST(PrioritizedReplayBufferTest, UpdatePrioritiesRoundTripsSampledIndices) {
    Buffer buffer(per_config(32));
    buffer.add(make_stream(32), std::vector<double>(32, 1.0));

    auto sample = buffer.sample(8);
    std::vector<double> errors(sample.size(), 0.0);
    buffer.update_priorities(errors, sample.leaf_indices);

    const double floor = std::pow(0.01, 0.6);
    for (size_t leaf : sample.leaf_indices) {
        EXPECT_NEAR(buffer.get_priority(leaf), floor, 1e-12);
    }
    EXPECT_THROW(buffer.update_priorities({1.0}, {}), core::ContractViolation);
}

TEST(PrioritizedReplayBufferTest, SamplingPreconditionsAreEnforced) {
    Buffer buffer(per_config(8));
    EXPECT_THROW(buffer.sample(4), core::ContractViolation);

    buffer.add(make_stream(2), {0.0, 0.0});
    EXPECT_THROW(buffer.sample(4), core::ContractViolation);

    buffer.add({make_transition(2.0)}, {1.0});
    EXPECT_THROW(buffer.sample(0), core::ContractViolation);
    EXPECT_NO_THROW(buffer.sample(4));
}

TEST(PrioritizedReplayBufferTest, ZeroPriorityTransitionsAreNeverSampled) {
    Buffer buffer(per_config(8));
    buffer.add(make_stream(5), {0.0, 2.0, 0.0, 0.0, 1.0});

    for (int round = 0; round < 50; ++round) {
        auto sample = buffer.sample(4);
        for (double reward : sample.batch.rewards) {
            EXPECT_TRUE(reward == 1.0 || reward == 4.0) << reward;
        }
    }
}

TEST(PrioritizedReplayBufferTest, ZeroingEveryPriorityMakesSamplingThrow) {
    core::ReplayMemoryConfig config = per_config(2);
    config.alpha = 1.0;
    config.epsilon = 0.0;
    Buffer buffer(config);
    buffer.add(make_stream(2), {0.1, 0.2});
    ASSERT_NO_THROW(buffer.sample(2));

    // 0.1 + 0.2 - 0.1 - 0.2 is not exactly zero in doubles
    buffer.update_priorities({0.0, 0.0}, {1, 2});
    EXPECT_EQ(buffer.total_priority(), 0.0);
    EXPECT_THROW(buffer.sample(2), core::ContractViolation);

    buffer.update_priorities({0.5}, {2});
    auto sample = buffer.sample(2);
    EXPECT_EQ(sample.leaf_indices, (std::vector<size_t>{2, 2}));
    for (double weight : sample.importance_weights) {
        EXPECT_FALSE(std::isnan(weight));
    }
}

TEST(PrioritizedReplayBufferTest, ParameterSettersTakeEffect) {
    Buffer buffer(per_config(8));
    EXPECT_DOUBLE_EQ(buffer.get_epsilon(), 0.01);

    buffer.set_alpha(1.0);
    EXPECT_EQ(buffer.get_alpha(), 1.0);
    EXPECT_DOUBLE_EQ(buffer.priority_for_error(-0.49), 0.5);
    buffer.set_alpha(0.0);
    EXPECT_EQ(buffer.priority_for_error(3.0), 1.0);

    buffer.add(make_stream(4), {1.0, 2.0, 3.0, 4.0});
    buffer.set_beta(0.0);
    EXPECT_EQ(buffer.get_beta(), 0.0);
    for (double weight : buffer.sample(4).importance_weights) {
        EXPECT_EQ(weight, 1.0);
    }

    buffer.set_beta_increment(0.75);
    buffer.anneal_beta();
    EXPECT_EQ(buffer.get_beta(), 0.75);
    buffer.anneal_beta();
    EXPECT_EQ(buffer.get_beta(), 1.0);
}

TEST(PrioritizedReplayBufferTest, ThreadSafeAccessorsDuringConcurrentAdds) {
    core::ReplayMemoryConfig config = per_config(512, 10);
    config.thread_safe = true;
    Buffer buffer(config);

    auto writer = [&buffer](double base) {
        for (int i = 0; i < 200; ++i) {
            buffer.add({make_transition(base + i)}, {buffer.max_priority() + 0.5});
        }
    };

    std::atomic<bool> done{false};
    size_t reads = 0;
    std::thread reader([&]() {
        size_t last_size = 0;
        while (!done.load()) {
            const size_t current = buffer.size();
            EXPECT_GE(current, last_size);
            EXPECT_LE(current, 400u);
            EXPECT_GE(buffer.max_priority(), 0.5);
            EXPECT_GE(buffer.total_priority(), 0.0);
            last_size = current;
            (void)buffer.initialized();
            ++reads;
        }
    });

    std::thread a(writer, 0.0);
    std::thread b(writer, 1000.0);
    a.join();
    b.join();
    done.store(true);
    reader.join();

    EXPECT_GT(reads, 0u);
    EXPECT_EQ(buffer.size(), 400u);
    EXPECT_TRUE(buffer.initialized());
    EXPECT_EQ(buffer.get_total_additions(), 400u);
}

TEST(PrioritizedReplayBufferTest, BetaScheduleAndAnnealing) {
    core::ReplayMemoryConfig config = per_config(8);
    config.beta = 0.9;
    config.beta_increment = 0.06;
    Buffer buffer(config);

    buffer.anneal_beta();
    EXPECT_NEAR(buffer.get_beta(), 0.96, 1e-12);
    buffer.anneal_beta();
    EXPECT_EQ(buffer.get_beta(), 1.0);

    int calls = 0;
    buffer.set_beta_schedule([&calls]() {
        ++calls;
        return 0.0;
    });
    buffer.add(make_stream(4), {1.0, 2.0, 3.0, 4.0});
    auto sample = buffer.sample(4);
    EXPECT_EQ(calls, 1);
    for (double weight : sample.importance_weights) {
        EXPECT_EQ(weight, 1.0);
    }
}

TEST(PrioritizedReplayBufferTest, OverwritesOldestWhenFull) {
    Buffer buffer(per_config(3));
    buffer.add(make_stream(5), {1.0, 1.0, 1.0, 1.0, 1.0});
    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer.get_total_additions(), 5u);

    for (int round = 0; round < 20; ++round) {
        for (double reward : buffer.sample(3).batch.rewards) {
            EXPECT_GE(reward, 2.0);
        }
    }

    buffer.reset();
    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_EQ(buffer.total_priority(), 0.0);
}

TEST(PrioritizedReplayBufferTest, SameSeedGivesSameSamples) {
    Buffer first(per_config(64, 0, 99));
    Buffer second(per_config(64, 0, 99));
    std::vector<double> priorities(50, 1.0);
    priorities[7] = 4.0;
    first.add(make_stream(50), priorities);
    second.add(make_stream(50), priorities);

    for (int round = 0; round < 5; ++round) {
        auto a = first.sample(10);
        auto b = second.sample(10);
        EXPECT_EQ(a.leaf_indices, b.leaf_indices);
        EXPECT_EQ(a.importance_weights, b.importance_weights);
    }
}
