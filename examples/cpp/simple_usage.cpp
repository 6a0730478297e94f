#include "rl_replay/core/circular_replay_buffer.hpp"
#include "rl_replay/prioritization/prioritized_replay_buffer.hpp"
#include "rl_replay/sequence/episodic_sequence_buffer.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <random>
#include <vector>

using namespace rl_replay;

using StateType = std::vector<double>;
using ActionType = int;
using Transition = core::Transition<StateType, ActionType>;

// Toy environment step: 4-dimensional state, episodes of random length
Transition make_step(std::mt19937& rng, int t) {
    std::uniform_real_distribution<double> state_dist(-1.0, 1.0);
    std::uniform_int_distribution<int> action_dist(0, 3);
    std::normal_distribution<double> reward_dist(0.0, 5.0);

    StateType state(4);
    StateType next_state(4);
    for (int j = 0; j < 4; ++j) {
        state[j] = state_dist(rng);
        next_state[j] = state_dist(rng);
    }

    const bool absorbing = t > 0 && rng() % 12 == 0;
    return Transition{std::move(state), action_dist(rng), reward_dist(rng), std::move(next_state),
                      absorbing, absorbing};
}

int main() {
    std::cout << "Replay Memory - Basic Usage Example\n";
    std::cout << "===================================\n\n";

    std::mt19937 rng(42);

    // Example 1: Uniform replay
    {
        std::cout << "Example 1: Circular Replay Buffer\n";
        std::cout << "---------------------------------\n";

        core::ReplayMemoryConfig config;
        config.max_size = 1000;
        config.initial_size = 50;
        config.seed = 7;

        core::CircularReplayBuffer<StateType, ActionType> buffer(config);

        std::cout << "Adding transitions to buffer...\n";
        for (int i = 0; i < 100; ++i) {
            buffer.add(make_step(rng, i));
        }
        std::cout << "Buffer size: " << buffer.size() << "/" << buffer.capacity()
                  << (buffer.initialized() ? " (initialized)" : "") << "\n";

        auto batch = buffer.sample(8);
        std::cout << "Sampled batch of size: " << batch.size() << "\n";
        std::cout << "Sample rewards: ";
        for (size_t i = 0; i < std::min(batch.rewards.size(), size_t(5)); ++i) {
            std::cout << std::fixed << std::setprecision(2) << batch.rewards[i] << " ";
        }
        std::cout << "\n\n";
    }

    // Example 2: Prioritized replay with TD-error feedback
    {
        std::cout << "Example 2: Prioritized Replay Buffer\n";
        std::cout << "------------------------------------\n";

        core::ReplayMemoryConfig config;
        config.max_size = 1000;
        config.initial_size = 50;
        config.alpha = 0.6;
        config.beta = 0.4;
        config.beta_increment = 0.01;
        config.seed = 7;

        prioritization::PrioritizedReplayBuffer<StateType, ActionType> buffer(config);

        std::cout << "Adding transitions at the current max priority...\n";
        for (int i = 0; i < 100; ++i) {
            buffer.add({make_step(rng, i)}, {buffer.max_priority()});
        }
        std::cout << "Buffer size: " << buffer.size() << "/" << buffer.capacity() << "\n";
        std::cout << "Total priority: " << buffer.total_priority() << "\n";

        std::normal_distribution<double> td_dist(0.0, 1.0);
        for (int step = 0; step < 3; ++step) {
            auto batch = buffer.sample(8);

            std::cout << "Step " << step << " (beta " << buffer.get_beta() << "):\n";
            for (size_t i = 0; i < std::min(batch.size(), size_t(3)); ++i) {
                std::cout << "  Leaf " << batch.leaf_indices[i]
                          << ", Reward: " << batch.batch.rewards[i]
                          << ", Weight: " << batch.importance_weights[i] << "\n";
            }

            // A learner would compute these from its value estimates
            std::vector<double> td_errors(batch.size());
            for (auto& error : td_errors) {
                error = td_dist(rng);
            }
            buffer.update_priorities(td_errors, batch.leaf_indices);
            buffer.anneal_beta();
        }
        std::cout << "Max priority after updates: " << buffer.max_priority() << "\n\n";
    }

    // Example 3: Episodic sequences for recurrent agents
    {
        std::cout << "Example 3: Episodic Sequence Buffer\n";
        std::cout << "-----------------------------------\n";

        core::ReplayMemoryConfig config;
        config.max_size = 500;
        config.initial_size = 16;
        config.unroll_steps = 4;
        config.seed = 7;

        sequence::EpisodicSequenceBuffer<StateType, ActionType> buffer(config);

        // The stream is cut at arbitrary points; partial episodes carry over
        for (int chunk = 0; chunk < 10; ++chunk) {
            std::vector<Transition> stream;
            for (int i = 0; i < 25; ++i) {
                stream.push_back(make_step(rng, i));
            }
            buffer.add(stream);
        }

        std::cout << "Stored episodes: " << buffer.num_episodes()
                  << ", transitions: " << buffer.size()
                  << ", unfinished: " << buffer.unfinished_size()
                  << ", dropped: " << buffer.dropped_episodes() << "\n";

        if (buffer.empty()) {
            std::cout << "No complete episode yet\n";
        } else {
            auto time_major = buffer.sample(16);
            std::cout << "Time-major batch: " << time_major.outer_size() << " steps x "
                      << time_major.rewards.front().size() << " sequences\n";

            auto batch_major = buffer.sample_batch_first(16);
            std::cout << "Batch-major batch: " << batch_major.outer_size() << " sequences x "
                      << batch_major.rewards.front().size() << " steps\n";
        }

        auto bytes = buffer.save();
        sequence::EpisodicSequenceBuffer<StateType, ActionType> restored(config);
        restored.load(bytes);
        std::cout << "Snapshot of " << bytes.size() << " bytes restored "
                  << restored.num_episodes() << " episodes\n";
    }

    std::cout << "\nExample completed successfully!\n";
    return 0;
}
