#pragma once

#include "../core/replay_memory_interface.hpp"
#include "../core/random_source.hpp"
#include "../core/errors.hpp"
#include "../memory/binary_codec.hpp"
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace rl_replay {
namespace sequence {

// One complete episode stored field by field
template<typename StateType, typename ActionType>
struct Episode {
    std::vector<StateType> states;
    std::vector<ActionType> actions;
    std::vector<double> rewards;
    std::vector<StateType> next_states;
    std::vector<bool> absorbing;
    std::vector<bool> last;

    size_t length() const { return states.size(); }
};

template<typename StateType, typename ActionType>
void encode(memory::ByteWriter& writer, const Episode<StateType, ActionType>& episode) {
    using memory::encode;
    encode(writer, episode.states);
    encode(writer, episode.actions);
    encode(writer, episode.rewards);
    encode(writer, episode.next_states);
    encode(writer, episode.absorbing);
    encode(writer, episode.last);
}

template<typename StateType, typename ActionType>
void decode(memory::ByteReader& reader, Episode<StateType, ActionType>& episode) {
    using memory::decode;
    decode(reader, episode.states);
    decode(reader, episode.actions);
    decode(reader, episode.rewards);
    decode(reader, episode.next_states);
    decode(reader, episode.absorbing);
    decode(reader, episode.last);
}

// Replay memory for recurrent agents (Hausknecht & Stone, DRQN).
//
// Transitions arrive as a stream that may stop mid-episode; the trailing
// partial episode is held back until its boundary transition arrives. Only
// complete episodes with unroll_steps <= length < max_size are stored, and
// whole episodes are evicted oldest first to keep size() <= max_size.
//
// Samples are windows of unroll_steps consecutive transitions. With
// sequential_updates set, sample_batch_first() returns whole episodes instead.
template<typename StateType, typename ActionType>
class EpisodicSequenceBuffer : public core::IReplayMemory {
public:
    using TransitionType = core::Transition<StateType, ActionType>;
    using EpisodeType = Episode<StateType, ActionType>;
    using BatchType = core::SequenceBatch<StateType, ActionType>;

    struct Snapshot {
        size_t initial_size = 0;
        size_t max_size = 0;
        size_t unroll_steps = 1;
        bool sequential_updates = false;
        core::EpisodeBoundary episode_boundary = core::EpisodeBoundary::ABSORBING;
        std::deque<EpisodeType> episodes;
        std::optional<std::deque<size_t>> lengths; // Recomputed from episodes when unset
        std::vector<TransitionType> unfinished_episode;
    };

private:
    std::deque<EpisodeType> episodes_;
    std::deque<size_t> lengths_;
    std::vector<TransitionType> unfinished_episode_;
    size_t total_size_;

    size_t initial_size_;
    size_t max_size_;
    size_t unroll_steps_;
    bool sequential_updates_;
    core::EpisodeBoundary episode_boundary_;

    std::atomic<size_t> total_additions_;
    std::atomic<size_t> total_samples_;
    std::atomic<size_t> dropped_episodes_;

    // Thread safety
    mutable std::mutex mutex_;
    bool thread_safe_;

    std::shared_ptr<core::IRandomSource> rng_;

public:
    explicit EpisodicSequenceBuffer(const core::ReplayMemoryConfig& config,
                                    std::shared_ptr<core::IRandomSource> rng = nullptr);
    ~EpisodicSequenceBuffer() override = default;

    // Returns the number of episodes stored by this call
    size_t add(const std::vector<TransitionType>& stream);

    // Time-major windows, [unroll_steps][batch_size] per field
    BatchType sample(size_t batch_size);

    // Batch-major windows, [n_samples][unroll_steps] per field
    BatchType sample_batch_first(size_t n_samples);

    // Buffer state
    size_t size() const override;
    size_t capacity() const override { return max_size_; }
    bool empty() const override;
    bool initialized() const override;
    void reset() override;

    size_t num_episodes() const;
    std::vector<size_t> lengths() const;
    size_t unfinished_size() const;
    size_t unroll_steps() const { return unroll_steps_; }
    bool sequential_updates() const { return sequential_updates_; }

    // Statistics
    size_t get_total_additions() const override { return total_additions_.load(); }
    size_t get_total_samples() const override { return total_samples_.load(); }

    // Complete episodes rejected as too short or too long
    size_t dropped_episodes() const { return dropped_episodes_.load(); }

    void set_random_source(std::shared_ptr<core::IRandomSource> rng);

    // Persistence
    Snapshot snapshot() const;
    void restore(const Snapshot& snapshot);
    std::vector<uint8_t> save() const;
    void load(const std::vector<uint8_t>& bytes);

private:
    std::unique_lock<std::mutex> guard() const;
    bool is_boundary(const TransitionType& transition) const;
    bool store_episode(std::vector<TransitionType>& pending, size_t begin, size_t end);
    void check_sample_request(size_t count) const;
    void append_step(BatchType& batch, size_t outer, const EpisodeType& episode, size_t step) const;
};

extern template class EpisodicSequenceBuffer<std::vector<double>, std::vector<double>>;
extern template class EpisodicSequenceBuffer<std::vector<double>, int>;

} // namespace sequence
} // namespace rl_replay
