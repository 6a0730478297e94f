#include "rl_replay/sequence/episodic_sequence_buffer.hpp"
#include <iterator>
#include <numeric>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

namespace rl_replay {
namespace sequence {

namespace {
constexpr char kSnapshotTag[5] = "RRES";
constexpr uint32_t kSnapshotVersion = 1;
} // namespace

template<typename StateType, typename ActionType>
EpisodicSequenceBuffer<StateType, ActionType>::EpisodicSequenceBuffer(
    const core::ReplayMemoryConfig& config, std::shared_ptr<core::IRandomSource> rng)
    : total_size_(0), initial_size_(config.initial_size), max_size_(config.max_size),
      unroll_steps_(config.unroll_steps), sequential_updates_(config.sequential_updates),
      episode_boundary_(config.episode_boundary),
      total_additions_(0), total_samples_(0), dropped_episodes_(0),
      thread_safe_(config.thread_safe),
      rng_(rng ? std::move(rng) : core::make_random_source(config.seed)) {
    core::validate_config(config);
}

template<typename StateType, typename ActionType>
std::unique_lock<std::mutex> EpisodicSequenceBuffer<StateType, ActionType>::guard() const {
    if (thread_safe_) {
        return std::unique_lock<std::mutex>(mutex_);
    }
    return std::unique_lock<std::mutex>();
}

template<typename StateType, typename ActionType>
bool EpisodicSequenceBuffer<StateType, ActionType>::is_boundary(const TransitionType& transition) const {
    return episode_boundary_ == core::EpisodeBoundary::ABSORBING ? transition.absorbing
                                                                 : transition.last;
}

template<typename StateType, typename ActionType>
size_t EpisodicSequenceBuffer<StateType, ActionType>::add(const std::vector<TransitionType>& stream) {
    auto lock = guard();

    // Resume the episode left open by the previous call
    std::vector<TransitionType> pending = std::move(unfinished_episode_);
    unfinished_episode_.clear();
    pending.insert(pending.end(), stream.begin(), stream.end());

    size_t added = 0;
    size_t begin = 0;
    for (size_t i = 0; i < pending.size(); ++i) {
        if (is_boundary(pending[i])) {
            if (store_episode(pending, begin, i + 1)) {
                ++added;
            }
            begin = i + 1;
        }
    }

    unfinished_episode_.assign(std::make_move_iterator(pending.begin() + static_cast<std::ptrdiff_t>(begin)),
                               std::make_move_iterator(pending.end()));

    total_additions_.fetch_add(stream.size(), std::memory_order_relaxed);
    return added;
}

template<typename StateType, typename ActionType>
bool EpisodicSequenceBuffer<StateType, ActionType>::store_episode(
    std::vector<TransitionType>& pending, size_t begin, size_t end) {
    const size_t length = end - begin;
    if (length < unroll_steps_ || length >= max_size_) {
        dropped_episodes_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    EpisodeType episode;
    episode.states.reserve(length);
    episode.actions.reserve(length);
    episode.rewards.reserve(length);
    episode.next_states.reserve(length);
    episode.absorbing.reserve(length);
    episode.last.reserve(length);

    for (size_t i = begin; i < end; ++i) {
        TransitionType& t = pending[i];
        episode.states.push_back(std::move(t.state));
        episode.actions.push_back(std::move(t.action));
        episode.rewards.push_back(t.reward);
        episode.next_states.push_back(std::move(t.next_state));
        episode.absorbing.push_back(t.absorbing);
        episode.last.push_back(t.last);
    }

    episodes_.push_back(std::move(episode));
    lengths_.push_back(length);
    total_size_ += length;

    // length < max_size, so the episode just stored always survives
    while (total_size_ > max_size_) {
        total_size_ -= lengths_.front();
        episodes_.pop_front();
        lengths_.pop_front();
    }
    return true;
}

template<typename StateType, typename ActionType>
void EpisodicSequenceBuffer<StateType, ActionType>::check_sample_request(size_t count) const {
    if (count > initial_size_) {
        throw core::ContractViolation("EpisodicSequenceBuffer: batch size " + std::to_string(count) +
                                      " exceeds the initial size " + std::to_string(initial_size_));
    }
    core::require(!episodes_.empty(), "EpisodicSequenceBuffer: no complete episode stored");
}

template<typename StateType, typename ActionType>
void EpisodicSequenceBuffer<StateType, ActionType>::append_step(
    BatchType& batch, size_t outer, const EpisodeType& episode, size_t step) const {
    batch.append(outer, episode.states[step], episode.actions[step], episode.rewards[step],
                 episode.next_states[step], episode.absorbing[step], episode.last[step]);
}

template<typename StateType, typename ActionType>
typename EpisodicSequenceBuffer<StateType, ActionType>::BatchType
EpisodicSequenceBuffer<StateType, ActionType>::sample(size_t batch_size) {
    auto lock = guard();
    core::require(!sequential_updates_,
                  "EpisodicSequenceBuffer::sample: time-major layout needs windowed sampling");
    check_sample_request(batch_size);

    std::vector<size_t> episodes(batch_size);
    for (auto& episode : episodes) {
        episode = rng_->randint(episodes_.size());
    }

    // One start offset per stored episode; every sample of the same episode
    // shares it and all of them advance together
    std::vector<size_t> offsets(episodes_.size());
    for (size_t e = 0; e < episodes_.size(); ++e) {
        offsets[e] = rng_->randint(lengths_[e] - unroll_steps_ + 1);
    }

    BatchType batch;
    batch.layout = core::SequenceLayout::TIME_MAJOR;
    batch.resize_outer(unroll_steps_);
    for (size_t step = 0; step < unroll_steps_; ++step) {
        for (size_t episode : episodes) {
            append_step(batch, step, episodes_[episode], offsets[episode] + step);
        }
    }

    total_samples_.fetch_add(batch_size, std::memory_order_relaxed);
    return batch;
}

template<typename StateType, typename ActionType>
typename EpisodicSequenceBuffer<StateType, ActionType>::BatchType
EpisodicSequenceBuffer<StateType, ActionType>::sample_batch_first(size_t n_samples) {
    auto lock = guard();
    check_sample_request(n_samples);

    std::vector<size_t> episodes(n_samples);
    for (auto& episode : episodes) {
        episode = rng_->randint(episodes_.size());
    }

    BatchType batch;
    batch.layout = core::SequenceLayout::BATCH_MAJOR;
    batch.resize_outer(n_samples);
    for (size_t b = 0; b < n_samples; ++b) {
        const EpisodeType& episode = episodes_[episodes[b]];
        const size_t length = episode.length();

        size_t start = 0;
        size_t end = length;
        if (!sequential_updates_) {
            start = rng_->randint(length - unroll_steps_ + 1);
            end = start + unroll_steps_;
        }
        for (size_t step = start; step < end; ++step) {
            append_step(batch, b, episode, step);
        }
    }

    total_samples_.fetch_add(n_samples, std::memory_order_relaxed);
    return batch;
}

template<typename StateType, typename ActionType>
size_t EpisodicSequenceBuffer<StateType, ActionType>::size() const {
    auto lock = guard();
    return total_size_;
}

template<typename StateType, typename ActionType>
bool EpisodicSequenceBuffer<StateType, ActionType>::empty() const {
    auto lock = guard();
    return episodes_.empty();
}

template<typename StateType, typename ActionType>
bool EpisodicSequenceBuffer<StateType, ActionType>::initialized() const {
    auto lock = guard();
    return total_size_ > initial_size_;
}

template<typename StateType, typename ActionType>
size_t EpisodicSequenceBuffer<StateType, ActionType>::num_episodes() const {
    auto lock = guard();
    return episodes_.size();
}

template<typename StateType, typename ActionType>
size_t EpisodicSequenceBuffer<StateType, ActionType>::unfinished_size() const {
    auto lock = guard();
    return unfinished_episode_.size();
}

template<typename StateType, typename ActionType>
std::vector<size_t> EpisodicSequenceBuffer<StateType, ActionType>::lengths() const {
    auto lock = guard();
    return std::vector<size_t>(lengths_.begin(), lengths_.end());
}

template<typename StateType, typename ActionType>
void EpisodicSequenceBuffer<StateType, ActionType>::reset() {
    auto lock = guard();
    episodes_.clear();
    lengths_.clear();
    unfinished_episode_.clear();
    total_size_ = 0;
}

template<typename StateType, typename ActionType>
void EpisodicSequenceBuffer<StateType, ActionType>::set_random_source(
    std::shared_ptr<core::IRandomSource> rng) {
    if (!rng) {
        throw std::invalid_argument("Random source must not be null");
    }
    auto lock = guard();
    rng_ = std::move(rng);
}

template<typename StateType, typename ActionType>
typename EpisodicSequenceBuffer<StateType, ActionType>::Snapshot
EpisodicSequenceBuffer<StateType, ActionType>::snapshot() const {
    auto lock = guard();
    Snapshot snapshot;
    snapshot.initial_size = initial_size_;
    snapshot.max_size = max_size_;
    snapshot.unroll_steps = unroll_steps_;
    snapshot.sequential_updates = sequential_updates_;
    snapshot.episode_boundary = episode_boundary_;
    snapshot.episodes = episodes_;
    snapshot.lengths = lengths_;
    snapshot.unfinished_episode = unfinished_episode_;
    return snapshot;
}

template<typename StateType, typename ActionType>
void EpisodicSequenceBuffer<StateType, ActionType>::restore(const Snapshot& snapshot) {
    if (snapshot.max_size == 0 || snapshot.unroll_steps == 0) {
        throw std::invalid_argument("Snapshot max_size and unroll_steps must be positive");
    }

    std::deque<size_t> lengths;
    if (snapshot.lengths) {
        lengths = *snapshot.lengths;
    } else {
        for (const auto& episode : snapshot.episodes) {
            lengths.push_back(episode.length());
        }
    }
    if (lengths.size() != snapshot.episodes.size()) {
        throw std::invalid_argument("Snapshot lengths do not match its episodes");
    }

    size_t total = 0;
    for (size_t e = 0; e < lengths.size(); ++e) {
        const EpisodeType& episode = snapshot.episodes[e];
        const size_t length = lengths[e];
        const bool consistent =
            episode.length() == length && episode.actions.size() == length &&
            episode.rewards.size() == length && episode.next_states.size() == length &&
            episode.absorbing.size() == length && episode.last.size() == length;
        if (!consistent || length < snapshot.unroll_steps || length >= snapshot.max_size) {
            throw std::invalid_argument("Snapshot episode " + std::to_string(e) + " is malformed");
        }
        total += length;
    }
    if (total > snapshot.max_size) {
        throw std::invalid_argument("Snapshot episodes exceed max_size");
    }

    auto lock = guard();
    initial_size_ = snapshot.initial_size;
    max_size_ = snapshot.max_size;
    unroll_steps_ = snapshot.unroll_steps;
    sequential_updates_ = snapshot.sequential_updates;
    episode_boundary_ = snapshot.episode_boundary;
    episodes_ = snapshot.episodes;
    lengths_ = std::move(lengths);
    unfinished_episode_ = snapshot.unfinished_episode;
    total_size_ = total;
}

template<typename StateType, typename ActionType>
std::vector<uint8_t> EpisodicSequenceBuffer<StateType, ActionType>::save() const {
    using memory::encode;
    const Snapshot state = snapshot();

    memory::ByteWriter writer;
    writer.write_tag(kSnapshotTag);
    encode(writer, kSnapshotVersion);
    encode(writer, static_cast<uint64_t>(state.initial_size));
    encode(writer, static_cast<uint64_t>(state.max_size));
    encode(writer, static_cast<uint64_t>(state.unroll_steps));
    encode(writer, state.sequential_updates);
    encode(writer, static_cast<uint8_t>(state.episode_boundary));
    encode(writer, state.episodes);
    encode(writer, state.lengths.has_value());
    if (state.lengths) {
        std::vector<uint64_t> lengths(state.lengths->begin(), state.lengths->end());
        encode(writer, lengths);
    }
    encode(writer, state.unfinished_episode);
    return writer.release();
}

template<typename StateType, typename ActionType>
void EpisodicSequenceBuffer<StateType, ActionType>::load(const std::vector<uint8_t>& bytes) {
    using memory::decode;
    memory::ByteReader reader(bytes);
    reader.expect_tag(kSnapshotTag);

    uint32_t version = 0;
    decode(reader, version);
    if (version != kSnapshotVersion) {
        throw std::runtime_error("Unsupported EpisodicSequenceBuffer snapshot version " +
                                 std::to_string(version));
    }

    Snapshot state;
    uint64_t initial_size = 0;
    uint64_t max_size = 0;
    uint64_t unroll_steps = 0;
    uint8_t boundary = 0;
    bool has_lengths = false;
    decode(reader, initial_size);
    decode(reader, max_size);
    decode(reader, unroll_steps);
    decode(reader, state.sequential_updates);
    decode(reader, boundary);
    decode(reader, state.episodes);
    decode(reader, has_lengths);
    if (has_lengths) {
        std::vector<uint64_t> lengths;
        decode(reader, lengths);
        state.lengths = std::deque<size_t>(lengths.begin(), lengths.end());
    }
    decode(reader, state.unfinished_episode);
    if (!reader.at_end()) {
        throw std::runtime_error("Trailing bytes after EpisodicSequenceBuffer snapshot");
    }
    if (boundary > static_cast<uint8_t>(core::EpisodeBoundary::LAST)) {
        throw std::runtime_error("Corrupted snapshot: unknown episode boundary");
    }

    state.initial_size = static_cast<size_t>(initial_size);
    state.max_size = static_cast<size_t>(max_size);
    state.unroll_steps = static_cast<size_t>(unroll_steps);
    state.episode_boundary = static_cast<core::EpisodeBoundary>(boundary);
    try {
        restore(state);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Corrupted EpisodicSequenceBuffer snapshot: ") + e.what());
    } catch (const std::length_error& e) {
        throw std::runtime_error(std::string("Corrupted EpisodicSequenceBuffer snapshot: ") + e.what());
    } catch (const std::bad_alloc&) {
        throw std::runtime_error("Corrupted EpisodicSequenceBuffer snapshot: contents cannot be allocated");
    }
}

// Explicit template instantiations for common types
template class EpisodicSequenceBuffer<std::vector<double>, std::vector<double>>;
template class EpisodicSequenceBuffer<std::vector<double>, int>;

} // namespace sequence
} // namespace rl_replay
