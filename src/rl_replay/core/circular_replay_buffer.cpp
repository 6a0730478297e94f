#include "rl_replay/core/circular_replay_buffer.hpp"
#include "rl_replay/memory/binary_codec.hpp"
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

namespace rl_replay {
namespace core {

namespace {
constexpr char kSnapshotTag[5] = "RRCB";
constexpr uint32_t kSnapshotVersion = 1;
} // namespace

template<typename StateType, typename ActionType>
CircularReplayBuffer<StateType, ActionType>::CircularReplayBuffer(
    const ReplayMemoryConfig& config, std::shared_ptr<IRandomSource> rng)
    : initial_size_(config.initial_size), max_size_(config.max_size),
      write_index_(0), full_(false), total_additions_(0), total_samples_(0),
      thread_safe_(config.thread_safe),
      rng_(rng ? std::move(rng) : make_random_source(config.seed)) {
    validate_config(config);
    reset_impl();
}

template<typename StateType, typename ActionType>
std::unique_lock<std::mutex> CircularReplayBuffer<StateType, ActionType>::guard() const {
    if (thread_safe_) {
        return std::unique_lock<std::mutex>(mutex_);
    }
    return std::unique_lock<std::mutex>();
}

template<typename StateType, typename ActionType>
void CircularReplayBuffer<StateType, ActionType>::add(const std::vector<TransitionType>& batch) {
    auto lock = guard();
    for (const auto& transition : batch) {
        add_impl(transition);
    }
}

template<typename StateType, typename ActionType>
void CircularReplayBuffer<StateType, ActionType>::add(TransitionType&& transition) {
    auto lock = guard();
    add_impl(std::move(transition));
}

template<typename StateType, typename ActionType>
void CircularReplayBuffer<StateType, ActionType>::add_impl(TransitionType transition) {
    states_[write_index_] = std::move(transition.state);
    actions_[write_index_] = std::move(transition.action);
    rewards_[write_index_] = transition.reward;
    next_states_[write_index_] = std::move(transition.next_state);
    absorbing_[write_index_] = transition.absorbing;
    last_[write_index_] = transition.last;

    ++write_index_;
    if (write_index_ == max_size_) {
        full_ = true;
        write_index_ = 0;
    }

    total_additions_.fetch_add(1, std::memory_order_relaxed);
}

template<typename StateType, typename ActionType>
typename CircularReplayBuffer<StateType, ActionType>::BatchType
CircularReplayBuffer<StateType, ActionType>::sample(size_t n) {
    auto lock = guard();
    const size_t current_size = size_impl();
    require(current_size > 0, "CircularReplayBuffer::sample: buffer is empty");

    BatchType batch;
    batch.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        const size_t idx = rng_->randint(current_size);

        batch.states.push_back(states_[idx]);
        batch.actions.push_back(actions_[idx]);
        batch.rewards.push_back(rewards_[idx]);
        batch.next_states.push_back(next_states_[idx]);
        batch.absorbing.push_back(absorbing_[idx]);
        batch.last.push_back(last_[idx]);
        batch.indices.push_back(idx);
    }

    total_samples_.fetch_add(n, std::memory_order_relaxed);
    return batch;
}

template<typename StateType, typename ActionType>
size_t CircularReplayBuffer<StateType, ActionType>::size() const {
    auto lock = guard();
    return size_impl();
}

template<typename StateType, typename ActionType>
bool CircularReplayBuffer<StateType, ActionType>::full() const {
    auto lock = guard();
    return full_;
}

template<typename StateType, typename ActionType>
bool CircularReplayBuffer<StateType, ActionType>::initialized() const {
    auto lock = guard();
    return size_impl() > initial_size_;
}

template<typename StateType, typename ActionType>
void CircularReplayBuffer<StateType, ActionType>::reset() {
    auto lock = guard();
    reset_impl();
}

template<typename StateType, typename ActionType>
void CircularReplayBuffer<StateType, ActionType>::reset_impl() {
    write_index_ = 0;
    full_ = false;
    states_.assign(max_size_, StateType{});
    actions_.assign(max_size_, ActionType{});
    rewards_.assign(max_size_, 0.0);
    next_states_.assign(max_size_, StateType{});
    absorbing_.assign(max_size_, false);
    last_.assign(max_size_, false);
}

template<typename StateType, typename ActionType>
void CircularReplayBuffer<StateType, ActionType>::set_random_source(std::shared_ptr<IRandomSource> rng) {
    if (!rng) {
        throw std::invalid_argument("Random source must not be null");
    }
    auto lock = guard();
    rng_ = std::move(rng);
}

template<typename StateType, typename ActionType>
typename CircularReplayBuffer<StateType, ActionType>::Snapshot
CircularReplayBuffer<StateType, ActionType>::snapshot() const {
    auto lock = guard();
    Snapshot snapshot;
    snapshot.initial_size = initial_size_;
    snapshot.max_size = max_size_;
    snapshot.write_index = write_index_;
    snapshot.full = full_;
    snapshot.states = states_;
    snapshot.actions = actions_;
    snapshot.rewards = rewards_;
    snapshot.next_states = next_states_;
    snapshot.absorbing = absorbing_;
    snapshot.last = last_;
    return snapshot;
}

template<typename StateType, typename ActionType>
void CircularReplayBuffer<StateType, ActionType>::restore(const Snapshot& snapshot) {
    if (snapshot.max_size == 0) {
        throw std::invalid_argument("Snapshot max_size must be positive");
    }

    const size_t n = snapshot.max_size;
    const bool arrays_match =
        snapshot.states.size() == n && snapshot.actions.size() == n &&
        snapshot.rewards.size() == n && snapshot.next_states.size() == n &&
        snapshot.absorbing.size() == n && snapshot.last.size() == n;
    if (snapshot.full.has_value() && (!arrays_match || snapshot.write_index >= n)) {
        throw std::invalid_argument("Snapshot arrays do not match max_size");
    }

    // Allocate everything before touching the buffer so a failure leaves it intact.
    // A snapshot without the cursor state carries no usable contents.
    Snapshot incoming;
    if (snapshot.full.has_value()) {
        incoming = snapshot;
    } else {
        incoming.states.assign(n, StateType{});
        incoming.actions.assign(n, ActionType{});
        incoming.rewards.assign(n, 0.0);
        incoming.next_states.assign(n, StateType{});
        incoming.absorbing.assign(n, false);
        incoming.last.assign(n, false);
    }

    auto lock = guard();
    initial_size_ = snapshot.initial_size;
    max_size_ = n;
    write_index_ = incoming.full.has_value() ? incoming.write_index : 0;
    full_ = incoming.full.value_or(false);
    states_ = std::move(incoming.states);
    actions_ = std::move(incoming.actions);
    rewards_ = std::move(incoming.rewards);
    next_states_ = std::move(incoming.next_states);
    absorbing_ = std::move(incoming.absorbing);
    last_ = std::move(incoming.last);
}

template<typename StateType, typename ActionType>
std::vector<uint8_t> CircularReplayBuffer<StateType, ActionType>::save() const {
    using memory::encode;
    const Snapshot state = snapshot();

    memory::ByteWriter writer;
    writer.write_tag(kSnapshotTag);
    encode(writer, kSnapshotVersion);
    encode(writer, static_cast<uint64_t>(state.initial_size));
    encode(writer, static_cast<uint64_t>(state.max_size));
    encode(writer, static_cast<uint64_t>(state.write_index));
    encode(writer, state.full.has_value());
    encode(writer, state.full.value_or(false));
    encode(writer, state.states);
    encode(writer, state.actions);
    encode(writer, state.rewards);
    encode(writer, state.next_states);
    encode(writer, state.absorbing);
    encode(writer, state.last);
    return writer.release();
}

template<typename StateType, typename ActionType>
void CircularReplayBuffer<StateType, ActionType>::load(const std::vector<uint8_t>& bytes) {
    using memory::decode;
    memory::ByteReader reader(bytes);
    reader.expect_tag(kSnapshotTag);

    uint32_t version = 0;
    decode(reader, version);
    if (version != kSnapshotVersion) {
        throw std::runtime_error("Unsupported CircularReplayBuffer snapshot version " +
                                 std::to_string(version));
    }

    Snapshot state;
    uint64_t initial_size = 0;
    uint64_t max_size = 0;
    uint64_t write_index = 0;
    bool has_full = false;
    bool full = false;
    decode(reader, initial_size);
    decode(reader, max_size);
    decode(reader, write_index);
    decode(reader, has_full);
    decode(reader, full);
    decode(reader, state.states);
    decode(reader, state.actions);
    decode(reader, state.rewards);
    decode(reader, state.next_states);
    decode(reader, state.absorbing);
    decode(reader, state.last);
    if (!reader.at_end()) {
        throw std::runtime_error("Trailing bytes after CircularReplayBuffer snapshot");
    }

    state.initial_size = static_cast<size_t>(initial_size);
    state.max_size = static_cast<size_t>(max_size);
    state.write_index = static_cast<size_t>(write_index);
    if (has_full) {
        state.full = full;
    }
    try {
        restore(state);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Corrupted CircularReplayBuffer snapshot: ") + e.what());
    } catch (const std::length_error& e) {
        throw std::runtime_error(std::string("Corrupted CircularReplayBuffer snapshot: ") + e.what());
    } catch (const std::bad_alloc&) {
        throw std::runtime_error("Corrupted CircularReplayBuffer snapshot: capacity cannot be allocated");
    }
}

// Explicit template instantiations for common types
template class CircularReplayBuffer<std::vector<double>, std::vector<double>>;
template class CircularReplayBuffer<std::vector<double>, int>;

} // namespace core
} // namespace rl_replay
