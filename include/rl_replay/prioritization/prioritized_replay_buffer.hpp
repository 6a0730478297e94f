#pragma once

#include "../core/replay_memory_interface.hpp"
#include "../core/random_source.hpp"
#include "../core/errors.hpp"
#include "priority_tree.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <functional>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>

namespace rl_replay {
namespace prioritization {

// Prioritized Experience Replay (Schaul et al., 2015) on top of a PriorityTree.
// Transitions are inserted with an explicit priority and sampled with
// stratified draws over the total priority mass.
template<typename StateType, typename ActionType>
class PrioritizedReplayBuffer : public core::IReplayMemory {
public:
    using TransitionType = core::Transition<StateType, ActionType>;
    using BatchType = core::PrioritizedBatch<StateType, ActionType>;
    using TreeType = PriorityTree<TransitionType>;
    using BetaSchedule = std::function<double()>;

    struct Snapshot {
        size_t initial_size = 0;
        size_t max_size = 0;
        double alpha = 0.0;
        double beta = 0.0;
        double epsilon = 0.0;
        std::optional<typename TreeType::Snapshot> tree; // Unset restores an empty tree of max_size
    };

private:
    std::unique_ptr<TreeType> tree_;
    size_t initial_size_;
    size_t max_size_;

    // Priority parameters
    double alpha_;          // Prioritization exponent
    double beta_;           // Importance sampling exponent
    double beta_increment_; // Beta annealing rate
    double epsilon_;        // Floor added to |error|
    BetaSchedule beta_schedule_;

    std::atomic<size_t> total_additions_;
    std::atomic<size_t> total_samples_;

    // Thread safety
    mutable std::mutex mutex_;
    bool thread_safe_;

    std::shared_ptr<core::IRandomSource> rng_;

public:
    explicit PrioritizedReplayBuffer(const core::ReplayMemoryConfig& config,
                                     std::shared_ptr<core::IRandomSource> rng = nullptr);
    ~PrioritizedReplayBuffer() override = default;

    // Core operations
    void add(const std::vector<TransitionType>& batch, const std::vector<double>& priorities);
    BatchType sample(size_t n);
    void update_priorities(const std::vector<double>& errors, const std::vector<size_t>& leaf_indices);

    // Buffer state
    size_t size() const override;
    size_t capacity() const override { return max_size_; }
    bool empty() const override { return size() == 0; }
    bool initialized() const override;
    void reset() override;

    // Statistics
    size_t get_total_additions() const override { return total_additions_.load(); }
    size_t get_total_samples() const override { return total_samples_.load(); }

    // Priority to give new transitions: the largest stored priority, or 1
    // while the buffer is still filling up
    double max_priority() const;
    double total_priority() const;
    double get_priority(size_t leaf_index) const;

    // (|error| + epsilon)^alpha
    double priority_for_error(double error) const {
        return std::pow(std::abs(error) + epsilon_, alpha_);
    }

    // Prioritized-specific parameters
    void set_alpha(double alpha) { alpha_ = alpha; }
    void set_beta(double beta) { beta_ = beta; }
    void set_beta_increment(double increment) { beta_increment_ = increment; }
    void set_beta_schedule(BetaSchedule schedule) { beta_schedule_ = std::move(schedule); }
    void anneal_beta() { beta_ = std::min(1.0, beta_ + beta_increment_); }

    double get_alpha() const { return alpha_; }
    double get_beta() const { return beta_schedule_ ? beta_schedule_() : beta_; }
    double get_epsilon() const { return epsilon_; }

    void set_random_source(std::shared_ptr<core::IRandomSource> rng);

    // Persistence
    Snapshot snapshot() const;
    void restore(const Snapshot& snapshot);
    std::vector<uint8_t> save() const;
    void load(const std::vector<uint8_t>& bytes);

private:
    std::unique_lock<std::mutex> guard() const;
};

template<typename StateType, typename ActionType>
PrioritizedReplayBuffer<StateType, ActionType>::PrioritizedReplayBuffer(
    const core::ReplayMemoryConfig& config, std::shared_ptr<core::IRandomSource> rng)
    : initial_size_(config.initial_size), max_size_(config.max_size),
      alpha_(config.alpha), beta_(config.beta), beta_increment_(config.beta_increment),
      epsilon_(config.epsilon), total_additions_(0), total_samples_(0),
      thread_safe_(config.thread_safe),
      rng_(rng ? std::move(rng) : core::make_random_source(config.seed)) {
    core::validate_config(config);
    tree_ = std::make_unique<TreeType>(max_size_);
}

template<typename StateType, typename ActionType>
std::unique_lock<std::mutex> PrioritizedReplayBuffer<StateType, ActionType>::guard() const {
    if (thread_safe_) {
        return std::unique_lock<std::mutex>(mutex_);
    }
    return std::unique_lock<std::mutex>();
}

template<typename StateType, typename ActionType>
size_t PrioritizedReplayBuffer<StateType, ActionType>::size() const {
    auto lock = guard();
    return tree_->size();
}

template<typename StateType, typename ActionType>
bool PrioritizedReplayBuffer<StateType, ActionType>::initialized() const {
    auto lock = guard();
    return tree_->size() > initial_size_;
}

template<typename StateType, typename ActionType>
double PrioritizedReplayBuffer<StateType, ActionType>::max_priority() const {
    auto lock = guard();
    return tree_->size() > initial_size_ ? tree_->max_priority() : 1.0;
}

template<typename StateType, typename ActionType>
double PrioritizedReplayBuffer<StateType, ActionType>::total_priority() const {
    auto lock = guard();
    return tree_->total_priority();
}

template<typename StateType, typename ActionType>
double PrioritizedReplayBuffer<StateType, ActionType>::get_priority(size_t leaf_index) const {
    auto lock = guard();
    return tree_->get(leaf_index);
}

template<typename StateType, typename ActionType>
void PrioritizedReplayBuffer<StateType, ActionType>::add(
    const std::vector<TransitionType>& batch, const std::vector<double>& priorities) {
    if (batch.size() != priorities.size()) {
        throw core::ContractViolation("PrioritizedReplayBuffer::add: one priority per transition is required");
    }

    auto lock = guard();
    for (size_t i = 0; i < batch.size(); ++i) {
        tree_->insert_next(priorities[i], batch[i]);
    }
    total_additions_.fetch_add(batch.size(), std::memory_order_relaxed);
}

template<typename StateType, typename ActionType>
typename PrioritizedReplayBuffer<StateType, ActionType>::BatchType
PrioritizedReplayBuffer<StateType, ActionType>::sample(size_t n) {
    auto lock = guard();
    const TreeType& t = *tree_;
    const size_t current_size = t.size();
    const double total = t.total_priority();

    core::require(n > 0, "PrioritizedReplayBuffer::sample: batch size must be positive");
    core::require(current_size > 0, "PrioritizedReplayBuffer::sample: buffer is empty");
    core::require(total > 0.0, "PrioritizedReplayBuffer::sample: total priority is zero");

    BatchType result;
    result.batch.reserve(n);
    result.leaf_indices.reserve(n);
    result.importance_weights.reserve(n);

    // Stratified sampling: one draw from each of n equal-width segments
    const double segment = total / static_cast<double>(n);
    std::vector<double> priorities;
    priorities.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        const double low = segment * static_cast<double>(i);
        const double high = (i + 1 == n) ? total : segment * static_cast<double>(i + 1);
        double s = rng_->uniform(low, high);
        if (s >= total) {
            // uniform_real_distribution may round onto its upper bound
            s = std::nextafter(total, 0.0);
        }

        const auto drawn = t.sample_by_value(s, *rng_);
        core::require(drawn.priority > 0.0, "PrioritizedReplayBuffer::sample: drew a zero-priority transition");
        result.batch.push_back(*drawn.payload, drawn.leaf_index - t.first_leaf());
        result.leaf_indices.push_back(drawn.leaf_index);
        priorities.push_back(drawn.priority);
    }

    const double beta = get_beta();
    double max_weight = 0.0;
    for (double p : priorities) {
        const double probability = p / total;
        const double weight = std::pow(static_cast<double>(current_size) * probability, -beta);
        result.importance_weights.push_back(weight);
        max_weight = std::max(max_weight, weight);
    }
    for (auto& weight : result.importance_weights) {
        weight /= max_weight;
    }

    total_samples_.fetch_add(n, std::memory_order_relaxed);
    return result;
}

template<typename StateType, typename ActionType>
void PrioritizedReplayBuffer<StateType, ActionType>::update_priorities(
    const std::vector<double>& errors, const std::vector<size_t>& leaf_indices) {
    if (errors.size() != leaf_indices.size()) {
        throw core::ContractViolation(
            "PrioritizedReplayBuffer::update_priorities: one error per index is required");
    }

    std::vector<double> priorities;
    priorities.reserve(errors.size());
    for (double error : errors) {
        priorities.push_back(priority_for_error(error));
    }

    auto lock = guard();
    tree_->update(leaf_indices, priorities);
}

template<typename StateType, typename ActionType>
void PrioritizedReplayBuffer<StateType, ActionType>::reset() {
    auto lock = guard();
    tree_->reset();
}

template<typename StateType, typename ActionType>
void PrioritizedReplayBuffer<StateType, ActionType>::set_random_source(
    std::shared_ptr<core::IRandomSource> rng) {
    if (!rng) {
        throw std::invalid_argument("Random source must not be null");
    }
    auto lock = guard();
    rng_ = std::move(rng);
}

template<typename StateType, typename ActionType>
typename PrioritizedReplayBuffer<StateType, ActionType>::Snapshot
PrioritizedReplayBuffer<StateType, ActionType>::snapshot() const {
    auto lock = guard();
    Snapshot snapshot;
    snapshot.initial_size = initial_size_;
    snapshot.max_size = max_size_;
    snapshot.alpha = alpha_;
    snapshot.beta = beta_;
    snapshot.epsilon = epsilon_;
    snapshot.tree = tree_->snapshot();
    return snapshot;
}

template<typename StateType, typename ActionType>
void PrioritizedReplayBuffer<StateType, ActionType>::restore(const Snapshot& snapshot) {
    if (snapshot.max_size == 0) {
        throw std::invalid_argument("Snapshot max_size must be positive");
    }

    if (snapshot.tree && snapshot.tree->data.size() != snapshot.max_size) {
        throw std::invalid_argument("Snapshot tree does not match max_size");
    }

    // Build the replacement first so a bad snapshot leaves the buffer untouched
    auto restored = std::make_unique<TreeType>(snapshot.max_size);
    if (snapshot.tree) {
        restored->restore(*snapshot.tree);
    }

    auto lock = guard();
    initial_size_ = snapshot.initial_size;
    max_size_ = snapshot.max_size;
    alpha_ = snapshot.alpha;
    beta_ = snapshot.beta;
    epsilon_ = snapshot.epsilon;
    tree_ = std::move(restored);
}

namespace detail {
constexpr char kPrioritizedSnapshotTag[5] = "RRPB";
constexpr uint32_t kPrioritizedSnapshotVersion = 1;
} // namespace detail

template<typename StateType, typename ActionType>
std::vector<uint8_t> PrioritizedReplayBuffer<StateType, ActionType>::save() const {
    using memory::encode;
    const Snapshot state = snapshot();

    memory::ByteWriter writer;
    writer.write_tag(detail::kPrioritizedSnapshotTag);
    encode(writer, detail::kPrioritizedSnapshotVersion);
    encode(writer, static_cast<uint64_t>(state.initial_size));
    encode(writer, static_cast<uint64_t>(state.max_size));
    encode(writer, state.alpha);
    encode(writer, state.beta);
    encode(writer, state.epsilon);
    encode(writer, state.tree.has_value());
    if (state.tree) {
        encode_tree_snapshot<TransitionType>(writer, *state.tree);
    }
    return writer.release();
}

template<typename StateType, typename ActionType>
void PrioritizedReplayBuffer<StateType, ActionType>::load(const std::vector<uint8_t>& bytes) {
    using memory::decode;
    memory::ByteReader reader(bytes);
    reader.expect_tag(detail::kPrioritizedSnapshotTag);

    uint32_t version = 0;
    decode(reader, version);
    if (version != detail::kPrioritizedSnapshotVersion) {
        throw std::runtime_error("Unsupported PrioritizedReplayBuffer snapshot version " +
                                 std::to_string(version));
    }

    Snapshot state;
    uint64_t initial_size = 0;
    uint64_t max_size = 0;
    bool has_tree = false;
    decode(reader, initial_size);
    decode(reader, max_size);
    decode(reader, state.alpha);
    decode(reader, state.beta);
    decode(reader, state.epsilon);
    decode(reader, has_tree);
    if (has_tree) {
        state.tree = decode_tree_snapshot<TransitionType>(reader);
    }
    if (!reader.at_end()) {
        throw std::runtime_error("Trailing bytes after PrioritizedReplayBuffer snapshot");
    }

    state.initial_size = static_cast<size_t>(initial_size);
    state.max_size = static_cast<size_t>(max_size);
    try {
        restore(state);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Corrupted PrioritizedReplayBuffer snapshot: ") + e.what());
    } catch (const std::length_error& e) {
        throw std::runtime_error(std::string("Corrupted PrioritizedReplayBuffer snapshot: ") + e.what());
    } catch (const std::bad_alloc&) {
        throw std::runtime_error("Corrupted PrioritizedReplayBuffer snapshot: capacity cannot be allocated");
    }
}

// Instantiated in prioritized_replay_buffer.cpp
extern template class PrioritizedReplayBuffer<std::vector<double>, std::vector<double>>;
extern template class PrioritizedReplayBuffer<std::vector<double>, int>;

} // namespace prioritization
} // namespace rl_replay
