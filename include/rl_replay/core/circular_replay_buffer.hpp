#pragma once

#include "replay_memory_interface.hpp"
#include "random_source.hpp"
#include "errors.hpp"
#include <vector>
#include <atomic>
#include <mutex>
#include <memory>
#include <optional>

namespace rl_replay {
namespace core {

// Fixed-capacity ring of transitions with uniform sampling. Once full, each
// insertion silently overwrites the oldest entry.
template<typename StateType, typename ActionType>
class CircularReplayBuffer : public IReplayMemory {
public:
    using TransitionType = Transition<StateType, ActionType>;
    using BatchType = TransitionBatch<StateType, ActionType>;

    // Complete persisted state. Arrays left unset (e.g. from an older writer)
    // are rebuilt empty on restore.
    struct Snapshot {
        size_t initial_size = 0;
        size_t max_size = 0;
        size_t write_index = 0;
        std::optional<bool> full;
        std::vector<StateType> states;
        std::vector<ActionType> actions;
        std::vector<double> rewards;
        std::vector<StateType> next_states;
        std::vector<bool> absorbing;
        std::vector<bool> last;
    };

private:
    std::vector<StateType> states_;
    std::vector<ActionType> actions_;
    std::vector<double> rewards_;
    std::vector<StateType> next_states_;
    std::vector<bool> absorbing_;
    std::vector<bool> last_;

    size_t initial_size_;
    size_t max_size_;
    size_t write_index_;
    bool full_;

    std::atomic<size_t> total_additions_;
    std::atomic<size_t> total_samples_;

    // Thread safety
    mutable std::mutex mutex_;
    bool thread_safe_;

    std::shared_ptr<IRandomSource> rng_;

public:
    explicit CircularReplayBuffer(const ReplayMemoryConfig& config,
                                  std::shared_ptr<IRandomSource> rng = nullptr);
    ~CircularReplayBuffer() override = default;

    // Core operations
    void add(const std::vector<TransitionType>& batch);
    void add(TransitionType&& transition);

    // n uniform draws with replacement; the buffer must not be empty
    BatchType sample(size_t n);

    // Buffer state
    size_t size() const override;
    size_t capacity() const override { return max_size_; }
    bool empty() const override { return size() == 0; }
    bool full() const;
    bool initialized() const override;

    void reset() override;

    // Statistics
    size_t get_total_additions() const override { return total_additions_.load(); }
    size_t get_total_samples() const override { return total_samples_.load(); }

    void set_random_source(std::shared_ptr<IRandomSource> rng);

    // Persistence
    Snapshot snapshot() const;
    void restore(const Snapshot& snapshot);
    std::vector<uint8_t> save() const;
    void load(const std::vector<uint8_t>& bytes);

private:
    std::unique_lock<std::mutex> guard() const;
    void add_impl(TransitionType transition);
    size_t size_impl() const { return full_ ? max_size_ : write_index_; }
    void reset_impl();
};

extern template class CircularReplayBuffer<std::vector<double>, std::vector<double>>;
extern template class CircularReplayBuffer<std::vector<double>, int>;

} // namespace core
} // namespace rl_replay
