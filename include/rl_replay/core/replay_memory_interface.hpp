#pragma once

#include "transition.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace rl_replay {
namespace core {

// Which per-transition flag closes an episode in the sequence buffer
enum class EpisodeBoundary {
    ABSORBING,
    LAST
};

// Configuration shared by every replay memory variant
struct ReplayMemoryConfig {
    size_t initial_size = 0;     // Size that must be exceeded before learning starts
    size_t max_size = 100000;

    // Prioritized replay
    double alpha = 0.6;          // Prioritization exponent
    double beta = 0.4;           // Importance sampling exponent
    double beta_increment = 0.0; // Beta annealing rate, 0 keeps beta constant
    double epsilon = 0.01;       // Keeps zero-error transitions sampleable

    // Episodic sequence replay
    size_t unroll_steps = 1;
    bool sequential_updates = false;
    EpisodeBoundary episode_boundary = EpisodeBoundary::ABSORBING;

    bool thread_safe = false;
    std::optional<uint64_t> seed; // Unset seeds from std::random_device
};

inline void validate_config(const ReplayMemoryConfig& config) {
    if (config.max_size == 0) {
        throw std::invalid_argument("max_size must be positive");
    }
    if (config.unroll_steps == 0) {
        throw std::invalid_argument("unroll_steps must be positive");
    }
    if (config.alpha < 0.0 || config.beta < 0.0 || config.beta_increment < 0.0) {
        throw std::invalid_argument("alpha, beta and beta_increment must be non-negative");
    }
    if (config.epsilon < 0.0) {
        throw std::invalid_argument("epsilon must be non-negative");
    }
}

// State queries every replay memory answers
class IReplayMemory {
public:
    virtual ~IReplayMemory() = default;

    virtual size_t size() const = 0;
    virtual size_t capacity() const = 0;
    virtual bool empty() const = 0;

    // True once size() exceeds the configured initial size
    virtual bool initialized() const = 0;

    virtual void reset() = 0;

    // Statistics
    virtual size_t get_total_additions() const = 0;
    virtual size_t get_total_samples() const = 0;
};

} // namespace core
} // namespace rl_replay
