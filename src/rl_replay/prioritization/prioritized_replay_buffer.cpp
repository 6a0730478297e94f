#include "rl_replay/prioritization/prioritized_replay_buffer.hpp"

namespace rl_replay {
namespace prioritization {

// Explicit template instantiations for common types
template class PrioritizedReplayBuffer<std::vector<double>, std::vector<double>>;
template class PrioritizedReplayBuffer<std::vector<double>, int>;

} // namespace prioritization
} // namespace rl_replay
