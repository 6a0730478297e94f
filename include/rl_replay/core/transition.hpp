#pragma once

#include "../memory/binary_codec.hpp"
#include <vector>
#include <cstddef>
#include <utility>

namespace rl_replay {
namespace core {

template<typename StateType, typename ActionType>
struct Transition {
    StateType state;
    ActionType action{};
    double reward = 0.0;
    StateType next_state;
    bool absorbing = false; // Episode terminated by the MDP
    bool last = false;      // Episode ended, possibly by truncation

    Transition() = default;

    Transition(StateType s, ActionType a, double r, StateType ns, bool ab, bool l)
        : state(std::move(s)), action(std::move(a)), reward(r),
          next_state(std::move(ns)), absorbing(ab), last(l) {}
};

// Common type aliases for continuous and discrete action spaces
using VectorTransition = Transition<std::vector<double>, std::vector<double>>;
using DiscreteTransition = Transition<std::vector<double>, int>;

// Parallel field arrays aligned by position
template<typename StateType, typename ActionType>
struct TransitionBatch {
    std::vector<StateType> states;
    std::vector<ActionType> actions;
    std::vector<double> rewards;
    std::vector<StateType> next_states;
    std::vector<bool> absorbing;
    std::vector<bool> last;
    std::vector<size_t> indices; // Storage slot each row was read from

    size_t size() const { return states.size(); }
    bool empty() const { return states.empty(); }

    void clear() {
        states.clear();
        actions.clear();
        rewards.clear();
        next_states.clear();
        absorbing.clear();
        last.clear();
        indices.clear();
    }

    void reserve(size_t capacity) {
        states.reserve(capacity);
        actions.reserve(capacity);
        rewards.reserve(capacity);
        next_states.reserve(capacity);
        absorbing.reserve(capacity);
        last.reserve(capacity);
        indices.reserve(capacity);
    }

    void push_back(const Transition<StateType, ActionType>& t, size_t index) {
        states.push_back(t.state);
        actions.push_back(t.action);
        rewards.push_back(t.reward);
        next_states.push_back(t.next_state);
        absorbing.push_back(t.absorbing);
        last.push_back(t.last);
        indices.push_back(index);
    }
};

// Sample returned by the prioritized buffer. leaf_indices are tree node
// indices and are handed back unchanged to update_priorities().
template<typename StateType, typename ActionType>
struct PrioritizedBatch {
    TransitionBatch<StateType, ActionType> batch;
    std::vector<size_t> leaf_indices;
    std::vector<double> importance_weights;

    size_t size() const { return batch.size(); }
};

enum class SequenceLayout {
    TIME_MAJOR,  // [step][batch]
    BATCH_MAJOR  // [batch][step]
};

// Windowed sequences for recurrent training. The outer index is the unroll
// step for TIME_MAJOR and the sample for BATCH_MAJOR.
template<typename StateType, typename ActionType>
struct SequenceBatch {
    SequenceLayout layout = SequenceLayout::TIME_MAJOR;
    std::vector<std::vector<StateType>> states;
    std::vector<std::vector<ActionType>> actions;
    std::vector<std::vector<double>> rewards;
    std::vector<std::vector<StateType>> next_states;
    std::vector<std::vector<bool>> absorbing;
    std::vector<std::vector<bool>> last;

    size_t outer_size() const { return states.size(); }

    void resize_outer(size_t n) {
        states.resize(n);
        actions.resize(n);
        rewards.resize(n);
        next_states.resize(n);
        absorbing.resize(n);
        last.resize(n);
    }

    void append(size_t outer, const StateType& s, const ActionType& a, double r,
                const StateType& ns, bool ab, bool l) {
        states[outer].push_back(s);
        actions[outer].push_back(a);
        rewards[outer].push_back(r);
        next_states[outer].push_back(ns);
        absorbing[outer].push_back(ab);
        last[outer].push_back(l);
    }
};

// Snapshot encoding, found through ADL by the memory:: container codecs
template<typename StateType, typename ActionType>
void encode(memory::ByteWriter& writer, const Transition<StateType, ActionType>& t) {
    using memory::encode;
    encode(writer, t.state);
    encode(writer, t.action);
    encode(writer, t.reward);
    encode(writer, t.next_state);
    encode(writer, t.absorbing);
    encode(writer, t.last);
}

template<typename StateType, typename ActionType>
void decode(memory::ByteReader& reader, Transition<StateType, ActionType>& t) {
    using memory::decode;
    decode(reader, t.state);
    decode(reader, t.action);
    decode(reader, t.reward);
    decode(reader, t.next_state);
    decode(reader, t.absorbing);
    decode(reader, t.last);
}

} // namespace core
} // namespace rl_replay
