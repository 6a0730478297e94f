#pragma once

#include "../core/errors.hpp"
#include "../core/random_source.hpp"
#include "../memory/binary_codec.hpp"
#include <vector>
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace rl_replay {
namespace prioritization {

// Sum tree over a fixed number of prioritized payload slots.
//
// The tree is a flat array of 2N-1 nodes. Leaves occupy the last N entries and
// map 1:1 onto the payload slots; node i has children 2i+1 and 2i+2. Every
// internal node holds the sum of its children, kept current by propagating
// the delta of each leaf write up to the root.
//
// Payload slots are filled by a circular cursor: once all N slots are used
// the oldest one is overwritten.
template<typename T>
class PriorityTree {
public:
    // payload points into the tree and is invalidated by the next insert
    struct Sample {
        size_t leaf_index;  // Tree node index, valid for update()
        double priority;
        const T* payload;
    };

    struct Snapshot {
        std::vector<double> tree;
        std::vector<T> data;
        size_t write_index = 0;
        bool full = false;
    };

private:
    std::vector<double> tree_;
    std::vector<T> data_;
    size_t capacity_;
    size_t data_start_; // Index of the first leaf node
    size_t write_index_;
    bool full_;

public:
    explicit PriorityTree(size_t capacity)
        : capacity_(capacity), data_start_(capacity - 1), write_index_(0), full_(false) {
        if (capacity == 0) {
            throw std::invalid_argument("PriorityTree capacity must be positive");
        }
        if (capacity > tree_.max_size() / 2) {
            throw std::length_error("PriorityTree capacity is too large");
        }
        tree_.assign(2 * capacity - 1, 0.0);
        data_.resize(capacity);
    }

    // Store payload in the next slot with the given priority
    void insert_next(double value, T payload) {
        data_[write_index_] = std::move(payload);
        set_leaf(data_start_ + write_index_, value);

        ++write_index_;
        if (write_index_ == capacity_) {
            write_index_ = 0;
            full_ = true;
        }
    }

    void update(const std::vector<size_t>& leaf_indices, const std::vector<double>& values) {
        if (leaf_indices.size() != values.size()) {
            throw core::ContractViolation("PriorityTree::update: index and value counts differ");
        }
        for (size_t leaf : leaf_indices) {
            if (!is_leaf(leaf)) {
                throw core::ContractViolation("PriorityTree::update: index is not a leaf node");
            }
        }
        for (size_t i = 0; i < leaf_indices.size(); ++i) {
            set_leaf(leaf_indices[i], values[i]);
        }
    }

    // Find the leaf whose cumulative priority range contains s.
    // Subtrees of equal mass are chosen between at random so that regions of
    // identical priority are not always resolved to the left.
    Sample sample_by_value(double s, core::IRandomSource& rng) const {
        if (!(s >= 0.0 && s < total_priority())) {
            throw core::ContractViolation("PriorityTree::sample_by_value: value outside [0, total)");
        }

        size_t index = 0;
        while (true) {
            const size_t left = 2 * index + 1;
            const size_t right = left + 1;
            if (left >= tree_.size()) {
                break;
            }

            const double left_sum = tree_[left];
            const double right_sum = tree_[right];
            if (left_sum <= 0.0 && right_sum <= 0.0) {
                throw core::ContractViolation("PriorityTree::sample_by_value: reached a subtree with no priority mass");
            }
            if (left_sum == right_sum) {
                index = rng.randint(2) == 0 ? left : right;
            } else if (right_sum <= 0.0 || (s <= left_sum && left_sum > 0.0)) {
                // Rounding in the propagated sums can leave s a hair above
                // left_sum with nothing on the right
                index = left;
            } else {
                s -= left_sum;
                index = right;
            }
        }

        return {index, tree_[index], &data_[index - data_start_]};
    }

    double get(size_t leaf_index) const {
        if (!is_leaf(leaf_index)) {
            throw std::out_of_range("PriorityTree::get: index is not a leaf node");
        }
        return tree_[leaf_index];
    }

    const T& payload(size_t leaf_index) const {
        if (!is_leaf(leaf_index)) {
            throw std::out_of_range("PriorityTree::payload: index is not a leaf node");
        }
        return data_[leaf_index - data_start_];
    }

    double total_priority() const { return tree_[0]; }

    // Maximum over the leaves written so far, 0 when nothing was inserted
    double max_priority() const {
        const auto first = tree_.begin() + static_cast<std::ptrdiff_t>(data_start_);
        const auto last = first + static_cast<std::ptrdiff_t>(size());
        if (first == last) {
            return 0.0;
        }
        return *std::max_element(first, last);
    }

    size_t size() const { return full_ ? capacity_ : write_index_; }
    size_t capacity() const { return capacity_; }
    bool full() const { return full_; }
    size_t first_leaf() const { return data_start_; }

    bool is_leaf(size_t index) const {
        return index >= data_start_ && index < tree_.size();
    }

    void reset() {
        std::fill(tree_.begin(), tree_.end(), 0.0);
        data_.assign(capacity_, T{});
        write_index_ = 0;
        full_ = false;
    }

    Snapshot snapshot() const {
        return {tree_, data_, write_index_, full_};
    }

    void restore(const Snapshot& snapshot) {
        if (snapshot.tree.size() != tree_.size() || snapshot.data.size() != capacity_ ||
            snapshot.write_index >= capacity_) {
            throw std::invalid_argument("PriorityTree snapshot does not match tree capacity");
        }
        tree_ = snapshot.tree;
        data_ = snapshot.data;
        write_index_ = snapshot.write_index;
        full_ = snapshot.full;
    }

private:
    void set_leaf(size_t tree_index, double value) {
        const double delta = value - tree_[tree_index];
        tree_[tree_index] = value;

        while (tree_index > 0) {
            tree_index = (tree_index - 1) / 2;
            tree_[tree_index] += delta;
            // Rounding residue must not leave mass above an emptied subtree
            if (tree_[2 * tree_index + 1] == 0.0 && tree_[2 * tree_index + 2] == 0.0) {
                tree_[tree_index] = 0.0;
            }
        }
    }
};

template<typename T>
void encode_tree_snapshot(memory::ByteWriter& writer, const typename PriorityTree<T>::Snapshot& snapshot) {
    using memory::encode;
    encode(writer, snapshot.tree);
    encode(writer, snapshot.data);
    encode(writer, static_cast<uint64_t>(snapshot.write_index));
    encode(writer, snapshot.full);
}

template<typename T>
typename PriorityTree<T>::Snapshot decode_tree_snapshot(memory::ByteReader& reader) {
    using memory::decode;
    typename PriorityTree<T>::Snapshot snapshot;
    uint64_t write_index = 0;
    decode(reader, snapshot.tree);
    decode(reader, snapshot.data);
    decode(reader, write_index);
    decode(reader, snapshot.full);
    snapshot.write_index = static_cast<size_t>(write_index);
    return snapshot;
}

} // namespace prioritization
} // namespace rl_replay
