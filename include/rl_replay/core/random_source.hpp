#pragma once

#include <random>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>

namespace rl_replay {
namespace core {

// Source of every random draw a buffer makes. Buffers never touch a global
// generator, so sampling is reproducible from the seed alone.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    // Uniform real in [low, high)
    virtual double uniform(double low, double high) = 0;

    // Uniform integer in [0, upper); upper must be positive
    virtual size_t randint(size_t upper) = 0;

    virtual void seed(uint64_t value) = 0;
};

class Mt19937RandomSource : public IRandomSource {
private:
    std::mt19937_64 engine_;

public:
    Mt19937RandomSource() : engine_(std::random_device{}()) {}
    explicit Mt19937RandomSource(uint64_t seed) : engine_(seed) {}

    double uniform(double low, double high) override {
        std::uniform_real_distribution<double> dist(low, high);
        return dist(engine_);
    }

    size_t randint(size_t upper) override {
        std::uniform_int_distribution<size_t> dist(0, upper - 1);
        return dist(engine_);
    }

    void seed(uint64_t value) override { engine_.seed(value); }
};

inline std::shared_ptr<IRandomSource> make_random_source(std::optional<uint64_t> seed) {
    if (seed) {
        return std::make_shared<Mt19937RandomSource>(*seed);
    }
    return std::make_shared<Mt19937RandomSource>();
}

} // namespace core
} // namespace rl_replay
