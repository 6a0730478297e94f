#pragma once

#include <stdexcept>
#include <string>

namespace rl_replay {
namespace core {

// Raised when a caller breaks an operation's precondition, e.g. sampling an
// empty buffer. Never raised for data-dependent conditions.
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what) : std::logic_error(what) {}
    explicit ContractViolation(const char* what) : std::logic_error(what) {}
};

inline void require(bool condition, const char* message) {
    if (!condition) {
        throw ContractViolation(message);
    }
}

} // namespace core
} // namespace rl_replay
