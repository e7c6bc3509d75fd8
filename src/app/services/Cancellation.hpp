#pragma once
#include <stdexcept>
#include <stop_token>

class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("The operation was cancelled.") {}
};

inline void ThrowIfCancelled(const std::stop_token& token) {
    if (token.stop_requested()) {
        throw OperationCancelled();
    }
}
