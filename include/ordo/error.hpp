#pragma once

// Errors raised while constructing a value from a token stream.
// Every error records the cursor position at which it was raised.

#include <cstddef>
#include <stdexcept>
#include <string>

#include "scalar.hpp"

namespace ordo {

enum class error_kind {
    end_of_input,
    type_mismatch,
    trailing_input,
    unsupported,
};

inline auto to_string(error_kind k) -> const char* {
    switch (k) {
        case error_kind::end_of_input:   return "end_of_input";
        case error_kind::type_mismatch:  return "type_mismatch";
        case error_kind::trailing_input: return "trailing_input";
        case error_kind::unsupported:    return "unsupported";
    }
    return "unknown";
}

// ============================================================================
// error - common base, catchable as std::runtime_error
// ============================================================================

class error : public std::runtime_error {
public:
    error(error_kind kind, std::size_t position, const std::string& message)
        : std::runtime_error(message), kind_(kind), position_(position) {}

    auto kind() const -> error_kind { return kind_; }
    auto position() const -> std::size_t { return position_; }

private:
    error_kind kind_;
    std::size_t position_;
};

// A read was attempted with nothing left to consume
class end_of_input : public error {
public:
    explicit end_of_input(std::size_t position)
        : error(error_kind::end_of_input, position,
                "unexpected end of input at token " + std::to_string(position)) {}
};

// The next token is not of the requested kind; nothing was consumed
class type_mismatch : public error {
public:
    type_mismatch(std::size_t position, scalar_kind expected, scalar_kind found)
        : error(error_kind::type_mismatch, position,
                "type mismatch at token " + std::to_string(position) +
                ": expected " + to_string(expected) + ", found " + to_string(found)),
          expected_(expected), found_(found) {}

    auto expected() const -> scalar_kind { return expected_; }
    auto found() const -> scalar_kind { return found_; }

private:
    scalar_kind expected_;
    scalar_kind found_;
};

// Construction succeeded without consuming the whole input
class trailing_input : public error {
public:
    trailing_input(std::size_t position, std::size_t size)
        : error(error_kind::trailing_input, position,
                "unexpected input remaining: " + std::to_string(position) +
                " of " + std::to_string(size) + " tokens consumed"),
          size_(size) {}

    auto remaining() const -> std::size_t { return size_ - position(); }

private:
    std::size_t size_;
};

// The target shape cannot be represented by the token vocabulary
class unsupported : public error {
public:
    unsupported(std::size_t position, const std::string& what)
        : error(error_kind::unsupported, position,
                "unsupported target at token " + std::to_string(position) + ": " + what) {}
};

} // namespace ordo
