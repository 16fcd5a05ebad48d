#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>

#include "error.hpp"
#include "scalar.hpp"

namespace ordo {

// ============================================================================
// ScalarVisitor - receives whichever kind the data holds
// ============================================================================

template <typename V>
concept ScalarVisitor = requires(V&& v, std::int32_t a, std::int64_t b) {
    { std::forward<V>(v)(a) };
    { std::forward<V>(v)(b) };
    requires std::same_as<std::invoke_result_t<V, std::int32_t>,
                          std::invoke_result_t<V, std::int64_t>>;
};

// ============================================================================
// cursor - single read position over a borrowed token sequence
// ============================================================================
//
// The cursor never copies or modifies the input; the caller keeps it alive
// for the cursor's lifetime. The position only moves forward, one token per
// successful take. A take that fails (end of input, kind mismatch) leaves
// the position where it was.

class cursor {
public:
    explicit cursor(std::span<const scalar_value> input) : input_(input) {}

    cursor(const cursor&) = delete;
    cursor& operator=(const cursor&) = delete;

    // --- Query ---

    auto position() const -> std::size_t { return index_; }
    auto size() const -> std::size_t { return input_.size(); }
    auto remaining() const -> std::size_t { return input_.size() - index_; }
    auto at_end() const -> bool { return index_ >= input_.size(); }

    // --- Untyped access ---

    auto peek() const -> const scalar_value& {
        if (at_end()) {
            throw end_of_input(index_);
        }
        return input_[index_];
    }

    auto take() -> const scalar_value& {
        const auto& value = peek();
        ++index_;
        return value;
    }

    // --- Typed access ---

    template <ScalarPayload T>
    auto take_as() -> T {
        const auto& value = peek();
        const auto* payload = value.get_if<T>();
        if (!payload) {
            throw type_mismatch(index_, scalar_traits<T>::kind, value.kind());
        }
        ++index_;
        return *payload;
    }

    auto take_i32() -> std::int32_t { return take_as<std::int32_t>(); }
    auto take_i64() -> std::int64_t { return take_as<std::int64_t>(); }

    // Infer the kind from the data and hand the value to the visitor
    template <ScalarVisitor V>
    decltype(auto) take_any(V&& visitor) {
        switch (peek().kind()) {
            case scalar_kind::i32: return std::forward<V>(visitor)(take_i32());
            case scalar_kind::i64: return std::forward<V>(visitor)(take_i64());
        }
        throw unsupported(index_, "unknown scalar kind");
    }

private:
    std::span<const scalar_value> input_;
    std::size_t index_ = 0;
};

} // namespace ordo
