#pragma once

// Scalar vocabulary for the token stream: a closed set of kinds and the
// tagged value that carries one of them.

#include <cctype>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ordo {

// ============================================================================
// Scalar kinds
// ============================================================================

enum class scalar_kind {
    i32,
    i64,
};

inline auto to_string(scalar_kind k) -> const char* {
    switch (k) {
        case scalar_kind::i32: return "i32";
        case scalar_kind::i64: return "i64";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<scalar_kind>, const std::string& s) -> scalar_kind {
    if (s == "i32") return scalar_kind::i32;
    if (s == "i64") return scalar_kind::i64;
    throw std::runtime_error("unknown scalar kind: " + s);
}

// ============================================================================
// Payload text: the whole string must be a decimal number in range
// ============================================================================

inline auto from_string(std::type_identity<std::int64_t>, const std::string& s) -> std::int64_t {
    std::size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(s, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("failed to parse number: '" + s + "'");
    }
    if (used != s.size()) {
        throw std::runtime_error("failed to parse number: '" + s + "'");
    }
    return static_cast<std::int64_t>(v);
}

inline auto from_string(std::type_identity<std::int32_t>, const std::string& s) -> std::int32_t {
    auto v = from_string(std::type_identity<std::int64_t>{}, s);
    if (v < INT32_MIN || v > INT32_MAX) {
        throw std::runtime_error("value out of range for i32: '" + s + "'");
    }
    return static_cast<std::int32_t>(v);
}

// ============================================================================
// scalar_traits - maps a payload type to its kind
// ============================================================================
//
// Only payload types with a specialization here may appear in a
// scalar_value. Adding a kind means adding an enumerator, a specialization,
// and an alternative to scalar_value::storage_t; every std::visit over the
// storage then fails to compile until it handles the new alternative.

template <typename T>
struct scalar_traits;

template <>
struct scalar_traits<std::int32_t> {
    static constexpr scalar_kind kind = scalar_kind::i32;
};

template <>
struct scalar_traits<std::int64_t> {
    static constexpr scalar_kind kind = scalar_kind::i64;
};

template <typename T>
concept ScalarPayload = requires {
    { scalar_traits<T>::kind } -> std::convertible_to<scalar_kind>;
};

// ============================================================================
// scalar_value - immutable tagged union of the supported kinds
// ============================================================================

class scalar_value {
public:
    using storage_t = std::variant<std::int32_t, std::int64_t>;

    // i32:0, so that aggregates holding a scalar_value can be value-initialized
    constexpr scalar_value() = default;
    explicit constexpr scalar_value(std::int32_t v) : data_(v) {}
    explicit constexpr scalar_value(std::int64_t v) : data_(v) {}

    auto kind() const -> scalar_kind {
        return std::visit([](auto v) { return scalar_traits<decltype(v)>::kind; }, data_);
    }

    template <ScalarPayload T>
    auto holds() const -> bool {
        return std::holds_alternative<T>(data_);
    }

    // Payload of type T, or nullptr if the tag is a different kind
    template <ScalarPayload T>
    auto get_if() const -> const T* {
        return std::get_if<T>(&data_);
    }

    template <typename F>
    decltype(auto) visit(F&& f) const {
        return std::visit(std::forward<F>(f), data_);
    }

    auto operator==(const scalar_value&) const -> bool = default;

private:
    storage_t data_;
};

inline auto i32(std::int32_t v) -> scalar_value { return scalar_value{v}; }
inline auto i64(std::int64_t v) -> scalar_value { return scalar_value{v}; }

// ============================================================================
// Text form: "<kind>:<value>", e.g. "i32:1" or "i64:-5"
// ============================================================================

inline auto to_string(const scalar_value& s) -> std::string {
    return s.visit([](auto v) {
        return std::string(to_string(scalar_traits<decltype(v)>::kind)) + ":" + std::to_string(v);
    });
}

inline auto operator<<(std::ostream& os, const scalar_value& s) -> std::ostream& {
    return os << to_string(s);
}

inline auto from_string(std::type_identity<scalar_value>, const std::string& s) -> scalar_value {
    auto colon = s.find(':');
    if (colon == std::string::npos) {
        throw std::runtime_error("expected '<kind>:<value>', got '" + s + "'");
    }
    auto digits = s.substr(colon + 1);

    switch (from_string(std::type_identity<scalar_kind>{}, s.substr(0, colon))) {
        case scalar_kind::i32: return i32(from_string(std::type_identity<std::int32_t>{}, digits));
        case scalar_kind::i64: return i64(from_string(std::type_identity<std::int64_t>{}, digits));
    }
    throw std::runtime_error("unknown scalar kind in '" + s + "'");
}

// Split a comma or whitespace separated token list, e.g. "i32:1, i32:2 i64:5"
inline auto parse_tokens(const std::string& text) -> std::vector<scalar_value> {
    auto result = std::vector<scalar_value>{};
    auto token = std::string{};

    auto flush = [&] {
        if (!token.empty()) {
            result.push_back(from_string(std::type_identity<scalar_value>{}, token));
            token.clear();
        }
    };

    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            token += c;
        }
    }
    flush();
    return result;
}

} // namespace ordo
