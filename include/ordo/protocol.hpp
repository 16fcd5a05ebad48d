#pragma once

// Type-directed construction over the token vocabulary.
// read() overloads walk the target type and pull scalars through a
// deserializer; write() overloads are the inverse and push them into a
// value_sink. Structs, tuples, pairs and arrays take one element per
// declared member, in order. Vectors take elements until the input ends.

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "config.hpp"
#include "deserializer.hpp"
#include "error.hpp"
#include "scalar.hpp"
#include "sink.hpp"

namespace ordo {

// ============================================================================
// Shape names for targets the vocabulary cannot represent
// ============================================================================

namespace detail {

template <typename T>
struct shape_name {
    static auto get() -> std::string {
        if constexpr (std::is_same_v<T, bool>) {
            return "boolean";
        } else if constexpr (std::is_floating_point_v<T>) {
            return "floating-point number";
        } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
            return "unsigned integer";
        } else if constexpr (std::is_integral_v<T>) {
            return "integer other than std::int32_t or std::int64_t";
        } else if constexpr (std::is_enum_v<T>) {
            return "enumeration";
        } else if constexpr (std::is_pointer_v<T>) {
            return "pointer";
        } else {
            return "type without fields()";
        }
    }
};

template <typename C, typename Tr, typename A>
struct shape_name<std::basic_string<C, Tr, A>> {
    static auto get() -> std::string { return "string"; }
};

template <typename T>
struct shape_name<std::optional<T>> {
    static auto get() -> std::string { return "optional"; }
};

template <typename K, typename V, typename C, typename A>
struct shape_name<std::map<K, V, C, A>> {
    static auto get() -> std::string { return "map"; }
};

template <typename K, typename V, typename H, typename E, typename A>
struct shape_name<std::unordered_map<K, V, H, E, A>> {
    static auto get() -> std::string { return "map"; }
};

template <typename... Ts>
struct shape_name<std::variant<Ts...>> {
    static auto get() -> std::string { return "variant"; }
};

} // namespace detail

// ============================================================================
// Read declarations
// ============================================================================

void read(deserializer& d, std::int32_t& value);
void read(deserializer& d, std::int64_t& value);
void read(deserializer& d, scalar_value& value);

template <typename T1, typename T2>
void read(deserializer& d, std::pair<T1, T2>& value);

template <typename... Ts>
void read(deserializer& d, std::tuple<Ts...>& value);

template <typename T, std::size_t N>
void read(deserializer& d, std::array<T, N>& value);

template <typename T>
void read(deserializer& d, std::vector<T>& value);

template <typename T>
    requires HasFields<T>
void read(deserializer& d, T& value);

// Any other target
template <typename T>
void read(deserializer& d, T& value);

// ============================================================================
// Write declarations
// ============================================================================

void write(value_sink& sink, std::int32_t value);
void write(value_sink& sink, std::int64_t value);
void write(value_sink& sink, const scalar_value& value);

template <typename T1, typename T2>
void write(value_sink& sink, const std::pair<T1, T2>& value);

template <typename... Ts>
void write(value_sink& sink, const std::tuple<Ts...>& value);

template <typename T, std::size_t N>
void write(value_sink& sink, const std::array<T, N>& value);

template <typename T>
void write(value_sink& sink, const std::vector<T>& value);

template <typename T>
    requires HasConstFields<T>
void write(value_sink& sink, const T& value);

// Any other value
template <typename T>
void write(value_sink& sink, const T& value);

// ============================================================================
// Fixed-arity aggregates
// ============================================================================

namespace detail {

// Fill each element, in order, from one sequence source. Running out of
// input before the last declared element is an end-of-input error.
template <typename... Ts>
void read_elements(deserializer& d, Ts&... elements) {
    auto source = d.begin_tuple();
    constexpr auto count = sizeof...(Ts);
    auto index = std::size_t{0};

    auto next = [&](auto& element) {
        ++index;
        auto filled = d.nested(index == count, [&] {
            return source.next_element(element);
        });
        if (!filled) {
            throw end_of_input(d.position());
        }
    };
    (next(elements), ...);
}

} // namespace detail

// ============================================================================
// Read implementations
// ============================================================================

inline void read(deserializer& d, std::int32_t& value) {
    d.read(value);
}

inline void read(deserializer& d, std::int64_t& value) {
    d.read(value);
}

// Kind inferred from the data
inline void read(deserializer& d, scalar_value& value) {
    d.read_any([&value](auto v) { value = scalar_value{v}; });
}

template <typename T1, typename T2>
void read(deserializer& d, std::pair<T1, T2>& value) {
    detail::read_elements(d, value.first, value.second);
}

template <typename... Ts>
void read(deserializer& d, std::tuple<Ts...>& value) {
    std::apply([&d](auto&... elements) {
        detail::read_elements(d, elements...);
    }, value);
}

template <typename T, std::size_t N>
void read(deserializer& d, std::array<T, N>& value) {
    std::apply([&d](auto&... elements) {
        detail::read_elements(d, elements...);
    }, value);
}

// Runs to the end of the input; only valid in tail position
template <typename T>
void read(deserializer& d, std::vector<T>& value) {
    auto source = d.begin_sequence();
    value.clear();
    while (true) {
        T element{};
        auto filled = d.nested(false, [&] {
            return source.next_element(element);
        });
        if (!filled) break;
        value.push_back(std::move(element));
    }
    d.end_sequence(value.size());
}

// Compound types with fields(), read positionally
template <typename T>
    requires HasFields<T>
void read(deserializer& d, T& value) {
    std::apply([&d](auto&&... f) {
        detail::read_elements(d, f.second...);
    }, fields(value));
}

template <typename T>
void read(deserializer& d, T&) {
    throw unsupported(d.position(), detail::shape_name<T>::get());
}

// ============================================================================
// Write implementations
// ============================================================================

inline void write(value_sink& sink, std::int32_t value) {
    sink.write(value);
}

inline void write(value_sink& sink, std::int64_t value) {
    sink.write(value);
}

inline void write(value_sink& sink, const scalar_value& value) {
    sink.write(value);
}

template <typename T1, typename T2>
void write(value_sink& sink, const std::pair<T1, T2>& value) {
    write(sink, value.first);
    write(sink, value.second);
}

template <typename... Ts>
void write(value_sink& sink, const std::tuple<Ts...>& value) {
    std::apply([&sink](const auto&... elements) {
        (write(sink, elements), ...);
    }, value);
}

template <typename T, std::size_t N>
void write(value_sink& sink, const std::array<T, N>& value) {
    for (const auto& elem : value) {
        write(sink, elem);
    }
}

template <typename T>
void write(value_sink& sink, const std::vector<T>& value) {
    for (const auto& elem : value) {
        write(sink, elem);
    }
}

template <typename T>
    requires HasConstFields<T>
void write(value_sink& sink, const T& value) {
    std::apply([&sink](auto&&... f) {
        (write(sink, f.second), ...);
    }, fields(value));
}

template <typename T>
void write(value_sink& sink, const T&) {
    throw unsupported(sink.position(), detail::shape_name<T>::get());
}

// ============================================================================
// Entry points
// ============================================================================

namespace detail {

template <typename T>
auto construct_impl(std::span<const scalar_value> input, std::ostream* log) -> T {
    auto tokens = cursor(input);
    auto d = deserializer(tokens, log);
    d.log("construct from " + std::to_string(input.size()) + " tokens");

    try {
        T value{};
        read(d, value);
        if (!tokens.at_end()) {
            throw trailing_input(tokens.position(), tokens.size());
        }
        d.log("construct complete");
        return value;
    } catch (const error& e) {
        d.log(std::string("  error: ") + e.what());
        throw;
    }
}

} // namespace detail

/**
 * Build a T from the whole token sequence.
 *
 * Throws end_of_input, type_mismatch, trailing_input or unsupported (all
 * derived from ordo::error). The input must outlive the call only.
 */
template <typename T>
auto construct(std::span<const scalar_value> input) -> T {
    return detail::construct_impl<T>(input, nullptr);
}

// As above, logging each consumed token and the outcome to log
template <typename T>
auto construct(std::span<const scalar_value> input, std::ostream& log) -> T {
    return detail::construct_impl<T>(input, &log);
}

// The token sequence construct<T> would build value from
template <typename T>
auto flatten(const T& value) -> std::vector<scalar_value> {
    auto tokens = std::vector<scalar_value>{};
    auto sink = value_sink(tokens);
    write(sink, value);
    return tokens;
}

} // namespace ordo
