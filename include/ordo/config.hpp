#pragma once

// Field description shared by construction and configuration.
//
// A struct takes part by providing ADL free functions fields(t) returning a
// tuple of field(name, member), in declaration order. Construction uses the
// order; set() uses the names.

#include <concepts>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "scalar.hpp"

namespace ordo {

// ============================================================================
// Field helper - returns std::pair<const char*, T&>
// ============================================================================

template <typename T>
constexpr auto field(const char* name, T& value) {
    return std::pair<const char*, T&>{name, value};
}

template <typename T>
constexpr auto field(const char* name, const T& value) {
    return std::pair<const char*, const T&>{name, value};
}

template <typename T>
concept HasFields = requires(T& t) {
    { fields(t) };
};

template <typename T>
concept HasConstFields = requires(const T& t) {
    { fields(t) };
};

// ============================================================================
// Option text
// ============================================================================
//
// Integers, scalar kinds and scalar values parse with the from_string
// overloads in scalar.hpp. A user enum joins by providing its own
// from_string(std::type_identity<E>, const std::string&) next to it.

inline auto from_string(std::type_identity<bool>, const std::string& s) -> bool {
    if (s == "true" || s == "1") return true;
    if (s == "false" || s == "0") return false;
    throw std::runtime_error("expected true or false, got '" + s + "'");
}

inline auto from_string(std::type_identity<std::string>, const std::string& s) -> std::string {
    return s;
}

template <typename T>
concept FromText = requires(const std::string& s) {
    { from_string(std::type_identity<T>{}, s) } -> std::same_as<T>;
};

// ============================================================================
// set() - assign one option by dotted path, e.g. "limits.kind"
// ============================================================================

namespace detail {

// Call f with the member of obj named name; false if obj has none
template <HasFields T, typename F>
auto with_field(T& obj, const std::string& name, F&& f) -> bool {
    return std::apply([&](auto&&... entry) {
        return ((entry.first == name && (f(entry.second), true)) || ...);
    }, fields(obj));
}

} // namespace detail

template <HasFields T>
void set(T& obj, const std::string& path, const std::string& text) {
    auto dot = path.find('.');
    auto name = path.substr(0, dot);

    auto found = detail::with_field(obj, name, [&](auto& member) {
        using M = std::remove_cvref_t<decltype(member)>;

        if (dot == std::string::npos) {
            if constexpr (FromText<M>) {
                member = from_string(std::type_identity<M>{}, text);
            } else {
                throw std::runtime_error("'" + path + "' is a group of options, not a value");
            }
        } else if constexpr (HasFields<M>) {
            ordo::set(member, path.substr(dot + 1), text);
        } else {
            throw std::runtime_error("'" + name + "' has no option '" + path.substr(dot + 1) + "'");
        }
    });

    if (!found) {
        throw std::runtime_error("no option named '" + name + "'");
    }
}

/**
 * Apply "key=value" arguments with set(); arguments without '=' are
 * returned untouched, in order.
 */
template <HasFields T>
auto apply_overrides(T& obj, int argc, char* argv[]) -> std::vector<std::string> {
    auto positional = std::vector<std::string>{};
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string(argv[i]);
        auto eq = arg.find('=');
        if (eq == std::string::npos) {
            positional.push_back(arg);
        } else {
            ordo::set(obj, arg.substr(0, eq), arg.substr(eq + 1));
        }
    }
    return positional;
}

} // namespace ordo
