#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>
#include "ordo/ordo.hpp"

using ordo::i32;
using ordo::i64;
using ordo::scalar_value;

// =============================================================================
// Test structures
// =============================================================================

struct point_t {
    std::int32_t x = 0;
    std::int32_t y = 0;

    auto operator==(const point_t&) const -> bool = default;
};

auto fields(point_t& p) {
    return std::make_tuple(ordo::field("x", p.x), ordo::field("y", p.y));
}

auto fields(const point_t& p) {
    return std::make_tuple(ordo::field("x", p.x), ordo::field("y", p.y));
}

struct point64_t {
    std::int64_t x = 0;
    std::int64_t y = 0;

    auto operator==(const point64_t&) const -> bool = default;
};

auto fields(point64_t& p) {
    return std::make_tuple(ordo::field("x", p.x), ordo::field("y", p.y));
}

auto fields(const point64_t& p) {
    return std::make_tuple(ordo::field("x", p.x), ordo::field("y", p.y));
}

struct compound_t {
    std::pair<point_t, point_t> points;
    std::vector<point64_t> more_points;

    auto operator==(const compound_t&) const -> bool = default;
};

auto fields(compound_t& c) {
    return std::make_tuple(
        ordo::field("points", c.points),
        ordo::field("more_points", c.more_points)
    );
}

auto fields(const compound_t& c) {
    return std::make_tuple(
        ordo::field("points", c.points),
        ordo::field("more_points", c.more_points)
    );
}

// A vector that is not the last thing consumed
struct misplaced_sequence_t {
    std::vector<std::int32_t> items;
    std::int32_t count = 0;
};

auto fields(misplaced_sequence_t& m) {
    return std::make_tuple(ordo::field("items", m.items), ordo::field("count", m.count));
}

struct labelled_t {
    std::int32_t id = 0;
    std::string label;
};

auto fields(labelled_t& l) {
    return std::make_tuple(ordo::field("id", l.id), ordo::field("label", l.label));
}

struct empty_t {
    auto operator==(const empty_t&) const -> bool = default;
};

auto fields(empty_t&) {
    return std::make_tuple();
}

auto fields(const empty_t&) {
    return std::make_tuple();
}

struct sample_t {
    scalar_value tag;
    std::array<std::int64_t, 2> range{};

    auto operator==(const sample_t&) const -> bool = default;
};

auto fields(sample_t& s) {
    return std::make_tuple(ordo::field("tag", s.tag), ordo::field("range", s.range));
}

auto fields(const sample_t& s) {
    return std::make_tuple(ordo::field("tag", s.tag), ordo::field("range", s.range));
}

// =============================================================================
// Helpers
// =============================================================================

template<typename E, typename F>
auto throws(F&& f) -> bool {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

template<typename T>
auto error_kind_of(const std::vector<scalar_value>& input) -> std::optional<ordo::error_kind> {
    try {
        ordo::construct<T>(input);
    } catch (const ordo::error& e) {
        return e.kind();
    }
    return std::nullopt;
}

auto make_compound_input() -> std::vector<scalar_value> {
    return {i32(1), i32(2), i32(3), i32(4), i64(5), i64(6)};
}

// =============================================================================
// Matching shapes
// =============================================================================

void test_flat_struct() {
    auto input = std::vector{i32(1), i32(2)};
    auto p = ordo::construct<point_t>(input);
    assert((p == point_t{1, 2}));

    auto input64 = std::vector{i64(1), i64(2)};
    auto q = ordo::construct<point64_t>(input64);
    assert((q == point64_t{1, 2}));

    std::cout << "test_flat_struct: PASSED\n";
}

void test_nested_composition() {
    auto input = make_compound_input();
    auto c = ordo::construct<compound_t>(input);

    auto expected = compound_t{{{1, 2}, {3, 4}}, {{5, 6}}};
    assert(c == expected);

    std::cout << "test_nested_composition: PASSED\n";
}

void test_tuples_and_arrays() {
    auto input = std::vector{i32(1), i64(2), i32(3), i32(4), i64(5), i64(6)};
    using target_t = std::tuple<std::int32_t, std::int64_t, point_t, std::array<std::int64_t, 2>>;
    auto t = ordo::construct<target_t>(input);

    assert(std::get<0>(t) == 1);
    assert(std::get<1>(t) == 2);
    assert((std::get<2>(t) == point_t{3, 4}));
    assert(std::get<3>(t)[0] == 5);
    assert(std::get<3>(t)[1] == 6);

    std::cout << "test_tuples_and_arrays: PASSED\n";
}

void test_sequence_runs_to_end() {
    auto input = std::vector{i32(1), i32(2), i32(3), i32(4), i32(5), i32(6)};

    auto points = ordo::construct<std::vector<point_t>>(input);
    assert(points.size() == 3);
    assert((points[2] == point_t{5, 6}));

    auto numbers = ordo::construct<std::vector<std::int32_t>>(input);
    assert(numbers.size() == 6);
    assert(numbers[5] == 6);

    auto none = ordo::construct<std::vector<point_t>>(std::vector<scalar_value>{});
    assert(none.empty());

    std::cout << "test_sequence_runs_to_end: PASSED\n";
}

void test_sequence_partial_element() {
    // The last element is only half present
    auto input = std::vector{i64(5), i64(6), i64(7)};
    assert(error_kind_of<std::vector<point64_t>>(input) == ordo::error_kind::end_of_input);

    std::cout << "test_sequence_partial_element: PASSED\n";
}

void test_kind_inference() {
    auto input = std::vector{i64(9), i32(1), i32(2)};

    auto s = ordo::construct<std::vector<scalar_value>>(input);
    assert(s == input);

    auto mixed = std::vector{i32(4), i64(10), i64(20)};
    auto sample = ordo::construct<sample_t>(mixed);
    assert(sample.tag == i32(4));
    assert(sample.range[0] == 10);
    assert(sample.range[1] == 20);

    std::cout << "test_kind_inference: PASSED\n";
}

void test_empty_aggregate() {
    auto e = ordo::construct<empty_t>(std::vector<scalar_value>{});
    assert(e == empty_t{});

    assert(error_kind_of<empty_t>(std::vector{i32(1)}) == ordo::error_kind::trailing_input);

    std::cout << "test_empty_aggregate: PASSED\n";
}

// =============================================================================
// Failures
// =============================================================================

void test_kind_strictness() {
    auto input = std::vector{i32(1), i32(2)};
    assert(error_kind_of<point64_t>(input) == ordo::error_kind::type_mismatch);

    auto input64 = std::vector{i64(1), i64(2)};
    assert(error_kind_of<point_t>(input64) == ordo::error_kind::type_mismatch);

    // Mismatch deep inside the compound: the sequence wants i64
    auto wrong = std::vector{i32(1), i32(2), i32(3), i32(4), i32(5), i32(6)};
    try {
        ordo::construct<compound_t>(wrong);
        assert(false);
    } catch (const ordo::type_mismatch& e) {
        assert(e.position() == 4);
        assert(e.expected() == ordo::scalar_kind::i64);
        assert(e.found() == ordo::scalar_kind::i32);
    }

    std::cout << "test_kind_strictness: PASSED\n";
}

void test_trailing_input() {
    auto input = std::vector{i32(1), i32(2), i32(3)};
    try {
        ordo::construct<point_t>(input);
        assert(false);
    } catch (const ordo::trailing_input& e) {
        assert(e.kind() == ordo::error_kind::trailing_input);
        assert(e.position() == 2);
        assert(e.remaining() == 1);
        assert(std::string(e.what()) == "unexpected input remaining: 2 of 3 tokens consumed");
    }

    std::cout << "test_trailing_input: PASSED\n";
}

void test_empty_input() {
    auto input = std::vector<scalar_value>{};
    assert(error_kind_of<point_t>(input) == ordo::error_kind::end_of_input);
    assert(error_kind_of<compound_t>(input) == ordo::error_kind::end_of_input);
    assert(error_kind_of<std::int32_t>(input) == ordo::error_kind::end_of_input);
    assert(error_kind_of<scalar_value>(input) == ordo::error_kind::end_of_input);

    std::cout << "test_empty_input: PASSED\n";
}

void test_short_input() {
    auto input = std::vector{i32(1), i32(2), i32(3)};
    try {
        ordo::construct<std::pair<point_t, point_t>>(input);
        assert(false);
    } catch (const ordo::end_of_input& e) {
        assert(e.position() == 3);
    }

    std::cout << "test_short_input: PASSED\n";
}

void test_misplaced_sequence() {
    auto input = std::vector{i32(1), i32(2), i32(3)};
    assert(error_kind_of<misplaced_sequence_t>(input) == ordo::error_kind::unsupported);
    assert(error_kind_of<std::vector<std::vector<std::int32_t>>>(input) == ordo::error_kind::unsupported);
    assert((error_kind_of<std::tuple<std::vector<std::int32_t>, std::int32_t>>(input)
            == ordo::error_kind::unsupported));

    // Rejected before anything is consumed
    try {
        ordo::construct<misplaced_sequence_t>(input);
        assert(false);
    } catch (const ordo::unsupported& e) {
        assert(e.position() == 0);
    }

    std::cout << "test_misplaced_sequence: PASSED\n";
}

void test_unsupported_shapes() {
    auto input = std::vector{i32(1), i32(2)};
    assert(error_kind_of<std::string>(input) == ordo::error_kind::unsupported);
    assert(error_kind_of<double>(input) == ordo::error_kind::unsupported);
    assert(error_kind_of<bool>(input) == ordo::error_kind::unsupported);
    assert(error_kind_of<std::uint32_t>(input) == ordo::error_kind::unsupported);
    assert(error_kind_of<std::int16_t>(input) == ordo::error_kind::unsupported);
    assert(error_kind_of<std::optional<std::int32_t>>(input) == ordo::error_kind::unsupported);
    assert((error_kind_of<std::map<std::int32_t, std::int32_t>>(input) == ordo::error_kind::unsupported));
    assert((error_kind_of<std::variant<std::int32_t, std::int64_t>>(input) == ordo::error_kind::unsupported));

    try {
        ordo::construct<labelled_t>(input);
        assert(false);
    } catch (const ordo::unsupported& e) {
        assert(e.position() == 1);
        assert(std::string(e.what()) == "unsupported target at token 1: string");
    }

    std::cout << "test_unsupported_shapes: PASSED\n";
}

void test_errors_are_runtime_errors() {
    auto input = std::vector{i32(1)};
    assert(throws<std::runtime_error>([&] { ordo::construct<point_t>(input); }));
    assert(throws<ordo::error>([&] { ordo::construct<point64_t>(input); }));

    std::cout << "test_errors_are_runtime_errors: PASSED\n";
}

// =============================================================================
// Backend pieces driven directly
// =============================================================================

void test_sequence_sources_share_cursor() {
    auto input = std::vector{i32(1), i32(2), i32(3), i32(4)};
    auto c = ordo::cursor(input);
    auto d = ordo::deserializer(c);

    auto first = d.begin_tuple();
    auto second = d.begin_tuple();

    auto a = point_t{};
    auto b = point_t{};
    assert(first.next_element(a));
    assert(c.position() == 2);
    assert(second.next_element(b));
    assert(c.position() == 4);
    assert((a == point_t{1, 2}));
    assert((b == point_t{3, 4}));

    auto extra = std::int32_t{0};
    assert(!first.next_element(extra));
    assert(c.position() == 4);

    std::cout << "test_sequence_sources_share_cursor: PASSED\n";
}

void test_read_any_visitor() {
    auto input = std::vector{i64(40), i32(2)};
    auto c = ordo::cursor(input);
    auto d = ordo::deserializer(c);

    auto widen = [](auto v) { return static_cast<std::int64_t>(v); };
    auto total = d.read_any(widen) + d.read_any(widen);
    assert(total == 42);
    assert(c.at_end());

    std::cout << "test_read_any_visitor: PASSED\n";
}

void test_log_output() {
    auto input = std::vector{i32(1), i32(2)};
    auto log = std::ostringstream{};
    ordo::construct<point_t>(input, log);

    auto text = log.str();
    assert(text.find("construct from 2 tokens") != std::string::npos);
    assert(text.find("take i32:1 at 0") != std::string::npos);
    assert(text.find("take i32:2 at 1") != std::string::npos);
    assert(text.find("construct complete") != std::string::npos);

    auto failed = std::ostringstream{};
    assert(throws<ordo::type_mismatch>([&] { ordo::construct<point64_t>(input, failed); }));
    assert(failed.str().find("error: type mismatch at token 0") != std::string::npos);

    std::cout << "test_log_output: PASSED\n";
}

// =============================================================================
// Write direction
// =============================================================================

void test_flatten() {
    auto c = compound_t{{{1, 2}, {3, 4}}, {{5, 6}, {7, 8}}};
    auto tokens = ordo::flatten(c);
    auto expected = std::vector{i32(1), i32(2), i32(3), i32(4), i64(5), i64(6), i64(7), i64(8)};
    assert(tokens == expected);
    assert(ordo::construct<compound_t>(tokens) == c);

    auto s = sample_t{i64(3), {{-1, 1}}};
    assert(ordo::construct<sample_t>(ordo::flatten(s)) == s);

    assert(ordo::flatten(empty_t{}).empty());
    assert(throws<ordo::unsupported>([] { ordo::flatten(std::string("x")); }));

    std::cout << "test_flatten: PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Matching Shapes ===\n\n";

    test_flat_struct();
    test_nested_composition();
    test_tuples_and_arrays();
    test_sequence_runs_to_end();
    test_sequence_partial_element();
    test_kind_inference();
    test_empty_aggregate();

    std::cout << "\n=== Failures ===\n\n";

    test_kind_strictness();
    test_trailing_input();
    test_empty_input();
    test_short_input();
    test_misplaced_sequence();
    test_unsupported_shapes();
    test_errors_are_runtime_errors();

    std::cout << "\n=== Backend ===\n\n";

    test_sequence_sources_share_cursor();
    test_read_any_visitor();
    test_log_output();

    std::cout << "\n=== Write Direction ===\n\n";

    test_flatten();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
