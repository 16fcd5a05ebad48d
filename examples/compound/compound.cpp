#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "ordo/ordo.hpp"

using namespace ordo;

// =============================================================================
// Example schemas
// =============================================================================

struct point_t {
    std::int32_t x = 0;
    std::int32_t y = 0;
};

inline auto fields(const point_t& p) {
    return std::make_tuple(field("x", p.x), field("y", p.y));
}

inline auto fields(point_t& p) {
    return std::make_tuple(field("x", p.x), field("y", p.y));
}

struct point64_t {
    std::int64_t x = 0;
    std::int64_t y = 0;
};

inline auto fields(const point64_t& p) {
    return std::make_tuple(field("x", p.x), field("y", p.y));
}

inline auto fields(point64_t& p) {
    return std::make_tuple(field("x", p.x), field("y", p.y));
}

struct compound_t {
    std::pair<point_t, point_t> points;
    std::vector<point64_t> more_points;
};

inline auto fields(const compound_t& c) {
    return std::make_tuple(
        field("points", c.points),
        field("more_points", c.more_points)
    );
}

inline auto fields(compound_t& c) {
    return std::make_tuple(
        field("points", c.points),
        field("more_points", c.more_points)
    );
}

// =============================================================================
// Printing
// =============================================================================

auto describe(const point_t& p) -> std::string {
    return "{x: " + std::to_string(p.x) + ", y: " + std::to_string(p.y) + "}";
}

auto describe(const point64_t& p) -> std::string {
    return "{x: " + std::to_string(p.x) + ", y: " + std::to_string(p.y) + "}";
}

auto describe(const compound_t& c) -> std::string {
    auto s = "{points: (" + describe(c.points.first) + ", " + describe(c.points.second) + "), more_points: [";
    for (std::size_t i = 0; i < c.more_points.size(); ++i) {
        if (i > 0) s += ", ";
        s += describe(c.more_points[i]);
    }
    return s + "]}";
}

template<typename T>
void build_and_print(const std::vector<scalar_value>& tokens, bool trace) {
    auto value = trace ? construct<T>(tokens, std::cerr) : construct<T>(tokens);
    std::cout << describe(value) << "\n";

    std::cout << "flattened:";
    for (const auto& token : flatten(value)) {
        std::cout << " " << token;
    }
    std::cout << "\n";
}

// =============================================================================
// Options
// =============================================================================

struct options_t {
    std::string schema = "compound";
    std::string tokens = "i32:1 i32:2 i32:3 i32:4 i64:5 i64:6";
    bool trace = false;
};

inline auto fields(options_t& o) {
    return std::make_tuple(
        field("schema", o.schema),
        field("tokens", o.tokens),
        field("trace", o.trace)
    );
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [schema=point|point64|compound] [trace=true] [tokens...]\n";
    std::cerr << "Tokens are <kind>:<value> with kind i32 or i64, e.g. i32:1 i64:5\n";
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    auto options = options_t{};

    try {
        auto positional = apply_overrides(options, argc, argv);
        if (!positional.empty()) {
            options.tokens.clear();
            for (const auto& arg : positional) {
                options.tokens += arg + " ";
            }
        }

        auto tokens = parse_tokens(options.tokens);
        std::cout << "schema: " << options.schema << ", " << tokens.size() << " tokens\n";

        if (options.schema == "point") {
            build_and_print<point_t>(tokens, options.trace);
        } else if (options.schema == "point64") {
            build_and_print<point64_t>(tokens, options.trace);
        } else if (options.schema == "compound") {
            build_and_print<compound_t>(tokens, options.trace);
        } else {
            std::cerr << "Error: unknown schema '" << options.schema << "'\n";
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
