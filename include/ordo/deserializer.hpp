#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include "cursor.hpp"
#include "error.hpp"
#include "scalar.hpp"
#include "sequence.hpp"

namespace ordo {

// ============================================================================
// deserializer - the backend the read() overloads drive
// ============================================================================
//
// Wraps the one cursor of a construction and answers the framework's
// requests: a scalar of a stated kind, a scalar of whatever kind the data
// holds, or a source of sub-values for an aggregate.
//
// Tail position: a variable-length sequence has no length prefix and runs
// to the end of the input, so it may only be the last thing the whole
// construction consumes. The top-level target is in tail position, the
// last element of a fixed-arity aggregate inherits its parent's position,
// and every other element is not in tail position.

class deserializer {
public:
    explicit deserializer(cursor& input, std::ostream* log = nullptr)
        : input_(input), log_(log) {}

    deserializer(const deserializer&) = delete;
    deserializer& operator=(const deserializer&) = delete;

    auto input() -> cursor& { return input_; }
    auto position() const -> std::size_t { return input_.position(); }

    // --- Scalars ---

    void read(std::int32_t& value) {
        auto at = input_.position();
        value = input_.take_i32();
        log_take(i32(value), at);
    }

    void read(std::int64_t& value) {
        auto at = input_.position();
        value = input_.take_i64();
        log_take(i64(value), at);
    }

    template <ScalarVisitor V>
    decltype(auto) read_any(V&& visitor) {
        auto at = input_.position();
        return input_.take_any([&](auto v) -> decltype(auto) {
            log_take(scalar_value{v}, at);
            return std::forward<V>(visitor)(v);
        });
    }

    // --- Aggregates ---

    // Source for a tuple or struct; the caller decides how many elements
    auto begin_tuple() -> sequence_source<deserializer> {
        return sequence_source<deserializer>(*this);
    }

    // Source for a sequence that runs to the end of the input
    auto begin_sequence() -> sequence_source<deserializer> {
        if (!tail_) {
            throw unsupported(input_.position(),
                "variable-length sequence must be the last element of the input");
        }
        log("begin sequence at " + std::to_string(input_.position()));
        return sequence_source<deserializer>(*this);
    }

    void end_sequence(std::size_t count) {
        log("end sequence of " + std::to_string(count) + " at " + std::to_string(input_.position()));
    }

    // Run f for one element of an aggregate; last marks its final element
    template <typename F>
    decltype(auto) nested(bool last, F&& f) {
        struct restore_t {
            bool& flag;
            bool saved;
            ~restore_t() { flag = saved; }
        } restore{tail_, tail_};
        tail_ = tail_ && last;
        return std::forward<F>(f)();
    }

    // --- Logging ---

    void log(const std::string& message) {
        if (log_) {
            *log_ << message << "\n";
            log_->flush();
        }
    }

private:
    cursor& input_;
    std::ostream* log_;
    bool tail_ = true;

    void log_take(const scalar_value& value, std::size_t at) {
        if (log_) {
            log("take " + to_string(value) + " at " + std::to_string(at));
        }
    }
};

} // namespace ordo
