#pragma once

// Write side of the token vocabulary: collects the scalars a value
// flattens to, in consumption order.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "scalar.hpp"

namespace ordo {

// ============================================================================
// value_sink - appends scalars to a caller-owned token vector
// ============================================================================

class value_sink {
public:
    explicit value_sink(std::vector<scalar_value>& out) : out_(out) {}

    void write(std::int32_t value) { out_.push_back(i32(value)); }
    void write(std::int64_t value) { out_.push_back(i64(value)); }
    void write(const scalar_value& value) { out_.push_back(value); }

    auto position() const -> std::size_t { return out_.size(); }

private:
    std::vector<scalar_value>& out_;
};

} // namespace ordo
