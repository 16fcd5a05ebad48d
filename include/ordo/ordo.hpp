#pragma once

// ============================================================================
// Ordo - typed values from a flat stream of kind-tagged scalars
// ============================================================================
//
// The input is an ordered sequence of scalar_value tokens (i32 or i64).
// The target type decides how they are grouped:
// - std::int32_t / std::int64_t take one token of exactly that kind
// - scalar_value takes one token of either kind
// - structs with ADL fields(), std::tuple, std::pair and std::array take
//   their members in declaration order
// - std::vector takes elements until the input runs out, so it must be the
//   last thing the target consumes
// Any token left over afterwards is an error.
//
// Basic usage:
//
//   #include "ordo/ordo.hpp"
//
//   struct point_t {
//       std::int32_t x = 0;
//       std::int32_t y = 0;
//   };
//
//   auto fields(point_t& p) {
//       return std::make_tuple(ordo::field("x", p.x), ordo::field("y", p.y));
//   }
//   auto fields(const point_t& p) {
//       return std::make_tuple(ordo::field("x", p.x), ordo::field("y", p.y));
//   }
//
//   auto tokens = std::vector{ordo::i32(1), ordo::i32(2)};
//   auto p = ordo::construct<point_t>(tokens);      // {1, 2}
//   auto back = ordo::flatten(p);                   // [i32:1, i32:2]
//
// Failures throw ordo::error subclasses: end_of_input, type_mismatch,
// trailing_input, unsupported.
//
// ============================================================================

#include "config.hpp"
#include "cursor.hpp"
#include "deserializer.hpp"
#include "error.hpp"
#include "protocol.hpp"
#include "scalar.hpp"
#include "sequence.hpp"
#include "sink.hpp"
