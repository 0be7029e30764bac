#pragma once

#include "geometry.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sl {

// Whole-string numeric parsing. Throws std::invalid_argument on trailing
// characters, std::out_of_range when the value does not fit.
int parse_int(const std::string& text);
std::uint64_t parse_u64(const std::string& text);

// Parses "X,Y,R" with finite coordinates and R >= 0.
std::optional<Circle> parse_circle(const std::string& text);

} // namespace sl
