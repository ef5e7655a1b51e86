#pragma once
#include <cstddef>
#include <string>

// Positional argument parsers for the bench CLI. Both throw
// std::invalid_argument naming the offending text.

// Finite, non-negative decimal ("2.5", "1e3").
double parse_number_arg(const std::string& s);

// Whole count in [1, max]; fractions, signs and exponents are refused.
std::size_t parse_count_arg(const std::string& s, std::size_t max);
