#include "bench/cli_args.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

double parse_number_arg(const std::string& s)
{
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || s.empty() || end != s.c_str() + s.size() || !std::isfinite(v) || v < 0) {
        throw std::invalid_argument("expected a non-negative number, got '" + s + "'");
    }
    return v;
}

std::size_t parse_count_arg(const std::string& s, std::size_t max)
{
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("expected a whole number, got '" + s + "'");
    }
    errno = 0;
    const unsigned long long n = std::strtoull(s.c_str(), nullptr, 10);
    if (errno == ERANGE || n == 0 || n > max) {
        throw std::invalid_argument("count '" + s + "' is outside [1, " + std::to_string(max) + "]");
    }
    return static_cast<std::size_t>(n);
}
