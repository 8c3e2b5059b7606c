#ifndef laminar_utils_hpp_
#define laminar_utils_hpp_

#include <string>

/// Small string helpers used across liblaminar.

/// Remove trailing zeroes (and a dangling decimal point) from a formatted number.
std::string trim_zeroes(std::string in);

/// Format a number with a fixed precision and strip trailing zeroes.
/// "-0" is printed as "0".
std::string to_string_nozero(double value, int precision);

#endif // laminar_utils_hpp_
