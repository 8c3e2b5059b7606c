#include "utils.hpp"
#include "liblaminar.h"
#include "Log.hpp"

#include <cstdarg>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

void
confess_at(const char *file, int line, const char *func,
            const char *pat, ...)
{
    char buf[1024];
    va_list args;
    va_start(args, pat);
    vsnprintf(buf, sizeof(buf), pat, args);
    va_end(args);

    std::stringstream ss;
    ss << "Error in function " << func << " at " << file << ":" << line << ": " << buf;

    Laminar::Log::error(std::string("liblaminar"), ss.str());
    throw std::runtime_error(ss.str());
}

std::string trim_zeroes(std::string in) {
    if (in.find('.') == std::string::npos) return in;
    size_t end = in.find_last_not_of('0');
    if (in[end] == '.') --end;
    in.erase(end + 1);
    return in;
}

std::string to_string_nozero(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    std::string out = trim_zeroes(ss.str());
    if (out == "-0") out = "0";
    return out;
}
