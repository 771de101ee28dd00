#include "strata/log.hpp"
#include <cstdarg>
#include <vector>

namespace strata {

void logger::write(log_level l, const char* tag, const std::string& message) const {
    if (sink) {
        sink(l, tag, message);
        return;
    }
    std::fprintf(stderr, "[%s] %s\n", tag, message.c_str());
}

namespace detail {

std::string format_log(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list copy;
    va_copy(copy, args);
    int size = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);

    if (size <= 0) {
        va_end(args);
        return {};
    }

    std::vector<char> buffer(static_cast<size_t>(size) + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);
    return std::string(buffer.data(), static_cast<size_t>(size));
}

} // namespace detail

} // namespace strata
