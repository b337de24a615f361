#include "utils.hpp"
#include <cerrno>
#include <cstdlib>

std::optional<long> parse_int_strict(const std::string& s) {
    std::string text = trimmed(s);
    if (text.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return value;
}
