#include "chunkvault/env.hpp"

#include "chunkvault/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace chunkvault::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string Trim(const std::string& value) {
    std::size_t start = 0;
    std::size_t end = value.size();
    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::optional<std::uint64_t> GetUnsigned(std::string_view name) {
    std::string raw = Trim(Get(name));
    if (raw.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char ch : raw) {
        if (ch < '0' || ch > '9') {
            throw ConfigurationError(std::string(name) + " must be an unsigned integer, got '" + raw + "'");
        }
        std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            throw ConfigurationError(std::string(name) + " is out of range");
        }
        value = value * 10 + digit;
    }
    return value;
}

}  // namespace chunkvault::env
