#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chunkvault::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

// Empty variable yields nullopt; anything that is not a plain unsigned
// decimal throws ConfigurationError naming the variable.
std::optional<std::uint64_t> GetUnsigned(std::string_view name);

}  // namespace chunkvault::env
