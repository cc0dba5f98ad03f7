#pragma once

#include "chunkvault/compression.hpp"
#include "chunkvault/constants.hpp"
#include "chunkvault/planner.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace chunkvault::config {

struct Config {
    std::string public_key;
    std::string public_key_file;
    std::string private_key;
    std::string private_key_file;
    planner::SizeLimits limits;
    compression::Compression compression = compression::Compression::Zlib;
    int compression_level = constants::kDefaultCompressionLevel;
    std::size_t workers = 0;
    std::uint64_t cache_bytes = 0;
};

// Reads CHUNKVAULT_* variables. Unparsable values raise ConfigurationError.
Config LoadConfig();

void Validate(const Config& config);

// Inline key text wins over the key file. Missing or unreadable keys raise
// ConfigurationError.
std::string RequirePublicKey(const Config& config);
std::string RequirePrivateKey(const Config& config);

// Set when a full chunk of incompressible data could encode past the ceiling.
std::optional<std::string> HeadroomWarning(const Config& config);

}  // namespace chunkvault::config
