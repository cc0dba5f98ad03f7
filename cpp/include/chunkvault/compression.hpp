#pragma once

#include "chunkvault/crypto.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace chunkvault::compression {

// Values are written into the artifact header.
enum class Compression : std::uint8_t {
    Zlib = 1,
    Xz = 2
};

bool IsAvailable(Compression algo);
std::string Name(Compression algo);
// Throws ConfigurationError for unknown names or algorithms missing from
// this build.
Compression FromName(const std::string& name);
// Throws std::runtime_error for ids that are not part of the format.
Compression FromId(std::uint8_t id);
int MaxLevel(Compression algo);

// Upper bound on the compressed size of `size` input bytes.
std::uint64_t WorstCaseSize(Compression algo, std::uint64_t size);

// Both throw std::runtime_error on failure. Decompress stops with an error as
// soon as the output would grow past `max_output`.
Bytes Compress(const std::uint8_t* data, std::size_t size, Compression algo, int level);
Bytes Decompress(const Bytes& data,
                 Compression algo,
                 std::size_t max_output = std::numeric_limits<std::size_t>::max());

}  // namespace chunkvault::compression
