#pragma once

#include "chunkvault/compression.hpp"
#include "chunkvault/constants.hpp"
#include "chunkvault/crypto.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace chunkvault::codec {

struct CodecOptions {
    compression::Compression compression = compression::Compression::Zlib;
    int level = constants::kDefaultCompressionLevel;
};

struct EncodedChunk {
    Bytes artifact;
    Digest plaintext_hash{};
};

// hash -> compress -> seal. Any failure raises EncodeError; a bad public key
// surfaces as ConfigurationError.
EncodedChunk Encode(const std::uint8_t* data,
                    std::size_t size,
                    const std::string& public_key,
                    const CodecOptions& options = {});
inline EncodedChunk Encode(const Bytes& plaintext,
                           const std::string& public_key,
                           const CodecOptions& options = {}) {
    return Encode(plaintext.data(), plaintext.size(), public_key, options);
}

// open -> decompress. Wrong key, tampering or a malformed stream raise
// DecodeError. Output larger than `max_plaintext` is treated as malformed.
Bytes Decode(const Bytes& artifact,
             const std::string& private_key,
             std::size_t max_plaintext = std::numeric_limits<std::size_t>::max());

// Header fields readable without the private key.
compression::Compression PeekCompression(const Bytes& artifact);

}  // namespace chunkvault::codec
