#pragma once

#include "chunkvault/compression.hpp"
#include "chunkvault/crypto.hpp"

#include <cstddef>
#include <cstdint>

namespace chunkvault::format {

struct ArtifactHeader {
    std::uint8_t version = 0;
    compression::Compression compression = compression::Compression::Zlib;
    Bytes ephemeral_public;
};

// Borrowed view into an artifact buffer; only valid while that buffer lives.
struct ArtifactView {
    ArtifactHeader header;
    Bytes header_bytes;
    Bytes nonce;
    const std::uint8_t* sealed = nullptr;
    std::size_t sealed_len = 0;
};

Bytes EncodeHeader(const ArtifactHeader& header);
Bytes AssembleArtifact(const Bytes& header_bytes, const Bytes& nonce, const Bytes& sealed);

bool HasArtifactMagic(const Bytes& data);
// Throws std::runtime_error when the framing is malformed.
ArtifactView ParseArtifact(const Bytes& artifact);

}  // namespace chunkvault::format
