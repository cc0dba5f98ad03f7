#include "chunkvault/format.hpp"

#include "chunkvault/constants.hpp"

#include <algorithm>
#include <stdexcept>

namespace chunkvault::format {

namespace {

constexpr std::size_t kMagicLen = constants::kArtifactMagic.size();
constexpr std::size_t kVersionOffset = kMagicLen;
constexpr std::size_t kCompressionOffset = kVersionOffset + 1;
constexpr std::size_t kReservedOffset = kCompressionOffset + 1;
constexpr std::size_t kEphemeralOffset = kReservedOffset + 2;

static_assert(kEphemeralOffset + constants::kX25519KeyLen == constants::kArtifactHeaderLen,
              "Artifact header layout mismatch");

}  // namespace

Bytes EncodeHeader(const ArtifactHeader& header) {
    if (header.ephemeral_public.size() != constants::kX25519KeyLen) {
        throw std::runtime_error("Ephemeral public key must be 32 bytes");
    }
    Bytes out;
    out.reserve(constants::kArtifactHeaderLen);
    out.insert(out.end(), constants::kArtifactMagic.begin(), constants::kArtifactMagic.end());
    out.push_back(header.version);
    out.push_back(static_cast<std::uint8_t>(header.compression));
    out.push_back(0);
    out.push_back(0);
    out.insert(out.end(), header.ephemeral_public.begin(), header.ephemeral_public.end());
    return out;
}

Bytes AssembleArtifact(const Bytes& header_bytes, const Bytes& nonce, const Bytes& sealed) {
    Bytes out;
    out.reserve(header_bytes.size() + nonce.size() + sealed.size());
    out.insert(out.end(), header_bytes.begin(), header_bytes.end());
    out.insert(out.end(), nonce.begin(), nonce.end());
    out.insert(out.end(), sealed.begin(), sealed.end());
    return out;
}

bool HasArtifactMagic(const Bytes& data) {
    return data.size() >= kMagicLen
           && std::equal(constants::kArtifactMagic.begin(), constants::kArtifactMagic.end(), data.begin());
}

ArtifactView ParseArtifact(const Bytes& artifact) {
    if (artifact.size() < constants::kArtifactOverhead) {
        throw std::runtime_error("Artifact too short");
    }
    if (!HasArtifactMagic(artifact)) {
        throw std::runtime_error("Artifact has bad magic");
    }
    ArtifactView view;
    view.header.version = artifact[kVersionOffset];
    if (view.header.version != constants::kArtifactVersion) {
        throw std::runtime_error("Unsupported artifact version " + std::to_string(view.header.version));
    }
    view.header.compression = compression::FromId(artifact[kCompressionOffset]);
    if (artifact[kReservedOffset] != 0 || artifact[kReservedOffset + 1] != 0) {
        throw std::runtime_error("Artifact reserved bytes are not zero");
    }
    auto begin = artifact.begin();
    view.header.ephemeral_public.assign(begin + kEphemeralOffset, begin + constants::kArtifactHeaderLen);
    view.header_bytes.assign(begin, begin + constants::kArtifactHeaderLen);
    view.nonce.assign(begin + constants::kArtifactHeaderLen,
                      begin + constants::kArtifactHeaderLen + constants::kAeadNonceLen);
    std::size_t sealed_offset = constants::kArtifactHeaderLen + constants::kAeadNonceLen;
    view.sealed = artifact.data() + sealed_offset;
    view.sealed_len = artifact.size() - sealed_offset;
    return view;
}

}  // namespace chunkvault::format
