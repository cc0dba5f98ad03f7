#include "chunkvault/codec.hpp"

#include "chunkvault/envelope.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/format.hpp"

#include <stdexcept>

namespace chunkvault::codec {

EncodedChunk Encode(const std::uint8_t* data,
                    std::size_t size,
                    const std::string& public_key,
                    const CodecOptions& options) {
    try {
        EncodedChunk out;
        out.plaintext_hash = crypto::Sha256(data, size);
        Bytes packed = compression::Compress(data, size, options.compression, options.level);

        envelope::KemResult kem = envelope::KemEncrypt(public_key);
        format::ArtifactHeader header;
        header.version = constants::kArtifactVersion;
        header.compression = options.compression;
        header.ephemeral_public = kem.ephemeral_public;
        Bytes header_bytes = format::EncodeHeader(header);

        Bytes nonce = crypto::RandomBytes(constants::kAeadNonceLen);
        Bytes sealed = crypto::AesGcmEncryptWithIv(kem.key, nonce, packed.data(), packed.size(), header_bytes);
        out.artifact = format::AssembleArtifact(header_bytes, nonce, sealed);
        return out;
    } catch (const Error&) {
        throw;
    } catch (const std::exception& exc) {
        throw EncodeError(std::string("Chunk encode failed: ") + exc.what());
    }
}

Bytes Decode(const Bytes& artifact, const std::string& private_key, std::size_t max_plaintext) {
    Bytes packed;
    compression::Compression algo = compression::Compression::Zlib;
    try {
        format::ArtifactView view = format::ParseArtifact(artifact);
        algo = view.header.compression;
        Bytes key = envelope::KemDecrypt(private_key, view.header.ephemeral_public);
        packed = crypto::AesGcmDecryptWithIv(key, view.nonce, view.sealed, view.sealed_len, view.header_bytes);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& exc) {
        throw DecodeError(std::string("Chunk decrypt failed: ") + exc.what());
    }
    try {
        return compression::Decompress(packed, algo, max_plaintext);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& exc) {
        throw DecodeError(std::string("Chunk decompress failed: ") + exc.what());
    }
}

compression::Compression PeekCompression(const Bytes& artifact) {
    try {
        return format::ParseArtifact(artifact).header.compression;
    } catch (const std::exception& exc) {
        throw DecodeError(std::string("Artifact header unreadable: ") + exc.what());
    }
}

}  // namespace chunkvault::codec
