#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace chunkvault::constants {

inline constexpr std::string_view kVersion = "1.0.0";

inline constexpr std::uint64_t kDefaultMaxArtifactSize = 100ull * 1024ull * 1024ull;
inline constexpr std::uint64_t kDefaultChunkSize = 10ull * 1024ull * 1024ull;
inline constexpr int kDefaultCompressionLevel = 9;

inline constexpr std::size_t kDigestLen = 32;
inline constexpr std::size_t kX25519KeyLen = 32;
inline constexpr std::size_t kAeadKeyLen = 32;
inline constexpr std::size_t kAeadNonceLen = 12;
inline constexpr std::size_t kAeadTagLen = 16;

// magic(4) + version(1) + compression(1) + reserved(2) + ephemeral key(32)
inline constexpr std::size_t kArtifactHeaderLen = 4 + 1 + 1 + 2 + kX25519KeyLen;
inline constexpr std::size_t kArtifactOverhead = kArtifactHeaderLen + kAeadNonceLen + kAeadTagLen;
inline constexpr std::string_view kArtifactMagic = "CVA1";
inline constexpr std::uint8_t kArtifactVersion = 1;

inline constexpr std::string_view kArtifactKdfInfo = "chunkvault.artifact.v1";

inline constexpr std::string_view kPublicKeyPrefix = "cvpk-";
inline constexpr std::string_view kPrivateKeyPrefix = "cvsk-";

inline constexpr int kManifestVersion = 1;
inline constexpr std::string_view kManifestSuffix = ".manifest.json";
inline constexpr std::string_view kArtifactSuffix = ".cva";
inline constexpr std::string_view kTempSuffix = ".tmp";

inline constexpr std::string_view kEnvPublicKey = "CHUNKVAULT_PUBLIC_KEY";
inline constexpr std::string_view kEnvPublicKeyFile = "CHUNKVAULT_PUBLIC_KEY_FILE";
inline constexpr std::string_view kEnvPrivateKey = "CHUNKVAULT_PRIVATE_KEY";
inline constexpr std::string_view kEnvPrivateKeyFile = "CHUNKVAULT_PRIVATE_KEY_FILE";
inline constexpr std::string_view kEnvMaxArtifactSize = "CHUNKVAULT_MAX_ARTIFACT_SIZE";
inline constexpr std::string_view kEnvChunkSize = "CHUNKVAULT_CHUNK_SIZE";
inline constexpr std::string_view kEnvCompression = "CHUNKVAULT_COMPRESSION";
inline constexpr std::string_view kEnvCompressionLevel = "CHUNKVAULT_COMPRESSION_LEVEL";
inline constexpr std::string_view kEnvWorkers = "CHUNKVAULT_WORKERS";
inline constexpr std::string_view kEnvCacheBytes = "CHUNKVAULT_CACHE_BYTES";

}  // namespace chunkvault::constants
