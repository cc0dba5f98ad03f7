#include "chunkvault/config.hpp"

#include "chunkvault/env.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/fileio.hpp"

#include <limits>

namespace chunkvault::config {

namespace {

std::string ResolveKey(const std::string& inline_value,
                       const std::string& file,
                       std::string_view inline_var,
                       std::string_view file_var) {
    if (!inline_value.empty()) {
        return inline_value;
    }
    if (!file.empty()) {
        try {
            std::string text = fileio::ReadText(file);
            if (!text.empty()) {
                return text;
            }
        } catch (const StorageError& exc) {
            throw ConfigurationError(std::string(file_var) + ": " + exc.what());
        }
        throw ConfigurationError(std::string(file_var) + " points at an empty file: " + file);
    }
    throw ConfigurationError("Set " + std::string(inline_var) + " or " + std::string(file_var));
}

}  // namespace

Config LoadConfig() {
    Config config;
    config.public_key = env::Get(constants::kEnvPublicKey);
    config.public_key_file = env::Get(constants::kEnvPublicKeyFile);
    config.private_key = env::Get(constants::kEnvPrivateKey);
    config.private_key_file = env::Get(constants::kEnvPrivateKeyFile);
    if (auto value = env::GetUnsigned(constants::kEnvMaxArtifactSize)) {
        config.limits.max_artifact_size = *value;
    }
    if (auto value = env::GetUnsigned(constants::kEnvChunkSize)) {
        config.limits.chunk_size = *value;
    }
    std::string algo = env::Get(constants::kEnvCompression);
    if (!algo.empty()) {
        config.compression = compression::FromName(algo);
    }
    if (auto value = env::GetUnsigned(constants::kEnvCompressionLevel)) {
        if (*value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw ConfigurationError(std::string(constants::kEnvCompressionLevel) + " is out of range");
        }
        config.compression_level = static_cast<int>(*value);
    }
    if (auto value = env::GetUnsigned(constants::kEnvWorkers)) {
        config.workers = static_cast<std::size_t>(*value);
    }
    if (auto value = env::GetUnsigned(constants::kEnvCacheBytes)) {
        config.cache_bytes = *value;
    }
    return config;
}

void Validate(const Config& config) {
    if (config.limits.max_artifact_size == 0) {
        throw ConfigurationError("Maximum artifact size must be positive");
    }
    if (config.limits.chunk_size == 0) {
        throw ConfigurationError("Chunk size must be positive");
    }
    if (config.limits.chunk_size > config.limits.max_artifact_size) {
        throw ConfigurationError("Chunk size " + std::to_string(config.limits.chunk_size)
                                 + " exceeds the maximum artifact size "
                                 + std::to_string(config.limits.max_artifact_size));
    }
    if (!compression::IsAvailable(config.compression)) {
        throw ConfigurationError("Compression " + compression::Name(config.compression)
                                 + " is not available in this build");
    }
    int max_level = compression::MaxLevel(config.compression);
    if (config.compression_level < 0 || config.compression_level > max_level) {
        throw ConfigurationError("Compression level must be between 0 and " + std::to_string(max_level));
    }
}

std::string RequirePublicKey(const Config& config) {
    return ResolveKey(config.public_key, config.public_key_file, constants::kEnvPublicKey,
                      constants::kEnvPublicKeyFile);
}

std::string RequirePrivateKey(const Config& config) {
    return ResolveKey(config.private_key, config.private_key_file, constants::kEnvPrivateKey,
                      constants::kEnvPrivateKeyFile);
}

std::optional<std::string> HeadroomWarning(const Config& config) {
    std::uint64_t worst = planner::WorstCaseArtifactSize(config.limits.chunk_size, config.compression);
    if (worst <= config.limits.max_artifact_size) {
        return std::nullopt;
    }
    return "Chunk size " + std::to_string(config.limits.chunk_size) + " can encode to " + std::to_string(worst)
           + " bytes, above the " + std::to_string(config.limits.max_artifact_size)
           + " byte ceiling; incompressible chunks will fail";
}

}  // namespace chunkvault::config
