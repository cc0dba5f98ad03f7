#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace chunkvault {

// Root of every failure the library reports. Nothing derived from Error is
// retried internally; callers decide whether re-fetching bytes is worthwhile.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Missing key material or invalid size / compression parameters.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message) : Error(message) {}
};

// Compression or encryption failed on the write path.
class EncodeError : public Error {
public:
    explicit EncodeError(const std::string& message) : Error(message) {}
};

// Decryption or decompression failed on the read path.
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message) : Error(message) {}
};

// A decoded chunk does not hash to the digest recorded in the manifest.
class IntegrityError : public Error {
public:
    IntegrityError(std::size_t index, std::string expected, std::string actual);

    std::size_t index() const noexcept { return index_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::size_t index_;
    std::string expected_;
    std::string actual_;
};

// An artifact exceeds the ceiling, or a reconstructed length disagrees with
// the manifest.
class SizeViolationError : public Error {
public:
    explicit SizeViolationError(const std::string& message) : Error(message) {}
};

// The manifest is not self-consistent (index gaps, duplicates, size sums,
// malformed text).
class StructuralError : public Error {
public:
    explicit StructuralError(const std::string& message) : Error(message) {}
};

// Artifact or manifest storage could not be read or written.
class StorageError : public Error {
public:
    explicit StorageError(const std::string& message) : Error(message) {}
};

}  // namespace chunkvault
