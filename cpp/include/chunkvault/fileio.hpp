#pragma once

#include "chunkvault/crypto.hpp"

#include <string>

namespace chunkvault::fileio {

// All three throw StorageError naming the path.
Bytes ReadFile(const std::string& path);
std::string ReadText(const std::string& path);
// Writes to "<path>.<random>.tmp" beside the target and renames it into place,
// so readers see either the old file or the complete new one.
void WriteFileAtomic(const std::string& path, const std::uint8_t* data, std::size_t size);
inline void WriteFileAtomic(const std::string& path, const Bytes& data) {
    WriteFileAtomic(path, data.data(), data.size());
}
inline void WriteFileAtomic(const std::string& path, const std::string& text) {
    WriteFileAtomic(path, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

}  // namespace chunkvault::fileio
