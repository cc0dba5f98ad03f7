#pragma once

#include "chunkvault/constants.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault {

using Bytes = std::vector<std::uint8_t>;
using Digest = std::array<std::uint8_t, constants::kDigestLen>;

}  // namespace chunkvault

namespace chunkvault::crypto {

Bytes RandomBytes(std::size_t size);
Bytes HkdfSha256(const Bytes& key_material, std::string_view info, std::size_t length);

// Output is ciphertext followed by the 16-byte tag.
Bytes AesGcmEncryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* plaintext,
                          std::size_t plaintext_len,
                          const Bytes& aad);
// Input is ciphertext followed by the tag; throws when authentication fails.
Bytes AesGcmDecryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* blob,
                          std::size_t blob_len,
                          const Bytes& aad);

Digest Sha256(const std::uint8_t* data, std::size_t size);
inline Digest Sha256(const Bytes& data) {
    return Sha256(data.data(), data.size());
}

std::string HexEncode(const std::uint8_t* data, std::size_t size);
inline std::string HexEncode(const Digest& digest) {
    return HexEncode(digest.data(), digest.size());
}
bool HexDecode(std::string_view hex, Digest& out);

std::string Base64Encode(const Bytes& data);
Bytes Base64Decode(std::string_view text, bool* ok = nullptr);

}  // namespace chunkvault::crypto
