#include "chunkvault/crypto.hpp"

#include "chunkvault/crypto_utils.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include <limits>
#include <stdexcept>

namespace chunkvault::crypto {

namespace {

using detail::UniqueCipherCtx;
using detail::UniqueMDCtx;
using detail::UniquePKEYCtx;

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

int CheckedInt(std::size_t size, const char* what) {
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::string(what) + " too large for a single OpenSSL call");
    }
    return static_cast<int>(size);
}

int HexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), CheckedInt(out.size(), "random request")) == 1, "RAND_bytes failed");
    return out;
}

Bytes HkdfSha256(const Bytes& key_material, std::string_view info, std::size_t length) {
    UniquePKEYCtx pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!pctx) {
        throw std::runtime_error("HKDF context allocation failed");
    }
    Bytes out(length);
    std::size_t out_len = out.size();
    Ensure(EVP_PKEY_derive_init(pctx.get()) == 1, "HKDF init failed");
    Ensure(EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) == 1, "HKDF set md failed");
    Ensure(EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), key_material.data(),
                                      CheckedInt(key_material.size(), "HKDF key")) == 1,
           "HKDF set key failed");
    if (!info.empty()) {
        Ensure(EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), reinterpret_cast<const unsigned char*>(info.data()),
                                           CheckedInt(info.size(), "HKDF info")) == 1,
               "HKDF set info failed");
    }
    Ensure(EVP_PKEY_derive(pctx.get(), out.data(), &out_len) == 1, "HKDF derive failed");
    out.resize(out_len);
    return out;
}

Bytes AesGcmEncryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* plaintext,
                          std::size_t plaintext_len,
                          const Bytes& aad) {
    if (key.size() != constants::kAeadKeyLen) {
        throw std::runtime_error("AES-GCM expects 32-byte key");
    }
    if (iv.empty()) {
        throw std::runtime_error("AES-GCM IV is required");
    }
    Bytes out(plaintext_len + constants::kAeadTagLen);

    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int out_len = 0;
    std::size_t total_len = 0;

    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), CheckedInt(aad.size(), "AAD")) == 1,
               "AES-GCM aad failed");
    }
    if (plaintext_len > 0) {
        Ensure(EVP_EncryptUpdate(ctx.get(), out.data(), &out_len, plaintext,
                                 CheckedInt(plaintext_len, "AES-GCM input")) == 1,
               "AES-GCM encrypt failed");
        total_len += static_cast<std::size_t>(out_len);
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1, "AES-GCM final failed");
    total_len += static_cast<std::size_t>(out_len);
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(constants::kAeadTagLen),
                               out.data() + total_len) == 1,
           "AES-GCM get tag failed");
    out.resize(total_len + constants::kAeadTagLen);
    return out;
}

Bytes AesGcmDecryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* blob,
                          std::size_t blob_len,
                          const Bytes& aad) {
    if (key.size() != constants::kAeadKeyLen) {
        throw std::runtime_error("AES-GCM expects 32-byte key");
    }
    if (iv.empty()) {
        throw std::runtime_error("AES-GCM IV is required");
    }
    if (blob_len < constants::kAeadTagLen) {
        throw std::runtime_error("AES-GCM blob too short");
    }
    std::size_t ct_len = blob_len - constants::kAeadTagLen;
    Bytes tag(blob + ct_len, blob + blob_len);
    Bytes plaintext(ct_len);

    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int out_len = 0;
    std::size_t total_len = 0;

    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), CheckedInt(aad.size(), "AAD")) == 1,
               "AES-GCM aad failed");
    }
    if (ct_len > 0) {
        Ensure(EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, blob,
                                 CheckedInt(ct_len, "AES-GCM input")) == 1,
               "AES-GCM decrypt failed");
        total_len += static_cast<std::size_t>(out_len);
    }
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
           "AES-GCM set tag failed");
    Ensure(EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &out_len) == 1,
           "AES-GCM auth failed");
    total_len += static_cast<std::size_t>(out_len);
    plaintext.resize(total_len);
    return plaintext;
}

Digest Sha256(const std::uint8_t* data, std::size_t size) {
    UniqueMDCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("SHA-256 context allocation failed");
    }
    Digest out{};
    unsigned int out_len = 0;
    Ensure(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1, "SHA-256 init failed");
    if (size > 0) {
        Ensure(EVP_DigestUpdate(ctx.get(), data, size) == 1, "SHA-256 update failed");
    }
    Ensure(EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) == 1, "SHA-256 final failed");
    Ensure(out_len == out.size(), "SHA-256 produced an unexpected length");
    return out;
}

std::string HexEncode(const std::uint8_t* data, std::size_t size) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

bool HexDecode(std::string_view hex, Digest& out) {
    if (hex.size() != out.size() * 2) {
        return false;
    }
    for (std::size_t i = 0; i < out.size(); ++i) {
        int hi = HexValue(hex[2 * i]);
        int lo = HexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return true;
}

std::string Base64Encode(const Bytes& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    if (data.empty()) {
        return out;
    }
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(),
                                  CheckedInt(data.size(), "base64 input"));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

Bytes Base64Decode(std::string_view text, bool* ok) {
    if (ok) {
        *ok = false;
    }
    if (text.empty() || text.size() % 4 != 0) {
        return {};
    }
    Bytes out(3 * (text.size() / 4));
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  CheckedInt(text.size(), "base64 input"));
    if (written < 0) {
        return {};
    }
    // EVP_DecodeBlock counts padding as zero bytes.
    std::size_t padding = 0;
    if (text.back() == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') {
            ++padding;
        }
    }
    out.resize(static_cast<std::size_t>(written) - padding);
    if (ok) {
        *ok = true;
    }
    return out;
}

}  // namespace chunkvault::crypto
