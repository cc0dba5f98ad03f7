#include "chunkvault/envelope.hpp"

#include "chunkvault/constants.hpp"
#include "chunkvault/crypto_utils.hpp"
#include "chunkvault/errors.hpp"

#include <openssl/evp.h>
#include <openssl/pem.h>

#include <cctype>
#include <stdexcept>
#include <string_view>

namespace chunkvault::envelope {

namespace {

using crypto::detail::UniqueBIO;
using crypto::detail::UniquePKEY;
using crypto::detail::UniquePKEYCtx;

std::string_view TrimView(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool StartsWith(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

Bytes DecodeRawKey(std::string_view body, const char* what) {
    bool ok = false;
    Bytes raw = crypto::Base64Decode(body, &ok);
    if (!ok || raw.size() != constants::kX25519KeyLen) {
        throw ConfigurationError(std::string("Malformed ") + what + " key encoding");
    }
    return raw;
}

void EnsureX25519(EVP_PKEY* key, const char* what) {
    if (EVP_PKEY_id(key) != EVP_PKEY_X25519) {
        throw ConfigurationError(std::string(what) + " key must be X25519");
    }
}

UniquePKEY LoadPublicKey(const std::string& text) {
    std::string_view trimmed = TrimView(text);
    if (trimmed.empty()) {
        throw ConfigurationError("Public key is empty");
    }
    if (StartsWith(trimmed, constants::kPublicKeyPrefix)) {
        Bytes raw = DecodeRawKey(trimmed.substr(constants::kPublicKeyPrefix.size()), "public");
        UniquePKEY key(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, raw.data(), raw.size()));
        if (!key) {
            throw ConfigurationError("Invalid X25519 public key");
        }
        return key;
    }
    UniqueBIO bio(BIO_new_mem_buf(trimmed.data(), static_cast<int>(trimmed.size())));
    if (!bio) {
        throw std::runtime_error("Failed to allocate BIO");
    }
    UniquePKEY key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        throw ConfigurationError("Unsupported public key format");
    }
    EnsureX25519(key.get(), "Public");
    return key;
}

UniquePKEY LoadPrivateKey(const std::string& text) {
    std::string_view trimmed = TrimView(text);
    if (trimmed.empty()) {
        throw ConfigurationError("Private key is empty");
    }
    if (StartsWith(trimmed, constants::kPrivateKeyPrefix)) {
        Bytes raw = DecodeRawKey(trimmed.substr(constants::kPrivateKeyPrefix.size()), "private");
        UniquePKEY key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, raw.data(), raw.size()));
        if (!key) {
            throw ConfigurationError("Invalid X25519 private key");
        }
        return key;
    }
    UniqueBIO bio(BIO_new_mem_buf(trimmed.data(), static_cast<int>(trimmed.size())));
    if (!bio) {
        throw std::runtime_error("Failed to allocate BIO");
    }
    UniquePKEY key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        throw ConfigurationError("Unsupported private key format");
    }
    EnsureX25519(key.get(), "Private");
    return key;
}

UniquePKEY GenerateKey() {
    UniquePKEYCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr));
    if (!ctx) {
        throw std::runtime_error("Failed to initialize X25519 keygen");
    }
    if (EVP_PKEY_keygen_init(ctx.get()) != 1) {
        throw std::runtime_error("Failed to init X25519 keygen");
    }
    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &pkey) != 1 || !pkey) {
        throw std::runtime_error("Failed to generate X25519 key");
    }
    return UniquePKEY(pkey);
}

Bytes RawPublic(EVP_PKEY* key) {
    std::size_t len = constants::kX25519KeyLen;
    Bytes out(len);
    if (EVP_PKEY_get_raw_public_key(key, out.data(), &len) != 1 || len != constants::kX25519KeyLen) {
        throw std::runtime_error("Failed to export X25519 public key");
    }
    return out;
}

Bytes RawPrivate(EVP_PKEY* key) {
    std::size_t len = constants::kX25519KeyLen;
    Bytes out(len);
    if (EVP_PKEY_get_raw_private_key(key, out.data(), &len) != 1 || len != constants::kX25519KeyLen) {
        throw std::runtime_error("Failed to export X25519 private key");
    }
    return out;
}

Bytes DeriveShared(EVP_PKEY* priv, EVP_PKEY* peer) {
    UniquePKEYCtx ctx(EVP_PKEY_CTX_new(priv, nullptr));
    if (!ctx) {
        throw std::runtime_error("Failed to init X25519 ctx");
    }
    if (EVP_PKEY_derive_init(ctx.get()) != 1) {
        throw std::runtime_error("Failed to init X25519 derive");
    }
    if (EVP_PKEY_derive_set_peer(ctx.get(), peer) != 1) {
        throw std::runtime_error("Failed to set X25519 peer");
    }
    std::size_t len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &len) != 1 || len == 0) {
        throw std::runtime_error("Failed to size X25519 shared secret");
    }
    Bytes shared(len);
    if (EVP_PKEY_derive(ctx.get(), shared.data(), &len) != 1) {
        throw std::runtime_error("Failed to derive X25519 shared secret");
    }
    shared.resize(len);
    return shared;
}

Bytes ExpandKey(const Bytes& shared, const Bytes& ephemeral_public, const Bytes& recipient_public) {
    Bytes material;
    material.reserve(shared.size() + ephemeral_public.size() + recipient_public.size());
    material.insert(material.end(), shared.begin(), shared.end());
    material.insert(material.end(), ephemeral_public.begin(), ephemeral_public.end());
    material.insert(material.end(), recipient_public.begin(), recipient_public.end());
    return crypto::HkdfSha256(material, constants::kArtifactKdfInfo, constants::kAeadKeyLen);
}

}  // namespace

KeyPair GenerateKeyPair() {
    UniquePKEY key = GenerateKey();
    KeyPair pair;
    pair.public_key = std::string(constants::kPublicKeyPrefix) + crypto::Base64Encode(RawPublic(key.get()));
    pair.private_key = std::string(constants::kPrivateKeyPrefix) + crypto::Base64Encode(RawPrivate(key.get()));
    return pair;
}

std::string PublicKeyFromPrivate(const std::string& private_key) {
    UniquePKEY key = LoadPrivateKey(private_key);
    return std::string(constants::kPublicKeyPrefix) + crypto::Base64Encode(RawPublic(key.get()));
}

void CheckPublicKey(const std::string& public_key) {
    LoadPublicKey(public_key);
}

void CheckPrivateKey(const std::string& private_key) {
    LoadPrivateKey(private_key);
}

KemResult KemEncrypt(const std::string& public_key) {
    UniquePKEY peer = LoadPublicKey(public_key);
    UniquePKEY eph = GenerateKey();
    Bytes shared = DeriveShared(eph.get(), peer.get());
    KemResult result;
    result.ephemeral_public = RawPublic(eph.get());
    result.key = ExpandKey(shared, result.ephemeral_public, RawPublic(peer.get()));
    return result;
}

Bytes KemDecrypt(const std::string& private_key, const Bytes& ephemeral_public) {
    if (ephemeral_public.size() != constants::kX25519KeyLen) {
        throw std::runtime_error("Ephemeral public key has the wrong length");
    }
    UniquePKEY priv = LoadPrivateKey(private_key);
    UniquePKEY peer(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, ephemeral_public.data(),
                                                ephemeral_public.size()));
    if (!peer) {
        throw std::runtime_error("Invalid ephemeral public key");
    }
    Bytes shared = DeriveShared(priv.get(), peer.get());
    return ExpandKey(shared, ephemeral_public, RawPublic(priv.get()));
}

}  // namespace chunkvault::envelope
