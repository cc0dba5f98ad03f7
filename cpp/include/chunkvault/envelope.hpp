#pragma once

#include "chunkvault/crypto.hpp"

#include <string>

namespace chunkvault::envelope {

// Text forms: "cvpk-<base64 raw X25519 public>" / "cvsk-<base64 raw X25519
// private>", or the equivalent PEM (SubjectPublicKeyInfo / PKCS#8).
struct KeyPair {
    std::string public_key;
    std::string private_key;
};

struct KemResult {
    Bytes ephemeral_public;
    Bytes key;
};

KeyPair GenerateKeyPair();
std::string PublicKeyFromPrivate(const std::string& private_key);

// Throw ConfigurationError when the text is not a usable X25519 key.
void CheckPublicKey(const std::string& public_key);
void CheckPrivateKey(const std::string& private_key);

// Ephemeral-static X25519 agreement expanded with HKDF-SHA256 into an
// AES-256 key bound to both public keys.
KemResult KemEncrypt(const std::string& public_key);
Bytes KemDecrypt(const std::string& private_key, const Bytes& ephemeral_public);

}  // namespace chunkvault::envelope
