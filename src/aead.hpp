#pragma once
#include "bytes.hpp"

// AES-256-GCM with a 16 byte tag appended to the ciphertext (ct || tag),
// which is the layout WebCrypto produces and consumes.
Bytes aead_seal(const SecretBytes& key, const Bytes& nonce, const Bytes& aad,
                const unsigned char* plaintext, size_t len);

// Throws AuthFailureError on tag mismatch. Nothing is returned unverified.
std::string aead_open(const SecretBytes& key, const Bytes& nonce, const Bytes& aad,
                      const Bytes& cipher_and_tag);
