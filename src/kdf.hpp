#pragma once
#include <string>
#include "bytes.hpp"
#include "format.hpp"

// PBKDF2-HMAC with the digest, iteration count and key length of params.
// Deterministic in (password, salt, params); nothing is cached.
SecretBytes derive_key(const std::string& password, const Bytes& salt, const FormatParams& params);

// Fills n bytes from the OpenSSL CSPRNG.
Bytes random_bytes(size_t n);
