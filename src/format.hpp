#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "bytes.hpp"

// Token format versions. Frozen once published: add a new one, never edit.
// The embedded decoder carries the same table (decrypt_template.cpp).
enum class FormatVersion : uint8_t {
    V1 = 1,
    V2 = 2,
};

struct FormatParams {
    FormatVersion version;
    const char* kdf_digest;   // OpenSSL digest name, PBKDF2-HMAC-<digest>
    int iterations;
    size_t salt_len;
    size_t nonce_len;
    size_t key_len;
    size_t tag_len;
    bool bind_version_aad;    // version byte authenticated as GCM AAD
};

constexpr FormatVersion kDefaultFormat = FormatVersion::V2;

const FormatParams& format_params(FormatVersion v);

// false when n names no registered version
bool try_format_version(int n, FormatVersion& out);

int format_number(FormatVersion v);

// Associated data bound into the GCM tag for version v (may be empty).
Bytes format_aad(FormatVersion v);
