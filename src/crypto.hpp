#pragma once
#include <string>
#include "payload.hpp"

// Password -> PBKDF2 key -> AES-GCM, with a fresh random salt and nonce.
// The password policy is the caller's business (see enforce_password_policy).
Payload seal_document(const std::string& plaintext, const std::string& password,
                      FormatVersion version = kDefaultFormat);

// Same, with caller-chosen salt and nonce. Only for fixtures and tests: a
// nonce must never repeat under one key.
Payload seal_document_with(const std::string& plaintext, const std::string& password,
                           FormatVersion version, const Bytes& salt, const Bytes& nonce);

// Re-derives the key with the payload's own version parameters.
// Throws AuthFailureError for a wrong password or altered payload.
std::string open_document(const Payload& payload, const std::string& password);

// decode_token + open_document. MalformedTokenError or AuthFailureError.
std::string open_token(const std::string& token, const std::string& password);
