#pragma once
#include <string>
#include "bytes.hpp"
#include "format.hpp"

// Everything that crosses from the encoder to the embedded decoder.
struct Payload {
    FormatVersion version = kDefaultFormat;
    Bytes salt;
    Bytes nonce;
    Bytes ciphertext;   // ct || tag
};

// "<version>.<b64 salt>.<b64 nonce>.<b64 ct||tag>"
std::string encode_token(const Payload& p);

// Returns false on any deviation from the grammar or the version's field sizes.
bool try_decode_token(const std::string& token, Payload& out);

// Throws MalformedTokenError.
Payload decode_token(const std::string& token);

// True for characters a well-formed token may contain.
bool is_token_char(char c);
