#pragma once
#include <string>
#include "bytes.hpp"

// RFC 4648 standard alphabet, padded, no line breaks.
std::string base64_encode(const unsigned char* data, size_t len);
std::string base64_encode(const Bytes& in);

// Strict: rejects empty input, bad length, characters outside the alphabet
// and padding anywhere but the end. Returns false instead of throwing.
bool try_base64_decode(const std::string& in, Bytes& out);
