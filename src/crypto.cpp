#include "crypto.hpp"
#include "aead.hpp"
#include "errors.hpp"
#include "kdf.hpp"

Payload seal_document_with(const std::string& plaintext, const std::string& password,
                           FormatVersion version, const Bytes& salt, const Bytes& nonce){
    const FormatParams& fp = format_params(version);
    if (salt.size() != fp.salt_len) throw UsageError("salt length invalid");
    if (nonce.size() != fp.nonce_len) throw UsageError("nonce length invalid");

    Payload p;
    p.version = version;
    p.salt = salt;
    p.nonce = nonce;

    SecretBytes key = derive_key(password, salt, fp);
    p.ciphertext = aead_seal(key, nonce, format_aad(version),
                             reinterpret_cast<const unsigned char*>(plaintext.data()), plaintext.size());
    return p;
}

Payload seal_document(const std::string& plaintext, const std::string& password, FormatVersion version){
    const FormatParams& fp = format_params(version);
    Bytes salt = random_bytes(fp.salt_len);
    Bytes nonce = random_bytes(fp.nonce_len);
    return seal_document_with(plaintext, password, version, salt, nonce);
}

std::string open_document(const Payload& payload, const std::string& password){
    FormatVersion known = kDefaultFormat;
    if (!try_format_version(format_number(payload.version), known))
        throw MalformedTokenError("unknown format version " + std::to_string(format_number(payload.version)));
    const FormatParams& fp = format_params(known);
    if (payload.salt.size() != fp.salt_len || payload.nonce.size() != fp.nonce_len)
        throw MalformedTokenError("payload fields do not match their format version");

    SecretBytes key = derive_key(password, payload.salt, fp);
    return aead_open(key, payload.nonce, format_aad(known), payload.ciphertext);
}

std::string open_token(const std::string& token, const std::string& password){
    return open_document(decode_token(token), password);
}
