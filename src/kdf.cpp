#include "kdf.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>

SecretBytes derive_key(const std::string& password, const Bytes& salt, const FormatParams& params){
    const EVP_MD* md = EVP_get_digestbyname(params.kdf_digest);
    if (!md) throw CryptoError(std::string("digest unavailable: ") + params.kdf_digest);

    SecretBytes key(params.key_len);
    if (PKCS5_PBKDF2_HMAC(password.data(), (int)password.size(),
                          salt.data(), (int)salt.size(),
                          params.iterations, md,
                          (int)key.size(), key.data()) != 1){
        throw CryptoError("PBKDF2 failed");
    }
    return key;
}

Bytes random_bytes(size_t n){
    Bytes b(n);
    if (n > 0 && RAND_bytes(b.data(), (int)n) != 1) throw CryptoError("RAND_bytes failed");
    return b;
}
