#include "aead.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <algorithm>

static constexpr int kTagLen = 16;

static const EVP_CIPHER* gcm_for(const SecretBytes& key){
    if (key.size() != 32) throw CryptoError("AES-256-GCM needs a 32 byte key");
    return EVP_aes_256_gcm();
}

Bytes aead_seal(const SecretBytes& key, const Bytes& nonce, const Bytes& aad,
                const unsigned char* plaintext, size_t len){
    const EVP_CIPHER* cipher = gcm_for(key);
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw CryptoError("EVP_CIPHER_CTX_new failed");

    int rc = EVP_EncryptInit_ex(ctx, cipher, nullptr, nullptr, nullptr);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("EncryptInit failed"); }

    rc = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, (int)nonce.size(), nullptr);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("SET_IVLEN failed"); }

    rc = EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data());
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("EncryptInit key/iv failed"); }

    int outlen1=0, outlen2=0, aadlen=0;
    if (!aad.empty()) {
        rc = EVP_EncryptUpdate(ctx, nullptr, &aadlen, aad.data(), (int)aad.size());
        if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("EncryptUpdate aad failed"); }
    }

    Bytes out(len + kTagLen);
    if (len > 0) {
        rc = EVP_EncryptUpdate(ctx, out.data(), &outlen1, plaintext, (int)len);
        if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("EncryptUpdate failed"); }
    }

    rc = EVP_EncryptFinal_ex(ctx, out.data()+outlen1, &outlen2);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("EncryptFinal failed"); }
    size_t ctlen = (size_t)(outlen1 + outlen2);

    rc = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, kTagLen, out.data()+ctlen);
    EVP_CIPHER_CTX_free(ctx);
    if (rc != 1) throw CryptoError("GET_TAG failed");

    out.resize(ctlen + kTagLen);
    return out;
}

std::string aead_open(const SecretBytes& key, const Bytes& nonce, const Bytes& aad,
                      const Bytes& cipher_and_tag){
    if (cipher_and_tag.size() < (size_t)kTagLen) throw AuthFailureError();
    const EVP_CIPHER* cipher = gcm_for(key);
    size_t ctlen = cipher_and_tag.size() - kTagLen;
    unsigned char tag[kTagLen];
    std::copy(cipher_and_tag.begin()+ctlen, cipher_and_tag.end(), tag);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw CryptoError("EVP_CIPHER_CTX_new failed");
    int rc = EVP_DecryptInit_ex(ctx, cipher, nullptr, nullptr, nullptr);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("DecryptInit failed"); }
    rc = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, (int)nonce.size(), nullptr);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("SET_IVLEN failed"); }
    rc = EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data());
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("DecryptInit key/iv failed"); }

    int outlen1=0, outlen2=0, aadlen=0;
    if (!aad.empty()) {
        rc = EVP_DecryptUpdate(ctx, nullptr, &aadlen, aad.data(), (int)aad.size());
        if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("DecryptUpdate aad failed"); }
    }

    // Held as a secret until the tag checks out; wiped on the failure path.
    SecretBytes out(ctlen + kTagLen);
    if (ctlen > 0) {
        rc = EVP_DecryptUpdate(ctx, out.data(), &outlen1, cipher_and_tag.data(), (int)ctlen);
        if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("DecryptUpdate failed"); }
    }

    rc = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, kTagLen, tag);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("SET_TAG failed"); }

    rc = EVP_DecryptFinal_ex(ctx, out.data()+outlen1, &outlen2);
    EVP_CIPHER_CTX_free(ctx);
    if (rc != 1) throw AuthFailureError();

    return std::string(reinterpret_cast<const char*>(out.data()), (size_t)(outlen1 + outlen2));
}
