#include "base64.hpp"
#include "errors.hpp"
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>

std::string base64_encode(const unsigned char* data, size_t len){
    if (len == 0) return std::string();
    BIO *bio, *b64; BUF_MEM *bufferPtr;
    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    if (!b64 || !bio) { BIO_free(b64); BIO_free(bio); throw CryptoError("BIO_new failed"); }
    b64 = BIO_push(b64, bio);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    if (BIO_write(b64, data, (int)len) != (int)len || BIO_flush(b64) != 1){
        BIO_free_all(b64);
        throw CryptoError("base64 encode failed");
    }
    BIO_get_mem_ptr(b64, &bufferPtr);
    std::string out(bufferPtr->data, bufferPtr->length);
    BIO_free_all(b64);
    return out;
}

std::string base64_encode(const Bytes& in){
    return base64_encode(in.data(), in.size());
}

static bool is_b64_char(char c){
    return (c>='A' && c<='Z') || (c>='a' && c<='z') || (c>='0' && c<='9') || c=='+' || c=='/';
}

bool try_base64_decode(const std::string& in, Bytes& out){
    if (in.empty() || in.size() % 4 != 0) return false;

    size_t pad = 0;
    if (in[in.size()-1] == '=') pad++;
    if (in[in.size()-2] == '=') pad++;
    if (pad == 1 && in[in.size()-2] == '=') return false;
    for (size_t i=0;i<in.size()-pad;++i)
        if (!is_b64_char(in[i])) return false;

    // EVP_DecodeBlock counts the padding bytes as output; trim them off.
    Bytes buf((in.size()/4)*3);
    int len = EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(in.data()), (int)in.size());
    if (len < 0 || (size_t)len < pad) return false;
    buf.resize((size_t)len - pad);
    out.swap(buf);
    return true;
}
