#include <gtest/gtest.h>
#include "aead.hpp"
#include "errors.hpp"

static SecretBytes fixed_key(){
    SecretBytes k(32);
    for (size_t i=0;i<k.size();++i) k.data()[i] = (unsigned char)(i * 7 + 1);
    return k;
}

static Bytes seal(const SecretBytes& k, const Bytes& nonce, const Bytes& aad, const std::string& pt){
    return aead_seal(k, nonce, aad, reinterpret_cast<const unsigned char*>(pt.data()), pt.size());
}

TEST(Aead, SealAppendsTagAndOpens){
    SecretBytes k = fixed_key();
    Bytes nonce(12, 0x24);
    Bytes ct = seal(k, nonce, {}, "attack at dawn");
    EXPECT_EQ(ct.size(), 14u + 16u);
    EXPECT_EQ(aead_open(k, nonce, {}, ct), "attack at dawn");
}

TEST(Aead, EmptyPlaintextIsJustATag){
    SecretBytes k = fixed_key();
    Bytes nonce(12, 0x01);
    Bytes ct = seal(k, nonce, {}, "");
    EXPECT_EQ(ct.size(), 16u);
    EXPECT_EQ(aead_open(k, nonce, {}, ct), "");
}

TEST(Aead, EveryBitFlipIsRejected){
    SecretBytes k = fixed_key();
    Bytes nonce(12, 0x55);
    Bytes ct = seal(k, nonce, {}, "hello");
    for (size_t i=0;i<ct.size();++i) {
        for (int bit=0; bit<8; ++bit) {
            Bytes bad = ct;
            bad[i] ^= (unsigned char)(1 << bit);
            EXPECT_THROW(aead_open(k, nonce, {}, bad), AuthFailureError) << "byte " << i << " bit " << bit;
        }
    }
}

TEST(Aead, AadMustMatch){
    SecretBytes k = fixed_key();
    Bytes nonce(12, 0x09);
    Bytes ct = seal(k, nonce, Bytes{0x02}, "bound");
    EXPECT_EQ(aead_open(k, nonce, Bytes{0x02}, ct), "bound");
    EXPECT_THROW(aead_open(k, nonce, {}, ct), AuthFailureError);
    EXPECT_THROW(aead_open(k, nonce, Bytes{0x01}, ct), AuthFailureError);
}

TEST(Aead, WrongNonceOrKeyFails){
    SecretBytes k = fixed_key();
    Bytes ct = seal(k, Bytes(12, 0x01), {}, "text");
    EXPECT_THROW(aead_open(k, Bytes(12, 0x02), {}, ct), AuthFailureError);
    SecretBytes other(32);
    EXPECT_THROW(aead_open(other, Bytes(12, 0x01), {}, ct), AuthFailureError);
}

TEST(Aead, ShortInputIsAuthFailure){
    SecretBytes k = fixed_key();
    EXPECT_THROW(aead_open(k, Bytes(12, 0), {}, Bytes(15, 0)), AuthFailureError);
}

TEST(Aead, KeyMustBe256Bits){
    SecretBytes k(16);
    EXPECT_THROW(seal(k, Bytes(12, 0), {}, "x"), CryptoError);
}
