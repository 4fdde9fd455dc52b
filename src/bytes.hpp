#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <utility>
#include <openssl/crypto.h>

using Bytes = std::vector<unsigned char>;

inline Bytes to_bytes(const std::string& s){
    return Bytes(s.begin(), s.end());
}

// Key material and password copies. Wiped with OPENSSL_cleanse when released.
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(size_t n) : buf_(n) {}
    SecretBytes(const char* p, size_t n) : buf_(p, p+n) {}
    ~SecretBytes(){ wipe(); }

    SecretBytes(const SecretBytes&) = delete;
    SecretBytes& operator=(const SecretBytes&) = delete;
    SecretBytes(SecretBytes&& o) noexcept : buf_(std::move(o.buf_)) { o.buf_.clear(); }
    SecretBytes& operator=(SecretBytes&& o) noexcept {
        if (this != &o) { wipe(); buf_ = std::move(o.buf_); o.buf_.clear(); }
        return *this;
    }

    unsigned char* data() { return buf_.data(); }
    const unsigned char* data() const { return buf_.data(); }
    size_t size() const { return buf_.size(); }
    bool operator==(const SecretBytes& o) const { return buf_ == o.buf_; }

    void wipe(){
        if (!buf_.empty()) OPENSSL_cleanse(buf_.data(), buf_.size());
        buf_.clear();
    }

private:
    Bytes buf_;
};

// Scrubs a std::string that held a password once the owning scope ends.
struct StringWiper {
    explicit StringWiper(std::string& s) : s_(s) {}
    ~StringWiper(){ if (!s_.empty()) OPENSSL_cleanse(&s_[0], s_.size()); s_.clear(); }
    StringWiper(const StringWiper&) = delete;
    StringWiper& operator=(const StringWiper&) = delete;
private:
    std::string& s_;
};
