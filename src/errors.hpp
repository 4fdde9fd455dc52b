#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>

// Base of everything pagelock throws on purpose.
struct PagelockError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct UsageError : PagelockError {
    using PagelockError::PagelockError;
};

struct CryptoError : PagelockError {
    using PagelockError::PagelockError;
};

struct WeakPasswordError : PagelockError {
    explicit WeakPasswordError(std::vector<std::string> why)
        : PagelockError(join(why)), reasons(std::move(why)) {}
    std::vector<std::string> reasons;

private:
    static std::string join(const std::vector<std::string>& v){
        std::string s = "weak password";
        for (size_t i=0;i<v.size();++i) s += (i==0 ? ": " : "; ") + v[i];
        return s;
    }
};

// Token could not be split into its four well-formed fields.
struct MalformedTokenError : PagelockError {
    using PagelockError::PagelockError;
};

// GCM tag mismatch: wrong password or modified data.
struct AuthFailureError : PagelockError {
    AuthFailureError() : PagelockError("authentication failed (wrong password or tampered data)") {}
};

struct IoError : PagelockError {
    IoError(const std::string& what, std::string p)
        : PagelockError(what + ": " + p), path(std::move(p)) {}
    std::string path;
};
